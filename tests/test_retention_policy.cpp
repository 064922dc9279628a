#include <QtTest/QtTest>

#include <string>
#include <vector>

#include "RetentionPolicy.h"
#include "Snapshot.h"
#include "exception.h"
#include "globals.h"

static const time_t DAY = SECS_PER_DAY;

static bool parseFails(const std::string &text)
{
    try {
        RetentionPolicy::parse(text);
    }
    catch (BGException &) {
        return true;
    }
    return false;
}

class RetentionPolicyTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testParse_data();
    void testParse();
    void testBareNumberIsDays();
    void testRejectsInvalid_data();
    void testRejectsInvalid();
    void testLongestAccepted();
    void testCutoffBoundary();
    void testClassifiesSnapshots();
    void testSkipsIncompleteAndUndated();
};

void RetentionPolicyTests::initTestCase()
{
    GLOBALS.quiet = true;
    GLOBALS.color = false;
}

void RetentionPolicyTests::testParse_data()
{
    QTest::addColumn<QString>("text");
    QTest::addColumn<qlonglong>("seconds");

    QTest::newRow("months") << "3M" << qlonglong(90 * DAY);
    QTest::newRow("days") << "365D" << qlonglong(365 * DAY);
    QTest::newRow("weeks") << "2W" << qlonglong(14 * DAY);
    QTest::newRow("years") << "1Y" << qlonglong(365 * DAY);
    QTest::newRow("combined") << "1Y6M" << qlonglong(545 * DAY);
    QTest::newRow("small units") << "1h30m10s" << qlonglong(5410);
    QTest::newRow("padded") << "  3M " << qlonglong(90 * DAY);
}

void RetentionPolicyTests::testParse()
{
    QFETCH(QString, text);
    QFETCH(qlonglong, seconds);

    const auto policy = RetentionPolicy::parse(text.toStdString());
    QCOMPARE(qlonglong(policy.thresholdSeconds()), seconds);
    QCOMPARE(QString::fromStdString(policy.engineNotation()), text.trimmed());
}

void RetentionPolicyTests::testBareNumberIsDays()
{
    const auto policy = RetentionPolicy::parse("30");
    QCOMPARE(qlonglong(policy.thresholdSeconds()), qlonglong(30 * DAY));
    QCOMPARE(policy.engineNotation(), std::string("30D"));
}

void RetentionPolicyTests::testRejectsInvalid_data()
{
    QTest::addColumn<QString>("text");

    QTest::newRow("empty") << "";
    QTest::newRow("unknown unit") << "3X";
    QTest::newRow("unit first") << "M3";
    QTest::newRow("words") << "three months";
    QTest::newRow("negative") << "-5";
    QTest::newRow("zero") << "0";
    QTest::newRow("zero days") << "0D";
    QTest::newRow("too many digits") << "99999999999999999999";
    QTest::newRow("too many digits with unit") << "99999999999999999999D";
    QTest::newRow("overflows when scaled") << "999999999999999D";
    QTest::newRow("over a thousand years") << "1001Y";
    QTest::newRow("sum over a thousand years") << "1000Y1D";
}

void RetentionPolicyTests::testRejectsInvalid()
{
    QFETCH(QString, text);
    QVERIFY(parseFails(text.toStdString()));
}

void RetentionPolicyTests::testLongestAccepted()
{
    const auto policy = RetentionPolicy::parse("1000Y");
    QCOMPARE(qlonglong(policy.thresholdSeconds()), qlonglong(1000 * 365 * DAY));
    QVERIFY(policy.cutoff(1700000000) < 1700000000);
}

void RetentionPolicyTests::testCutoffBoundary()
{
    const time_t now = 1700000000;
    const auto policy = RetentionPolicy::parse("3M");

    QCOMPARE(qlonglong(policy.cutoff(now)), qlonglong(now - 90 * DAY));
    QVERIFY(policy.isPrunable(policy.cutoff(now), now));
    QVERIFY(policy.isPrunable(policy.cutoff(now) - 1, now));
    QVERIFY(!policy.isPrunable(policy.cutoff(now) + 1, now));
}

void RetentionPolicyTests::testClassifiesSnapshots()
{
    const time_t now = 1700000000;
    const auto policy = RetentionPolicy::parse("3M");

    std::vector<Snapshot> snapshots = {
        Snapshot(snapshotName(now - 400 * DAY), "", now - 400 * DAY),
        Snapshot(snapshotName(now - 100 * DAY), "", now - 100 * DAY),
        Snapshot(snapshotName(now - 10 * DAY), "", now - 10 * DAY)
    };

    const auto prunable = policy.prunable(snapshots, now);
    QCOMPARE(prunable.size(), size_t(2));
    QCOMPARE(qlonglong(prunable[0].timestamp), qlonglong(now - 400 * DAY));
    QCOMPARE(qlonglong(prunable[1].timestamp), qlonglong(now - 100 * DAY));
}

void RetentionPolicyTests::testSkipsIncompleteAndUndated()
{
    const time_t now = 1700000000;
    const auto policy = RetentionPolicy::parse("7D");

    std::vector<Snapshot> snapshots = {
        Snapshot("incomplete-backup-old", "", now - 30 * DAY, false),
        Snapshot("backup-garbage", "", 0, true)
    };

    QVERIFY(policy.prunable(snapshots, now).empty());
}

QTEST_MAIN(RetentionPolicyTests)
#include "test_retention_policy.moc"
