#include <QtTest/QtTest>

#include <string>
#include <vector>

#include "ExclusionPolicy.h"
#include "globals.h"

class ExclusionPolicyTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testBaselineOrder();
    void testCacheExcluded();
    void testHomeIncludedAcrossFilesystems();
    void testMountContentsExcluded();
    void testRootContentIncluded();
    void testPseudoFilesystemContents();
    void testSpecialFilesAndOtherFilesystems();
    void testFirstMatchWins();
    void testForRunExcludesNestedDestination();
    void testGlobSyntax();
    void testGlobBracketClasses();
    void testForRunQuotesDestination();
    void testRdiffArguments();
    void testRdiffDropsGlobsOutsideSource();
    void testRsyncArguments();
    void testRsyncArgumentsRelativeToSource();
};

void ExclusionPolicyTests::initTestCase()
{
    GLOBALS.quiet = true;
    GLOBALS.color = false;
    GLOBALS.debugSelector = 0;
}

void ExclusionPolicyTests::testBaselineOrder()
{
    const auto rules = ExclusionPolicy::baseline().getRules();
    QCOMPARE(rules.size(), size_t(9));

    QVERIFY(rules[0] == ExclusionRule::exclude("/home/*/.cache"));
    QVERIFY(rules[1] == ExclusionRule::include("/home"));
    QVERIFY(rules[2] == ExclusionRule::exclude("/tmp/*"));
    QVERIFY(rules[3] == ExclusionRule::exclude("/var/tmp/*"));
    QVERIFY(rules[4] == ExclusionRule::exclude("/proc/*"));
    QVERIFY(rules[5] == ExclusionRule::exclude("/sys/*"));
    QVERIFY(rules[6] == ExclusionRule::exclude("/mnt/*/*"));
    QVERIFY(rules[7] == ExclusionRule(SPECIAL_FILES, EXCLUDE));
    QVERIFY(rules[8] == ExclusionRule(OTHER_FILESYSTEMS, EXCLUDE));
}

void ExclusionPolicyTests::testCacheExcluded()
{
    const auto policy = ExclusionPolicy::baseline();

    QCOMPARE(policy.evaluate("/home/alice/.cache"), EXCLUDE);
    QCOMPARE(policy.evaluate("/home/alice/.cache/thumbnails/large/a.png"), EXCLUDE);
    QCOMPARE(policy.evaluate("/home/alice/.cachefile"), INCLUDE);
}

void ExclusionPolicyTests::testHomeIncludedAcrossFilesystems()
{
    const auto policy = ExclusionPolicy::baseline();

    QCOMPARE(policy.evaluate("/home/alice/documents"), INCLUDE);
    QCOMPARE(policy.evaluate("/home/alice/documents", PathTraits(false, true)), INCLUDE);
    QCOMPARE(policy.evaluate("/home", PathTraits(false, true)), INCLUDE);
}

void ExclusionPolicyTests::testMountContentsExcluded()
{
    const auto policy = ExclusionPolicy::baseline();

    QCOMPARE(policy.evaluate("/mnt/external/data"), EXCLUDE);
    QCOMPARE(policy.evaluate("/mnt/external/data", PathTraits(false, true)), EXCLUDE);
    QCOMPARE(policy.evaluate("/mnt/external"), INCLUDE);
}

void ExclusionPolicyTests::testRootContentIncluded()
{
    const auto policy = ExclusionPolicy::baseline();

    QCOMPARE(policy.evaluate("/"), INCLUDE);
    QCOMPARE(policy.evaluate("/etc/passwd"), INCLUDE);
    QCOMPARE(policy.evaluate("/usr/bin/env"), INCLUDE);
    QCOMPARE(policy.evaluate("/var/lib/dpkg/status"), INCLUDE);
}

void ExclusionPolicyTests::testPseudoFilesystemContents()
{
    const auto policy = ExclusionPolicy::baseline();

    // the directories survive, their contents don't
    QCOMPARE(policy.evaluate("/tmp"), INCLUDE);
    QCOMPARE(policy.evaluate("/tmp/scratch.txt"), EXCLUDE);
    QCOMPARE(policy.evaluate("/var/tmp/build/obj.o"), EXCLUDE);
    QCOMPARE(policy.evaluate("/proc"), INCLUDE);
    QCOMPARE(policy.evaluate("/proc/1/status"), EXCLUDE);
    QCOMPARE(policy.evaluate("/sys/kernel"), EXCLUDE);
}

void ExclusionPolicyTests::testSpecialFilesAndOtherFilesystems()
{
    const auto policy = ExclusionPolicy::baseline();

    QCOMPARE(policy.evaluate("/run/dbus/system_bus_socket", PathTraits(true, false)), EXCLUDE);
    QCOMPARE(policy.evaluate("/boot/efi/EFI/boot.efi", PathTraits(false, true)), EXCLUDE);

    // include /home comes first, so it decides for everything under /home
    QCOMPARE(policy.evaluate("/home/alice/agent.sock", PathTraits(true, false)), INCLUDE);
}

void ExclusionPolicyTests::testFirstMatchWins()
{
    ExclusionPolicy policy({ ExclusionRule::include("/data/keep"), ExclusionRule::exclude("/data") });

    QCOMPARE(policy.evaluate("/data/keep/file"), INCLUDE);
    QCOMPARE(policy.evaluate("/data/other"), EXCLUDE);
    QCOMPARE(policy.evaluate("/data"), INCLUDE);
    QCOMPARE(policy.evaluate("/elsewhere"), INCLUDE);

    ExclusionPolicy reversed({ ExclusionRule::exclude("/data"), ExclusionRule::include("/data/keep") });
    QCOMPARE(reversed.evaluate("/data/keep/file"), EXCLUDE);
}

void ExclusionPolicyTests::testForRunExcludesNestedDestination()
{
    const auto nested = ExclusionPolicy::forRun("/", "/srv/backup");
    QCOMPARE(nested.getRules().size(), size_t(10));
    QVERIFY(nested.getRules()[0] == ExclusionRule::exclude("/srv/backup"));
    QCOMPARE(nested.evaluate("/srv/backup/backup-2024-01-01T00:00:00/etc"), EXCLUDE);
    QCOMPARE(nested.evaluate("/srv/www"), INCLUDE);

    const auto separate = ExclusionPolicy::forRun("/data", "/mnt/backup");
    QVERIFY(separate.getRules() == ExclusionPolicy::baseline().getRules());
}

void ExclusionPolicyTests::testGlobSyntax()
{
    QVERIFY(globMatches("/home/*/.cache", "/home/bob/.cache", false));
    QVERIFY(!globMatches("/home/*/.cache", "/home/bob/sub/.cache", false));
    QVERIFY(globMatches("/home/**/.cache", "/home/bob/sub/.cache", false));
    QVERIFY(globMatches("/var/log/syslog.?", "/var/log/syslog.1", false));
    QVERIFY(!globMatches("/var/log/syslog.?", "/var/log/syslog.10", false));
    QVERIFY(globMatches("/tmp/*", "/tmp/a/b/c", false));
    QVERIFY(globMatches("/home", "/home/", false));

    // ancestors only count for includes
    QVERIFY(!globMatches("/home/*/.cache", "/home/bob", false));
    QVERIFY(globMatches("/home/*/.cache", "/home/bob", true));
    QVERIFY(globMatches("/home", "/", true));
    QVERIFY(!globMatches("/home/*/.cache", "/var", true));
}

void ExclusionPolicyTests::testGlobBracketClasses()
{
    QVERIFY(globMatches("/var/log/syslog.[0-9]", "/var/log/syslog.3", false));
    QVERIFY(!globMatches("/var/log/syslog.[0-9]", "/var/log/syslog.x", false));
    QVERIFY(globMatches("/var/log/syslog.[!0-9]", "/var/log/syslog.x", false));
    QVERIFY(!globMatches("/var/log/syslog.[!0-9]", "/var/log/syslog.3", false));
    QVERIFY(globMatches("/data/[]]x", "/data/]x", false));

    // an unterminated class is literal text
    QVERIFY(globMatches("/data/[abc", "/data/[abc", false));
    QVERIFY(!globMatches("/data/[abc", "/data/a", false));
}

void ExclusionPolicyTests::testForRunQuotesDestination()
{
    QCOMPARE(literalGlob("/srv/back*up?[1]"), std::string("/srv/back[*]up[?][[]1]"));
    QCOMPARE(literalGlob("/home/jos\xc3\xa9/bk"), std::string("/home/jos\xc3\xa9/bk"));

    const auto starred = ExclusionPolicy::forRun("/", "/srv/back*up");
    QVERIFY(starred.getRules()[0] == ExclusionRule::exclude("/srv/back[*]up"));
    QCOMPARE(starred.evaluate("/srv/back*up/backup-2024-01-01T00:00:00"), EXCLUDE);
    QCOMPARE(starred.evaluate("/srv/backXup"), INCLUDE);
    QCOMPARE(starred.evaluate("/srv/backup"), INCLUDE);
    QCOMPARE(starred.rsyncArguments("/")[0], std::string("--exclude=/srv/back[*]up"));

    const auto accented = ExclusionPolicy::forRun("/", "/home/jos\xc3\xa9/bk");
    QCOMPARE(accented.evaluate("/home/jos\xc3\xa9/bk/current"), EXCLUDE);
    QCOMPARE(accented.evaluate("/home/jos\xc3\xa9/docs"), INCLUDE);
    QCOMPARE(accented.evaluate("/home/josx/bk/current"), INCLUDE);
}

void ExclusionPolicyTests::testRdiffArguments()
{
    const std::vector<std::string> expected = {
        "--exclude", "/home/*/.cache",
        "--include", "/home",
        "--exclude", "/tmp/*",
        "--exclude", "/var/tmp/*",
        "--exclude", "/proc/*",
        "--exclude", "/sys/*",
        "--exclude", "/mnt/*/*",
        "--exclude-special-files",
        "--exclude-other-filesystems"
    };

    QVERIFY(ExclusionPolicy::baseline().rdiffArguments("/") == expected);
}

void ExclusionPolicyTests::testRdiffDropsGlobsOutsideSource()
{
    const std::vector<std::string> expected = { "--exclude-special-files", "--exclude-other-filesystems" };
    QVERIFY(ExclusionPolicy::baseline().rdiffArguments("/data") == expected);

    const auto homeArgs = ExclusionPolicy::baseline().rdiffArguments("/home/alice");
    QCOMPARE(homeArgs.size(), size_t(6));
    QCOMPARE(homeArgs[1], std::string("/home/*/.cache"));
    QCOMPARE(homeArgs[3], std::string("/home"));
}

void ExclusionPolicyTests::testRsyncArguments()
{
    const std::vector<std::string> expected = {
        "--exclude=/home/*/.cache",
        "--include=/home",
        "--exclude=/tmp/*",
        "--exclude=/var/tmp/*",
        "--exclude=/proc/*",
        "--exclude=/sys/*",
        "--exclude=/mnt/*/*",
        "--no-devices",
        "--no-specials",
        "--one-file-system"
    };

    QVERIFY(ExclusionPolicy::baseline().rsyncArguments("/") == expected);
}

void ExclusionPolicyTests::testRsyncArgumentsRelativeToSource()
{
    const std::vector<std::string> expected = {
        "--exclude=/.cache",
        "--include=/**",
        "--no-devices",
        "--no-specials",
        "--one-file-system"
    };

    QVERIFY(ExclusionPolicy::baseline().rsyncArguments("/home/alice") == expected);

    ExclusionPolicy nested({ ExclusionRule::exclude("/data/backups") });
    const std::vector<std::string> nestedExpected = { "--exclude=/backups" };
    QVERIFY(nested.rsyncArguments("/data") == nestedExpected);
}

QTEST_MAIN(ExclusionPolicyTests)
#include "test_exclusion_policy.moc"
