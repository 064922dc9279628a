#include <QtTest/QtTest>

#include <QTemporaryDir>
#include <QFile>
#include <QDir>

#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>
#include <string>
#include <variant>

#include "PipeExec.h"
#include "LockManager.h"
#include "util_generic.h"
#include "globals.h"

class PipeExecTests : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase();
    void testExitStatus();
    void testCaptureOutput();
    void testMissingProgram();
    void testKilledBySignal();
    void testChildGetsDefaultSignals();
    void testTestModeDoesNotRun();
    void testCommandLineQuoting();
    void testSignalMaskRestored();
    void testSignalDuringStartupReachesEngine();
};

void PipeExecTests::initTestCase()
{
    GLOBALS.quiet = true;
    GLOBALS.color = false;
    GLOBALS.test = false;
    GLOBALS.debugSelector = 0;
}

void PipeExecTests::testExitStatus()
{
    PipeExec success({ "/bin/sh", "-c", "exit 0" });
    QCOMPARE(success.execute(), 0);

    PipeExec failure({ "/bin/sh", "-c", "exit 3" });
    QCOMPARE(failure.execute(), 3);
    QVERIFY(failure.pid() > 0);
    QCOMPARE(int(GLOBALS.childPid), 0);
}

void PipeExecTests::testCaptureOutput()
{
    PipeExec echo({ "/bin/sh", "-c", "echo hello; echo world" });
    QCOMPARE(echo.execute(true), 0);
    QCOMPARE(echo.output(), std::string("hello\nworld\n"));
}

void PipeExecTests::testMissingProgram()
{
    PipeExec missing({ "/nonexistent/rdiff-backup", "--version" });
    QCOMPARE(missing.execute(true), EXEC_FAILED);
}

void PipeExecTests::testKilledBySignal()
{
    PipeExec suicide({ "/bin/sh", "-c", "kill -TERM $$" });
    QCOMPARE(suicide.execute(), 128 + SIGTERM);
}

void PipeExecTests::testChildGetsDefaultSignals()
{
    // an ignored SIGTERM would otherwise be inherited across exec
    auto previous = signal(SIGTERM, SIG_IGN);

    PipeExec suicide({ "/bin/sh", "-c", "kill -TERM $$; exit 7" });
    const int status = suicide.execute();

    signal(SIGTERM, previous);
    QCOMPARE(status, 128 + SIGTERM);
}

void PipeExecTests::testTestModeDoesNotRun()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const QString marker = tempDir.path() + "/ran";

    GLOBALS.test = true;
    PipeExec touch({ "/bin/sh", "-c", "touch " + marker.toStdString() });
    const int status = touch.execute();
    GLOBALS.test = false;

    QCOMPARE(status, 0);
    QVERIFY(!QFile::exists(marker));
}

void PipeExecTests::testCommandLineQuoting()
{
    PipeExec rdiff({ "rdiff-backup", "--exclude", "/tmp/*", "--verbosity", "5", "/", "/mnt/my backups" });
    QCOMPARE(rdiff.commandLine(), std::string("rdiff-backup --exclude '/tmp/*' --verbosity 5 / '/mnt/my backups'"));
}

void PipeExecTests::testSignalMaskRestored()
{
    PipeExec success({ "/bin/sh", "-c", "exit 0" });
    QCOMPARE(success.execute(), 0);

    sigset_t current;
    QCOMPARE(sigprocmask(SIG_BLOCK, nullptr, &current), 0);
    QVERIFY(!sigismember(&current, SIGINT));
    QVERIFY(!sigismember(&current, SIGQUIT));
    QVERIFY(!sigismember(&current, SIGTERM));
}

void PipeExecTests::testSignalDuringStartupReachesEngine()
{
    QTemporaryDir tempDir;
    QVERIFY(tempDir.isValid());
    const std::string pidFile = (tempDir.path() + "/engine.pid").toStdString();
    LockManager locks((tempDir.path() + "/locks").toStdString());
    const std::string marker = locks.lockPathFor("/mnt/backup");

    pid_t child = fork();
    QVERIFY(child >= 0);

    if (!child) {
        auto result = locks.acquire("/mnt/backup");
        if (!std::holds_alternative<LockHandle>(result)) {
            _exit(2);
        }
        LockGuard guard(locks, std::get<LockHandle>(result));

        // the engine signals its parent the moment it starts
        PipeExec engine({ "/bin/sh", "-c", "echo $$ > " + pidFile + "; kill -TERM $PPID; exec sleep 30" });
        engine.execute();
        _exit(3);
    }

    int status = 0;
    QCOMPARE(waitpid(child, &status, 0), child);
    QVERIFY(WIFEXITED(status));
    QCOMPARE(WEXITSTATUS(status), 1);
    QVERIFY(!QDir(QString::fromStdString(marker)).exists());

    const std::string enginePid = readFirstLine(pidFile);
    QVERIFY(!enginePid.empty());
    QVERIFY(!processRunning((pid_t)std::stol(enginePid)));
}

QTEST_MAIN(PipeExecTests)
#include "test_pipe_exec.moc"
