#include <string>
#include <iostream>
#include <unistd.h>
#include <signal.h>
#include <string.h>
#include <errno.h>
#include <sys/wait.h>
#include "util_generic.h"
#include "colors.h"
#include "globals.h"
#include "PipeExec.h"
#include "LockManager.h"
#include "exception.h"
#include "debug.h"


#define READ_END 0
#define WRITE_END 1

using namespace std;


string PipeExec::commandLine() {
    string result;

    for (auto &arg: args) {
        if (result.length())
            result += " ";

        if (!arg.length() || arg.find_first_of(" \t'\"*?$") != string::npos)
            result += "'" + arg + "'";
        else
            result += arg;
    }

    return result;
}


int PipeExec::execute(bool captureOutput) {
    int readfd[2];

    if (!args.size())
        throw BGException("no command to execute");

    if (GLOBALS.test) {
        cout << YELLOW << "test: would run " << RESET << commandLine() << endl;
        return 0;
    }

    DEBUG(D_engine) DFMT("executing [" << commandLine() << "]");

    if (captureOutput && pipe(readfd))
        throw BGException("unable to create pipe" + errtext());

    {
        // a signal between fork() and recording the pid would orphan the engine
        SignalBlocker blocker;

        if ((childPID = fork()) < 0)
            throw BGException("unable to fork for " + args[0] + errtext());

        if (!childPID) {
            // CHILD
            signal(SIGINT, SIG_DFL);
            signal(SIGQUIT, SIG_DFL);
            signal(SIGTERM, SIG_DFL);
            signal(SIGPIPE, SIG_DFL);

            sigset_t none;
            sigemptyset(&none);
            sigprocmask(SIG_SETMASK, &none, NULL);

            if (captureOutput) {
                close(readfd[READ_END]);
                DUP2(readfd[WRITE_END], STDOUT_FILENO);
                close(readfd[WRITE_END]);
            }

            vector<char*> argv;
            for (auto &arg: args)
                argv.push_back((char*)arg.c_str());
            argv.push_back(NULL);

            execvp(argv[0], argv.data());

            string msg = "unable to execute " + args[0] + errtext() + "\n";
            if (write(STDERR_FILENO, msg.c_str(), msg.length()) < 0)
                _exit(EXEC_FAILED);
            _exit(EXEC_FAILED);
        }

        // PARENT
        GLOBALS.childPid = childPID;
    }

    if (captureOutput) {
        char buffer[16 * 1024];
        ssize_t bytesRead;

        close(readfd[WRITE_END]);
        captured.clear();

        while ((bytesRead = read(readfd[READ_END], buffer, sizeof(buffer))) != 0) {
            if (bytesRead < 0) {
                if (errno == EINTR)
                    continue;
                break;
            }

            captured.append(buffer, bytesRead);
        }

        close(readfd[READ_END]);
    }

    int status;
    while (waitpid(childPID, &status, 0) < 0)
        if (errno != EINTR) {
            GLOBALS.childPid = 0;
            throw BGException("unable to wait for " + args[0] + errtext());
        }

    GLOBALS.childPid = 0;

    int result;
    if (WIFEXITED(status))
        result = WEXITSTATUS(status);
    else if (WIFSIGNALED(status))
        result = 128 + WTERMSIG(status);
    else
        result = 1;

    DEBUG(D_engine) DFMT(args[0] << " (pid " << childPID << ") exited " << result);

    if (result == EXEC_FAILED)
        log("unable to execute " + commandLine());

    return result;
}

