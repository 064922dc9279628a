#ifndef PIPE_EXEC_H
#define PIPE_EXEC_H

#include <string>
#include <vector>

/****************************************************************
 * PipeExec
 *
 * Run one external program from an argument vector and wait for
 * it.  Its stdout and stderr pass straight through to ours unless
 * captureOutput is set, in which case stdout is collected and
 * available from output().  While the child runs its pid sits in
 * GLOBALS.childPid so a signal handler can forward signals to it.
 *
 * Examples:
 *
 * PipeExec p({"rdiff-backup", "--verbosity", "5", "/", "/mnt/backup"});
 * if (p.execute())
 *     cout << "engine failed" << endl;
 *
 * PipeExec p({"rsync", "--version"});
 * p.execute(true);
 * cout << p.output();
 *
 */

using namespace std;

// exit status reported when the program couldn't be exec'd
#define EXEC_FAILED 127


class PipeExec {
    vector<string> args;
    string captured;
    pid_t childPID;

    public:
        PipeExec(vector<string> argv) : args(argv), childPID(0) {}

        /* execute(captureOutput)
         * Fork, exec and wait.  Returns the child's exit status, 128 + signal number if it
         * was killed, or EXEC_FAILED if the program couldn't be run.  In test mode (-t) the
         * command line is printed instead and 0 is returned. */
        int execute(bool captureOutput = false);

        string output() { return captured; }
        string commandLine();
        pid_t pid() { return childPID; }
};


#endif

