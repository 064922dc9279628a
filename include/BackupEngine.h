
#ifndef BACKUPENGINE_H
#define BACKUPENGINE_H

#include <string>
#include <memory>

#include "ExclusionPolicy.h"
#include "RetentionPolicy.h"

using namespace std;


// everything one invocation needs to make a backup
struct BackupRun {
    string source;
    string destination;
    ExclusionPolicy policy;
    int verbosity;

    BackupRun(string s, string d, ExclusionPolicy p, int v) : source(s), destination(d), policy(p), verbosity(v) {}
};


/****************************************************************
 * BackupEngine
 *
 * The program that actually moves the bytes.  Both calls block
 * until the engine is finished and return its exit status; zero
 * is success.  Engine output goes straight to the terminal.
 ****************************************************************/

class BackupEngine {
    public:
        virtual ~BackupEngine() {}

        virtual string name() = 0;
        virtual int backup(BackupRun &run) = 0;
        virtual int prune(string destination, const RetentionPolicy &retention) = 0;
};


class RunConfig;

// the engine selected by config, ready to run
unique_ptr<BackupEngine> makeEngine(RunConfig &config);

#endif

