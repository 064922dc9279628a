
#ifndef COORDINATOR_H
#define COORDINATOR_H

#include <string>
#include <vector>

#include "BackupEngine.h"
#include "LockManager.h"
#include "RetentionPolicy.h"

using namespace std;


enum RunState { STATE_IDLE, STATE_LOCKING, STATE_BACKINGUP, STATE_PRUNING, STATE_RELEASING, STATE_DONE, STATE_FAILED };

string stateName(RunState state);

#define NOT_RUN -1


struct RunOutcome {
    RunState state;             // STATE_DONE or STATE_FAILED
    RunState failedIn;          // first phase that failed, STATE_IDLE if none
    int backupStatus;           // engine exit status or NOT_RUN
    int pruneStatus;
    bool contention;
    LockContention owner;       // set on contention
    int exitCode;

    RunOutcome() : state(STATE_IDLE), failedIn(STATE_IDLE), backupStatus(NOT_RUN), pruneStatus(NOT_RUN),
                   contention(false), exitCode(0) {}
};


/****************************************************************
 * Coordinator
 *
 * Drives one run:  Idle -> Locking -> BackingUp -> Pruning ->
 * Releasing -> Done, or Failed.  Contention fails straight out of
 * Locking without touching anything.  Once the lock is held it's
 * released on every path out, including signals.
 ****************************************************************/

class Coordinator {
    LockManager &locks;
    BackupEngine &engine;
    RetentionPolicy retention;
    bool pruneFailed;
    bool noPrune;
    RunState state;
    vector<RunState> history;

    void enter(RunState next);
    void fail(RunOutcome &outcome);

    public:
        Coordinator(LockManager &lockManager, BackupEngine &backupEngine, RetentionPolicy keep,
                    bool pruneAfterFailure = true, bool skipPrune = false);

        RunOutcome run(BackupRun &backupRun);

        RunState getState() { return state; }
        const vector<RunState>& transitions() { return history; }
};

#endif

