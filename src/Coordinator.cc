#include <iostream>
#include <memory>

#include "Coordinator.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"
#include "exception.h"


string stateName(RunState state) {
    switch (state) {
        case STATE_IDLE:       return "Idle";
        case STATE_LOCKING:    return "Locking";
        case STATE_BACKINGUP:  return "BackingUp";
        case STATE_PRUNING:    return "Pruning";
        case STATE_RELEASING:  return "Releasing";
        case STATE_DONE:       return "Done";
        case STATE_FAILED:     return "Failed";
    }

    return "unknown";
}


Coordinator::Coordinator(LockManager &lockManager, BackupEngine &backupEngine, RetentionPolicy keep,
                         bool pruneAfterFailure, bool skipPrune) :
    locks(lockManager), engine(backupEngine), retention(keep), pruneFailed(pruneAfterFailure), noPrune(skipPrune) {

    state = STATE_IDLE;
    history.push_back(state);
}


void Coordinator::enter(RunState next) {
    DEBUG(D_backup) DFMT(stateName(state) << " -> " << stateName(next));
    state = next;
    history.push_back(state);
}


void Coordinator::fail(RunOutcome &outcome) {
    if (outcome.failedIn == STATE_IDLE)
        outcome.failedIn = state;

    outcome.exitCode = 1;
}


RunOutcome Coordinator::run(BackupRun &backupRun) {
    RunOutcome outcome;
    unique_ptr<LockGuard> guard;
    timer runTime;

    enter(STATE_LOCKING);
    {
        // nothing may interrupt between creating the marker and owning it
        SignalBlocker blocker;
        auto result = locks.acquire(backupRun.destination);

        if (holds_alternative<LockContention>(result)) {
            outcome.contention = true;
            outcome.owner = get<LockContention>(result);
            fail(outcome);

            SCREENERR(log(backupRun.destination + ": " + outcome.owner.describe()));
            enter(STATE_FAILED);
            outcome.state = state;
            return outcome;
        }

        guard.reset(new LockGuard(locks, get<LockHandle>(result)));
    }

    runTime.start();

    enter(STATE_BACKINGUP);
    if (NOTQUIET)
        cout << "Backing up '" << backupRun.source << "' to '" << backupRun.destination << "'...\n" << endl;

    try {
        outcome.backupStatus = engine.backup(backupRun);
    }
    catch (BGException &e) {
        SCREENERR(log("backup of " + backupRun.source + " failed: " + e.detail()));
        outcome.backupStatus = 1;
    }

    if (outcome.backupStatus) {
        fail(outcome);
        SCREENERR(log(engine.name() + " backup of " + backupRun.source + " to " + backupRun.destination +
            " failed with exit status " + to_string(outcome.backupStatus)));
    }

    if (noPrune) {
        DEBUG(D_prune) DFMT("pruning disabled");
    }
    else if (outcome.backupStatus && !pruneFailed) {
        DEBUG(D_prune) DFMT("skipping prune after failed backup");
    }
    else {
        enter(STATE_PRUNING);
        if (NOTQUIET)
            cout << "\nPurging old backups in '" << backupRun.destination << "'...\n" << endl;

        try {
            outcome.pruneStatus = engine.prune(backupRun.destination, retention);
        }
        catch (BGException &e) {
            SCREENERR(log("prune of " + backupRun.destination + " failed: " + e.detail()));
            outcome.pruneStatus = 1;
        }

        if (outcome.pruneStatus) {
            fail(outcome);
            SCREENERR(log(engine.name() + " prune of " + backupRun.destination + " failed with exit status " +
                to_string(outcome.pruneStatus)));
        }
    }

    enter(STATE_RELEASING);
    if (!guard->release()) {
        fail(outcome);
        SCREENERR(log("unable to release lock for " + backupRun.destination));
    }
    guard.reset();

    runTime.stop();
    enter(outcome.exitCode ? STATE_FAILED : STATE_DONE);
    outcome.state = state;

    string summary = "backup of " + backupRun.source + " to " + backupRun.destination +
        (outcome.exitCode ? " failed" : " completed") + " in " + runTime.elapsed();

    log(summary);
    if (NOTQUIET)
        cout << "\n" << (outcome.exitCode ? RED : GREEN) << summary << RESET << endl;

    return outcome;
}

