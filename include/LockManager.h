
#ifndef LOCKMANAGER_H
#define LOCKMANAGER_H

#include <string>
#include <variant>
#include <signal.h>
#include <sys/types.h>
#include <time.h>

using namespace std;

#define LOCK_SUFFIX ".lock"
#define LOCK_PID_FILE "pid"
#define LOCK_STARTED_FILE "started"


// a marker this process created and owns
struct LockHandle {
    string path;
    pid_t pid;
    time_t started;

    LockHandle(string p = "", pid_t o = 0, time_t s = 0) : path(p), pid(o), started(s) {}
};


// someone else's marker; ownerPid is 0 and startTime blank when they can't be read
struct LockContention {
    string path;
    pid_t ownerPid;
    string startTime;

    LockContention(string p = "", pid_t o = 0, string s = "") : path(p), ownerPid(o), startTime(s) {}
    string describe() const;
};


enum UnlockResult { UNLOCK_NOT_LOCKED, UNLOCK_REMOVED, UNLOCK_OWNER_RUNNING, UNLOCK_FAILED };


/****************************************************************
 * LockManager
 *
 * At most one run per destination.  The lock is the directory
 * <lockdir>/<md5 of destination>.lock and whoever's mkdir() of it
 * succeeds holds it.  The winner records its pid and start time
 * inside; a loser reads them back for its error message.  Nothing
 * ever waits on, retries or expires a lock on its own.
 ****************************************************************/

class LockManager {
    string lockDir;
    bool reclaimStale;

    public:
        LockManager(string dir, bool reclaim = false) : lockDir(dir), reclaimStale(reclaim) {}

        string lockPathFor(string destination);

        /* acquire(destination)
         * Returns a LockHandle on success or a LockContention describing the current owner.
         * Unexpected failures (e.g. permissions on the lock directory) throw BGException. */
        variant<LockHandle, LockContention> acquire(string destination);

        // remove the marker; only the process that created it may
        bool release(LockHandle &handle);

        // what's recorded in an existing marker
        LockContention inspect(string markerPath);

        // operator removal of a stale marker; force removes it even when the owner still runs
        UnlockResult unlock(string destination, bool force, LockContention &owner);

        // remove a marker started before the current boot; true if one was removed.
        // Concurrent reclaimers are serialized on the lock directory.
        bool reclaim(string destination);
};


/****************************************************************
 * LockGuard
 *
 * Scoped ownership of an acquired lock.  While it lives SIGINT,
 * SIGQUIT and SIGTERM are caught; the handler passes the signal on
 * to any running engine, removes the marker and exits 1.  Leaving
 * scope releases the lock and puts the old handlers back.
 ****************************************************************/

class LockGuard {
    LockManager &manager;
    LockHandle handle;
    bool released;
    struct sigaction oldInt;
    struct sigaction oldQuit;
    struct sigaction oldTerm;

    public:
        LockGuard(LockManager &mgr, LockHandle lock);
        ~LockGuard();

        LockGuard(const LockGuard&) = delete;
        LockGuard& operator=(const LockGuard&) = delete;

        bool release();
        const LockHandle& getHandle() { return handle; }
};


// holds off SIGINT, SIGQUIT and SIGTERM for its lifetime; pending ones arrive afterwards
class SignalBlocker {
    sigset_t previous;

    public:
        SignalBlocker();
        ~SignalBlocker();
};


// async-signal-safe removal of the marker named in GLOBALS.interruptLock
void removeInterruptLock();

void sigTermHandler(int sigNum);

#endif

