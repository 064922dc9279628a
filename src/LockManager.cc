#include <iostream>
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <string.h>
#include <errno.h>
#include <sys/stat.h>
#include <sys/wait.h>

#include "LockManager.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"
#include "exception.h"


string LockContention::describe() const {
    return "backup already in progress (pid " + (ownerPid ? to_string(ownerPid) : string("unknown")) +
        ", started " + (startTime.length() ? startTime : string("unknown")) + "); lock " + path;
}


string LockManager::lockPathFor(string destination) {
    return slashConcat(lockDir, MD5string(destination) + LOCK_SUFFIX);
}


LockContention LockManager::inspect(string markerPath) {
    string pidText = readFirstLine(slashConcat(markerPath, LOCK_PID_FILE));
    pid_t owner = 0;

    if (pidText.length() && pidText.find_first_not_of("0123456789") == string::npos)
        owner = (pid_t)stol(pidText);

    return LockContention(markerPath, owner, readFirstLine(slashConcat(markerPath, LOCK_STARTED_FILE)));
}


variant<LockHandle, LockContention> LockManager::acquire(string destination) {
    string path = lockPathFor(destination);
    DEBUG(D_lock) DFMT("lock for " << destination << " is " << path);

    if (reclaimStale)
        reclaim(destination);

    int result = mkdir(path.c_str(), 0700);
    if (result && errno == ENOENT) {
        if (mkdirp(lockDir))
            throw BGException("unable to create lock directory " + lockDir + errtext());

        result = mkdir(path.c_str(), 0700);
    }

    if (result) {
        if (errno == EEXIST) {
            auto owner = inspect(path);
            DEBUG(D_lock) DFMT("contention: " << owner.describe());
            return owner;
        }

        throw BGException("unable to create lock " + path + errtext());
    }

    LockHandle handle(path, getpid(), time(NULL));

    if (!writeFileAtomic(slashConcat(path, LOCK_PID_FILE), to_string(handle.pid)) ||
        !writeFileAtomic(slashConcat(path, LOCK_STARTED_FILE), timeString(handle.started))) {

        string error = errtext();
        rmrf(path);
        throw BGException("unable to record owner in lock " + path + error);
    }

    DEBUG(D_lock) DFMT("acquired " << path << " for pid " << handle.pid);
    return handle;
}


bool LockManager::release(LockHandle &handle) {
    if (!handle.path.length())
        return true;

    if (handle.pid != getpid()) {
        DEBUG(D_lock) DFMT("not releasing " << handle.path << ", owned by pid " << handle.pid);
        return false;
    }

    if (!rmrf(handle.path)) {
        log("unable to remove lock " + handle.path + errtext());
        return false;
    }

    DEBUG(D_lock) DFMT("released " << handle.path);
    handle.path = "";
    return true;
}


UnlockResult LockManager::unlock(string destination, bool force, LockContention &owner) {
    string path = lockPathFor(destination);
    struct stat statData;

    if (mylstat(path, &statData))
        return UNLOCK_NOT_LOCKED;

    owner = inspect(path);
    if (processRunning(owner.ownerPid) && !force)
        return UNLOCK_OWNER_RUNNING;

    if (!rmrf(path))
        return UNLOCK_FAILED;

    log("removed lock " + path + " for " + destination + " (pid " + to_string(owner.ownerPid) + ")");
    return UNLOCK_REMOVED;
}


static bool startedBeforeBoot(string startTime) {
    auto started = parseTimeString(startTime);
    auto booted = systemBootTime();

    return (started && booted && started < booted);
}


/*
 * reclaim(destination)
 * Reclaimers take turns under an flock() on the lock directory and judge the
 * marker afresh once they have it.  A stale marker only goes away under that
 * lock, so while one is being judged nobody's mkdir() can succeed and no
 * other reclaimer can remove a marker that has since been replaced.  The
 * kernel drops the flock if the holder dies.
 */
bool LockManager::reclaim(string destination) {
    string path = lockPathFor(destination);
    struct stat statData;

    if (mylstat(path, &statData))
        return false;

    int dirFd = open(lockDir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd < 0) {
        log("unable to open " + lockDir + " to reclaim locks" + errtext());
        return false;
    }

    int result;
    while ((result = flock(dirFd, LOCK_EX)) && errno == EINTR);
    if (result) {
        log("unable to lock " + lockDir + " to reclaim locks" + errtext());
        close(dirFd);
        return false;
    }

    bool reclaimed = false;
    auto owner = inspect(path);

    if (mylstat(path, &statData) || !startedBeforeBoot(owner.startTime)) {
        DEBUG(D_lock) DFMT("keeping " << path << " (started " << owner.startTime << ")");
    }
    else if (!rmrf(path))
        log("unable to reclaim stale lock " + path + errtext());
    else {
        log("reclaimed lock " + path + " left from before the last boot (started " + owner.startTime + ")");
        reclaimed = true;
    }

    close(dirFd);
    return reclaimed;
}


void removeInterruptLock() {
    if (GLOBALS.interruptLock[0]) {
        unlink(GLOBALS.interruptLockPid);
        unlink(GLOBALS.interruptLockStarted);
        rmdir(GLOBALS.interruptLock);
        GLOBALS.interruptLock[0] = 0;
    }
}


/*
 * sigTermHandler(sig)
 * Signals (sig > 0) take an async-signal-safe path: pass the signal to the
 * engine, wait for it, drop the marker and _exit.  Called with -1 on a fatal
 * error from normal code.
 */
void sigTermHandler(int sig) {
    if (sig > 0) {
        const char msg[] = "\ninterrupted: aborting backup, removing lock\n";
        [[maybe_unused]] auto written = write(STDERR_FILENO, msg, sizeof(msg) - 1);

        pid_t child = GLOBALS.childPid;
        if (child > 0) {
            kill(child, sig);
            while (waitpid(child, NULL, 0) < 0 && errno == EINTR);
        }

        removeInterruptLock();
        _exit(1);
    }

    log("operation aborted on error" + (GLOBALS.interruptLock[0] ? string(", removing lock ") + GLOBALS.interruptLock : string("")));
    removeInterruptLock();
    exit(1);
}


static void copyPath(char *target, string source) {
    strncpy(target, source.c_str(), sizeof(GLOBALS.interruptLock) - 1);
    target[sizeof(GLOBALS.interruptLock) - 1] = 0;
}


LockGuard::LockGuard(LockManager &mgr, LockHandle lock) : manager(mgr), handle(lock), released(false) {
    // the handler needs room for the longest of the three names
    if (slashConcat(handle.path, LOCK_STARTED_FILE).length() >= sizeof(GLOBALS.interruptLock)) {
        manager.release(handle);
        throw BGException("lock path too long: " + handle.path);
    }

    copyPath(GLOBALS.interruptLockPid, slashConcat(handle.path, LOCK_PID_FILE));
    copyPath(GLOBALS.interruptLockStarted, slashConcat(handle.path, LOCK_STARTED_FILE));
    copyPath(GLOBALS.interruptLock, handle.path);

    struct sigaction action;
    memset(&action, 0, sizeof(action));
    action.sa_handler = sigTermHandler;
    sigemptyset(&action.sa_mask);
    sigaddset(&action.sa_mask, SIGINT);
    sigaddset(&action.sa_mask, SIGQUIT);
    sigaddset(&action.sa_mask, SIGTERM);

    sigaction(SIGINT, &action, &oldInt);
    sigaction(SIGQUIT, &action, &oldQuit);
    sigaction(SIGTERM, &action, &oldTerm);

    DEBUG(D_signal) DFMT("handlers installed for " << handle.path);
}


LockGuard::~LockGuard() {
    release();

    sigaction(SIGINT, &oldInt, NULL);
    sigaction(SIGQUIT, &oldQuit, NULL);
    sigaction(SIGTERM, &oldTerm, NULL);

    DEBUG(D_signal) DFMT("handlers restored");
}


bool LockGuard::release() {
    if (released)
        return true;

    released = true;
    bool success = manager.release(handle);
    GLOBALS.interruptLock[0] = 0;
    return success;
}


SignalBlocker::SignalBlocker() {
    sigset_t blocked;
    sigemptyset(&blocked);
    sigaddset(&blocked, SIGINT);
    sigaddset(&blocked, SIGQUIT);
    sigaddset(&blocked, SIGTERM);
    sigprocmask(SIG_BLOCK, &blocked, &previous);
}


SignalBlocker::~SignalBlocker() {
    sigprocmask(SIG_SETMASK, &previous, NULL);
}

