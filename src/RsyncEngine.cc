#include <iostream>
#include <unistd.h>
#include <stdio.h>

#include "RsyncEngine.h"
#include "Snapshot.h"
#include "PipeExec.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"
#include "exception.h"


bool updateCurrentLink(string destination, string snapshot) {
    string link = slashConcat(destination, CURRENT_LINK);
    string tempLink = link + ".tmp." + to_string(getpid());

    unlink(tempLink.c_str());

    // relative, so the destination can be moved without breaking it
    if (symlink(snapshot.c_str(), tempLink.c_str()))
        return false;

    if (rename(tempLink.c_str(), link.c_str())) {
        unlink(tempLink.c_str());
        return false;
    }

    return true;
}


vector<string> RsyncEngine::backupCommand(BackupRun &run, string target) {
    vector<string> command = { binary, "--itemize-changes", "--human-readable", "--recursive", "--links",
        "--perms", "--times", "--group", "--owner", "--devices", "--specials", "--executability" };

    if (run.verbosity > 5)
        command.push_back("--verbose");

    string current = currentSnapshot(run.destination);
    if (current.length())
        command.push_back("--link-dest=" + slashConcat(run.destination, current));

    // after the defaults so --no-devices etc. win
    auto ruleArgs = run.policy.rsyncArguments(run.source);
    command.insert(command.end(), ruleArgs.begin(), ruleArgs.end());

    // trailing slash: copy the contents of source, not source itself
    command.push_back(run.source == "/" ? run.source : run.source + "/");
    command.push_back(target);

    return command;
}


int RsyncEngine::backup(BackupRun &run) {
    return backupAt(run, time(NULL));
}


int RsyncEngine::backupAt(BackupRun &run, time_t when) {
    if (!GLOBALS.test && mkdirp(run.destination))
        throw BGException("unable to create " + run.destination + errtext());

    string incomplete = slashConcat(run.destination, incompleteName(when));
    string complete = slashConcat(run.destination, snapshotName(when));

    PipeExec rsync(backupCommand(run, incomplete));
    int status = rsync.execute();

    if (status) {
        log("rsync exited with " + to_string(status) + ", leaving " + incomplete);
        return status;
    }

    if (GLOBALS.test) {
        cout << YELLOW << "test: would rename " << RESET << incomplete << " to " << complete << endl;
        return 0;
    }

    DEBUG(D_backup) DFMT("marking " << complete << " complete");
    if (rename(incomplete.c_str(), complete.c_str())) {
        log("unable to rename " + incomplete + " to " + complete + errtext());
        return 1;
    }

    if (!updateCurrentLink(run.destination, snapshotName(when))) {
        log("unable to point " + slashConcat(run.destination, CURRENT_LINK) + " at " + complete + errtext());
        return 1;
    }

    return 0;
}


int RsyncEngine::prune(string destination, const RetentionPolicy &retention) {
    return pruneAt(destination, retention, time(NULL));
}


static bool removeSnapshot(Snapshot &snapshot) {
    if (GLOBALS.test) {
        cout << YELLOW << "test: would remove " << RESET << snapshot.path << endl;
        return true;
    }

    DEBUG(D_prune) DFMT("removing " << snapshot.path);
    if (!rmrf(snapshot.path)) {
        SCREENERR(log("unable to remove " + snapshot.path + errtext()));
        return false;
    }

    return true;
}


/*******************************************************************************
 * pruneAt(destination, retention, now)
 *
 * Two passes.  First every complete snapshot at or before the cutoff goes,
 * except the one "current" points to.  Then every incomplete snapshot older
 * than the newest complete one goes; a newer one may still be in use.
 * Snapshots without a readable timestamp are left alone.
 *******************************************************************************/
int RsyncEngine::pruneAt(string destination, const RetentionPolicy &retention, time_t now) {
    auto snapshots = listSnapshots(destination);
    string current = currentSnapshot(destination);
    unsigned int removed = 0;
    unsigned int failed = 0;

    DEBUG(D_prune) DFMT("cutoff " << timeString(retention.cutoff(now)) << ", current " << current);

    vector<Snapshot> kept;
    auto expired = retention.prunable(snapshots, now);

    for (auto &snapshot: snapshots) {
        bool expire = false;
        for (auto &entry: expired)
            if (entry.name == snapshot.name)
                expire = true;

        if (expire && snapshot.name == current) {
            DEBUG(D_prune) DFMT("keeping " << snapshot.name << ", it's current");
            expire = false;
        }

        if (!expire)
            kept.push_back(snapshot);
        else if (removeSnapshot(snapshot))
            ++removed;
        else
            ++failed;
    }

    time_t newest = 0;
    for (auto &snapshot: kept)
        if (snapshot.complete && snapshot.timestamp > newest)
            newest = snapshot.timestamp;

    unsigned int abandoned = 0;
    if (newest) {
        for (auto &snapshot: kept)
            if (!snapshot.complete && snapshot.timestamp && snapshot.timestamp < newest) {
                if (removeSnapshot(snapshot))
                    ++abandoned;
                else
                    ++failed;
            }
    }
    else
        DEBUG(D_prune) DFMT("no complete snapshot in " << destination << ", leaving incomplete ones");

    string summary = "removed " + plural(removed, "old backup") + " and " + plural(abandoned, "incomplete backup") +
        " from " + destination;

    if (!GLOBALS.test)
        log(summary);

    if (NOTQUIET)
        cout << summary << endl;

    return failed ? 1 : 0;
}

