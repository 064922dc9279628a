
#ifndef RSYNCENGINE_H
#define RSYNCENGINE_H

#include <string>
#include <vector>
#include <time.h>

#include "BackupEngine.h"

using namespace std;


/****************************************************************
 * RsyncEngine
 *
 * Hard-linked snapshot directories.  Each run transfers into
 * incomplete-backup-<time> with --link-dest pointing at the
 * previous snapshot so unchanged files cost nothing.  Once rsync
 * succeeds the directory is renamed to backup-<time> and the
 * relative "current" link is moved to it.  Pruning is done here
 * rather than by rsync.
 ****************************************************************/

class RsyncEngine : public BackupEngine {
    string binary;
    int verbosity;

    public:
        RsyncEngine(string bin = "rsync", int verbose = 5) : binary(bin), verbosity(verbose) {}

        string name() { return "rsync"; }
        int backup(BackupRun &run);
        int prune(string destination, const RetentionPolicy &retention);

        int backupAt(BackupRun &run, time_t when);
        int pruneAt(string destination, const RetentionPolicy &retention, time_t now);

        vector<string> backupCommand(BackupRun &run, string target);
};


// point destination/current at the named snapshot; replaces any existing link
bool updateCurrentLink(string destination, string snapshot);

#endif

