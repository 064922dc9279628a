
#ifndef RDIFFENGINE_H
#define RDIFFENGINE_H

#include <string>
#include <vector>

#include "BackupEngine.h"

using namespace std;


/****************************************************************
 * RdiffEngine
 *
 * rdiff-backup keeps a mirror of the latest state plus reverse
 * diffs in rdiff-backup-data/, and does its own pruning with
 * --remove-older-than.
 ****************************************************************/

class RdiffEngine : public BackupEngine {
    string binary;
    int verbosity;

    public:
        RdiffEngine(string bin = "rdiff-backup", int verbose = 5) : binary(bin), verbosity(verbose) {}

        string name() { return "rdiff-backup"; }
        int backup(BackupRun &run);
        int prune(string destination, const RetentionPolicy &retention);

        vector<string> backupCommand(BackupRun &run);
        vector<string> pruneCommand(string destination, const RetentionPolicy &retention);
};

#endif

