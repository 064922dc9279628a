
#ifndef SNAPSHOT_H
#define SNAPSHOT_H

#include <string>
#include <vector>
#include <time.h>

using namespace std;

#define SNAPSHOT_PREFIX "backup-"
#define INCOMPLETE_PREFIX "incomplete-"
#define CURRENT_LINK "current"


/* One dated backup directory under a destination root.  Incomplete
 * snapshots keep the INCOMPLETE_PREFIX until their transfer finishes. */
struct Snapshot {
    string name;
    string path;
    time_t timestamp;
    bool complete;

    Snapshot(string n = "", string p = "", time_t t = 0, bool c = true) : name(n), path(p), timestamp(t), complete(c) {}

    friend bool operator<(const Snapshot &a, const Snapshot &b) { return a.timestamp < b.timestamp || (a.timestamp == b.timestamp && a.name < b.name); }
};


string snapshotName(time_t when);
string incompleteName(time_t when);

// backup-* and incomplete-backup-* directories of a destination, oldest first
vector<Snapshot> listSnapshots(string destination);

// name of the snapshot the "current" link points to, blank if none
string currentSnapshot(string destination);

#endif
