
#ifndef RETENTIONPOLICY_H
#define RETENTIONPOLICY_H

#include <string>
#include <vector>
#include <time.h>

#include "Snapshot.h"

using namespace std;


/****************************************************************
 * RetentionPolicy
 *
 * A single age threshold.  Snapshots dated at or before
 * (now - threshold) are prunable.  The threshold is written in
 * rdiff-backup's time notation so it can be handed to the engine
 * verbatim:
 *
 *     30s  15m  12h  10D  2W  3M  1Y  1Y6M
 *
 * with M = 30 days, W = 7 days and Y = 365 days.  A bare number
 * is a count of days.
 ****************************************************************/

class RetentionPolicy {
    string text;
    time_t seconds;

    RetentionPolicy(string t, time_t s) : text(t), seconds(s) {}

    public:
        static RetentionPolicy parse(string threshold);

        string engineNotation() const { return text; }
        time_t thresholdSeconds() const { return seconds; }

        time_t cutoff(time_t now) const { return now - seconds; }
        bool isPrunable(time_t snapshotTime, time_t now) const { return snapshotTime <= cutoff(now); }

        vector<Snapshot> prunable(const vector<Snapshot> &snapshots, time_t now) const;
};

#endif
