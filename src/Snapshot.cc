#include <algorithm>
#include <dirent.h>
#include <string.h>
#include <unistd.h>
#include <limits.h>
#include <sys/stat.h>

#include "Snapshot.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"
#include "exception.h"


string snapshotName(time_t when) {
    return SNAPSHOT_PREFIX + timeString(when);
}


string incompleteName(time_t when) {
    return INCOMPLETE_PREFIX + snapshotName(when);
}


vector<Snapshot> listSnapshots(string destination) {
    vector<Snapshot> result;
    DIR *dirPtr;
    struct dirent *dirEntry;
    struct stat statData;

    if ((dirPtr = opendir(destination.c_str())) == NULL)
        throw BGException("unable to read " + destination + errtext());

    string completePrefix = SNAPSHOT_PREFIX;
    string incompletePrefix = string(INCOMPLETE_PREFIX) + SNAPSHOT_PREFIX;

    while ((dirEntry = readdir(dirPtr)) != NULL) {
        string name = dirEntry->d_name;
        string path = slashConcat(destination, name);
        bool complete;

        if (!name.compare(0, completePrefix.length(), completePrefix))
            complete = true;
        else if (!name.compare(0, incompletePrefix.length(), incompletePrefix))
            complete = false;
        else
            continue;

        // only real directories count; "current" and strays are skipped
        if (mylstat(path, &statData) || !S_ISDIR(statData.st_mode))
            continue;

        auto timestamp = parseTimeString(name);
        if (!timestamp)
            log("unable to parse a timestamp from " + path);

        result.push_back(Snapshot(name, path, timestamp, complete));
    }
    closedir(dirPtr);

    sort(result.begin(), result.end());
    return result;
}


string currentSnapshot(string destination) {
    char target[PATH_MAX + 1];
    string link = slashConcat(destination, CURRENT_LINK);

    auto length = readlink(link.c_str(), target, sizeof(target) - 1);
    if (length < 0)
        return "";

    target[length] = 0;
    string name = target;

    // the link is relative but tolerate an absolute one
    auto slash = name.find_last_of("/");
    return (slash == string::npos ? name : name.substr(slash + 1));
}
