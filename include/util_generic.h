
#ifndef UTIL_GENERIC
#define UTIL_GENERIC

#include <string>
#include <vector>
#include <time.h>
#include <sys/time.h>
#include <sys/stat.h>
#include <iostream>

#include "pcre++.h"
#include "globals.h"

using namespace pcrepp;
using namespace std;


#define mytimersub(tvp, uvp, vvp)                         \
    do {                                                  \
        (vvp)->tv_sec = (tvp)->tv_sec - (uvp)->tv_sec;    \
        (vvp)->tv_usec = (tvp)->tv_usec - (uvp)->tv_usec; \
        if ((vvp)->tv_usec < 0) {                         \
            (vvp)->tv_sec--;                              \
            (vvp)->tv_usec += 1000000;                    \
        }                                                 \
    } while (0)


string cppgetenv(string variable);

string plural(size_t number, string text);

// log to syslog and hand the message back so it can be shown as well
string log(string message);

string timeDiffSingle(struct timeval duration, int maxUnits = 2);

string perlJoin(string delimiter, vector<string> items);

string slashConcat(string str1, string str2, string str3 = "");

string MD5string(string data);

int mkdirp(string dir, mode_t mode = 0775);

string trimSpace(const string &s);

bool str2bool(string text);


// render a time as TIME_FORMAT in local time
string timeString(time_t when);

// parse the trailing TIME_FORMAT stamp of a name; 0 when there isn't one
time_t parseTimeString(string text);

time_t systemBootTime();

bool processRunning(pid_t pid);

bool rmrf(string directory, bool includeTopDir = true);

string readFirstLine(string filename);

bool writeFileAtomic(string filename, string data);

int mylstat(string filename, struct stat *buf);
int mystat(string filename, struct stat *buf);

string errtext(bool format = true);

// true if child lies at or below parent (both absolute, normalized)
bool isPathWithin(string child, string parent);


class timer {
    struct timeval startTime;
    struct timeval endTime;
    struct timeval spentTime;

    public:
        void start() { gettimeofday(&startTime, NULL); }
        void stop() {
            gettimeofday(&endTime, NULL);
            mytimersub(&endTime, &startTime, &spentTime);
        }

        time_t seconds() { return (spentTime.tv_sec); }
        string elapsed() { return timeDiffSingle(spentTime, 3); }

    timer() { startTime.tv_sec = startTime.tv_usec = endTime.tv_sec = endTime.tv_usec = spentTime.tv_sec = spentTime.tv_usec = 0; }
};


struct pdCallbackData {
    string filename;
    struct stat statData;
};

/* processDirectory(directory, callback, includeTopDir)
 * Walk a directory tree calling callback on every entry.  Files get the callback as they're
 * found; directories get it after everything inside them (depth-first) so callers can delete
 * as they go.  A callback returning false stops the walk.  Returns a blank string on success. */
string processDirectory(string directory, bool (*callback)(pdCallbackData&), bool includeTopDir = false);

#endif
