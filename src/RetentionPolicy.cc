#include <ctype.h>
#include <errno.h>
#include <stdlib.h>
#include <map>
#include <pcre++.h>

#include "RetentionPolicy.h"
#include "util_generic.h"
#include "exception.h"

using namespace pcrepp;

// nobody keeps backups for a thousand years; anything above is a typo
#define MAX_RETENTION ((time_t)SECS_PER_DAY * 365 * 1000)


// count * unit, refusing anything that can't be represented or is past MAX_RETENTION
static time_t scaledCount(string digits, time_t unit, string threshold) {
    errno = 0;
    long long count = strtoll(digits.c_str(), NULL, 10);

    if (errno == ERANGE || count < 0 || count > MAX_RETENTION / unit)
        throw BGException("retention '" + threshold + "' is longer than 1000 years");

    return (time_t)count * unit;
}


RetentionPolicy RetentionPolicy::parse(string threshold) {
    static const map<char, time_t> unitSeconds = {
        { 's', 1 },
        { 'm', 60 },
        { 'h', 60 * 60 },
        { 'D', SECS_PER_DAY },
        { 'W', SECS_PER_DAY * 7 },
        { 'M', SECS_PER_DAY * 30 },
        { 'Y', SECS_PER_DAY * 365 }
    };

    string trimmed = trimSpace(threshold);

    Pcre daysOnly("^(\\d+)$");
    if (daysOnly.search(trimmed)) {
        auto seconds = scaledCount(daysOnly.get_match(0), SECS_PER_DAY, threshold);
        if (!seconds)
            throw BGException("retention of zero days would prune every backup");

        return RetentionPolicy(trimmed + "D", seconds);
    }

    Pcre wholeRE("^(?:\\d+[smhDWMY])+$");
    if (!trimmed.length() || !wholeRE.search(trimmed))
        throw BGException("unable to parse retention '" + threshold + "' (expected e.g. 3M, 365D, 1Y6M)");

    time_t total = 0;
    size_t pos = 0;
    while (pos < trimmed.length()) {
        size_t digits = pos;
        while (isdigit(trimmed[digits]))
            ++digits;

        total += scaledCount(trimmed.substr(pos, digits - pos), unitSeconds.at(trimmed[digits]), threshold);
        if (total > MAX_RETENTION)
            throw BGException("retention '" + threshold + "' is longer than 1000 years");

        pos = digits + 1;
    }

    if (!total)
        throw BGException("retention of '" + threshold + "' would prune every backup");

    return RetentionPolicy(trimmed, total);
}


vector<Snapshot> RetentionPolicy::prunable(const vector<Snapshot> &snapshots, time_t now) const {
    vector<Snapshot> result;

    for (auto &snapshot: snapshots)
        if (snapshot.complete && snapshot.timestamp && isPrunable(snapshot.timestamp, now))
            result.push_back(snapshot);

    return result;
}
