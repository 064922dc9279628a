
#include "Setting.h"
#include "globals.h"
#include "exception.h"

map<string, int>settingMap =
{{ CLI_ENGINE, sEngine },
    { CLI_KEEP, sKeep },
    { CLI_VERBOSITY, sVerbosity },
    { CLI_LOCKDIR, sLockDir },
    { CLI_NICE, sNice },
    { CLI_IDLEIO, sIdleIO },
    { CLI_PRUNEFAILED, sPruneFailed },
    { CLI_RECLAIM, sReclaim },
    { CLI_RDIFF, sRdiffBinary },
    { CLI_RSYNC, sRsyncBinary }
    };


Setting::Setting(string name, string pattern, enum SetType setType, string defaultVal) {
    regex = Pcre("^\\s*" + pattern + CAPTURE_VALUE + RE_COMMENT);
    display_name = name;
    data_type = setType;
    defaultValue = defaultVal;
    value = defaultValue;
    seen = false;
}


int Setting::ivalue() {
    try {
        size_t used;
        int result = stoi(value, &used);

        if (trimSpace(value.substr(used)).length())
            throw BGException("trailing characters");

        return result;
    }
    catch (exception &e) {
        throw BGException("setting '" + display_name + "' requires a number, not '" + value + "'");
    }
}


string Setting::confPrint() {
    bool isDef = value == defaultValue;
    string shown = data_type == BOOL ? (str2bool(value) ? "true" : "false") : value;

    return display_name + ": " + shown + (isDef ? "  # default" : "");
}
