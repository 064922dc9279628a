#include <fstream>
#include <sstream>
#include <sys/stat.h>
#include <unistd.h>
#include <pcre++.h>

#include "RunConfig.h"
#include "RetentionPolicy.h"
#include "Setting.h"
#include "util_generic.h"
#include "globals.h"
#include "colors.h"
#include "debug.h"
#include "exception.h"

using namespace pcrepp;


RunConfig::RunConfig() {
    config_filename = "";
    source = "/";
    destination = "";

    // *** order *** of these inserts matter because they're accessed by position via the SetSpecifier enum
    settings.insert(settings.end(), Setting(CLI_ENGINE, RE_ENGINE, STRING, "rdiff"));
    settings.insert(settings.end(), Setting(CLI_KEEP, RE_KEEP, DURATION, "3M"));
    settings.insert(settings.end(), Setting(CLI_VERBOSITY, RE_VERBOSITY, INT, "5"));
    settings.insert(settings.end(), Setting(CLI_LOCKDIR, RE_LOCKDIR, STRING, LOCK_DIR));
    settings.insert(settings.end(), Setting(CLI_NICE, RE_NICE, INT, "19"));
    settings.insert(settings.end(), Setting(CLI_IDLEIO, RE_IDLEIO, BOOL, "true"));
    settings.insert(settings.end(), Setting(CLI_PRUNEFAILED, RE_PRUNEFAILED, BOOL, "true"));
    settings.insert(settings.end(), Setting(CLI_RECLAIM, RE_RECLAIM, BOOL, "false"));
    settings.insert(settings.end(), Setting(CLI_RDIFF, RE_RDIFF, STRING, "rdiff-backup"));
    settings.insert(settings.end(), Setting(CLI_RSYNC, RE_RSYNC, STRING, "rsync"));
}


/*******************************************************************************
 * loadConfig(filename)
 *
 * Read "key: value" lines from a config file into the settings.  Blank lines
 * and # comments are skipped; anything else that doesn't match a setting is
 * an error.  Returns false if the file can't be opened.
 *******************************************************************************/
bool RunConfig::loadConfig(string filename) {
    ifstream configFile;
    Pcre reBlank(RE_BLANK);
    string dataLine;
    unsigned int line = 0;

    configFile.open(filename);
    if (!configFile.is_open())
        return false;

    config_filename = filename;

    while (getline(configFile, dataLine)) {
        ++line;

        if (reBlank.search(dataLine))
            continue;

        bool identified = false;
        for (auto &setting: settings) {
            if (setting.regex.search(dataLine) && setting.regex.matches() > 2) {
                setting.value = trimSpace(setting.regex.get_match(2));
                setting.seen = identified = true;

                DEBUG(D_config) DFMT(filename << ":" << line << " " << setting.display_name << " = " << setting.value);
                break;
            }
        }

        if (!identified)
            throw BGException("unknown setting on line " + to_string(line) + " of " + filename, trimSpace(dataLine));
    }

    configFile.close();
    return true;
}


void RunConfig::applyEnvironment() {
    string temp = cppgetenv("BG_LOCKDIR");

    if (temp.length()) {
        settings[sLockDir].value = temp;
        DEBUG(D_config) DFMT("lock directory from BG_LOCKDIR: " << temp);
    }
}


/*******************************************************************************
 * setPaths(paths)
 *
 * One path is the destination of a whole-system backup; two are source and
 * destination.  Both are made absolute and normalized.
 *******************************************************************************/
void RunConfig::setPaths(vector<string> paths) {
    if (paths.size() < 1 || paths.size() > 2)
        throw BGException("expected <destination> or <source> <destination>");

    auto normalize = [](string path) {
        if (!path.length())
            throw BGException("empty path given");

        if (path[0] != '/') {
            char cwd[4096];
            if (getcwd(cwd, sizeof(cwd)) == NULL)
                throw BGException("unable to determine the current directory" + errtext());
            path = slashConcat(cwd, path);
        }

        // collapse "//", "/./" and "/../"
        vector<string> parts;
        string part;
        stringstream tokenizer(path);
        while (getline(tokenizer, part, '/')) {
            if (!part.length() || part == ".")
                continue;
            if (part == "..") {
                if (parts.size())
                    parts.pop_back();
                continue;
            }
            parts.push_back(part);
        }

        return "/" + perlJoin("/", parts);
    };

    source = paths.size() == 2 ? normalize(paths[0]) : "/";
    destination = normalize(paths.back());
}


void RunConfig::validate() {
    engine();
    RetentionPolicy::parse(settings[sKeep].value);

    Pcre boolRE("^\\s*(t|true|y|yes|1|on|f|false|n|no|0|off)?\\s*$", "i");
    for (auto &setting: settings)
        if (setting.data_type == BOOL && !boolRE.search(setting.value))
            throw BGException("setting '" + setting.display_name + "' requires true or false, not '" + setting.value + "'");

    auto verbosity = settings[sVerbosity].ivalue();
    if (verbosity < 0 || verbosity > 9)
        throw BGException("verbosity must be between 0 and 9, not " + settings[sVerbosity].value);

    auto niceValue = settings[sNice].ivalue();
    if (niceValue < -20 || niceValue > 19)
        throw BGException("nice must be between -20 and 19, not " + settings[sNice].value);

    if (!settings[sLockDir].value.length() || settings[sLockDir].value[0] != '/')
        throw BGException("lock directory must be an absolute path, not '" + settings[sLockDir].value + "'");

    if (destination == "/")
        throw BGException("refusing to use / as the backup destination");

    if (source == destination)
        throw BGException("source and destination are both " + source);
}


EngineType RunConfig::engine() {
    string name = trimSpace(settings[sEngine].value);

    if (name == "rdiff" || name == "rdiff-backup")
        return ENGINE_RDIFF;

    if (name == "rsync")
        return ENGINE_RSYNC;

    throw BGException("unknown engine '" + name + "' (expected rdiff or rsync)");
}


string RunConfig::engineBinary() {
    return (engine() == ENGINE_RSYNC ? settings[sRsyncBinary].value : settings[sRdiffBinary].value);
}


void RunConfig::fullDump() {
    DFMT("config file: " << (config_filename.length() ? config_filename : "(none)"));
    DFMT("source: " << source);
    DFMT("destination: " << destination);

    for (auto &setting: settings)
        DFMTNOPREFIX("\t" << setting.confPrint());
}
