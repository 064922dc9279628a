
#ifndef GLOBALSDEF_H
#define GLOBALSDEF_H

#define VERSION "1.0.2"

#include "colors.h"
#include <string>
#include <sys/types.h>

/*
 Adding a commandline option vs adding a config setting.

 (A) To add a CLI option:
    (1) add a defined constant for its name #define CLI_xxxx in globalsdef.h
    (2) add the constant along with its type to options.add_options() in backupguard.cc

 (B) To add a config setting:
    (1) add a defined constant for its regex #define RE_xxxx in globalsdef.h
    (2) add an enum constant to reference it in Setting.h (order matters, add at end of list)
    (3) add a map entry between the CLI constant and the enum in Setting.cc
    (4) add it to the settings vector with its default in RunConfig::RunConfig()
    (5) add the matching CLI option per (A) so it can be overridden

 Settings are accessed as config.settings[ENUM].value or config.settings[ENUM].ivalue().
 */

#define CONF_DIR "/etc/backupguard"
#define CONF_FILE "backupguard.conf"
#define LOCK_DIR "/tmp/backupguard"

#define DFMT(x) cerr << BOLDGREEN << __FUNCTION__ << ": " << RESET << GREEN << x << RESET << endl
#define DFMTNOPREFIX(x) cerr << GREEN << x << RESET << endl

#define NOTQUIET (!GLOBALS.quiet)
#define SCREENERR(x) cerr << RED << x << RESET << endl;
#define DUP2(x,y) while (dup2(x,y) < 0 && errno == EINTR)

#define SECS_PER_DAY (60*60*24)

// snapshot and lock timestamps; always renders to the same length
#define TIME_FORMAT "%Y-%m-%dT%H:%M:%S"
#define TIME_REGEX "(\\d{4})-(\\d{2})-(\\d{2})T(\\d{2}):(\\d{2}):(\\d{2})$"

// define commandline options
#define CLI_ENGINE "engine"
#define CLI_KEEP "keep"
#define CLI_VERBOSITY "verbosity"
#define CLI_LOCKDIR "lockdir"
#define CLI_CONFIG "config"
#define CLI_NICE "nice"
#define CLI_IDLEIO "idleio"
#define CLI_NOPRUNE "noprune"
#define CLI_PRUNEFAILED "prunefailed"
#define CLI_RECLAIM "reclaim"
#define CLI_RDIFF "rdiff"
#define CLI_RSYNC "rsync"
#define CLI_UNLOCK "unlock"
#define CLI_FORCE "force"
#define CLI_TEST "test"
#define CLI_QUIET "quiet"
#define CLI_NOCOLOR "nocolor"
#define CLI_HELP "help"
#define CLI_VERSION "version"
#define CLI_DEFAULTS "defaults"
#define CLI_PATHS "paths"

// conf file regexes
#define CAPTURE_VALUE string("((?:\\s|=|:)+)(.*?)\\s*?")
#define RE_COMMENT "((?:\\s*#).*)*$"
#define RE_BLANK "^((?:\\s*#).*)*$"
#define RE_ENGINE "(engine)"
#define RE_KEEP "(keep|keep_for|keepfor)"
#define RE_VERBOSITY "(verbosity)"
#define RE_LOCKDIR "(lockdir|lock_dir|lock)"
#define RE_NICE "(nice)"
#define RE_IDLEIO "(idleio|idle_io)"
#define RE_PRUNEFAILED "(prunefailed|prune_failed)"
#define RE_RECLAIM "(reclaim)"
#define RE_RDIFF "(rdiff|rdiff_backup)"
#define RE_RSYNC "(rsync)"

using namespace std;

enum helpType { hDefaults, hOptions, hSyntax };

struct global_vars {
    unsigned int debugSelector;
    bool color;
    bool quiet;
    bool test;
    string confDir;

    // interruptLock* hold the marker paths as plain buffers so the signal
    // handler can remove them with unlink()/rmdir() only
    char interruptLock[4096];
    char interruptLockPid[4096];
    char interruptLockStarted[4096];
    volatile pid_t childPid;
};

#endif
