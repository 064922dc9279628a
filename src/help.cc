#include <iostream>
#include <string>
#include "help.h"
#include "RunConfig.h"
#include "globals.h"
#include "colors.h"
#include "util_generic.h"


using namespace std;

void showHelp(enum helpType kind) {
    switch (kind) {
        case hDefaults: {
            RunConfig config;
            cout << "Configuration defaults:" << endl;

            char buffer[200];
            for (auto cfg: config.settings) {
                snprintf(buffer, sizeof(buffer), "   %-15s %s", cfg.display_name.c_str(), cfg.value.c_str());
                cout << buffer << endl;
            }
            break;
        }

        case hOptions: {
            string helpText = "backup [options] <destination>\nbackup [options] <source> <destination>\n\n"
            + string(BOLDBLUE) + "BACKUP" + string(RESET) + "\n"
            + "   -e, --engine [e]    Backup engine: rdiff (rdiff-backup, the default) or rsync (hard-linked snapshots).\n"
            + "   -V, --verbosity [n] Engine verbosity, 0-9 (default 5).\n"
            + "   --rdiff [path]      rdiff-backup binary to run.\n"
            + "   --rsync [path]      rsync binary to run.\n"
            + "   -t, --test          Test mode; show the engine commands without running them.\n"
            + "\n" + string(BOLDBLUE) + "PRUNING\n" + RESET
            + "   -k, --keep [time]   Remove backups older than this: 3M, 365D, 2W, 1Y6M or a number of days (default 3M).\n"
            + "   --noprune           Don't prune after the backup.\n"
            + "   --prunefailed [b]   Prune even when the backup failed (default true).\n"
            + "\n" + string(BOLDBLUE) + "LOCKING\n" + RESET
            + "   -l, --lockdir [dir] Where lock markers live (default " + LOCK_DIR + ", or $BG_LOCKDIR).\n"
            + "   --reclaim [b]       Remove locks left over from before the last reboot (default false).\n"
            + "   --unlock            Remove the lock for <destination> if its owner is no longer running.\n"
            + "   --force             With --unlock, remove the lock even if its owner is still running.\n"
            + "\n" + string(BOLDBLUE) + "OTHER\n" + RESET
            + "   -c, --config [file] Config file (default " + CONF_DIR + "/" + CONF_FILE + ", or $BG_CONFDIR).\n"
            + "   --nice [n]          CPU nice value (default 19).\n"
            + "   --idleio [b]        Use the idle IO scheduling class (default true).\n"
            + "   --defaults          Show the default settings.\n"
            + "   -q, --quiet         Quiet mode; errors only.\n"
            + "   --nocolor           Disable color.\n"
            + "   -v[=+sel-sel]       Debugging output; selectors are backup config engine filter lock prune signal.\n"
            + "   --vv                All debugging output.\n"
            + "   --version           Show the version.\n";

            cout << helpText;
        }

        break;

        case hSyntax:
        default:
            cout << R"END(backup takes an incremental backup of a directory tree (the whole system by
default) and then prunes backups older than the retention period.  Only one
backup per destination runs at a time.

    • Use "backup --help" for options.)END" << endl;
        break;
    }
}
