/*
 * Copyright (C) 2023 Rick Ennis
 * This file is part of backupguard.
 *
 * backupguard is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * backupguard is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with backupguard.  If not, see <http://www.gnu.org/licenses/>.
 *
 *
 *  backupguard
 *
 *  backupguard takes incremental, versioned backups of a filesystem tree and
 *  prunes the ones that have aged out.  The byte moving is done by an external
 *  engine (rdiff-backup or rsync); backupguard supplies:
 *
 *  1. Locking
 *
 *     Only one backup per destination runs at a time.  A second invocation
 *     reports who holds the lock and exits 1 without touching anything.
 *     The lock is released on every way out, including SIGINT/SIGQUIT/SIGTERM.
 *
 *  2. Selection
 *
 *     A fixed, ordered list of include/exclude rules keeps caches, temp
 *     directories, pseudo filesystems and other mounts out of the backup.
 *
 *  3. Pruning
 *
 *     After each backup, snapshots older than the retention period
 *     (3 months by default) are deleted.
 */

#include <signal.h>
#include <stdlib.h>
#include <unistd.h>
#include <syslog.h>
#include <sys/time.h>
#include <sys/resource.h>
#include <sys/syscall.h>

#include <iostream>

#include "cxxopts.hpp"
#include "globals.h"
#include "colors.h"
#include "debug.h"
#include "exception.h"
#include "help.h"
#include "util_generic.h"
#include "RunConfig.h"
#include "ExclusionPolicy.h"
#include "RetentionPolicy.h"
#include "LockManager.h"
#include "BackupEngine.h"
#include "Coordinator.h"

using namespace std;

#ifndef IOPRIO_CLASS_IDLE
#define IOPRIO_CLASS_SHIFT 13
#define IOPRIO_CLASS_IDLE 3
#define IOPRIO_WHO_PROCESS 1
#define IOPRIO_PRIO_VALUE(class, data) (((class) << IOPRIO_CLASS_SHIFT) | (data))
#endif


// descriptive function name for exit
void cleanupAndExitOnError() {
    sigTermHandler(-1);
}


/*******************************************************************************
 * lowerPriority(config)
 *
 * Backups run in the background of a live system, so drop to the configured
 * nice value and the idle IO class.  Failure to do either is only logged.
 *******************************************************************************/
void lowerPriority(RunConfig &config) {
    auto niceValue = config.settings[sNice].ivalue();

    if (setpriority(PRIO_PROCESS, 0, niceValue))
        log("unable to set nice value to " + to_string(niceValue) + errtext());
    else
        DEBUG(D_backup) DFMT("nice " << niceValue);

    if (config.settings[sIdleIO].bvalue()) {
        if (syscall(SYS_ioprio_set, IOPRIO_WHO_PROCESS, 0, IOPRIO_PRIO_VALUE(IOPRIO_CLASS_IDLE, 0)))
            log("unable to switch to the idle IO class" + errtext());
        else
            DEBUG(D_backup) DFMT("idle IO class");
    }
}


/*******************************************************************************
 * unlockDestination(config, force)
 *
 * Operator removal of a lock left behind by a run that couldn't clean up
 * after itself (kill -9, power loss).
 *******************************************************************************/
int unlockDestination(RunConfig &config, bool force) {
    LockManager locks(config.lockDir());
    LockContention owner;

    switch (locks.unlock(config.destination, force, owner)) {
        case UNLOCK_NOT_LOCKED:
            if (NOTQUIET)
                cout << config.destination << " isn't locked" << endl;
            return 0;

        case UNLOCK_REMOVED:
            if (NOTQUIET)
                cout << "removed lock for " << config.destination << " (pid " << owner.ownerPid << ", started "
                << owner.startTime << ")" << endl;
            return 0;

        case UNLOCK_OWNER_RUNNING:
            SCREENERR("error: " << config.destination << " is locked by running pid " << owner.ownerPid <<
                " (started " << owner.startTime << "); use --force to remove it anyway");
            return 1;

        case UNLOCK_FAILED:
        default:
            SCREENERR("error: " << log("unable to remove lock " + owner.path + errtext()));
            return 1;
    }
}


/*******************************************************************************
 * setDebugging(args)
 *
 * Enable selective debugging (in the style of the Exim MTA - Philip Hazel).
 * "-v" turns on the default areas, "--vv" everything and "-v=+lock-prune"
 * edits the default set.
 *******************************************************************************/
void setDebugging(vector<string> args) {
    GLOBALS.debugSelector = 0;

    for (auto uarg : args) {
        if (uarg == "--vv") {
            GLOBALS.debugSelector = D_all;
            continue;
        }

        if (uarg == "-v") {
            GLOBALS.debugSelector = D_default;
            continue;
        }

        unsigned int selector = D_default;
        string remainder = uarg.substr(2);
        string error;

        // "-v=+lock" is an edit, "-v=0x30" a value
        if (remainder.length() > 1 && remainder[0] == '=' && (remainder[1] == '+' || remainder[1] == '-'))
            remainder = remainder.substr(1);

        if (!decodeDebugSelector(selector, remainder, error)) {
            SCREENERR("error: " << error);
            exit(1);
        }

        GLOBALS.debugSelector = selector;
    }
}


/*******************************************************************************
 * parseCommandLine(options, argc, argv)
 *
 * The -v forms don't fit cxxopts' idea of a short option so they're pulled
 * out first; everything else is cxxopts' to parse.
 *******************************************************************************/
cxxopts::ParseResult parseCommandLine(cxxopts::Options &options, int argc, char *argv[]) {
    vector<char*> remaining;
    vector<string> debugArgs;

    for (int index = 0; index < argc; ++index) {
        string arg = argv[index];

        if (index && (arg == "--vv" || arg == "-v" ||
                      (arg.length() > 2 && arg.substr(0, 2) == "-v" && string("=+-").find(arg[2]) != string::npos)))
            debugArgs.push_back(arg);
        else
            remaining.push_back(argv[index]);
    }

    setDebugging(debugArgs);

    try {
        options.parse_positional({ CLI_PATHS });
        int remainingCount = (int)remaining.size();
        return options.parse(remainingCount, remaining.data());
    }
    catch (exception &e) {
        SCREENERR("backup: " << e.what() << "\nUse --help for a list of options.");
        exit(1);
    }
}


/*******************************************************************************
 * main(argc, argv)
 *******************************************************************************/
int main(int argc, char *argv[]) {
    GLOBALS.childPid = 0;
    GLOBALS.interruptLock[0] = 0;
    GLOBALS.color = isatty(STDOUT_FILENO);
    GLOBALS.quiet = false;
    GLOBALS.test = false;
    GLOBALS.confDir = CONF_DIR;

    // overwrite with env vars (if any)
    string temp = cppgetenv("BG_CONFDIR");
    if (temp.length()) GLOBALS.confDir = temp;

    openlog("backupguard", LOG_PID | LOG_NDELAY, LOG_LOCAL1);
    cxxopts::Options options("backup", "Locked, policy-driven incremental backups");

    options.add_options()(string("e,") + CLI_ENGINE, "Engine", cxxopts::value<std::string>())(
        string("k,") + CLI_KEEP, "Retention", cxxopts::value<std::string>())(
        string("V,") + CLI_VERBOSITY, "Engine verbosity", cxxopts::value<std::string>())(
        string("l,") + CLI_LOCKDIR, "Lock directory", cxxopts::value<std::string>())(
        string("c,") + CLI_CONFIG, "Config file", cxxopts::value<std::string>())(
        string("t,") + CLI_TEST, "Test only mode", cxxopts::value<bool>()->default_value("false"))(
        string("q,") + CLI_QUIET, "No output", cxxopts::value<bool>()->default_value("false"))(
        string("h,") + CLI_HELP, "Show help", cxxopts::value<bool>()->default_value("false"))(
        CLI_NICE, "Nice value", cxxopts::value<std::string>())(
        CLI_IDLEIO, "Idle IO class", cxxopts::value<std::string>())(
        CLI_PRUNEFAILED, "Prune after a failed backup", cxxopts::value<std::string>())(
        CLI_RECLAIM, "Reclaim locks from before boot", cxxopts::value<std::string>())(
        CLI_RDIFF, "rdiff-backup binary", cxxopts::value<std::string>())(
        CLI_RSYNC, "rsync binary", cxxopts::value<std::string>())(
        CLI_NOPRUNE, "Disable pruning", cxxopts::value<bool>()->default_value("false"))(
        CLI_UNLOCK, "Remove a stale lock", cxxopts::value<bool>()->default_value("false"))(
        CLI_FORCE, "Force unlock", cxxopts::value<bool>()->default_value("false"))(
        CLI_NOCOLOR, "Disable color", cxxopts::value<bool>()->default_value("false"))(
        CLI_DEFAULTS, "Show defaults", cxxopts::value<bool>()->default_value("false"))(
        CLI_VERSION, "Version", cxxopts::value<bool>()->default_value("false"))(
        CLI_PATHS, "Source and destination", cxxopts::value<std::vector<std::string>>());

    auto cli = parseCommandLine(options, argc, argv);

    GLOBALS.quiet = cli[CLI_QUIET].as<bool>();
    GLOBALS.test = cli[CLI_TEST].as<bool>();
    if (GLOBALS.quiet || cli[CLI_NOCOLOR].as<bool>())
        GLOBALS.color = false;

    if (cli[CLI_HELP].as<bool>()) {
        showHelp(hOptions);
        exit(0);
    }

    if (cli[CLI_DEFAULTS].as<bool>()) {
        showHelp(hDefaults);
        exit(0);
    }

    if (cli[CLI_VERSION].as<bool>()) {
        cout << "backupguard v" << VERSION << endl;
        exit(0);
    }

    if (!cli.count(CLI_PATHS)) {
        showHelp(hSyntax);
        exit(1);
    }

    RunConfig config;
    try {
        // lowest precedence first: defaults, config file, environment, command line
        if (cli.count(CLI_CONFIG)) {
            string configFile = cli[CLI_CONFIG].as<string>();
            if (!config.loadConfig(configFile))
                throw BGException("unable to read config file " + configFile + errtext());
        }
        else
            config.loadConfig(slashConcat(GLOBALS.confDir, CONF_FILE));

        config.applyEnvironment();

        for (auto &setting: settingMap)
            if (cli.count(setting.first))
                config.settings[setting.second].value = cli[setting.first].as<string>();

        config.setPaths(cli[CLI_PATHS].as<vector<string>>());
        config.validate();
    }
    catch (BGException &e) {
        SCREENERR("error: " << log(e.detail()) << (e.getData().length() ? ": " + e.getData() : ""));
        exit(1);
    }

    DEBUG(D_config) config.fullDump();

    if (cli[CLI_UNLOCK].as<bool>())
        return unlockDestination(config, cli[CLI_FORCE].as<bool>());

    lowerPriority(config);

    try {
        LockManager locks(config.lockDir(), config.settings[sReclaim].bvalue());
        auto engine = makeEngine(config);
        auto retention = RetentionPolicy::parse(config.settings[sKeep].value);

        BackupRun run(config.source, config.destination, ExclusionPolicy::forRun(config.source, config.destination),
                      config.settings[sVerbosity].ivalue());

        DEBUG(D_filter) {
            for (auto &rule: run.policy.getRules())
                DFMT(rule.describe());
        }

        Coordinator coordinator(locks, *engine, retention, config.settings[sPruneFailed].bvalue(),
                                cli[CLI_NOPRUNE].as<bool>());

        auto outcome = coordinator.run(run);
        DEBUG(D_backup) DFMT("finished in state " << stateName(outcome.state) << ", backup " << outcome.backupStatus
                             << ", prune " << outcome.pruneStatus);

        return outcome.exitCode;
    }
    catch (BGException &e) {
        SCREENERR("error: " << log(e.detail()));
        cleanupAndExitOnError();
    }

    return 1;
}
