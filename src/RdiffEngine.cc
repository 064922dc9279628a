#include "RdiffEngine.h"
#include "PipeExec.h"
#include "globals.h"
#include "debug.h"
#include <iostream>


vector<string> RdiffEngine::backupCommand(BackupRun &run) {
    vector<string> command = { binary };

    auto ruleArgs = run.policy.rdiffArguments(run.source);
    command.insert(command.end(), ruleArgs.begin(), ruleArgs.end());

    command.push_back("--verbosity");
    command.push_back(to_string(run.verbosity));
    command.push_back(run.source);
    command.push_back(run.destination);

    return command;
}


vector<string> RdiffEngine::pruneCommand(string destination, const RetentionPolicy &retention) {
    return { binary, "--remove-older-than", retention.engineNotation(), "--force",
             "--verbosity", to_string(verbosity), destination };
}


int RdiffEngine::backup(BackupRun &run) {
    PipeExec rdiff(backupCommand(run));
    return rdiff.execute();
}


int RdiffEngine::prune(string destination, const RetentionPolicy &retention) {
    DEBUG(D_prune) DFMT("removing increments older than " << retention.engineNotation() << " from " << destination);

    PipeExec rdiff(pruneCommand(destination, retention));
    return rdiff.execute();
}

