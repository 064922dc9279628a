#include "BackupEngine.h"
#include "RdiffEngine.h"
#include "RsyncEngine.h"
#include "RunConfig.h"
#include "globals.h"
#include "debug.h"


unique_ptr<BackupEngine> makeEngine(RunConfig &config) {
    auto verbosity = config.settings[sVerbosity].ivalue();

    DEBUG(D_engine) DFMT("engine " << config.settings[sEngine].value << " via " << config.engineBinary());

    if (config.engine() == ENGINE_RSYNC)
        return unique_ptr<BackupEngine>(new RsyncEngine(config.engineBinary(), verbosity));

    return unique_ptr<BackupEngine>(new RdiffEngine(config.engineBinary(), verbosity));
}

