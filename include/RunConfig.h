
#ifndef RUNCONFIG_H
#define RUNCONFIG_H

#include <vector>
#include <string>
#include "Setting.h"


using namespace std;


enum EngineType { ENGINE_RDIFF, ENGINE_RSYNC };


class RunConfig {

public:
    string config_filename;
    vector<Setting> settings;

    // source defaults to the whole filesystem when only a destination is given
    string source;
    string destination;

    RunConfig();

    bool loadConfig(string filename);
    void applyEnvironment();
    void setPaths(vector<string> paths);
    void validate();

    EngineType engine();
    string lockDir() { return settings[sLockDir].value; }
    string engineBinary();

    void fullDump();
};

#endif
