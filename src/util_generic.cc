#include <iostream>
#include <sstream>
#include <fstream>
#include <dirent.h>
#include <unistd.h>
#include <signal.h>
#include <syslog.h>
#include <errno.h>
#include <string.h>
#include <limits.h>
#include <stdlib.h>
#include <openssl/evp.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <functional>
#include <list>
#include <map>

#include "pcre++.h"
#include "util_generic.h"
#include "globals.h"
#include "exception.h"

using namespace pcrepp;


string plural(size_t number, string text) {
    return (to_string(number) + " " + text + (number == 1 ? "" : "s"));
}


string cppgetenv(string variable) {
    char* c;

    c = getenv(variable.c_str());
    if (c == NULL)
        return "";
    else
        return c;
}


string perlJoin(string delimiter, vector<string> items) {
    string result;

    for (auto &item: items)
        result += (result.length() ? delimiter : "") + item;

    return result;
}


// replace carriage-returns with commas so a message stays on one syslog line
static string commafy(string data) {
    while (data.length() && data.back() == '\n')
        data.pop_back();

    size_t pos;
    while ((pos = data.find("\n")) != string::npos)
        data.replace(pos, 1, ", ");

    return data;
}


string log(string message) {
    syslog(LOG_CRIT, "%s", commafy(message).c_str());
    return message;
}


string timeDiffSingle(struct timeval duration, int maxUnits) {
    auto secs = duration.tv_sec;
    int unitsUsed = 0;
    string result;
    map<unsigned long, string, greater<unsigned long>> units {
        { 86400, "day" },
        { 3600, "hour" },
        { 60, "minute" },
        { 1, "second" }
    };

    for (auto &unit: units) {
        if (unitsUsed >= maxUnits)
            break;

        if ((unsigned long)secs >= unit.first) {
            result += (result.length() ? ", " : "") + plural(secs / unit.first, unit.second);
            secs %= unit.first;
            ++unitsUsed;
        }
    }

    if (!result.length()) {
        char buffer[50];
        snprintf(buffer, sizeof(buffer), "%.2f seconds", duration.tv_usec / 1000000.0);
        result = buffer;
    }

    return result;
}


string slashConcat(string str1, string str2, string str3) {
    if (str1.length() && str1[str1.length() - 1] == '/')
        str1.pop_back();

    if (str2.length() && str2[0] == '/')
        str2.erase(0, 1);

    return (str3.length() ? slashConcat(str1 + "/" + str2, str3) : str1 + "/" + str2);
}


string MD5string(string origString) {
    EVP_MD_CTX *md5Context;
    unsigned char md5Digest[EVP_MAX_MD_SIZE];
    unsigned int md5DigestLen = EVP_MD_size(EVP_md5());

    md5Context = EVP_MD_CTX_new();
    if (md5Context == NULL)
        throw BGException("unable to allocate an MD5 context");

    EVP_DigestInit_ex(md5Context, EVP_md5(), NULL);
    EVP_DigestUpdate(md5Context, origString.c_str(), origString.length());
    EVP_DigestFinal_ex(md5Context, md5Digest, &md5DigestLen);
    EVP_MD_CTX_free(md5Context);

    char hex[3];
    string result;
    for (unsigned int i = 0; i < md5DigestLen; ++i) {
        snprintf(hex, sizeof(hex), "%02x", md5Digest[i]);
        result += hex;
    }

    return result;
}


int mkdirp(string dir, mode_t mode) {
    struct stat statBuf;

    if (mystat(dir, &statBuf) == -1) {
        string path;
        string part;
        stringstream tokenizer(dir);

        while (getline(tokenizer, part, '/')) {
            if (!part.length())
                continue;

            path += "/" + part;

            if (mystat(path, &statBuf) == -1 && mkdir(path.c_str(), mode) && errno != EEXIST)
                return -1;
        }
    }

    return 0;
}


string trimSpace(const string &s) {
    auto start = s.begin();
    while (start != s.end() && isspace(*start))
        start++;

    if (start == s.end())
        return "";

    auto end = s.end();
    do {
        end--;
    } while (distance(start, end) > 0 && isspace(*end));

    return string(start, end + 1);
}


bool str2bool(string text) {
    Pcre regTrue("(^\\s*(t|true|y|yes|1|on)\\s*$)|(^\\s*$)", "i");
    // a blank value is true so a directive can be given by name alone
    return(regTrue.search(text));
}


string timeString(time_t when) {
    char buffer[100];
    struct tm timeFields;

    localtime_r(&when, &timeFields);
    strftime(buffer, sizeof(buffer), TIME_FORMAT, &timeFields);
    return buffer;
}


time_t parseTimeString(string text) {
    Pcre timeRE(TIME_REGEX);

    if (!timeRE.search(text) || timeRE.matches() < 6)
        return 0;

    struct tm fields;
    memset(&fields, 0, sizeof(fields));
    fields.tm_year  = stoi(timeRE.get_match(0)) - 1900;
    fields.tm_mon   = stoi(timeRE.get_match(1)) - 1;
    fields.tm_mday  = stoi(timeRE.get_match(2));
    fields.tm_hour  = stoi(timeRE.get_match(3));
    fields.tm_min   = stoi(timeRE.get_match(4));
    fields.tm_sec   = stoi(timeRE.get_match(5));
    fields.tm_isdst = -1;

    auto result = mktime(&fields);
    return (result == -1 ? 0 : result);
}


time_t systemBootTime() {
    ifstream statFile("/proc/stat");
    string line;

    while (getline(statFile, line))
        if (line.compare(0, 6, "btime ") == 0)
            return (time_t)stoll(line.substr(6));

    return 0;
}


bool processRunning(pid_t pid) {
    if (pid <= 0)
        return false;

    return (!kill(pid, 0) || errno == EPERM);
}


string readFirstLine(string filename) {
    ifstream inFile(filename);
    string line;

    if (inFile.is_open())
        getline(inFile, line);

    return trimSpace(line);
}


bool writeFileAtomic(string filename, string data) {
    string tempName = filename + ".tmp." + to_string(getpid());
    ofstream outFile(tempName);

    if (!outFile.is_open())
        return false;

    outFile << data << endl;
    outFile.close();

    if (outFile.fail() || rename(tempName.c_str(), filename.c_str())) {
        unlink(tempName.c_str());
        return false;
    }

    return true;
}


bool rmrfCallback(pdCallbackData &file) {
    return (S_ISDIR(file.statData.st_mode) ? !rmdir(file.filename.c_str()) : !unlink(file.filename.c_str()));
}


// delete a directory tree (rm -rf); symlinks are removed, never followed
bool rmrf(string directory, bool includeTopDir) {
    return (processDirectory(directory, rmrfCallback, includeTopDir) == "");
}


string processDirectory(string directory, bool (*callback)(pdCallbackData&), bool includeTopDir) {
    DIR *dirPtr;
    struct dirent *dirEntry;
    list<string> dirsToRead;
    list<pdCallbackData> dirsToCallback;           // dirs to callback after their contents
    struct stat dirStat;
    pdCallbackData file;

    dirsToRead.push_back(directory);

    try {
        while (!dirsToRead.empty()) {
            string baseDir = dirsToRead.front();
            dirsToRead.pop_front();

            if (mylstat(baseDir, &dirStat))
                return "error: stat failed for " + baseDir + errtext();

            // in case we're given a file (or symlink) instead of a directory
            if (!S_ISDIR(dirStat.st_mode)) {
                file.filename = baseDir;
                file.statData = dirStat;
                if (!callback(file))
                    return "error: unable to process " + baseDir + errtext();
                continue;
            }

            if ((dirPtr = opendir(baseDir.c_str())) == NULL)
                return "error: unable to open " + baseDir + errtext();

            bool stopped = false;
            while ((dirEntry = readdir(dirPtr)) != NULL) {
                if (!strcmp(dirEntry->d_name, ".") || !strcmp(dirEntry->d_name, ".."))
                    continue;

                file.filename = slashConcat(baseDir, dirEntry->d_name);

                if (mylstat(file.filename, &file.statData))
                    continue;

                if (S_ISDIR(file.statData.st_mode))
                    dirsToRead.push_back(file.filename);
                else if (!callback(file)) {
                    stopped = true;
                    break;
                }
            }
            closedir(dirPtr);

            if (stopped)
                return "error: unable to process " + file.filename + errtext();

            // directories are called back once everything below them is done
            if (includeTopDir || baseDir != directory) {
                file.filename = baseDir;
                file.statData = dirStat;
                dirsToCallback.push_front(file);
            }
        }

        while (!dirsToCallback.empty()) {
            file = dirsToCallback.front();
            dirsToCallback.pop_front();

            if (!callback(file))
                return "error: unable to process " + file.filename + errtext();
        }
    }
    catch (BGException &e) {
        log("error: " + e.detail());
        return e.detail();
    }

    return "";
}


int mylstat(string filename, struct stat *buf) {
    return (lstat(filename.c_str(), buf));
}


int mystat(string filename, struct stat *buf) {
    return (stat(filename.c_str(), buf));
}


string errtext(bool format) {
    return((format ? " - " : "") + string(strerror(errno)));
}


bool isPathWithin(string child, string parent) {
    while (parent.length() > 1 && parent.back() == '/')
        parent.pop_back();

    if (parent == "/")
        return (child.length() && child[0] == '/');

    return (child == parent || child.compare(0, parent.length() + 1, parent + "/") == 0);
}

