#include <map>
#include <ctype.h>
#include <stdlib.h>

#include "debug.h"

using namespace std;


static const map<string, unsigned int> debugOptions = {
    { "all",    D_all },
    { "backup", D_backup },
    { "config", D_config },
    { "engine", D_engine },
    { "filter", D_filter },
    { "lock",   D_lock },
    { "prune",  D_prune },
    { "signal", D_signal },
};


bool decodeDebugSelector(unsigned int &selector, string text, string &error) {
    if (!text.length())
        return true;

    if (text[0] == '=') {
        char *end;
        unsigned long value = strtoul(text.c_str() + 1, &end, 0);

        if (*end) {
            error = "unknown debugging selection: " + text;
            return false;
        }

        selector = (unsigned int)value;
        return true;
    }

    size_t pos = 0;
    while (pos < text.length()) {
        while (pos < text.length() && isspace(text[pos]))
            ++pos;

        if (pos >= text.length())
            break;

        if (text[pos] != '+' && text[pos] != '-') {
            error = "unknown debugging flag (should be + or -): " + text.substr(pos);
            return false;
        }

        bool adding = text[pos++] == '+';
        size_t start = pos;
        while (pos < text.length() && (isalnum(text[pos]) || text[pos] == '_'))
            ++pos;

        string name = text.substr(start, pos - start);
        auto option = debugOptions.find(name);
        if (option == debugOptions.end()) {
            error = string("unknown debugging selection: ") + (adding ? "+" : "-") + name;
            return false;
        }

        if (adding)
            selector |= option->second;
        else
            selector &= ~option->second;
    }

    return true;
}
