#include <sstream>
#include <pcre++.h>

#include "ExclusionPolicy.h"
#include "util_generic.h"
#include "globals.h"
#include "debug.h"

using namespace pcrepp;


static vector<string> pathComponents(string path) {
    vector<string> result;
    string part;
    stringstream tokenizer(path);

    while (getline(tokenizer, part, '/'))
        if (part.length())
            result.push_back(part);

    return result;
}


// translate a glob into the body of a regex
static string globToRegex(string glob) {
    string result;

    for (size_t pos = 0; pos < glob.length(); ++pos) {
        char c = glob[pos];

        if (c == '*') {
            if (pos + 1 < glob.length() && glob[pos + 1] == '*') {
                result += ".*";
                ++pos;
            }
            else
                result += "[^/]*";
        }
        else if (c == '?')
            result += "[^/]";
        else if (c == '[') {
            // bracket class; a "]" right after the opening is a member
            size_t close = glob.find(']', pos + (pos + 1 < glob.length() && glob[pos + 1] == '!' ? 3 : 2));
            if (close == string::npos) {
                result += "\\[";
                continue;
            }

            string members = glob.substr(pos + 1, close - pos - 1);
            result += "[";
            if (members[0] == '!') {
                result += "^";
                members.erase(0, 1);
            }
            for (auto m: members)
                result += (m == '\\' || m == '^' || m == '[') ? string("\\") + m : string(1, m);
            result += "]";
            pos = close;
        }
        else if (isalnum((unsigned char)c) || c == '/' || c == '_' || c == '-')
            result += c;
        else
            result += string("\\") + c;
    }

    return result;
}


static bool componentMatches(string globComponent, string component) {
    Pcre re("^" + globToRegex(globComponent) + "$");
    return re.search(component);
}


bool globMatches(string glob, string path, bool matchAncestors) {
    while (path.length() > 1 && path.back() == '/')
        path.pop_back();

    Pcre selfOrBelow("^" + globToRegex(glob) + "(?:/.*)?$");
    if (selfOrBelow.search(path))
        return true;

    if (!matchAncestors)
        return false;

    // path is a directory leading down to something the glob names
    auto globParts = pathComponents(glob);
    auto pathParts = pathComponents(path);

    if (pathParts.size() >= globParts.size())
        return false;

    for (size_t index = 0; index < pathParts.size(); ++index) {
        if (globParts[index].find("**") != string::npos)
            return true;

        if (!componentMatches(globParts[index], pathParts[index]))
            return false;
    }

    return true;
}


/* Re-express an absolute glob relative to a source directory.  Returns false
 * when nothing at or below source can match.  A glob that covers the source
 * itself becomes "/**", which covers the whole transfer. */
static bool relativeGlob(string glob, string source, string &relative) {
    if (source == "/") {
        relative = glob;
        return true;
    }

    auto globParts = pathComponents(glob);
    auto sourceParts = pathComponents(source);

    for (size_t index = 0; index < sourceParts.size(); ++index) {
        if (index >= globParts.size()) {
            relative = "/**";
            return true;
        }

        if (globParts[index].find("**") != string::npos) {
            relative = "/" + perlJoin("/", vector<string>(globParts.begin() + index, globParts.end()));
            return true;
        }

        if (!componentMatches(globParts[index], sourceParts[index]))
            return false;
    }

    if (globParts.size() == sourceParts.size())
        relative = "/**";
    else
        relative = "/" + perlJoin("/", vector<string>(globParts.begin() + sourceParts.size(), globParts.end()));

    return true;
}


string ExclusionRule::describe() const {
    string verb = polarity == INCLUDE ? "include" : "exclude";

    switch (condition) {
        case GLOB:
            return verb + " " + pattern;
        case SPECIAL_FILES:
            return verb + " special files";
        case OTHER_FILESYSTEMS:
            return verb + " other filesystems";
    }

    return verb;
}


ExclusionPolicy ExclusionPolicy::baseline() {
    return ExclusionPolicy({
        ExclusionRule::exclude("/home/*/.cache"),
        ExclusionRule::include("/home"),
        ExclusionRule::exclude("/tmp/*"),
        ExclusionRule::exclude("/var/tmp/*"),
        ExclusionRule::exclude("/proc/*"),
        ExclusionRule::exclude("/sys/*"),
        ExclusionRule::exclude("/mnt/*/*"),
        ExclusionRule(SPECIAL_FILES, EXCLUDE),
        ExclusionRule(OTHER_FILESYSTEMS, EXCLUDE)
    });
}


// quote glob metacharacters so a path only ever matches itself
string literalGlob(string path) {
    string result;

    for (auto c: path)
        if (c == '*' || c == '?' || c == '[')
            result += string("[") + c + "]";
        else
            result += c;

    return result;
}


ExclusionPolicy ExclusionPolicy::forRun(string source, string destination) {
    auto policy = baseline();

    // never back up the backups
    if (isPathWithin(destination, source) && destination != source)
        policy.prepend(ExclusionRule::exclude(literalGlob(destination)));

    return policy;
}


void ExclusionPolicy::prepend(ExclusionRule rule) {
    rules.insert(rules.begin(), rule);
}


RulePolarity ExclusionPolicy::evaluate(string path, PathTraits traits) const {
    for (auto &rule: rules) {
        bool matched = false;

        switch (rule.condition) {
            case GLOB:
                matched = globMatches(rule.pattern, path, rule.polarity == INCLUDE);
                break;
            case SPECIAL_FILES:
                matched = traits.special;
                break;
            case OTHER_FILESYSTEMS:
                matched = traits.otherFilesystem;
                break;
        }

        if (matched) {
            DEBUG(D_filter) DFMT(path << ": " << rule.describe());
            return rule.polarity;
        }
    }

    DEBUG(D_filter) DFMT(path << ": no rule, included");
    return INCLUDE;
}


vector<string> ExclusionPolicy::rdiffArguments(string source) const {
    vector<string> args;
    string unused;

    for (auto &rule: rules) {
        switch (rule.condition) {
            case GLOB:
                // rdiff-backup refuses selections that can't match below the source
                if (relativeGlob(rule.pattern, source, unused)) {
                    args.push_back(rule.polarity == INCLUDE ? "--include" : "--exclude");
                    args.push_back(rule.pattern);
                }
                else
                    DEBUG(D_filter) DFMT("dropping " << rule.describe() << " (outside " << source << ")");
                break;
            case SPECIAL_FILES:
                args.push_back(rule.polarity == INCLUDE ? "--include-special-files" : "--exclude-special-files");
                break;
            case OTHER_FILESYSTEMS:
                if (rule.polarity == EXCLUDE)
                    args.push_back("--exclude-other-filesystems");
                break;
        }
    }

    return args;
}


vector<string> ExclusionPolicy::rsyncArguments(string source) const {
    vector<string> args;
    string relative;

    for (auto &rule: rules) {
        switch (rule.condition) {
            case GLOB:
                // rsync anchors a leading "/" at the top of the transfer
                if (relativeGlob(rule.pattern, source, relative))
                    args.push_back((rule.polarity == INCLUDE ? "--include=" : "--exclude=") + relative);
                else
                    DEBUG(D_filter) DFMT("dropping " << rule.describe() << " (outside " << source << ")");
                break;
            case SPECIAL_FILES:
                if (rule.polarity == EXCLUDE) {
                    args.push_back("--no-devices");
                    args.push_back("--no-specials");
                }
                break;
            case OTHER_FILESYSTEMS:
                // rsync applies this to the whole transfer rather than in rule order
                if (rule.polarity == EXCLUDE)
                    args.push_back("--one-file-system");
                break;
        }
    }

    return args;
}
