
#ifndef EXCLUSIONPOLICY_H
#define EXCLUSIONPOLICY_H

#include <string>
#include <vector>

using namespace std;


enum RulePolarity { INCLUDE, EXCLUDE };
enum RuleCondition { GLOB, SPECIAL_FILES, OTHER_FILESYSTEMS };


struct ExclusionRule {
    RuleCondition condition;
    RulePolarity polarity;
    string pattern;          // GLOB only

    ExclusionRule(RuleCondition c, RulePolarity p, string pat = "") : condition(c), polarity(p), pattern(pat) {}

    static ExclusionRule include(string glob) { return ExclusionRule(GLOB, INCLUDE, glob); }
    static ExclusionRule exclude(string glob) { return ExclusionRule(GLOB, EXCLUDE, glob); }

    string describe() const;

    friend bool operator==(const ExclusionRule &a, const ExclusionRule &b) {
        return a.condition == b.condition && a.polarity == b.polarity && a.pattern == b.pattern;
    }
};


// what the traversal knows about a path beyond its name
struct PathTraits {
    bool special;            // socket, device or fifo
    bool otherFilesystem;    // on a different device than the source root

    PathTraits(bool s = false, bool o = false) : special(s), otherFilesystem(o) {}
};


/****************************************************************
 * ExclusionPolicy
 *
 * An ordered list of selection rules handed to the backup engine
 * verbatim.  The first rule that matches a path decides whether
 * it's backed up; paths no rule matches are included.  Narrow
 * excludes therefore come before the broad include they carve
 * out of:
 *
 *     exclude /home/<user>/.cache   <- wins for the cache
 *     include /home                <- wins for the rest of /home,
 *                                     even on another filesystem
 *     ...
 *     exclude other filesystems
 *
 * Globs: "*" stays within a path component, "**" spans
 * components, "?" is one character.  A glob matches a path or
 * anything below it; an include glob also matches the
 * directories leading down to it.
 ****************************************************************/

class ExclusionPolicy {
    vector<ExclusionRule> rules;

    public:
        ExclusionPolicy() {}
        ExclusionPolicy(vector<ExclusionRule> r) : rules(r) {}

        static ExclusionPolicy baseline();
        static ExclusionPolicy forRun(string source, string destination);

        const vector<ExclusionRule>& getRules() const { return rules; }
        void prepend(ExclusionRule rule);

        RulePolarity evaluate(string path, PathTraits traits = PathTraits()) const;

        // flags for the engine; globs that can't apply below source are dropped
        vector<string> rdiffArguments(string source = "/") const;
        vector<string> rsyncArguments(string source = "/") const;
};


bool globMatches(string glob, string path, bool matchAncestors);
string literalGlob(string path);

#endif
