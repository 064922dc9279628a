
#ifndef DEBUG_H
#define DEBUG_H

/*
 Selective debugging in the style of Philip Hazel's Exim Mail Transport Agent.
 Each area of the program has a bit; "-v" turns on D_default, "--vv" turns on
 everything and "-v=+lock-prune" adds and removes individual areas.
 */

#include <string>

#define BIT(n) (1UL << (n))

enum {
    D_backup = BIT(0),
    D_config = BIT(1),
    D_engine = BIT(2),
    D_filter = BIT(3),
    D_lock   = BIT(4),
    D_prune  = BIT(5),
    D_signal = BIT(6),
};

#define D_all                        0xffffffff

#define D_default                    (D_all & \
                                       ~(D_config           | \
                                         D_filter           | \
                                         D_engine))


#define DEBUG(x)      if (GLOBALS.debugSelector & (x))


/* decodeDebugSelector(selector, text)
 * Apply a selector edit to an existing selector.  text is either "=<number>"
 * to set the selector outright or a sequence of "+name" / "-name" items.
 * Returns false (and leaves a message in error) on an unknown name. */
bool decodeDebugSelector(unsigned int &selector, std::string text, std::string &error);

#endif
