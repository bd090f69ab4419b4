#pragma once

#include <iosfwd>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#define ENABLE_DEBUG 0

// Debug levels
#define DEBUG_LEVEL_NONE 0
#define DEBUG_LEVEL_BASIC 1
#define DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define CURRENT_DEBUG_LEVEL DEBUG_LEVEL_BASIC

// Debug macros
#define DEBUG_MSG(level, x) do { \
    if (ENABLE_DEBUG && level <= CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

/**
 * @brief Counters collected by the solver passes.
 *
 * Always collected; printed by the host on demand. Reset between runs.
 */
class DebugStats {
public:
    static void reset();

    static void recordContactCheck(bool colliding, double penetration);
    static void recordDegenerateContact(bool skipped);
    static void recordBoundaryClamp();

    static long contactsChecked() { return contacts_checked; }
    static long contactsResolved() { return contacts_resolved; }
    static long degenerateContacts() { return degenerate_contacts; }
    static long skippedContacts() { return skipped_contacts; }
    static long boundaryClamps() { return boundary_clamps; }
    static double maxPenetration() { return max_penetration; }

    static void printContactStats(std::ostream& out);

private:
    static long contacts_checked;
    static long contacts_resolved;
    static long degenerate_contacts;
    static long skipped_contacts;
    static long boundary_clamps;
    static double max_penetration;
};
