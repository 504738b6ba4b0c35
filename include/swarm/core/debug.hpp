#pragma once

#include <algorithm>
#include <cstdint>
#include <iostream>

// Set to 1 to enable debug output, 0 to disable
#ifndef SWARM_ENABLE_DEBUG
#define SWARM_ENABLE_DEBUG 0
#endif

// Debug levels
#define SWARM_DEBUG_LEVEL_NONE 0
#define SWARM_DEBUG_LEVEL_BASIC 1
#define SWARM_DEBUG_LEVEL_VERBOSE 2

// Set current debug level
#define SWARM_CURRENT_DEBUG_LEVEL SWARM_DEBUG_LEVEL_BASIC

// Debug macros
#define SWARM_DEBUG_MSG(level, x) do { \
    if (SWARM_ENABLE_DEBUG && (level) <= SWARM_CURRENT_DEBUG_LEVEL) { \
        std::cout << x; \
    } \
} while(0)

// Per-frame counters for the force model and contact solver
class DebugStats {
public:
    static void reset() {
        max_force = 0.0;
        pairs_evaluated = 0;
        pairs_in_range = 0;
        contacts = 0;
    }

    static void updatePair(bool inRange, double force) {
        pairs_evaluated++;
        if (inRange) {
            pairs_in_range++;
            max_force = std::max(max_force, force);
        }
    }

    static void updateContacts(std::size_t count) {
        contacts += count;
    }

    static void printFrameStats() {
        SWARM_DEBUG_MSG(SWARM_DEBUG_LEVEL_VERBOSE,
            "Frame stats:\n"
            "  Pairs evaluated: " << pairs_evaluated << "\n"
            "  Pairs in range: " << pairs_in_range << "\n"
            "  Max pair force: " << max_force << "\n"
            "  Contacts: " << contacts << "\n"
        );
    }

    static std::uint64_t pairsEvaluated() { return pairs_evaluated; }
    static std::uint64_t pairsInRange() { return pairs_in_range; }
    static std::uint64_t contactCount() { return contacts; }

private:
    static double max_force;
    static std::uint64_t pairs_evaluated;
    static std::uint64_t pairs_in_range;
    static std::uint64_t contacts;
};
