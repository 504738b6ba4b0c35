#include "swarm/core/debug.hpp"

// Initialize static members
double DebugStats::max_force = 0.0;
std::uint64_t DebugStats::pairs_evaluated = 0;
std::uint64_t DebugStats::pairs_in_range = 0;
std::uint64_t DebugStats::contacts = 0;
