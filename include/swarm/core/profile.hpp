/**
 * @file profile.hpp
 * @brief Scope timing for the frame loop
 *
 * Times named scopes with an RAII guard and aggregates call counts and
 * durations. Scopes opened while another is active are recorded as its
 * children, so the printed summary reads as a tree:
 * @code
 * void ForceModel::update(entt::registry& registry) {
 *     SWARM_PROFILE_SCOPE("ForceModel");
 *     // ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <iosfwd>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing store. All access goes through the static methods.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    /**
     * @brief Aggregated timings for one named scope
     */
    struct ProfileData {
        Duration total_time{0};
        std::uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Writes the scope tree with call counts, totals and averages
     */
    static void printStats(std::ostream& out);

    /** @brief Number of completed calls for a scope (0 if never entered) */
    static std::uint64_t callCount(const std::string& name);

    static void reset();

private:
    Profiler() = default;
    static Profiler& getInstance();

    void printNode(std::ostream& out, const std::string& name, int depth) const;

    std::unordered_map<std::string, ProfileData> sections;
    std::unordered_map<std::string, TimePoint> open_sections;
    std::vector<std::string> scope_stack;
};

/**
 * @brief Starts a section on construction and ends it on destruction
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
};

} // namespace Profiling

#define SWARM_PROFILE_CONCAT_INNER(a, b) a##b
#define SWARM_PROFILE_CONCAT(a, b) SWARM_PROFILE_CONCAT_INNER(a, b)

#define SWARM_PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler SWARM_PROFILE_CONCAT(swarm_scoped_profiler_, __LINE__)(name)
