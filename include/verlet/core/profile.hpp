/**
 * @file profile.hpp
 * @brief Scope timing for the solver passes
 *
 * Sections are identified by name and aggregated flat (no parent/child
 * tree): call count, total, min and max duration. The host prints the table
 * at the end of a run.
 *
 * Example usage:
 * @code
 * void CollisionSystem::update(...) {
 *     PROFILE_SCOPE("CollisionSystem");
 *     // ... code ...
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

namespace Profiling {

/**
 * @brief Process-wide timing table.
 *
 * Singleton; use the static methods. Not thread safe, the solver is
 * single-threaded.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = std::chrono::time_point<Clock>;
    using Duration  = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        uint64_t call_count{0};
        Duration min_time{Duration::max()};
        Duration max_time{0};
    };

    static void record(const std::string& name, Duration duration);

    /**
     * @brief Returns the aggregate for a section, or an empty record if the
     *        section never ran.
     */
    static ProfileData getStats(const std::string& name);

    /**
     * @brief Prints one line per section, slowest total first.
     */
    static void printStats(std::ostream& out);

    static void reset();

private:
    std::unordered_map<std::string, ProfileData> sections;

    Profiler() = default;
    static Profiler& getInstance();
};

/**
 * @brief RAII guard that times its own lifetime into a named section.
 */
class ScopedProfiler {
public:
    explicit ScopedProfiler(std::string name);
    ~ScopedProfiler();

    ScopedProfiler(const ScopedProfiler&) = delete;
    ScopedProfiler& operator=(const ScopedProfiler&) = delete;

private:
    std::string section_name;
    Profiler::TimePoint start_time;
};

} // namespace Profiling

#define VERLET_PROFILE_CONCAT_INNER(a, b) a##b
#define VERLET_PROFILE_CONCAT(a, b) VERLET_PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the enclosing scope under the given section name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler VERLET_PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
