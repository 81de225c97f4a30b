/**
 * @file profile.hpp
 * @brief Scoped timers for the per-tick systems
 *
 * Each named scope accumulates call count, total time and worst case. Scopes
 * opened inside another scope are recorded as its children, which gives a
 * per-system breakdown of GameSession::advance.
 *
 * Example usage:
 * @code
 * void MovementSystem::update(...) {
 *     PROFILE_SCOPE("MovementSystem");
 *     // ... code ...
 * }
 *
 * Profiling::Profiler::printStats(std::cout);
 * @endcode
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <ostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace Profiling {

/**
 * @brief Process-wide timing table, accessed through static methods.
 *
 * Not thread-safe; the game core runs on one thread.
 */
class Profiler {
public:
    using Clock     = std::chrono::steady_clock;
    using TimePoint = Clock::time_point;
    using Duration  = std::chrono::nanoseconds;

    struct ProfileData {
        Duration total_time{0};
        Duration max_time{0};
        std::uint64_t call_count{0};
        std::string parent_name;
        std::vector<std::string> children;
    };

    static void startSection(const std::string& name);
    static void endSection(const std::string& name);

    /**
     * @brief Prints every scope as a tree with average and worst-case time per call.
     */
    static void printStats(std::ostream& out);

    /**
     * @brief Number of completed calls of a scope, 0 if never entered.
     */
    static std::uint64_t callCount(const std::string& name);

    /**
     * @brief Clears all recorded data.
     */
    static void reset();

private:
    struct SectionData {
        TimePoint start_time;
        ProfileData profile_data;
    };

    std::unordered_map<std::string, SectionData> sections;
    std::vector<std::string> scope_stack;

    Profiler() = default;

    static Profiler& getInstance();

    static void printNode(std::ostream& out,
                          const std::string& name,
                          const std::string& prefix,
                          bool is_last);
};

/**
 * @brief RAII guard timing the enclosing scope.
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

#define PROFILE_CONCAT_INNER(a, b) a##b
#define PROFILE_CONCAT(a, b) PROFILE_CONCAT_INNER(a, b)

/**
 * @brief Times the rest of the enclosing scope under the given name.
 */
#define PROFILE_SCOPE(name) \
    ::Profiling::ScopedProfiler PROFILE_CONCAT(_scopedProfiler, __LINE__) { name }
