#pragma once

/// @file job_scheduler.hpp
/// @brief GameJobScheduler wrapping kcenon thread_system for recurring combat ticks.

#include "vigor/foundation/game_result.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <stop_token>
#include <string>
#include <thread>

namespace vigor::foundation {

/// Priority levels for scheduled jobs.
///
/// Maps to kcenon::thread::job_priority internally:
///   Critical -> highest, High -> high, Normal -> normal, Low -> low
enum class JobPriority { Critical, High, Normal, Low };

/// Tick scheduler over a kcenon thread pool.
///
/// Tick jobs are registered once and dispatched to the pool by
/// processTick() whenever their interval elapses. A tick job
/// never overlaps with itself: if the previous dispatch is still running
/// the due tick is skipped and counted. Every tick job receives the
/// scheduler's stop token and is expected to return early once stop has
/// been requested.
///
/// Example:
/// @code
///   GameJobScheduler scheduler(2);
///   scheduler.scheduleTick("health", 3000ms, [&](std::stop_token st) {
///       healthPools.processAll(st);
///   });
///   // from the game loop:
///   scheduler.processTick(delta);
/// @endcode
class GameJobScheduler {
public:
    using JobId = uint64_t;
    using TickFunc = std::function<void(std::stop_token)>;

    /// Construct a scheduler backed by a thread pool with @p numThreads workers.
    explicit GameJobScheduler(std::size_t numThreads = std::thread::hardware_concurrency());

    ~GameJobScheduler();

    GameJobScheduler(const GameJobScheduler&) = delete;
    GameJobScheduler& operator=(const GameJobScheduler&) = delete;
    GameJobScheduler(GameJobScheduler&&) noexcept;
    GameJobScheduler& operator=(GameJobScheduler&&) noexcept;

    /// Register a recurring tick job that becomes due every @p interval.
    /// @p priority orders its dispatches against other due ticks in the pool.
    /// @return InvalidArgument for a non-positive interval.
    GameResult<JobId> scheduleTick(std::string name, std::chrono::milliseconds interval,
                                   TickFunc job, JobPriority priority = JobPriority::Normal);

    /// Advance tick timers by @p deltaTime and dispatch due tick jobs.
    /// Call once per game-loop iteration.
    void processTick(std::chrono::milliseconds deltaTime);

    /// Ask running tick jobs to stop and stop dispatching new ones.
    void requestStop();

    [[nodiscard]] bool stopRequested() const noexcept;

    /// Number of due ticks skipped because the previous run was still busy.
    [[nodiscard]] uint64_t skippedTicks(JobId id) const;

    /// Number of completed runs of a tick job.
    [[nodiscard]] uint64_t completedTicks(JobId id) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace vigor::foundation
