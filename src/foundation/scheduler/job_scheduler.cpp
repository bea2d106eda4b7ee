/// @file job_scheduler.cpp
/// @brief GameJobScheduler implementation over kcenon thread_system.

#include "vigor/foundation/job_scheduler.hpp"

#include "vigor/foundation/game_logger.hpp"

// kcenon thread_system headers (hidden behind PIMPL)
#include <kcenon/thread/core/thread_pool.h>
#include <kcenon/thread/core/thread_worker.h>
#include <kcenon/thread/core/job_builder.h>

#include <atomic>
#include <exception>
#include <mutex>
#include <vector>

namespace vigor::foundation {

// ---------------------------------------------------------------------------
// Priority mapping: vigor -> kcenon
// ---------------------------------------------------------------------------
static kcenon::thread::job_priority mapPriority(JobPriority p) {
    switch (p) {
        case JobPriority::Critical: return kcenon::thread::job_priority::highest;
        case JobPriority::High:     return kcenon::thread::job_priority::high;
        case JobPriority::Normal:   return kcenon::thread::job_priority::normal;
        case JobPriority::Low:      return kcenon::thread::job_priority::low;
    }
    return kcenon::thread::job_priority::normal;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameJobScheduler::Impl {
    struct TickEntry {
        JobId id;
        std::string name;
        std::chrono::milliseconds interval;
        std::chrono::milliseconds elapsed{0};
        TickFunc func;
        JobPriority priority{JobPriority::Normal};
        std::atomic<bool> running{false};
        std::atomic<uint64_t> skipped{0};
        std::atomic<uint64_t> completed{0};
    };

    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::atomic<uint64_t> nextJobId{1};
    std::stop_source stopSource;

    std::vector<std::shared_ptr<TickEntry>> tickJobs;

    mutable std::mutex mutex;

    std::shared_ptr<TickEntry> findTick(JobId id) const {
        for (const auto& tick : tickJobs) {
            if (tick->id == id) {
                return tick;
            }
        }
        return nullptr;
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
GameJobScheduler::GameJobScheduler(std::size_t numThreads)
    : impl_(std::make_unique<Impl>())
{
    if (numThreads == 0) {
        numThreads = 1;
    }
    impl_->pool = std::make_shared<kcenon::thread::thread_pool>("vigor_scheduler");

    std::vector<std::unique_ptr<kcenon::thread::thread_worker>> workers;
    workers.reserve(numThreads);
    for (std::size_t i = 0; i < numThreads; ++i) {
        workers.push_back(std::make_unique<kcenon::thread::thread_worker>());
    }
    impl_->pool->enqueue_batch(std::move(workers));
    impl_->pool->start();
}

GameJobScheduler::~GameJobScheduler() {
    if (impl_ && impl_->pool) {
        impl_->stopSource.request_stop();
        impl_->pool->stop(false); // graceful: wait for running jobs
    }
}

GameJobScheduler::GameJobScheduler(GameJobScheduler&&) noexcept = default;
GameJobScheduler& GameJobScheduler::operator=(GameJobScheduler&&) noexcept = default;

// ---------------------------------------------------------------------------
// scheduleTick()
// ---------------------------------------------------------------------------
GameResult<GameJobScheduler::JobId> GameJobScheduler::scheduleTick(
    std::string name, std::chrono::milliseconds interval, TickFunc job, JobPriority priority)
{
    if (interval.count() <= 0) {
        return GameResult<JobId>::err(
            GameError(ErrorCode::InvalidArgument, "tick interval must be positive"));
    }
    auto id = impl_->nextJobId.fetch_add(1, std::memory_order_relaxed);

    auto entry = std::make_shared<Impl::TickEntry>();
    entry->id = id;
    entry->name = std::move(name);
    entry->interval = interval;
    entry->func = std::move(job);
    entry->priority = priority;

    VIGOR_LOG_INFO(LogCategory::Scheduler,
                   "registered tick '" + entry->name + "' every " +
                   std::to_string(interval.count()) + "ms");

    std::lock_guard lock(impl_->mutex);
    impl_->tickJobs.push_back(std::move(entry));
    return GameResult<JobId>::ok(id);
}

// ---------------------------------------------------------------------------
// processTick()
// ---------------------------------------------------------------------------
void GameJobScheduler::processTick(std::chrono::milliseconds deltaTime) {
    if (impl_->stopSource.stop_requested()) {
        return;
    }

    std::vector<std::shared_ptr<Impl::TickEntry>> due;
    {
        std::lock_guard lock(impl_->mutex);
        for (auto& tick : impl_->tickJobs) {
            tick->elapsed += deltaTime;
            if (tick->elapsed >= tick->interval) {
                tick->elapsed = std::chrono::milliseconds{0};
                due.push_back(tick);
            }
        }
    }

    auto token = impl_->stopSource.get_token();
    for (auto& tick : due) {
        bool expected = false;
        if (!tick->running.compare_exchange_strong(expected, true,
                                                   std::memory_order_acq_rel)) {
            tick->skipped.fetch_add(1, std::memory_order_relaxed);
            VIGOR_LOG_WARN(LogCategory::Scheduler,
                           "tick '" + tick->name + "' still running, skipping");
            continue;
        }

        auto threadJob = kcenon::thread::job_builder()
            .name("vigor_tick_" + tick->name)
            .priority(mapPriority(tick->priority))
            .work([tick, token]() -> kcenon::common::VoidResult {
                try {
                    tick->func(token);
                } catch (const std::exception& e) {
                    VIGOR_LOG_ERROR(LogCategory::Scheduler,
                                    "tick '" + tick->name + "' failed: " + e.what());
                }
                tick->completed.fetch_add(1, std::memory_order_relaxed);
                tick->running.store(false, std::memory_order_release);
                return kcenon::common::VoidResult::ok(std::monostate{});
            })
            .build();

        auto enqResult = impl_->pool->enqueue(std::move(threadJob));
        if (enqResult.is_err()) {
            tick->running.store(false, std::memory_order_release);
            VIGOR_LOG_ERROR(LogCategory::Scheduler,
                            "failed to dispatch tick '" + tick->name + "'");
        }
    }
}

// ---------------------------------------------------------------------------
// Stop / counters
// ---------------------------------------------------------------------------
void GameJobScheduler::requestStop() {
    impl_->stopSource.request_stop();
}

bool GameJobScheduler::stopRequested() const noexcept {
    return impl_->stopSource.stop_requested();
}

uint64_t GameJobScheduler::skippedTicks(JobId id) const {
    std::lock_guard lock(impl_->mutex);
    auto tick = impl_->findTick(id);
    return tick ? tick->skipped.load(std::memory_order_relaxed) : 0;
}

uint64_t GameJobScheduler::completedTicks(JobId id) const {
    std::lock_guard lock(impl_->mutex);
    auto tick = impl_->findTick(id);
    return tick ? tick->completed.load(std::memory_order_relaxed) : 0;
}

} // namespace vigor::foundation
