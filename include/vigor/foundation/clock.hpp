#pragma once

/// @file clock.hpp
/// @brief Wall-clock abstraction for penalty expiry, effect durations and regeneration.

#include <atomic>
#include <chrono>

namespace vigor::foundation {

using GameClock = std::chrono::system_clock;
using GameTime = GameClock::time_point;
using Seconds = std::chrono::seconds;

/// Source of the current game time.
///
/// Implementations must be thread-safe.
class IClock {
public:
    virtual ~IClock() = default;

    [[nodiscard]] virtual GameTime now() const = 0;
};

/// Clock reading the system wall clock.
class SystemClock : public IClock {
public:
    [[nodiscard]] GameTime now() const override { return GameClock::now(); }
};

/// Clock that only moves when told to, for tests and replays.
class ManualClock : public IClock {
public:
    explicit ManualClock(GameTime start = GameTime{} + std::chrono::hours(24 * 365 * 50))
        : ticks_(start.time_since_epoch().count()) {}

    [[nodiscard]] GameTime now() const override {
        return GameTime(GameClock::duration(ticks_.load(std::memory_order_acquire)));
    }

    void advance(GameClock::duration delta) {
        ticks_.fetch_add(delta.count(), std::memory_order_acq_rel);
    }

    void set(GameTime time) {
        ticks_.store(time.time_since_epoch().count(), std::memory_order_release);
    }

private:
    std::atomic<GameClock::rep> ticks_;
};

} // namespace vigor::foundation
