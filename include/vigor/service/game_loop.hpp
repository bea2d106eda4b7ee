#pragma once

/// @file game_loop.hpp
/// @brief Monotonic ticker that drives the job scheduler.
///
/// GameLoop calls its tick callback at a fixed rate (default 10 Hz) on a
/// dedicated std::jthread. The callback receives the measured steady-clock
/// time since the previous tick, so a slow tick makes the next delta larger
/// instead of dropping time.

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <stop_token>
#include <thread>

namespace vigor::service {

/// Timing of one loop iteration.
struct TickMetrics {
    /// Time handed to the callback as its delta.
    std::chrono::milliseconds delta{0};

    /// Time spent inside the callback.
    std::chrono::microseconds updateTime{0};

    uint64_t tickNumber = 0;

    /// True when updateTime exceeded the target period.
    bool overrun = false;
};

/// Usage:
/// @code
///   GameLoop loop(10);
///   loop.setTickCallback([&](std::chrono::milliseconds dt) {
///       scheduler.processTick(dt);
///   });
///   loop.start();
///   // ...
///   loop.stop();
/// @endcode
class GameLoop {
public:
    using TickCallback = std::function<void(std::chrono::milliseconds deltaTime)>;

    /// @param tickRate  Ticks per second; 0 falls back to 10.
    explicit GameLoop(uint32_t tickRate = 10);

    ~GameLoop();

    GameLoop(const GameLoop&) = delete;
    GameLoop& operator=(const GameLoop&) = delete;
    GameLoop(GameLoop&&) = delete;
    GameLoop& operator=(GameLoop&&) = delete;

    void setTickCallback(TickCallback callback);

    /// @return false if already running.
    [[nodiscard]] bool start();

    /// Request stop and join the loop thread.
    void stop();

    /// Run one iteration on the calling thread with an explicit delta.
    /// The loop must not be running.
    TickMetrics tick(std::chrono::milliseconds deltaTime);

    [[nodiscard]] bool isRunning() const noexcept;
    [[nodiscard]] uint32_t tickRate() const noexcept { return tickRate_; }
    [[nodiscard]] std::chrono::microseconds period() const noexcept { return period_; }
    [[nodiscard]] uint64_t tickCount() const noexcept;
    [[nodiscard]] TickMetrics lastMetrics() const;

private:
    void run(std::stop_token stopToken);
    TickMetrics executeTick(std::chrono::milliseconds deltaTime);

    uint32_t tickRate_;
    std::chrono::microseconds period_;

    mutable std::mutex callbackMutex_;
    TickCallback tickCallback_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> tickCount_{0};
    std::jthread thread_;

    mutable std::mutex metricsMutex_;
    TickMetrics lastMetrics_;
};

}  // namespace vigor::service
