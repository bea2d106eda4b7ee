/// @file game_loop.cpp
/// @brief GameLoop implementation.

#include "vigor/service/game_loop.hpp"

namespace vigor::service {

namespace {

constexpr uint32_t kDefaultTickRate = 10;

}  // namespace

GameLoop::GameLoop(uint32_t tickRate)
    : tickRate_(tickRate > 0 ? tickRate : kDefaultTickRate),
      period_(std::chrono::microseconds(1'000'000 / tickRate_)) {}

GameLoop::~GameLoop() {
    stop();
}

void GameLoop::setTickCallback(TickCallback callback) {
    std::lock_guard<std::mutex> lock(callbackMutex_);
    tickCallback_ = std::move(callback);
}

bool GameLoop::start() {
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true)) {
        return false;
    }
    thread_ = std::jthread([this](std::stop_token st) { run(st); });
    return true;
}

void GameLoop::stop() {
    if (thread_.joinable()) {
        thread_.request_stop();
        thread_.join();
    }
    running_.store(false);
}

TickMetrics GameLoop::tick(std::chrono::milliseconds deltaTime) {
    auto metrics = executeTick(deltaTime);
    std::lock_guard<std::mutex> lock(metricsMutex_);
    lastMetrics_ = metrics;
    return metrics;
}

bool GameLoop::isRunning() const noexcept {
    return running_.load();
}

uint64_t GameLoop::tickCount() const noexcept {
    return tickCount_.load();
}

TickMetrics GameLoop::lastMetrics() const {
    std::lock_guard<std::mutex> lock(metricsMutex_);
    return lastMetrics_;
}

void GameLoop::run(std::stop_token stopToken) {
    auto previous = std::chrono::steady_clock::now();
    auto nextTick = previous + period_;

    while (!stopToken.stop_requested()) {
        auto now = std::chrono::steady_clock::now();
        if (now < nextTick) {
            std::this_thread::sleep_until(nextTick);
            continue;
        }

        auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(now - previous);
        // Sub-millisecond remainders carry into the next delta.
        previous += delta;

        tick(delta);

        nextTick += period_;
        if (nextTick < now) {
            // Overran: do not try to catch up with a burst of ticks.
            nextTick = now + period_;
        }
    }
}

TickMetrics GameLoop::executeTick(std::chrono::milliseconds deltaTime) {
    auto start = std::chrono::steady_clock::now();
    {
        std::lock_guard<std::mutex> lock(callbackMutex_);
        if (tickCallback_) {
            tickCallback_(deltaTime);
        }
    }
    auto updateTime = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);

    TickMetrics metrics;
    metrics.delta = deltaTime;
    metrics.updateTime = updateTime;
    metrics.tickNumber = tickCount_.fetch_add(1);
    metrics.overrun = updateTime > period_;
    return metrics;
}

}  // namespace vigor::service
