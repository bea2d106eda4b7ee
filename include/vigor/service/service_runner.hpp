#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities: signals, config loading, shutdown hooks
///        and CLI parsing.

#include <atomic>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

#include "vigor/foundation/config_manager.hpp"
#include "vigor/foundation/game_result.hpp"

namespace vigor::service {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one instance should exist per process. The destructor restores
/// the default handlers so a second signal terminates immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Block until a shutdown signal arrives.
    void waitForShutdown() const;

    /// Raise the flag without a signal (tests, fatal startup errors).
    static void requestShutdown() noexcept;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Ordered shutdown steps. A step that throws is logged and the
/// remaining steps still run.
class GracefulShutdown {
public:
    using Hook = std::function<void()>;

    void addHook(std::string name, Hook hook);

    /// Run every hook once, in registration order.
    void execute();

    [[nodiscard]] std::size_t hookCount() const noexcept { return hooks_.size(); }

private:
    struct NamedHook {
        std::string name;
        Hook callback;
    };
    std::vector<NamedHook> hooks_;
    bool executed_ = false;
};

/// Load configuration into @p config.
///
/// VIGOR_CONFIG_PATH, when set, takes precedence over @p defaultPath.
[[nodiscard]] vigor::foundation::GameResult<void>
loadConfig(vigor::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath);

/// Apply `logging.level` from @p config to every log category, then each
/// `logging.categories.<category>` entry to its own category. Unknown
/// level or category names are reported and leave that level in place.
void applyLoggingConfig(const vigor::foundation::ConfigManager& config);

/// Parse `--config <path>` or `--config=<path>`.
/// @return The path, or an empty path when absent.
[[nodiscard]] std::filesystem::path parseConfigArg(int argc, char* argv[]);

}  // namespace vigor::service
