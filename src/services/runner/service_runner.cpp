/// @file service_runner.cpp
/// @brief Shared service entry-point utilities.

#include "vigor/service/service_runner.hpp"

#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <string_view>
#include <thread>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::service {

using vigor::foundation::GameLogger;
using vigor::foundation::LogCategory;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

void SignalHandler::waitForShutdown() const {
    using namespace std::chrono_literals;
    while (!shutdownFlag_.load(std::memory_order_relaxed)) {
        std::this_thread::sleep_for(100ms);
    }
}

void SignalHandler::requestShutdown() noexcept {
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

// -- GracefulShutdown --------------------------------------------------------

void GracefulShutdown::addHook(std::string name, Hook hook) {
    hooks_.push_back({std::move(name), std::move(hook)});
}

void GracefulShutdown::execute() {
    if (executed_) {
        return;
    }
    executed_ = true;
    for (auto& hook : hooks_) {
        VIGOR_LOG_INFO(LogCategory::Core, "shutdown: " + hook.name);
        try {
            hook.callback();
        } catch (const std::exception& e) {
            VIGOR_LOG_ERROR(LogCategory::Core,
                            "shutdown step '" + hook.name + "' failed: " + e.what());
        }
    }
}

// -- Config loading ----------------------------------------------------------

vigor::foundation::GameResult<void>
loadConfig(vigor::foundation::ConfigManager& config,
           const std::filesystem::path& defaultPath) {
    std::filesystem::path configPath = defaultPath;

    const char* envPath = std::getenv("VIGOR_CONFIG_PATH");
    if (envPath != nullptr && *envPath != '\0') {
        configPath = envPath;
    }

    VIGOR_LOG_INFO(LogCategory::Config, "loading configuration from " + configPath.string());
    return config.load(configPath);
}

void applyLoggingConfig(const vigor::foundation::ConfigManager& config) {
    auto& logger = GameLogger::instance();
    if (auto name = config.get<std::string>("logging.level")) {
        if (auto level = vigor::foundation::parseLogLevel(name.value())) {
            logger.setAllLevels(*level);
        } else {
            VIGOR_LOG_WARN(LogCategory::Config, "unknown logging.level '" + name.value() + "'");
        }
    }

    // logging.categories.<category>: <level> overrides the global level.
    constexpr std::string_view kSection = "logging.categories";
    for (const auto& key : config.keysUnder(kSection)) {
        auto categoryName = std::string_view(key).substr(kSection.size() + 1);
        auto category = vigor::foundation::parseLogCategory(categoryName);
        auto level = vigor::foundation::parseLogLevel(config.getOr<std::string>(key, ""));
        if (!category || !level) {
            VIGOR_LOG_WARN(LogCategory::Config, "ignoring log override '" + key + "'");
            continue;
        }
        logger.setCategoryLevel(*category, *level);
    }
}

// -- CLI argument parsing ----------------------------------------------------

std::filesystem::path parseConfigArg(int argc, char* argv[]) {
    constexpr std::string_view kFlag = "--config";
    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        if (arg == kFlag && i + 1 < argc) {
            return argv[i + 1];  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
        if (arg.size() > kFlag.size() + 1 && arg.substr(0, kFlag.size()) == kFlag &&
            arg[kFlag.size()] == '=') {
            return std::filesystem::path(std::string(arg.substr(kFlag.size() + 1)));
        }
    }
    return {};
}

}  // namespace vigor::service
