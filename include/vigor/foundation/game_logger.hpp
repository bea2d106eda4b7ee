#pragma once

/// @file game_logger.hpp
/// @brief GameLogger wrapping the kcenon common_system logger registry.
///
/// Category-based filtering and structured context for combat, effect and
/// vitality logging.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "vigor/foundation/game_result.hpp"
#include "vigor/foundation/types.hpp"

namespace vigor::foundation {

/// Log severity levels for the game framework.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per combat-core subsystem.
///
/// Each category has its own minimum level so that, for example, attack
/// rolls can be traced without flooding the log with pool updates.
enum class LogCategory : uint8_t {
    Core      = 0, ///< Startup, shutdown, wiring
    Combat    = 1, ///< Attack resolution and sessions
    Effect    = 2, ///< Status effect application and ticks
    Vitality  = 3, ///< Pool reconciliation and regeneration
    AI        = 4, ///< NPC decisions
    Scheduler = 5, ///< Tick scheduling
    Config    = 6  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 7;

/// Return the string name for a log category.
constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Combat", "Effect", "Vitality", "AI", "Scheduler", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

/// Return the string name for a log level.
constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as written in configuration ("debug", "WARNING").
/// Unrecognized names yield std::nullopt.
[[nodiscard]] std::optional<LogLevel> parseLogLevel(std::string_view name);

/// Parse a category name, ignoring case ("combat", "AI").
[[nodiscard]] std::optional<LogCategory> parseLogCategory(std::string_view name);

/// Who, against whom, where. Rendered as a trailing
/// "{combatant=42, target=7, session=3, room=9, sv=7}" block; extra pairs
/// follow the fixed fields in key order.
struct LogContext {
    std::optional<CombatantId> combatantId;
    std::optional<CombatantId> targetId;
    std::optional<CombatSessionId> sessionId;
    std::optional<RoomId> room;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger forwarding to loggers registered in kcenon's GlobalLoggerRegistry.
///
/// Messages go to the logger named "vigor.<Category>" when one is
/// registered (e.g. "vigor.Combat"), otherwise to the registry's default
/// logger. PIMPL keeps the kcenon headers out of the public API.
///
/// Default log levels per category:
/// | Category  | Default Level |
/// |-----------|---------------|
/// | Core      | Info          |
/// | Combat    | Debug         |
/// | Effect    | Info          |
/// | Vitality  | Info          |
/// | AI        | Debug         |
/// | Scheduler | Info          |
/// | Config    | Info          |
class GameLogger {
public:
    GameLogger();
    ~GameLogger();

    // Non-copyable, movable.
    GameLogger(const GameLogger&) = delete;
    GameLogger& operator=(const GameLogger&) = delete;
    GameLogger(GameLogger&&) noexcept;
    GameLogger& operator=(GameLogger&&) noexcept;

    /// "[Category] msg". No-op below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// "[Category] msg {context}"; the braces are omitted for an empty context.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    /// Set the minimum log level for a category at runtime.
    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Get the current minimum log level for a category.
    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    /// Check if logging is enabled for the given level and category.
    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Set every category to the same minimum level.
    void setAllLevels(LogLevel minLevel);

    /// Flush all buffered log messages.
    GameResult<void> flush();

    /// Get the global GameLogger singleton instance.
    static GameLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace vigor::foundation

// ---------------------------------------------------------------------------
// Convenience macros
// ---------------------------------------------------------------------------

/// @name VIGOR_LOG Macros
/// @brief Logging macros with compile-time and runtime level checks.
///
/// Define VIGOR_MIN_LOG_LEVEL to strip calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef VIGOR_MIN_LOG_LEVEL
    #define VIGOR_MIN_LOG_LEVEL 0
#endif

#define VIGOR_LOG(level, cat, msg)                                                 \
    do {                                                                         \
        _Pragma("GCC diagnostic push")                                           \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                      \
        if (static_cast<int>(level) >= VIGOR_MIN_LOG_LEVEL &&                      \
            ::vigor::foundation::GameLogger::instance().isEnabled((level), (cat)))  \
        {                                                                        \
            ::vigor::foundation::GameLogger::instance().log((level), (cat), (msg)); \
        }                                                                        \
        _Pragma("GCC diagnostic pop")                                            \
    } while (0)

#define VIGOR_LOG_DEBUG(cat, msg) \
    VIGOR_LOG(::vigor::foundation::LogLevel::Debug, (cat), (msg))

#define VIGOR_LOG_INFO(cat, msg) \
    VIGOR_LOG(::vigor::foundation::LogLevel::Info, (cat), (msg))

#define VIGOR_LOG_WARN(cat, msg) \
    VIGOR_LOG(::vigor::foundation::LogLevel::Warning, (cat), (msg))

#define VIGOR_LOG_ERROR(cat, msg) \
    VIGOR_LOG(::vigor::foundation::LogLevel::Error, (cat), (msg))

#define VIGOR_LOG_CTX(level, cat, msg, ctx)                                          \
    do {                                                                             \
        if (::vigor::foundation::GameLogger::instance().isEnabled((level), (cat))) { \
            ::vigor::foundation::GameLogger::instance().logWithContext(              \
                (level), (cat), (msg), (ctx));                                       \
        }                                                                            \
    } while (0)

/// @}
