/// @file game_logger.cpp
/// @brief GameLogger implementation over kcenon common_system logger interfaces.

#include "vigor/foundation/game_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <array>
#include <atomic>
#include <cctype>
#include <map>
#include <string>

namespace vigor::foundation {

// ---------------------------------------------------------------------------
// Level mapping: vigor -> kcenon
// ---------------------------------------------------------------------------
static kcenon::common::interfaces::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kcenon::common::interfaces::log_level::trace;
        case LogLevel::Debug:    return kcenon::common::interfaces::log_level::debug;
        case LogLevel::Info:     return kcenon::common::interfaces::log_level::info;
        case LogLevel::Warning:  return kcenon::common::interfaces::log_level::warning;
        case LogLevel::Error:    return kcenon::common::interfaces::log_level::error;
        case LogLevel::Critical: return kcenon::common::interfaces::log_level::critical;
        case LogLevel::Off:      return kcenon::common::interfaces::log_level::off;
    }
    return kcenon::common::interfaces::log_level::info;
}

// ---------------------------------------------------------------------------
// Default log levels per category
// ---------------------------------------------------------------------------
static constexpr std::array<LogLevel, kLogCategoryCount> kDefaultCategoryLevels = {
    LogLevel::Info,   // Core
    LogLevel::Debug,  // Combat
    LogLevel::Info,   // Effect
    LogLevel::Info,   // Vitality
    LogLevel::Debug,  // AI
    LogLevel::Info,   // Scheduler
    LogLevel::Info    // Config
};

static std::string lowercase(std::string_view text) {
    std::string lower;
    lower.reserve(text.size());
    for (char c : text) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower;
}

std::optional<LogLevel> parseLogLevel(std::string_view name) {
    auto lower = lowercase(name);
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warning;
    if (lower == "error") return LogLevel::Error;
    if (lower == "critical") return LogLevel::Critical;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

std::optional<LogCategory> parseLogCategory(std::string_view name) {
    auto lower = lowercase(name);
    for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
        auto cat = static_cast<LogCategory>(i);
        if (lowercase(logCategoryName(cat)) == lower) {
            return cat;
        }
    }
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// Context serialization: "combatant=42, target=7, session=3, room=9, k=v"
// ---------------------------------------------------------------------------
static void appendField(std::string& out, std::string_view key, std::string_view val) {
    if (!out.empty()) {
        out += ", ";
    }
    out += key;
    out += '=';
    out += val;
}

template <typename Id>
static void appendId(std::string& out, std::string_view key, const std::optional<Id>& id) {
    if (id && id->isValid()) {
        appendField(out, key, std::to_string(id->value()));
    }
}

static std::string formatContext(const LogContext& ctx) {
    std::string out;
    appendId(out, "combatant", ctx.combatantId);
    appendId(out, "target", ctx.targetId);
    appendId(out, "session", ctx.sessionId);
    appendId(out, "room", ctx.room);
    // Key order keeps identical contexts byte-identical.
    std::map<std::string, std::string> sorted(ctx.extra.begin(), ctx.extra.end());
    for (const auto& [key, val] : sorted) {
        appendField(out, key, val);
    }
    return out;
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct GameLogger::Impl {
    // Per-category log levels (atomic for lock-free reads on the hot path)
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers registered in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(kDefaultCategoryLevels[i],
                                    std::memory_order_relaxed);
            loggerNames[i] = std::string("vigor.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kcenon::common::interfaces::ILogger> getLogger(
        LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kcenon::common::interfaces::GlobalLoggerRegistry::null_logger();
        }
        // Named per-category logger first, then the registry default.
        auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (!logger->is_enabled(kcenon::common::interfaces::log_level::off)) {
            auto defaultLogger = registry.get_default_logger();
            if (defaultLogger != kcenon::common::interfaces::GlobalLoggerRegistry::null_logger()) {
                return defaultLogger;
            }
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view context) const {
        std::string line;
        line.reserve(msg.size() + context.size() + 16);
        line += '[';
        line += logCategoryName(cat);
        line += "] ";
        line += msg;
        if (!context.empty()) {
            line += " {";
            line += context;
            line += '}';
        }
        getLogger(cat)->log(mapLevel(level), line);
    }
};

// ---------------------------------------------------------------------------
// Construction / Destruction / Move
// ---------------------------------------------------------------------------
GameLogger::GameLogger() : impl_(std::make_unique<Impl>()) {}

GameLogger::~GameLogger() = default;

GameLogger::GameLogger(GameLogger&&) noexcept = default;
GameLogger& GameLogger::operator=(GameLogger&&) noexcept = default;

// ---------------------------------------------------------------------------
// log() / logWithContext()
// ---------------------------------------------------------------------------
void GameLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (isEnabled(level, cat)) {
        impl_->emit(level, cat, msg, {});
    }
}

void GameLogger::logWithContext(LogLevel level, LogCategory cat,
                                std::string_view msg, const LogContext& ctx) {
    if (isEnabled(level, cat)) {
        impl_->emit(level, cat, msg, formatContext(ctx));
    }
}

// ---------------------------------------------------------------------------
// Category level control
// ---------------------------------------------------------------------------
void GameLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

LogLevel GameLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

void GameLogger::setAllLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

bool GameLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

// ---------------------------------------------------------------------------
// flush()
// ---------------------------------------------------------------------------
GameResult<void> GameLogger::flush() {
    auto& registry = kcenon::common::interfaces::GlobalLoggerRegistry::instance();
    auto logger = registry.get_default_logger();
    auto result = logger->flush();
    if (result.is_err()) {
        return GameResult<void>::err(
            GameError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return GameResult<void>::ok();
}

// ---------------------------------------------------------------------------
// instance()
// ---------------------------------------------------------------------------
GameLogger& GameLogger::instance() {
    static GameLogger inst;
    return inst;
}

} // namespace vigor::foundation
