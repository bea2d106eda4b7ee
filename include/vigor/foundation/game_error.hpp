#pragma once

/// @file game_error.hpp
/// @brief Error type used with Result<T, GameError>.

#include <any>
#include <string>
#include <string_view>
#include <utility>

#include "vigor/foundation/error_code.hpp"

namespace vigor::foundation {

/// Error carrying a categorized code, a message that can be shown to
/// the acting player, and optional type-erased context for diagnostics.
class GameError {
public:
    GameError() = default;

    explicit GameError(ErrorCode code)
        : code_(code) {}

    GameError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    GameError(ErrorCode code, std::string message, std::any context)
        : code_(code), message_(std::move(message)), context_(std::move(context)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// Access typed context data (nullptr on type mismatch or when empty).
    template <typename T>
    [[nodiscard]] const T* context() const noexcept {
        return std::any_cast<T>(&context_);
    }

    [[nodiscard]] bool hasContext() const noexcept { return context_.has_value(); }

    /// True when this error is in the given subsystem range.
    [[nodiscard]] bool isIn(ErrorCode rangeBase) const noexcept {
        return (static_cast<uint32_t>(code_) & 0xFF00) ==
               (static_cast<uint32_t>(rangeBase) & 0xFF00);
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    std::any context_;
};

} // namespace vigor::foundation
