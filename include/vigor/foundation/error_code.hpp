#pragma once

/// @file error_code.hpp
/// @brief Categorized error codes for the combat core.

#include <cstdint>
#include <string_view>

namespace vigor::foundation {

/// Error codes categorized by subsystem using hex ranges.
///
/// Each subsystem occupies a 256-value range (0x100), so the source of a
/// failure can be read from the code value alone.
enum class ErrorCode : uint32_t {
    // General (0x0000 - 0x00FF)
    Success = 0x0000,
    Unknown = 0x0001,
    InvalidArgument = 0x0002,
    NotFound = 0x0003,
    AlreadyExists = 0x0004,
    NotImplemented = 0x0005,
    Cancelled = 0x0006,

    // Combat (0x0100 - 0x01FF)
    CombatError = 0x0100,
    NotInSameRoom = 0x0101,
    InsufficientStamina = 0x0102,
    NoUsableWeapon = 0x0103,
    BrokenEquipment = 0x0104,
    CombatSessionNotFound = 0x0105,
    ParticipantNotFound = 0x0106,
    NotInCombat = 0x0107,
    CombatantNotFound = 0x0108,
    ActionPrevented = 0x0109,

    // Effect (0x0200 - 0x02FF)
    EffectError = 0x0200,
    EffectDefinitionNotFound = 0x0201,
    EffectInstanceNotFound = 0x0202,
    EffectCatalogLoadFailed = 0x0203,

    // Vitality (0x0300 - 0x03FF)
    VitalityError = 0x0300,
    ActionBlocked = 0x0301,
    FocusCheckFailed = 0x0302,

    // Storage (0x0400 - 0x04FF)
    StorageUnavailable = 0x0400,

    // Config (0x0600 - 0x06FF)
    ConfigLoadFailed = 0x0600,
    ConfigKeyNotFound = 0x0601,
    ConfigTypeMismatch = 0x0602,

    // Thread (0x0700 - 0x07FF)
    ThreadError = 0x0700,
    JobScheduleFailed = 0x0701,

    // Logger (0x0800 - 0x08FF)
    LoggerError = 0x0800,
    LoggerFlushFailed = 0x0801,
};

/// Return the subsystem name for a given error code.
constexpr std::string_view errorSubsystem(ErrorCode code) {
    auto value = static_cast<uint32_t>(code);
    auto category = value & 0xFF00;
    switch (category) {
        case 0x0000: return "General";
        case 0x0100: return "Combat";
        case 0x0200: return "Effect";
        case 0x0300: return "Vitality";
        case 0x0400: return "Storage";
        case 0x0600: return "Config";
        case 0x0700: return "Thread";
        case 0x0800: return "Logger";
        default: return "Unknown";
    }
}

} // namespace vigor::foundation
