#pragma once

/// @file combat_types.hpp
/// @brief Enumerations and constants for melee resolution.

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace vigor::game {

/// Length of one combat round; timed penalties are counted in rounds.
constexpr std::chrono::seconds kRoundDuration{3};

/// Skill level assumed when a combatant lacks the skill entirely.
constexpr int kDefaultSkillLevel = 10;

/// Target number subtracted from the physicality check.
constexpr int kPhysicalityCheckTarget = 8;

/// Attack penalty for striking with the off hand.
constexpr int kOffHandPenalty = 2;

/// NPCs switch to parrying below this much fatigue.
constexpr int kParryFatigueThreshold = 3;

/// Health fraction at or below which an NPC tries to flee.
constexpr double kDefaultFleeThreshold = 0.25;

/// Damage type classification for armor absorption.
enum class DamageType : uint8_t {
    Bashing,
    Cutting,
    Piercing,
    Projectile,
    Energy,
    Heat,
    Cold,
    Acid
};

constexpr std::size_t kDamageTypeCount = 8;

/// Weapon and armor class. Weapons whose class exceeds the armor's class
/// reduce absorption by the difference.
enum class DamageClass : uint8_t {
    Class1 = 1,
    Class2 = 2,
    Class3 = 3,
    Class4 = 4
};

/// Where a blow lands. General is used for wounds without a location.
enum class BodyLocation : uint8_t {
    General,
    Head,
    Torso,
    LeftArm,
    RightArm,
    LeftLeg,
    RightLeg
};

constexpr std::size_t kBodyLocationCount = 7;

/// Equipment slots relevant to combat.
enum class EquipSlot : uint8_t {
    Head,
    Chest,
    ArmLeft,
    ArmRight,
    Hands,
    Legs,
    Feet,
    Back,
    MainHand,
    OffHand,
    TwoHand
};

/// Hand used for a melee attack.
enum class AttackHand : uint8_t { MainHand, OffHand };

/// Kind of entry in a session's action log.
enum class CombatActionType : uint8_t {
    MeleeAttack,
    RangedAttack,
    Knockback,
    Flee
};

/// How a skill was exercised, reported to the progression subsystem.
enum class SkillUsageType : uint8_t {
    RoutineUse,
    ChallengingUse,
    CriticalSuccess,
    TeachingOthers,
    TrainingPractice
};

/// Loudness of a published combat action.
enum class SoundLevel : uint8_t { Quiet, Normal, Loud };

constexpr std::string_view damageTypeName(DamageType type) {
    switch (type) {
        case DamageType::Bashing:    return "Bashing";
        case DamageType::Cutting:    return "Cutting";
        case DamageType::Piercing:   return "Piercing";
        case DamageType::Projectile: return "Projectile";
        case DamageType::Energy:     return "Energy";
        case DamageType::Heat:       return "Heat";
        case DamageType::Cold:       return "Cold";
        case DamageType::Acid:       return "Acid";
    }
    return "Unknown";
}

constexpr std::string_view bodyLocationName(BodyLocation location) {
    switch (location) {
        case BodyLocation::General:  return "General";
        case BodyLocation::Head:     return "Head";
        case BodyLocation::Torso:    return "Torso";
        case BodyLocation::LeftArm:  return "LeftArm";
        case BodyLocation::RightArm: return "RightArm";
        case BodyLocation::LeftLeg:  return "LeftLeg";
        case BodyLocation::RightLeg: return "RightLeg";
    }
    return "Unknown";
}

/// Lowercase ASCII copy, used for case-insensitive name matching.
std::string asciiLower(std::string_view text);

/// Parse a damage type name as written in catalogs ("cutting", "Heat").
std::optional<DamageType> parseDamageType(std::string_view name);

/// Parse a body location name ("LeftArm", "head").
std::optional<BodyLocation> parseBodyLocation(std::string_view name);

/// Well-known skill and attribute names.
namespace skills {
inline constexpr std::string_view kPhysicality = "Physicality";
inline constexpr std::string_view kDodge = "Dodge";
inline constexpr std::string_view kDrive = "Drive";
inline constexpr std::string_view kReasoning = "Reasoning";
inline constexpr std::string_view kAwareness = "Awareness";
inline constexpr std::string_view kFocus = "Focus";
inline constexpr std::string_view kBearing = "Bearing";
inline constexpr std::string_view kUnarmedCombat = "Unarmed Combat";
} // namespace skills

}  // namespace vigor::game
