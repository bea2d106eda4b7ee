/// @file status_effect_types.cpp
/// @brief Name tables for effect enumerations and summary lookups.

#include "vigor/game/status_effect_types.hpp"

#include <array>
#include <utility>

namespace vigor::game {

namespace {

constexpr std::array<std::pair<EffectCategory, std::string_view>, 6> kCategoryNames = {{
    {EffectCategory::Wound, "Wound"},
    {EffectCategory::Buff, "Buff"},
    {EffectCategory::Debuff, "Debuff"},
    {EffectCategory::DamageOverTime, "DamageOverTime"},
    {EffectCategory::HealOverTime, "HealOverTime"},
    {EffectCategory::Status, "Status"},
}};

constexpr std::array<std::pair<ImpactType, std::string_view>, 16> kImpactNames = {{
    {ImpactType::ModifyAttribute, "ModifyAttribute"},
    {ImpactType::ModifySkill, "ModifySkill"},
    {ImpactType::ModifyAttackValue, "ModifyAttackValue"},
    {ImpactType::ModifyDefenseValue, "ModifyDefenseValue"},
    {ImpactType::PeriodicFatigueDamage, "PeriodicFatigueDamage"},
    {ImpactType::PeriodicVitalityDamage, "PeriodicVitalityDamage"},
    {ImpactType::PeriodicFatigueHealing, "PeriodicFatigueHealing"},
    {ImpactType::PeriodicVitalityHealing, "PeriodicVitalityHealing"},
    {ImpactType::ModifyMaxFatigue, "ModifyMaxFatigue"},
    {ImpactType::ModifyMaxVitality, "ModifyMaxVitality"},
    {ImpactType::PreventMovement, "PreventMovement"},
    {ImpactType::PreventSpellcasting, "PreventSpellcasting"},
    {ImpactType::PreventActions, "PreventActions"},
    {ImpactType::Invisibility, "Invisibility"},
    {ImpactType::ModifyDamageDealt, "ModifyDamageDealt"},
    {ImpactType::ModifyDamageReceived, "ModifyDamageReceived"},
}};

} // namespace

int EffectSummary::ModifierFor(std::string_view name) const {
    auto wanted = asciiLower(name);
    int total = 0;
    for (const auto& [key, value] : attributeModifiers) {
        if (asciiLower(key) == wanted) {
            total += value;
        }
    }
    for (const auto& [key, value] : skillModifiers) {
        if (asciiLower(key) == wanted) {
            total += value;
        }
    }
    return total;
}

std::string_view effectCategoryName(EffectCategory category) {
    for (const auto& [value, name] : kCategoryNames) {
        if (value == category) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<EffectCategory> parseEffectCategory(std::string_view name) {
    auto lower = asciiLower(name);
    if (lower == "statuseffect") {
        return EffectCategory::Status;
    }
    for (const auto& [value, text] : kCategoryNames) {
        if (asciiLower(text) == lower) {
            return value;
        }
    }
    return std::nullopt;
}

std::string_view impactTypeName(ImpactType type) {
    for (const auto& [value, name] : kImpactNames) {
        if (value == type) {
            return name;
        }
    }
    return "Unknown";
}

std::optional<ImpactType> parseImpactType(std::string_view name) {
    auto lower = asciiLower(name);
    for (const auto& [value, text] : kImpactNames) {
        if (asciiLower(text) == lower) {
            return value;
        }
    }
    return std::nullopt;
}

}  // namespace vigor::game
