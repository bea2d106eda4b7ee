#pragma once

/// @file status_effect_types.hpp
/// @brief Status effect definitions, instances and the aggregated summary.

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vigor/foundation/clock.hpp"
#include "vigor/foundation/types.hpp"
#include "vigor/game/combat_types.hpp"

namespace vigor::game {

using vigor::foundation::CombatantId;
using vigor::foundation::EffectDefinitionId;
using vigor::foundation::EffectInstanceId;
using vigor::foundation::GameTime;

/// Broad classification of an effect.
enum class EffectCategory : uint8_t {
    Wound,
    Buff,
    Debuff,
    DamageOverTime,
    HealOverTime,
    Status
};

/// What a single impact of an effect does.
enum class ImpactType : uint8_t {
    ModifyAttribute,
    ModifySkill,
    ModifyAttackValue,
    ModifyDefenseValue,
    PeriodicFatigueDamage,
    PeriodicVitalityDamage,
    PeriodicFatigueHealing,
    PeriodicVitalityHealing,
    ModifyMaxFatigue,
    ModifyMaxVitality,
    PreventMovement,
    PreventSpellcasting,
    PreventActions,
    Invisibility,
    ModifyDamageDealt,
    ModifyDamageReceived
};

/// Attack-value penalty contributed by each wound stack.
constexpr int kWoundAttackPenalty = -2;

/// Name of the definition used for wounds inflicted by melee hits.
inline constexpr std::string_view kWoundEffectName = "Wound";

/// One effect of a definition (e.g. "+2 Physicality", "2 vitality damage per tick").
struct EffectImpact {
    ImpactType type = ImpactType::ModifyAttackValue;
    double value = 0.0;
    /// Attribute or skill name for ModifyAttribute / ModifySkill.
    std::string target;
    bool scalesWithIntensity = true;
    bool isPercentage = false;
};

/// Immutable description of an effect, loaded once at startup.
struct StatusEffectDefinition {
    EffectDefinitionId id;
    std::string name;
    std::string description;
    EffectCategory category = EffectCategory::Status;
    bool stackable = false;
    int maxStacks = 1;
    /// Seconds between periodic ticks; 0 means no periodic impacts.
    int tickIntervalSeconds = 0;
    /// Default duration in seconds; 0 means permanent.
    int defaultDurationSeconds = 0;
    double defaultIntensity = 1.0;
    std::vector<EffectImpact> impacts;
};

/// An effect applied to a combatant.
struct StatusEffectInstance {
    EffectInstanceId id;
    CombatantId combatantId;
    EffectDefinitionId definitionId;
    int stacks = 1;
    double intensity = 1.0;
    GameTime appliedAt{};
    std::optional<GameTime> expiresAt;   ///< Empty means permanent.
    std::optional<GameTime> lastTickAt;
    std::optional<BodyLocation> bodyLocation;
    std::optional<CombatantId> sourceId;
    bool active = true;
    std::optional<GameTime> removedAt;
    std::string removalReason;

    [[nodiscard]] bool IsExpiredAt(GameTime now) const noexcept {
        return expiresAt.has_value() && *expiresAt <= now;
    }
};

/// Options for applying an effect. Unset fields use the definition defaults.
struct ApplyEffectOptions {
    /// Seconds; 0 expires immediately, unset uses the definition default.
    std::optional<int> durationSeconds;
    std::optional<double> intensity;
    std::optional<BodyLocation> bodyLocation;
    std::optional<CombatantId> sourceId;
};

/// Outcome of an apply call.
struct EffectApplication {
    EffectInstanceId instanceId;
    int stacks = 0;
    bool stacked = false;
    bool refreshed = false;
    std::string message;
};

/// Aggregate of every active, non-expired effect on a combatant.
struct EffectSummary {
    std::vector<std::string> activeEffectNames;
    int woundCount = 0;
    std::map<BodyLocation, int> woundsByLocation;
    std::map<std::string, int> attributeModifiers;
    std::map<std::string, int> skillModifiers;
    int attackValueModifier = 0;
    int defenseValueModifier = 0;
    int maxFatigueModifier = 0;
    int maxVitalityModifier = 0;
    /// Fractional modifiers, e.g. -0.25 deals 25% less damage.
    double damageDealtModifier = 0.0;
    double damageReceivedModifier = 0.0;
    bool canMove = true;
    bool canCastSpells = true;
    bool canAct = true;
    bool isInvisible = false;

    /// Attribute plus skill modifier for @p name, compared case-insensitively.
    [[nodiscard]] int ModifierFor(std::string_view name) const;
};

/// Pending changes produced by one periodic pass over a combatant.
struct PeriodicResult {
    int fatigueDelta = 0;   ///< Positive damage, negative healing.
    int vitalityDelta = 0;
    std::vector<std::string> messages;
};

std::string_view effectCategoryName(EffectCategory category);
std::optional<EffectCategory> parseEffectCategory(std::string_view name);
std::string_view impactTypeName(ImpactType type);
std::optional<ImpactType> parseImpactType(std::string_view name);

}  // namespace vigor::game
