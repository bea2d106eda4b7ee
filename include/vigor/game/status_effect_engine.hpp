#pragma once

/// @file status_effect_engine.hpp
/// @brief StatusEffectEngine: stacking, timed effects on combatants.
///
/// Holds the active effect instances of every combatant. Attack resolution
/// reads the aggregated EffectSummary; the effect tick drives periodic
/// damage and healing, expiry and natural wound healing.

#include <memory>
#include <mutex>
#include <optional>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vigor/foundation/clock.hpp"
#include "vigor/foundation/game_result.hpp"
#include "vigor/game/combatant.hpp"
#include "vigor/game/effect_catalog.hpp"
#include "vigor/game/status_effect_types.hpp"

namespace vigor::game {

using vigor::foundation::IClock;

/// Time for one wound stack to heal on its own.
constexpr std::chrono::hours kNaturalWoundHealInterval{4};

/// Thread-safe store of active status effects.
///
/// Locking: the engine mutex is never held while a combatant mutex is
/// taken. Callers that already hold a combatant mutex may call any method
/// except ProcessPeriodicEffects, which takes the combatant mutex itself.
class StatusEffectEngine {
public:
    StatusEffectEngine(std::shared_ptr<const EffectCatalog> catalog,
                       std::shared_ptr<const IClock> clock);

    // ── Application ─────────────────────────────────────────────────────

    /// Apply the named effect.
    ///
    /// Stackable effects add a stack up to the definition's maximum, then
    /// only refresh. Non-stackable effects refresh timestamps and intensity.
    /// @return EffectDefinitionNotFound for an unknown name.
    GameResult<EffectApplication> ApplyEffect(CombatantId combatant, std::string_view name,
                                              const ApplyEffectOptions& options = {});

    GameResult<EffectApplication> ApplyEffect(CombatantId combatant,
                                              EffectDefinitionId definition,
                                              const ApplyEffectOptions& options = {});

    /// Add one Wound stack at @p location.
    GameResult<EffectApplication> ApplyWound(CombatantId combatant, BodyLocation location,
                                             std::optional<CombatantId> source = std::nullopt);

    // ── Removal ─────────────────────────────────────────────────────────

    /// Deactivate one instance.
    /// @return The removed instance, or EffectInstanceNotFound.
    GameResult<StatusEffectInstance> RemoveEffect(CombatantId combatant,
                                                  EffectInstanceId instance,
                                                  std::string_view reason = "removed");

    /// Remove every instance of @p category. @return Number removed.
    int RemoveEffectsByCategory(CombatantId combatant, EffectCategory category,
                                std::string_view reason = "removed");

    /// Heal up to @p count wound stacks (0 = all), oldest first, optionally
    /// only at @p location. Does not touch the pools. @return Stacks healed.
    int HealWoundStacks(CombatantId combatant, int count = 0,
                        std::optional<BodyLocation> location = std::nullopt);

    /// HealWoundStacks, then lower the combatant's wound pool by the same
    /// amount. Takes the combatant mutex. @return Stacks healed.
    int HealWounds(Combatant& combatant, int count = 0,
                   std::optional<BodyLocation> location = std::nullopt);

    /// Drop every instance of a combatant (e.g. on despawn).
    void RemoveAllFor(CombatantId combatant);

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] EffectSummary Summary(CombatantId combatant) const;

    /// Active, non-expired instances.
    [[nodiscard]] std::vector<StatusEffectInstance> ActiveEffects(CombatantId combatant) const;

    [[nodiscard]] bool HasEffect(CombatantId combatant, std::string_view name) const;
    [[nodiscard]] int WoundCount(CombatantId combatant) const;
    [[nodiscard]] std::map<BodyLocation, int> WoundsByLocation(CombatantId combatant) const;

    /// Combatants that currently hold at least one instance.
    [[nodiscard]] std::vector<CombatantId> AffectedCombatants() const;

    // ── Tick processing ─────────────────────────────────────────────────

    /// Compute the periodic damage and healing owed by @p combatant's
    /// effects and advance their tick timestamps. Does not touch the pools.
    PeriodicResult CollectPeriodicEffects(CombatantId combatant);

    /// CollectPeriodicEffects, then queue the result as pending damage or
    /// healing on the combatant. Takes the combatant mutex.
    PeriodicResult ProcessPeriodicEffects(Combatant& combatant);

    /// Heal one wound stack per kNaturalWoundHealInterval elapsed on each
    /// wound instance. Does not touch the pools. @return Stacks healed.
    int CollectNaturalWoundHealing(CombatantId combatant);

    /// CollectNaturalWoundHealing, then lower the combatant's wound pool by
    /// the same amount. Takes the combatant mutex. @return Stacks healed.
    int ProcessNaturalWoundHealing(Combatant& combatant);

    /// Deactivate and drop expired instances of every combatant.
    /// @return The removed instances, reason "expired".
    std::vector<StatusEffectInstance> CleanupExpired();

    /// Stateless summary over a set of instances.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static EffectSummary Summarize(const std::vector<StatusEffectInstance>& instances,
                                                 const EffectCatalog& catalog, GameTime now);

private:
    using InstanceList = std::vector<StatusEffectInstance>;

    GameResult<EffectApplication> applyLocked(CombatantId combatant,
                                              const StatusEffectDefinition& definition,
                                              const ApplyEffectOptions& options, GameTime now);

    /// Active instance of @p definition that a new application should
    /// merge into. Requires mutex_.
    StatusEffectInstance* findMergeTarget(InstanceList& list, EffectDefinitionId definition,
                                          std::optional<BodyLocation> location, GameTime now);

    std::shared_ptr<const EffectCatalog> catalog_;
    std::shared_ptr<const IClock> clock_;

    mutable std::mutex mutex_;
    std::unordered_map<CombatantId, InstanceList> instances_;
    uint64_t nextInstanceId_ = 1;
};

}  // namespace vigor::game
