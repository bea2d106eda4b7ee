#pragma once

/// @file health_pool_processor.hpp
/// @brief HealthPoolProcessor: drains pending damage and healing into the
///        fatigue and vitality pools, and runs passive regeneration.
///
/// Pending changes are applied in halves (at least one point per tick), so
/// a heavy blow is felt over several ticks rather than all at once.

#include <chrono>
#include <memory>
#include <optional>
#include <stop_token>
#include <vector>

#include "vigor/foundation/clock.hpp"
#include "vigor/game/combatant.hpp"

namespace vigor::game {

using vigor::foundation::GameTime;
using vigor::foundation::IClock;

/// What one reconciliation step did to a single pool.
struct PoolStep {
    int applied = 0;     ///< Points removed (damage) or added (healing).
    int overflow = 0;    ///< Damage that found no points left to remove.
    bool changed = false;
};

/// What one tick did to a combatant.
struct PoolTickResult {
    bool changed = false;
    int fatigueDamage = 0;
    int fatigueHealed = 0;
    int vitalityDamage = 0;
    int vitalityHealed = 0;
    bool fatigueCrashed = false;
    /// Vitality dropped to zero during this tick.
    bool died = false;
};

class HealthPoolProcessor {
public:
    /// @param baseTick Reference tick length; also the fatigue regeneration
    ///        interval for a combatant with plenty of vitality.
    HealthPoolProcessor(std::shared_ptr<const IClock> clock, std::chrono::seconds baseTick);

    /// True when the combatant has pending changes or a pool below maximum.
    [[nodiscard]] static bool NeedsProcessing(const VitalPools& pools) noexcept {
        return pools.HasPending() || pools.BelowMax();
    }

    /// Run one tick on @p combatant: fatigue regeneration, vitality
    /// regeneration, then pending fatigue and pending vitality.
    /// Takes combatant.Mutex().
    PoolTickResult Process(Combatant& combatant);

    /// Process every combatant that needs it. Stops early when @p stop is
    /// requested. @return Number of combatants changed.
    std::size_t ProcessAll(const std::vector<std::shared_ptr<Combatant>>& combatants,
                           std::stop_token stop = {});

    // ── Pure steps, exposed for testability ─────────────────────────────

    /// Apply pending fatigue. Damage that overflows an empty pool, and the
    /// crash penalty when fatigue first reaches zero, are queued on pending
    /// vitality. @return What happened to the fatigue pool.
    static PoolStep ApplyPendingFatigue(VitalPools& pools, bool* crashed = nullptr);

    /// Apply pending vitality. Healing never spills into fatigue.
    static PoolStep ApplyPendingVitality(VitalPools& pools);

    /// Queue -1 pending fatigue when the regeneration interval for the
    /// available vitality has elapsed. @return true if state changed.
    static bool ApplyFatigueRegen(VitalPools& pools, RegenTimers& timers, GameTime now,
                                  std::chrono::seconds baseTick);

    /// Restore one vitality per elapsed hour, capped at the missing amount.
    /// @return true if state changed.
    static bool ApplyVitalityRegen(VitalPools& pools, RegenTimers& timers, GameTime now);

private:
    std::shared_ptr<const IClock> clock_;
    std::chrono::seconds baseTick_;
};

}  // namespace vigor::game
