/// @file health_pool_processor.cpp
/// @brief HealthPoolProcessor implementation.

#include "vigor/game/health_pool_processor.hpp"

#include <algorithm>
#include <mutex>

#include "vigor/foundation/game_logger.hpp"
#include "vigor/game/vitality_rules.hpp"

namespace vigor::game {

using vigor::foundation::LogCategory;
using vigor::foundation::LogContext;
using vigor::foundation::LogLevel;
using vigor::foundation::saturatingAdd;

namespace {

/// max(1, ceil(|pending| / 2)) without overflowing on INT_MIN.
int tickAmount(int pending) {
    auto magnitude = pending < 0 ? -static_cast<int64_t>(pending) : static_cast<int64_t>(pending);
    return static_cast<int>(std::max<int64_t>(1, (magnitude + 1) / 2));
}

/// Heal @p current toward @p max. Full pools discard the pending healing.
PoolStep healStep(int& current, int max, int& pending) {
    PoolStep step;
    int amount = tickAmount(pending);
    int capacity = max - current;
    if (capacity <= 0) {
        pending = 0;
        step.changed = true;
        return step;
    }
    step.applied = std::min(amount, capacity);
    current = std::min(max, current + step.applied);
    pending = std::min(0, saturatingAdd(pending, amount));
    if (amount > step.applied) {
        pending = 0;
    }
    step.changed = step.applied > 0;
    return step;
}

} // namespace

HealthPoolProcessor::HealthPoolProcessor(std::shared_ptr<const IClock> clock,
                                         std::chrono::seconds baseTick)
    : clock_(std::move(clock)), baseTick_(baseTick) {}

// ── Pure steps ──────────────────────────────────────────────────────────

PoolStep HealthPoolProcessor::ApplyPendingFatigue(VitalPools& pools, bool* crashed) {
    PoolStep step;
    if (crashed != nullptr) {
        *crashed = false;
    }
    if (pools.pendingFatigue == 0) {
        return step;
    }
    if (pools.pendingFatigue < 0) {
        return healStep(pools.currentFatigue, pools.maxFatigue, pools.pendingFatigue);
    }

    int amount = tickAmount(pools.pendingFatigue);
    int before = pools.currentFatigue;
    step.applied = std::min(amount, std::max(0, pools.currentFatigue));
    pools.currentFatigue = std::max(0, pools.currentFatigue - step.applied);
    pools.pendingFatigue = std::max(0, pools.pendingFatigue - amount);

    step.overflow = amount - step.applied;
    if (step.overflow > 0) {
        pools.pendingVitality = saturatingAdd(pools.pendingVitality, step.overflow);
    }

    bool crash = before > 0 && pools.currentFatigue == 0;
    if (crash) {
        pools.pendingVitality = saturatingAdd(pools.pendingVitality, kFatigueCrashVitalityDamage);
    }
    if (crashed != nullptr) {
        *crashed = crash;
    }
    step.changed = step.applied > 0 || step.overflow > 0 || crash;
    return step;
}

PoolStep HealthPoolProcessor::ApplyPendingVitality(VitalPools& pools) {
    PoolStep step;
    if (pools.pendingVitality == 0) {
        return step;
    }
    if (pools.pendingVitality < 0) {
        return healStep(pools.currentVitality, pools.maxVitality, pools.pendingVitality);
    }

    int amount = tickAmount(pools.pendingVitality);
    step.applied = std::min(amount, std::max(0, pools.currentVitality));
    pools.currentVitality = std::max(0, pools.currentVitality - step.applied);
    pools.pendingVitality = std::max(0, pools.pendingVitality - amount);
    step.overflow = amount - step.applied;
    step.changed = step.applied > 0;
    return step;
}

bool HealthPoolProcessor::ApplyFatigueRegen(VitalPools& pools, RegenTimers& timers, GameTime now,
                                            std::chrono::seconds baseTick) {
    auto available = VitalityRules::AvailableResource(pools.currentVitality, pools.pendingVitality);
    auto interval = VitalityRules::FatigueRegenInterval(available, baseTick);
    if (!interval) {
        if (timers.lastFatigueRegen) {
            timers.lastFatigueRegen.reset();
            return true;
        }
        return false;
    }

    bool changed = false;
    if (!timers.lastFatigueRegen) {
        timers.lastFatigueRegen = now;
        changed = true;
    }
    if (pools.currentFatigue < pools.maxFatigue && now - *timers.lastFatigueRegen >= *interval) {
        pools.pendingFatigue = saturatingAdd(pools.pendingFatigue, -1);
        timers.lastFatigueRegen = now;
        changed = true;
    }
    return changed;
}

bool HealthPoolProcessor::ApplyVitalityRegen(VitalPools& pools, RegenTimers& timers, GameTime now) {
    if (pools.currentVitality <= 0) {
        if (timers.lastVitalityRegen) {
            timers.lastVitalityRegen.reset();
            return true;
        }
        return false;
    }
    if (!timers.lastVitalityRegen) {
        timers.lastVitalityRegen = now;
        return true;
    }
    if (pools.currentVitality >= pools.maxVitality) {
        if (*timers.lastVitalityRegen != now) {
            timers.lastVitalityRegen = now;
            return true;
        }
        return false;
    }

    auto last = *timers.lastVitalityRegen;
    if (now - last < kVitalityRegenInterval) {
        return false;
    }
    auto ticks = (now - last) / kVitalityRegenInterval;
    int missing = std::max(0, pools.maxVitality - pools.currentVitality);
    int heal = static_cast<int>(std::min<int64_t>(ticks, missing));
    if (heal > 0) {
        pools.currentVitality = std::min(pools.maxVitality, pools.currentVitality + heal);
    }
    timers.lastVitalityRegen = pools.currentVitality >= pools.maxVitality
        ? now
        : last + kVitalityRegenInterval * ticks;
    return heal > 0 || *timers.lastVitalityRegen != last;
}

// ── Tick ────────────────────────────────────────────────────────────────

PoolTickResult HealthPoolProcessor::Process(Combatant& combatant) {
    PoolTickResult result;
    auto now = clock_->now();
    {
        std::lock_guard lock(combatant.Mutex());
        auto& pools = combatant.Pools();
        auto& timers = combatant.Regen();
        int vitalityBefore = pools.currentVitality;

        result.changed |= ApplyFatigueRegen(pools, timers, now, baseTick_);
        int regenBase = pools.currentVitality;
        result.changed |= ApplyVitalityRegen(pools, timers, now);
        result.vitalityHealed += pools.currentVitality - regenBase;

        bool crashed = false;
        bool fatigueDamage = pools.pendingFatigue > 0;
        auto fatigue = ApplyPendingFatigue(pools, &crashed);
        bool vitalityDamage = pools.pendingVitality > 0;
        auto vitality = ApplyPendingVitality(pools);
        result.changed |= fatigue.changed || vitality.changed;
        result.fatigueCrashed = crashed;

        if (fatigueDamage) {
            result.fatigueDamage = fatigue.applied;
        } else {
            result.fatigueHealed = fatigue.applied;
        }
        if (vitalityDamage) {
            result.vitalityDamage = vitality.applied;
        } else {
            result.vitalityHealed += vitality.applied;
        }
        result.died = vitalityBefore > 0 && pools.currentVitality <= 0;
    }

    if (result.died || result.fatigueCrashed) {
        LogContext ctx;
        ctx.combatantId = combatant.Id();
        VIGOR_LOG_CTX(LogLevel::Info, LogCategory::Vitality,
                      result.died ? "vitality exhausted" : "fatigue crashed", ctx);
    }
    return result;
}

std::size_t HealthPoolProcessor::ProcessAll(
    const std::vector<std::shared_ptr<Combatant>>& combatants, std::stop_token stop) {
    std::size_t changed = 0;
    for (const auto& combatant : combatants) {
        if (stop.stop_requested()) {
            break;
        }
        if (!combatant || !combatant->IsActive()) {
            continue;
        }
        bool needed = false;
        {
            std::lock_guard lock(combatant->Mutex());
            needed = NeedsProcessing(combatant->Pools());
        }
        if (needed && Process(*combatant).changed) {
            ++changed;
        }
    }
    if (changed > 0) {
        VIGOR_LOG_DEBUG(LogCategory::Vitality,
                        "health tick updated " + std::to_string(changed) + " combatant(s)");
    }
    return changed;
}

}  // namespace vigor::game
