#pragma once

/// @file combat_tick_service.hpp
/// @brief Recurring background work of the combat core.
///
/// Two tick jobs are registered on the GameJobScheduler:
///   - health tick: effect-adjusted maxima, pool reconciliation, death on
///     tick, timed-penalty pruning and one NPC decision per NPC in combat
///   - effect tick: periodic effects, expiry cleanup and natural wound
///     healing
///
/// Both jobs check the stop token between combatants. A combatant whose
/// processing throws is logged and skipped; the batch continues.

#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>

#include "vigor/foundation/config_manager.hpp"
#include "vigor/foundation/event_bus.hpp"
#include "vigor/foundation/game_result.hpp"
#include "vigor/foundation/job_scheduler.hpp"
#include "vigor/game/combat_session_manager.hpp"
#include "vigor/game/combatant_registry.hpp"
#include "vigor/game/health_pool_processor.hpp"
#include "vigor/game/npc_decision_policy.hpp"
#include "vigor/game/status_effect_engine.hpp"

namespace vigor::service {

/// Tick periods, read from the `combat.*` configuration keys.
struct CombatTickSettings {
    std::chrono::milliseconds healthTick{3000};
    std::chrono::milliseconds effectTick{1000};
    /// Ended sessions older than this are forgotten.
    std::chrono::seconds sessionRetention{300};

    [[nodiscard]] static CombatTickSettings FromConfig(
        const vigor::foundation::ConfigManager& config);
};

/// Collaborators the ticks operate on.
struct CombatTickDependencies {
    std::shared_ptr<vigor::game::CombatantRegistry> registry;
    std::shared_ptr<vigor::game::CombatSessionManager> sessions;
    std::shared_ptr<vigor::game::StatusEffectEngine> effects;
    std::shared_ptr<vigor::game::HealthPoolProcessor> healthPools;
    std::shared_ptr<vigor::game::NpcDecisionPolicy> npcPolicy;
    std::shared_ptr<vigor::foundation::EventBus> events;
};

/// Counters from one health tick.
struct HealthTickReport {
    std::size_t poolsChanged = 0;
    std::size_t deaths = 0;
    std::size_t penaltiesPruned = 0;
    std::size_t npcDecisions = 0;
    std::size_t failures = 0;
};

/// Counters from one effect tick.
struct EffectTickReport {
    std::size_t combatantsTicked = 0;
    std::size_t expired = 0;
    int woundsHealed = 0;
    std::size_t failures = 0;
};

class CombatTickService {
public:
    CombatTickService(CombatTickDependencies deps, CombatTickSettings settings);

    /// Register both tick jobs.
    vigor::foundation::GameResult<void> Register(vigor::foundation::GameJobScheduler& scheduler);

    HealthTickReport RunHealthTick(std::stop_token stop);
    EffectTickReport RunEffectTick(std::stop_token stop);

    [[nodiscard]] const CombatTickSettings& Settings() const noexcept { return settings_; }

private:
    /// Pools for one combatant. @return true when it died this tick.
    bool tickPools(vigor::game::Combatant& combatant, HealthTickReport& report);

    void refreshMaxima(vigor::game::Combatant& combatant);
    void handleTickDeath(vigor::game::Combatant& combatant);
    void runNpcDecisions(std::stop_token stop, HealthTickReport& report);
    void tickEffects(vigor::game::Combatant& combatant, EffectTickReport& report);

    CombatTickDependencies deps_;
    CombatTickSettings settings_;
};

}  // namespace vigor::service
