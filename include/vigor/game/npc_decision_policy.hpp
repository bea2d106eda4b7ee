#pragma once

/// @file npc_decision_policy.hpp
/// @brief NpcDecisionPolicy: one combat decision per NPC per health tick.
///
/// Priority order:
///   1. Flee when vitality has fallen to the flee threshold
///   2. Parry when fatigue is low, otherwise dodge
///   3. Counterattack the first active player in the session

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

#include "vigor/foundation/event_bus.hpp"
#include "vigor/foundation/types.hpp"
#include "vigor/game/attack_resolver.hpp"
#include "vigor/game/combat_session_manager.hpp"
#include "vigor/game/combatant.hpp"
#include "vigor/game/combatant_registry.hpp"

namespace vigor::game {

enum class NpcDecision : uint8_t { Fled, Attacked, NoAction };

[[nodiscard]] std::string_view npcDecisionName(NpcDecision decision) noexcept;


class NpcDecisionPolicy {
public:
    NpcDecisionPolicy(std::shared_ptr<CombatSessionManager> sessions,
                      std::shared_ptr<AttackResolver> resolver,
                      std::shared_ptr<const CombatantRegistry> registry,
                      std::shared_ptr<EventBus> events);

    /// Take one action for @p npc inside @p session.
    NpcDecision DecideAndAct(const std::shared_ptr<NpcCombatant>& npc,
                             CombatSessionId session);

    /// True when @p pools sit at or below @p threshold of max vitality.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static bool ShouldFlee(const VitalPools& pools,
                                         std::optional<double> threshold) noexcept;

    /// This is a pure function exposed for testability.
    [[nodiscard]] static bool ShouldParry(const VitalPools& pools) noexcept {
        return pools.currentFatigue < kParryFatigueThreshold;
    }

private:
    std::shared_ptr<Combatant> selectTarget(CombatSessionId session, CombatantId self) const;

    std::shared_ptr<CombatSessionManager> sessions_;
    std::shared_ptr<AttackResolver> resolver_;
    std::shared_ptr<const CombatantRegistry> registry_;
    std::shared_ptr<EventBus> events_;
};

}  // namespace vigor::game
