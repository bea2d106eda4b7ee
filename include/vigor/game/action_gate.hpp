#pragma once

/// @file action_gate.hpp
/// @brief ActionGate: Focus checks a weakened combatant must pass to act.

#include <memory>
#include <string>
#include <vector>

#include "vigor/foundation/error_code.hpp"
#include "vigor/foundation/event_bus.hpp"
#include "vigor/foundation/game_result.hpp"
#include "vigor/game/combat_events.hpp"
#include "vigor/game/combatant.hpp"
#include "vigor/game/dice.hpp"
#include "vigor/game/vitality_rules.hpp"

namespace vigor::game {

using vigor::foundation::ErrorCode;
using vigor::foundation::EventBus;
using vigor::foundation::GameResult;

/// Result of running the restriction table and any Focus checks.
struct GateDecision {
    bool allowed = true;
    /// ActionBlocked or FocusCheckFailed when not allowed.
    ErrorCode code = ErrorCode::Success;
    std::string message;
    /// One entry per Focus check rolled, to publish once locks are released.
    std::vector<SkillUsageEvent> skillUsage;
};

class ActionGate {
public:
    ActionGate(std::shared_ptr<DiceRoller> dice, std::shared_ptr<EventBus> events);

    /// Evaluate @p pools for @p combatant and roll the required checks.
    ///
    /// Each check rolls Focus (default 10) plus @p focusModifier plus an
    /// exploding 4dF and passes when the total reaches the target.
    /// Requires the caller to hold combatant.Mutex(); publishes nothing.
    [[nodiscard]] GateDecision Evaluate(const Combatant& combatant, const VitalPools& pools,
                                        int focusModifier = 0);

    /// Publish the skill usage recorded in @p decision.
    void Publish(const GateDecision& decision);

    /// Lock, evaluate, unlock and publish.
    /// @return ActionBlocked or FocusCheckFailed carrying the failure message.
    GameResult<void> CheckAction(const Combatant& combatant, int focusModifier = 0);

    /// Convert a refused decision into an error result.
    [[nodiscard]] static GameResult<void> ToResult(const GateDecision& decision);

private:
    std::shared_ptr<DiceRoller> dice_;
    std::shared_ptr<EventBus> events_;
};

}  // namespace vigor::game
