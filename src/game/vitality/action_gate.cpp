/// @file action_gate.cpp
/// @brief ActionGate implementation.

#include "vigor/game/action_gate.hpp"

#include <mutex>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::game {

using vigor::foundation::GameError;
using vigor::foundation::LogCategory;
using vigor::foundation::LogContext;
using vigor::foundation::LogLevel;
using vigor::foundation::saturatingAdd;

ActionGate::ActionGate(std::shared_ptr<DiceRoller> dice, std::shared_ptr<EventBus> events)
    : dice_(std::move(dice)), events_(std::move(events)) {
    if (!dice_) {
        dice_ = std::make_shared<DiceRoller>(nullptr);
    }
}

GateDecision ActionGate::Evaluate(const Combatant& combatant, const VitalPools& pools,
                                  int focusModifier) {
    GateDecision decision;
    for (const auto& restriction : VitalityRules::Evaluate(pools)) {
        if (!restriction.canAttempt) {
            decision.allowed = false;
            decision.code = ErrorCode::ActionBlocked;
            decision.message = restriction.failureMessage;
            return decision;
        }
        if (!restriction.focusCheck) {
            continue;
        }

        const auto& check = *restriction.focusCheck;
        int focus = combatant.SkillLevel(skills::kFocus).value_or(kDefaultSkillLevel);
        int roll = saturatingAdd(saturatingAdd(focus, focusModifier), dice_->RollExploding4dF());
        bool passed = roll >= check.targetValue;

        decision.skillUsage.push_back(SkillUsageEvent{
            combatant.Id(), std::string(skills::kFocus), check.usageType, 1, check.contextTag});

        LogContext ctx;
        ctx.combatantId = combatant.Id();
        ctx.extra["resource"] = check.resourceLabel;
        ctx.extra["roll"] = std::to_string(roll);
        ctx.extra["target"] = std::to_string(check.targetValue);
        VIGOR_LOG_CTX(LogLevel::Debug, LogCategory::Vitality,
                      passed ? "focus check passed" : "focus check failed", ctx);

        if (!passed) {
            decision.allowed = false;
            decision.code = ErrorCode::FocusCheckFailed;
            decision.message = check.failureMessage;
            return decision;
        }
    }
    return decision;
}

void ActionGate::Publish(const GateDecision& decision) {
    if (!events_) {
        return;
    }
    for (const auto& usage : decision.skillUsage) {
        events_->Publish(usage);
    }
}

GameResult<void> ActionGate::CheckAction(const Combatant& combatant, int focusModifier) {
    GateDecision decision;
    {
        std::lock_guard lock(combatant.Mutex());
        decision = Evaluate(combatant, combatant.Pools(), focusModifier);
    }
    Publish(decision);
    return ToResult(decision);
}

GameResult<void> ActionGate::ToResult(const GateDecision& decision) {
    if (decision.allowed) {
        return GameResult<void>::ok();
    }
    return GameResult<void>::err(GameError(decision.code, decision.message));
}

}  // namespace vigor::game
