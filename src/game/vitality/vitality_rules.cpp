/// @file vitality_rules.cpp
/// @brief VitalityRules tables.

#include "vigor/game/vitality_rules.hpp"

#include <algorithm>

namespace vigor::game {

namespace {

FocusCheckRequirement vitalityCheck(int target, std::string message, int available) {
    return FocusCheckRequirement{target, std::move(message), "vitality", available,
                                 SkillUsageType::ChallengingUse, "low_vitality_action"};
}

FocusCheckRequirement fatigueCheck(int target, std::string message, int available) {
    return FocusCheckRequirement{target, std::move(message), "fatigue", available,
                                 SkillUsageType::ChallengingUse, "low_fatigue_action"};
}

} // namespace

int VitalityRules::AvailableResource(int current, int pending) noexcept {
    return std::max(0, current - std::max(0, pending));
}

ActionRestriction VitalityRules::EvaluateVitality(int availableVitality) {
    if (availableVitality <= 0) {
        return ActionRestriction::Blocked("You have died.");
    }
    switch (availableVitality) {
        case 1:
            return ActionRestriction::Blocked("You are too grievously injured to move.");
        case 2:
            return ActionRestriction::RequiresFocus(vitalityCheck(
                12, "You hover on the edge of death and your limbs refuse to move.", 2));
        case 3:
            return ActionRestriction::RequiresFocus(vitalityCheck(
                7, "Pain grips every nerve; you cannot force your body to respond.", 3));
        default:
            return ActionRestriction::Allowed();
    }
}

ActionRestriction VitalityRules::EvaluateFatigue(int availableFatigue) {
    switch (availableFatigue) {
        case 3:
            return ActionRestriction::RequiresFocus(fatigueCheck(
                5, "You force yourself to stay upright, but you can't muster the focus to act.", 3));
        case 2:
            return ActionRestriction::RequiresFocus(fatigueCheck(
                7, "Your vision swims as exhaustion overtakes you.", 2));
        case 1:
            return ActionRestriction::RequiresFocus(fatigueCheck(
                12, "You sway on your feet and blackness creeps at the edge of your sight.", 1));
        default:
            return ActionRestriction::Allowed();
    }
}

std::vector<ActionRestriction> VitalityRules::Evaluate(const VitalPools& pools) {
    std::vector<ActionRestriction> out;
    auto vitality = EvaluateVitality(AvailableResource(pools.currentVitality, pools.pendingVitality));
    if (!vitality.canAttempt) {
        out.push_back(std::move(vitality));
        return out;
    }
    if (vitality.focusCheck) {
        out.push_back(std::move(vitality));
    }
    auto fatigue = EvaluateFatigue(AvailableResource(pools.currentFatigue, pools.pendingFatigue));
    if (fatigue.focusCheck) {
        out.push_back(std::move(fatigue));
    }
    return out;
}

std::optional<std::chrono::seconds> VitalityRules::FatigueRegenInterval(
    int availableVitality, std::chrono::seconds baseInterval) noexcept {
    using namespace std::chrono_literals;
    if (availableVitality <= 1) {
        return std::nullopt;
    }
    switch (availableVitality) {
        case 2: return std::chrono::seconds(1h);
        case 3: return std::chrono::seconds(30min);
        case 4: return std::chrono::seconds(1min);
        default: return baseInterval;
    }
}

}  // namespace vigor::game
