#pragma once

/// @file vitality_rules.hpp
/// @brief What a combatant may still do at low vitality or fatigue, and how
///        fast it recovers.

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "vigor/game/combat_types.hpp"
#include "vigor/game/combatant.hpp"

namespace vigor::game {

/// Passive vitality recovery: one point per interval.
constexpr std::chrono::hours kVitalityRegenInterval{1};

/// Vitality queued when fatigue crashes to zero.
constexpr int kFatigueCrashVitalityDamage = 2;

/// A Focus skill check a combatant must pass before acting.
struct FocusCheckRequirement {
    int targetValue = 0;
    std::string failureMessage;
    std::string resourceLabel;   ///< "vitality" or "fatigue"
    int resourceValue = 0;
    SkillUsageType usageType = SkillUsageType::ChallengingUse;
    std::string contextTag;
};

/// Outcome of evaluating one pool against the restriction table.
struct ActionRestriction {
    bool canAttempt = true;
    std::optional<FocusCheckRequirement> focusCheck;
    std::string failureMessage;

    static ActionRestriction Allowed() { return {}; }

    static ActionRestriction Blocked(std::string message) {
        ActionRestriction r;
        r.canAttempt = false;
        r.failureMessage = std::move(message);
        return r;
    }

    static ActionRestriction RequiresFocus(FocusCheckRequirement check) {
        ActionRestriction r;
        r.focusCheck = std::move(check);
        return r;
    }
};

/// Pure rule tables; every function is exposed for testability.
class VitalityRules {
public:
    /// max(0, current - max(0, pending)).
    [[nodiscard]] static int AvailableResource(int current, int pending) noexcept;

    /// | Available | Result                                  |
    /// |-----------|-----------------------------------------|
    /// | <= 0      | blocked, "You have died."               |
    /// | 1         | blocked, too grievously injured to move |
    /// | 2         | Focus check against 12                  |
    /// | 3         | Focus check against 7                   |
    /// | >= 4      | allowed                                 |
    [[nodiscard]] static ActionRestriction EvaluateVitality(int availableVitality);

    /// Available fatigue 3, 2 and 1 require Focus checks against 5, 7 and 12.
    [[nodiscard]] static ActionRestriction EvaluateFatigue(int availableFatigue);

    /// Every restriction that applies to @p pools, vitality first. A block
    /// short-circuits: the result then holds only that entry.
    [[nodiscard]] static std::vector<ActionRestriction> Evaluate(const VitalPools& pools);

    /// Passive fatigue regeneration interval for the available vitality;
    /// std::nullopt means no regeneration.
    [[nodiscard]] static std::optional<std::chrono::seconds> FatigueRegenInterval(
        int availableVitality, std::chrono::seconds baseInterval) noexcept;
};

}  // namespace vigor::game
