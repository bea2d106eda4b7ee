#pragma once

/// @file combat_components.hpp
/// @brief Combat session records: CombatSession, CombatParticipant,
///        TimedPenalty and CombatActionLog.
///
/// Plain data owned by CombatSessionManager. Snapshots of these structs are
/// handed out to callers; the live copies never leave the manager's lock.

#include <algorithm>
#include <optional>
#include <string>
#include <vector>

#include "vigor/foundation/clock.hpp"
#include "vigor/foundation/types.hpp"
#include "vigor/game/combat_types.hpp"

namespace vigor::game {

using vigor::foundation::CombatantId;
using vigor::foundation::CombatSessionId;
using vigor::foundation::GameTime;
using vigor::foundation::RoomId;

// ── TimedPenalty ────────────────────────────────────────────────────────

/// Temporary attack modifier left by a badly missed attack or a failed
/// physicality check.
struct TimedPenalty {
    int amount = 0;           ///< Negative modifier to attack value.
    GameTime expiresAt{};

    [[nodiscard]] bool IsExpiredAt(GameTime now) const noexcept { return expiresAt <= now; }
};

// ── CombatParticipant ───────────────────────────────────────────────────

struct CombatParticipant {
    CombatantId combatantId;
    bool isPlayer = false;
    std::string name;
    bool active = true;
    bool parrying = false;
    std::vector<TimedPenalty> penalties;
    GameTime joinedAt{};
    std::optional<GameTime> leftAt;
    std::string leaveReason;

    /// Drop expired penalties. @return Number dropped.
    std::size_t PrunePenalties(GameTime now) {
        auto before = penalties.size();
        std::erase_if(penalties, [now](const TimedPenalty& p) { return p.IsExpiredAt(now); });
        return before - penalties.size();
    }

    /// Sum of unexpired penalty amounts.
    [[nodiscard]] int PenaltyTotal(GameTime now) const {
        int total = 0;
        for (const auto& p : penalties) {
            if (!p.IsExpiredAt(now)) {
                total = vigor::foundation::saturatingAdd(total, p.amount);
            }
        }
        return total;
    }

    /// Mark the participant as having left the fight.
    void Leave(GameTime now, std::string reason) {
        if (!active) {
            return;
        }
        active = false;
        leftAt = now;
        leaveReason = std::move(reason);
    }
};

// ── CombatActionLog ─────────────────────────────────────────────────────

/// Immutable record of one resolved combat action.
struct CombatActionLog {
    CombatantId actorId;
    std::optional<CombatantId> targetId;
    CombatActionType actionType = CombatActionType::MeleeAttack;
    int attackValue = 0;
    int defenseValue = 0;
    int successValue = 0;
    int damageTotal = 0;
    int fatigueDamage = 0;
    int vitalityDamage = 0;
    int wounds = 0;
    std::optional<BodyLocation> hitLocation;
    std::optional<DamageType> damageType;
    std::string description;
    GameTime timestamp{};
};

// ── CombatSession ───────────────────────────────────────────────────────

struct CombatSession {
    CombatSessionId id;
    RoomId room;
    bool active = true;
    GameTime startedAt{};
    std::optional<GameTime> endedAt;
    std::string endReason;
    std::vector<CombatParticipant> participants;
    std::vector<CombatActionLog> actions;

    [[nodiscard]] CombatParticipant* FindParticipant(CombatantId combatant) {
        auto it = std::find_if(participants.begin(), participants.end(),
                               [&](const CombatParticipant& p) { return p.combatantId == combatant; });
        return it == participants.end() ? nullptr : &*it;
    }

    [[nodiscard]] const CombatParticipant* FindParticipant(CombatantId combatant) const {
        auto it = std::find_if(participants.begin(), participants.end(),
                               [&](const CombatParticipant& p) { return p.combatantId == combatant; });
        return it == participants.end() ? nullptr : &*it;
    }

    [[nodiscard]] std::size_t ActiveParticipantCount() const noexcept {
        return static_cast<std::size_t>(std::count_if(
            participants.begin(), participants.end(),
            [](const CombatParticipant& p) { return p.active; }));
    }
};

/// Snapshot of one combatant's combat status.
struct CombatState {
    bool inCombat = false;
    std::optional<CombatSessionId> sessionId;
    bool parrying = false;
    /// Name of the first other active participant, empty when none.
    std::string opponentName;
};

}  // namespace vigor::game
