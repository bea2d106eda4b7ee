#pragma once

/// @file combat_session_manager.hpp
/// @brief CombatSessionManager: who is fighting whom, parry stance and
///        timed attack penalties.

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "vigor/foundation/clock.hpp"
#include "vigor/foundation/event_bus.hpp"
#include "vigor/foundation/game_result.hpp"
#include "vigor/game/combat_components.hpp"
#include "vigor/game/combat_events.hpp"
#include "vigor/game/combatant.hpp"

namespace vigor::game {

using vigor::foundation::EventBus;
using vigor::foundation::GameResult;
using vigor::foundation::IClock;

/// Owns every combat session.
///
/// A combatant is an active participant of at most one session at a time.
/// All state sits behind one mutex; events are published after it is
/// released, so subscribers may call back into the manager.
class CombatSessionManager {
public:
    CombatSessionManager(std::shared_ptr<EventBus> events,
                         std::shared_ptr<const IClock> clock);

    // ── Lifecycle ───────────────────────────────────────────────────────

    /// Find or create the session in which @p attacker fights @p target.
    ///
    /// An engaged attacker keeps its session. Otherwise the attacker joins
    /// the target's session when they share its room, or a new session is
    /// created for the pair and CombatStarted is published.
    /// @return The session id, or NotInSameRoom.
    GameResult<CombatSessionId> InitiateCombat(const Combatant& attacker,
                                               const Combatant& target);

    /// Leave the current session with reason "Fled". Ends the session when
    /// at most one active participant remains.
    /// @return false when @p combatant is not in combat.
    bool Flee(CombatantId combatant);

    /// Close a session and publish CombatEnded. The winner's name is
    /// resolved from the participant list.
    GameResult<void> EndCombat(CombatSessionId session, std::string reason,
                               std::optional<CombatantId> winner = std::nullopt);

    // ── Stance ──────────────────────────────────────────────────────────

    /// @return NotInCombat when @p combatant has no active session.
    GameResult<void> SetParryMode(CombatantId combatant, bool enabled);

    [[nodiscard]] bool IsInParryMode(CombatantId combatant) const;

    // ── Timed penalties ─────────────────────────────────────────────────

    /// Record the penalty the severity table assigns to @p margin.
    /// @return The penalty added, or std::nullopt when the margin carries
    ///         none or the combatant is not in combat.
    std::optional<TimedPenalty> ApplyTimedPenalty(CombatantId combatant, int margin);

    /// Prune expired penalties of @p combatant and sum the rest.
    int TotalTimedPenalty(CombatantId combatant);

    /// Prune expired penalties of every participant. @return Number pruned.
    std::size_t PruneExpiredPenalties();

    // ── Queries ─────────────────────────────────────────────────────────

    [[nodiscard]] std::optional<CombatSessionId> ActiveSessionFor(CombatantId combatant) const;
    [[nodiscard]] bool IsInCombat(CombatantId combatant) const;

    /// Snapshot of a session, active or ended.
    [[nodiscard]] std::optional<CombatSession> Session(CombatSessionId session) const;

    [[nodiscard]] std::vector<CombatParticipant> ActiveParticipants(CombatSessionId session) const;

    [[nodiscard]] CombatState StateOf(CombatantId combatant) const;

    [[nodiscard]] std::vector<CombatSessionId> ActiveSessionIds() const;

    /// Append to a session's action log.
    /// @return CombatSessionNotFound for an unknown session.
    GameResult<void> AppendAction(CombatSessionId session, CombatActionLog action);

    /// Forget ended sessions older than @p age. @return Number dropped.
    std::size_t DiscardEndedSessions(std::chrono::seconds age);

private:
    /// Close @p session and build its CombatEnded event. Requires mutex_.
    CombatEnded endLocked(CombatSession& session, std::string reason,
                          std::optional<CombatantId> winner, GameTime now);

    CombatSession* activeSessionLocked(CombatantId combatant);
    const CombatSession* activeSessionLocked(CombatantId combatant) const;

    static CombatParticipant makeParticipant(const Combatant& combatant, GameTime now);

    std::shared_ptr<EventBus> events_;
    std::shared_ptr<const IClock> clock_;

    mutable std::mutex mutex_;
    std::map<CombatSessionId, CombatSession> sessions_;
    std::unordered_map<CombatantId, CombatSessionId> activeByCombatant_;
    uint64_t nextSessionId_ = 1;
};

}  // namespace vigor::game
