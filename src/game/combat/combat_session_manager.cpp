/// @file combat_session_manager.cpp
/// @brief CombatSessionManager implementation.

#include "vigor/game/combat_session_manager.hpp"

#include <algorithm>

#include "vigor/foundation/game_logger.hpp"
#include "vigor/game/combat_tables.hpp"

namespace vigor::game {

using vigor::foundation::ErrorCode;
using vigor::foundation::GameError;
using vigor::foundation::LogCategory;
using vigor::foundation::LogContext;
using vigor::foundation::LogLevel;

CombatSessionManager::CombatSessionManager(std::shared_ptr<EventBus> events,
                                           std::shared_ptr<const IClock> clock)
    : events_(std::move(events)), clock_(std::move(clock)) {}

CombatParticipant CombatSessionManager::makeParticipant(const Combatant& combatant,
                                                        GameTime now) {
    CombatParticipant participant;
    participant.combatantId = combatant.Id();
    participant.isPlayer = combatant.IsPlayer();
    participant.name = combatant.Name();
    participant.joinedAt = now;
    return participant;
}

CombatSession* CombatSessionManager::activeSessionLocked(CombatantId combatant) {
    auto idx = activeByCombatant_.find(combatant);
    if (idx == activeByCombatant_.end()) {
        return nullptr;
    }
    auto it = sessions_.find(idx->second);
    return it == sessions_.end() || !it->second.active ? nullptr : &it->second;
}

const CombatSession* CombatSessionManager::activeSessionLocked(CombatantId combatant) const {
    auto idx = activeByCombatant_.find(combatant);
    if (idx == activeByCombatant_.end()) {
        return nullptr;
    }
    auto it = sessions_.find(idx->second);
    return it == sessions_.end() || !it->second.active ? nullptr : &it->second;
}

// ── Lifecycle ───────────────────────────────────────────────────────────

GameResult<CombatSessionId> CombatSessionManager::InitiateCombat(const Combatant& attacker,
                                                                 const Combatant& target) {
    std::optional<CombatStarted> started;
    CombatSessionId sessionId;
    {
        std::lock_guard lock(mutex_);
        auto now = clock_->now();

        if (auto* existing = activeSessionLocked(attacker.Id())) {
            return GameResult<CombatSessionId>::ok(existing->id);
        }

        if (auto* targetSession = activeSessionLocked(target.Id())) {
            if (attacker.Room() != targetSession->room) {
                VIGOR_LOG_WARN(LogCategory::Combat,
                               "cannot join combat: " + attacker.Name() +
                               " is in a different room from the fight");
                return GameResult<CombatSessionId>::err(
                    GameError(ErrorCode::NotInSameRoom, "attacker is not in the combat's room"));
            }
            // Rejoining after fleeing reuses the participant record.
            if (auto* previous = targetSession->FindParticipant(attacker.Id())) {
                previous->active = true;
                previous->leftAt.reset();
                previous->leaveReason.clear();
                previous->joinedAt = now;
            } else {
                targetSession->participants.push_back(makeParticipant(attacker, now));
            }
            activeByCombatant_[attacker.Id()] = targetSession->id;
            VIGOR_LOG_INFO(LogCategory::Combat,
                           attacker.Name() + " joined combat session " +
                           std::to_string(targetSession->id.value()));
            return GameResult<CombatSessionId>::ok(targetSession->id);
        }

        if (attacker.Room() != target.Room()) {
            VIGOR_LOG_WARN(LogCategory::Combat,
                           "cannot initiate combat: " + attacker.Name() + " and " +
                           target.Name() + " are in different rooms");
            return GameResult<CombatSessionId>::err(
                GameError(ErrorCode::NotInSameRoom, "participants are in different rooms"));
        }

        CombatSession session;
        session.id = CombatSessionId(nextSessionId_++);
        session.room = attacker.Room();
        session.startedAt = now;
        session.participants.push_back(makeParticipant(attacker, now));
        session.participants.push_back(makeParticipant(target, now));
        sessionId = session.id;

        activeByCombatant_[attacker.Id()] = sessionId;
        activeByCombatant_[target.Id()] = sessionId;
        sessions_.emplace(sessionId, std::move(session));

        started = CombatStarted{sessionId, attacker.Id(), attacker.Name(),
                                target.Id(), target.Name(), attacker.Room()};
    }

    LogContext ctx;
    ctx.combatantId = attacker.Id();
    ctx.targetId = target.Id();
    ctx.sessionId = sessionId;
    ctx.room = attacker.Room();
    VIGOR_LOG_CTX(LogLevel::Info, LogCategory::Combat, "combat started", ctx);

    if (events_) {
        events_->Publish(*started);
    }
    return GameResult<CombatSessionId>::ok(sessionId);
}

bool CombatSessionManager::Flee(CombatantId combatant) {
    std::optional<CombatEnded> ending;
    {
        std::lock_guard lock(mutex_);
        auto* session = activeSessionLocked(combatant);
        if (session == nullptr) {
            return false;
        }
        auto* participant = session->FindParticipant(combatant);
        if (participant == nullptr) {
            return false;
        }
        auto now = clock_->now();
        participant->Leave(now, "Fled");
        activeByCombatant_.erase(combatant);

        if (session->ActiveParticipantCount() <= 1) {
            ending = endLocked(*session, "One participant fled", std::nullopt, now);
        }
    }
    if (ending && events_) {
        events_->Publish(*ending);
    }
    return true;
}

CombatEnded CombatSessionManager::endLocked(CombatSession& session, std::string reason,
                                            std::optional<CombatantId> winner, GameTime now) {
    session.active = false;
    session.endedAt = now;
    session.endReason = reason;

    for (auto& participant : session.participants) {
        if (participant.active) {
            participant.Leave(now, reason);
        }
        auto idx = activeByCombatant_.find(participant.combatantId);
        if (idx != activeByCombatant_.end() && idx->second == session.id) {
            activeByCombatant_.erase(idx);
        }
    }

    CombatEnded ending;
    ending.sessionId = session.id;
    ending.room = session.room;
    ending.reason = std::move(reason);
    ending.winnerId = winner;
    if (winner.has_value()) {
        if (const auto* w = session.FindParticipant(*winner)) {
            ending.winnerName = w->name;
        }
    }

    LogContext ctx;
    ctx.sessionId = session.id;
    ctx.room = session.room;
    ctx.extra["reason"] = ending.reason;
    VIGOR_LOG_CTX(LogLevel::Info, LogCategory::Combat, "combat ended", ctx);
    return ending;
}

GameResult<void> CombatSessionManager::EndCombat(CombatSessionId sessionId, std::string reason,
                                                 std::optional<CombatantId> winner) {
    CombatEnded ending;
    {
        std::lock_guard lock(mutex_);
        auto it = sessions_.find(sessionId);
        if (it == sessions_.end()) {
            return GameResult<void>::err(
                GameError(ErrorCode::CombatSessionNotFound,
                          "no combat session " + std::to_string(sessionId.value())));
        }
        if (!it->second.active) {
            return GameResult<void>::ok();
        }
        ending = endLocked(it->second, std::move(reason), winner, clock_->now());
    }
    if (events_) {
        events_->Publish(ending);
    }
    return GameResult<void>::ok();
}

// ── Stance ──────────────────────────────────────────────────────────────

GameResult<void> CombatSessionManager::SetParryMode(CombatantId combatant, bool enabled) {
    std::lock_guard lock(mutex_);
    auto* session = activeSessionLocked(combatant);
    auto* participant = session ? session->FindParticipant(combatant) : nullptr;
    if (participant == nullptr) {
        return GameResult<void>::err(
            GameError(ErrorCode::NotInCombat, "combatant is not in combat"));
    }
    participant->parrying = enabled;
    VIGOR_LOG_DEBUG(LogCategory::Combat,
                    participant->name + " parry mode: " + (enabled ? "on" : "off"));
    return GameResult<void>::ok();
}

bool CombatSessionManager::IsInParryMode(CombatantId combatant) const {
    std::lock_guard lock(mutex_);
    const auto* session = activeSessionLocked(combatant);
    const auto* participant = session ? session->FindParticipant(combatant) : nullptr;
    return participant != nullptr && participant->parrying;
}

// ── Timed penalties ─────────────────────────────────────────────────────

std::optional<TimedPenalty> CombatSessionManager::ApplyTimedPenalty(CombatantId combatant,
                                                                    int margin) {
    auto entry = CombatTables::PenaltyForMargin(margin);
    if (!entry) {
        return std::nullopt;
    }
    std::lock_guard lock(mutex_);
    auto* session = activeSessionLocked(combatant);
    auto* participant = session ? session->FindParticipant(combatant) : nullptr;
    if (participant == nullptr) {
        return std::nullopt;
    }
    TimedPenalty penalty{entry->amount, clock_->now() + kRoundDuration * entry->rounds};
    participant->penalties.push_back(penalty);
    VIGOR_LOG_DEBUG(LogCategory::Combat,
                    participant->name + " suffers " + std::to_string(entry->amount) +
                    " attack penalty for " + std::to_string(entry->rounds) + " round(s)");
    return penalty;
}

int CombatSessionManager::TotalTimedPenalty(CombatantId combatant) {
    std::lock_guard lock(mutex_);
    auto* session = activeSessionLocked(combatant);
    auto* participant = session ? session->FindParticipant(combatant) : nullptr;
    if (participant == nullptr) {
        return 0;
    }
    auto now = clock_->now();
    participant->PrunePenalties(now);
    return participant->PenaltyTotal(now);
}

std::size_t CombatSessionManager::PruneExpiredPenalties() {
    std::lock_guard lock(mutex_);
    auto now = clock_->now();
    std::size_t pruned = 0;
    for (auto& [id, session] : sessions_) {
        if (!session.active) {
            continue;
        }
        for (auto& participant : session.participants) {
            pruned += participant.PrunePenalties(now);
        }
    }
    return pruned;
}

// ── Queries ─────────────────────────────────────────────────────────────

std::optional<CombatSessionId> CombatSessionManager::ActiveSessionFor(
    CombatantId combatant) const {
    std::lock_guard lock(mutex_);
    const auto* session = activeSessionLocked(combatant);
    return session ? std::optional<CombatSessionId>(session->id) : std::nullopt;
}

bool CombatSessionManager::IsInCombat(CombatantId combatant) const {
    return ActiveSessionFor(combatant).has_value();
}

std::optional<CombatSession> CombatSessionManager::Session(CombatSessionId sessionId) const {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<CombatParticipant> CombatSessionManager::ActiveParticipants(
    CombatSessionId sessionId) const {
    std::vector<CombatParticipant> out;
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end() || !it->second.active) {
        return out;
    }
    for (const auto& participant : it->second.participants) {
        if (participant.active) {
            out.push_back(participant);
        }
    }
    return out;
}

CombatState CombatSessionManager::StateOf(CombatantId combatant) const {
    CombatState state;
    std::lock_guard lock(mutex_);
    const auto* session = activeSessionLocked(combatant);
    if (session == nullptr) {
        return state;
    }
    state.inCombat = true;
    state.sessionId = session->id;
    for (const auto& participant : session->participants) {
        if (participant.combatantId == combatant) {
            state.parrying = participant.parrying;
        } else if (participant.active && state.opponentName.empty()) {
            state.opponentName = participant.name;
        }
    }
    return state;
}

std::vector<CombatSessionId> CombatSessionManager::ActiveSessionIds() const {
    std::vector<CombatSessionId> out;
    std::lock_guard lock(mutex_);
    for (const auto& [id, session] : sessions_) {
        if (session.active) {
            out.push_back(id);
        }
    }
    return out;
}

GameResult<void> CombatSessionManager::AppendAction(CombatSessionId sessionId,
                                                    CombatActionLog action) {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(sessionId);
    if (it == sessions_.end()) {
        return GameResult<void>::err(
            GameError(ErrorCode::CombatSessionNotFound,
                      "no combat session " + std::to_string(sessionId.value())));
    }
    it->second.actions.push_back(std::move(action));
    return GameResult<void>::ok();
}

std::size_t CombatSessionManager::DiscardEndedSessions(std::chrono::seconds age) {
    std::lock_guard lock(mutex_);
    auto cutoff = clock_->now() - age;
    return std::erase_if(sessions_, [cutoff](const auto& entry) {
        const auto& session = entry.second;
        return !session.active && session.endedAt.has_value() && *session.endedAt <= cutoff;
    });
}

}  // namespace vigor::game
