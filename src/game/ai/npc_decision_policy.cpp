/// @file npc_decision_policy.cpp
/// @brief NpcDecisionPolicy implementation.

#include "vigor/game/npc_decision_policy.hpp"

#include <string>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::game {

using vigor::foundation::LogCategory;

std::string_view npcDecisionName(NpcDecision decision) noexcept {
    switch (decision) {
        case NpcDecision::Fled:
            return "Fled";
        case NpcDecision::Attacked:
            return "Attacked";
        case NpcDecision::NoAction:
            return "NoAction";
    }
    return "Unknown";
}

NpcDecisionPolicy::NpcDecisionPolicy(std::shared_ptr<CombatSessionManager> sessions,
                                     std::shared_ptr<AttackResolver> resolver,
                                     std::shared_ptr<const CombatantRegistry> registry,
                                     std::shared_ptr<EventBus> events)
    : sessions_(std::move(sessions)),
      resolver_(std::move(resolver)),
      registry_(std::move(registry)),
      events_(std::move(events)) {}

bool NpcDecisionPolicy::ShouldFlee(const VitalPools& pools,
                                   std::optional<double> threshold) noexcept {
    if (!threshold) {
        return false;
    }
    // A non-positive maximum reads as full health.
    double fraction = pools.maxVitality > 0 ? pools.VitalityFraction() : 1.0;
    return fraction <= *threshold;
}

NpcDecision NpcDecisionPolicy::DecideAndAct(const std::shared_ptr<NpcCombatant>& npc,
                                            CombatSessionId session) {
    if (!npc || !npc->IsActive()) {
        return NpcDecision::NoAction;
    }

    auto pools = npc->SnapshotPools();

    // ── Flee ────────────────────────────────────────────────────────────
    if (ShouldFlee(pools, npc->FleeThreshold())) {
        VIGOR_LOG_DEBUG(LogCategory::AI,
                        npc->Name() + " attempting to flee (VIT " +
                        std::to_string(pools.currentVitality) + "/" +
                        std::to_string(pools.maxVitality) + ")");
        if (sessions_->Flee(npc->Id())) {
            if (events_) {
                CombatActionEvent fled;
                fled.attackerId = npc->Id();
                fled.attackerName = npc->Name();
                fled.room = npc->Room();
                fled.description = npc->Name() + " flees from combat!";
                fled.skillUsed = "Flee";
                events_->Publish(fled);
            }
            VIGOR_LOG_INFO(LogCategory::AI, npc->Name() + " fled from combat");
            return NpcDecision::Fled;
        }
        VIGOR_LOG_DEBUG(LogCategory::AI, npc->Name() + " failed to flee");
    }

    // ── Stance ──────────────────────────────────────────────────────────
    bool parry = ShouldParry(pools);
    if (sessions_->IsInParryMode(npc->Id()) != parry) {
        auto changed = sessions_->SetParryMode(npc->Id(), parry);
        if (changed.hasValue()) {
            VIGOR_LOG_DEBUG(LogCategory::AI, npc->Name() + " switched to " +
                                                 (parry ? "parry" : "dodge") + " mode");
        }
    }

    // ── Counterattack ───────────────────────────────────────────────────
    auto target = selectTarget(session, npc->Id());
    if (!target) {
        VIGOR_LOG_DEBUG(LogCategory::AI, npc->Name() + " has no valid targets");
        return NpcDecision::NoAction;
    }

    auto result = resolver_->ResolveMeleeAttack({npc, target, AttackHand::MainHand});
    if (result.hasError()) {
        VIGOR_LOG_DEBUG(LogCategory::AI, npc->Name() + " could not attack " + target->Name() +
                                             ": " + std::string(result.error().message()));
        return NpcDecision::NoAction;
    }
    VIGOR_LOG_DEBUG(LogCategory::AI, npc->Name() + " attacked " + target->Name() +
                                         (result.value().hit ? " (hit)" : " (miss)"));
    return NpcDecision::Attacked;
}

std::shared_ptr<Combatant> NpcDecisionPolicy::selectTarget(CombatSessionId session,
                                                           CombatantId self) const {
    if (!registry_) {
        return nullptr;
    }
    for (const auto& participant : sessions_->ActiveParticipants(session)) {
        if (!participant.isPlayer || participant.combatantId == self) {
            continue;
        }
        auto combatant = registry_->Find(participant.combatantId);
        if (combatant && combatant->IsActive()) {
            return combatant;
        }
    }
    return nullptr;
}

}  // namespace vigor::game
