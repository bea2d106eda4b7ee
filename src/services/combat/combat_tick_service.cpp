/// @file combat_tick_service.cpp
/// @brief CombatTickService implementation.

#include "vigor/service/combat_tick_service.hpp"

#include <exception>
#include <string>

#include "vigor/foundation/game_logger.hpp"
#include "vigor/game/combat_events.hpp"

namespace vigor::service {

using vigor::foundation::GameResult;
using vigor::foundation::JobPriority;
using vigor::foundation::LogCategory;
using vigor::game::Combatant;
using vigor::game::CombatNarration;
using vigor::game::NpcCombatant;

CombatTickSettings CombatTickSettings::FromConfig(const vigor::foundation::ConfigManager& config) {
    CombatTickSettings settings;
    auto health = config.getOr<int>("combat.health_tick_ms",
                                    static_cast<int>(settings.healthTick.count()));
    auto effect = config.getOr<int>("combat.effect_tick_ms",
                                    static_cast<int>(settings.effectTick.count()));
    auto retention = config.getOr<int>("combat.session_retention_s",
                                       static_cast<int>(settings.sessionRetention.count()));
    // Non-positive values keep the defaults.
    if (health > 0) {
        settings.healthTick = std::chrono::milliseconds(health);
    }
    if (effect > 0) {
        settings.effectTick = std::chrono::milliseconds(effect);
    }
    if (retention >= 0) {
        settings.sessionRetention = std::chrono::seconds(retention);
    }
    return settings;
}

CombatTickService::CombatTickService(CombatTickDependencies deps, CombatTickSettings settings)
    : deps_(std::move(deps)), settings_(settings) {}

GameResult<void> CombatTickService::Register(vigor::foundation::GameJobScheduler& scheduler) {
    auto health = scheduler.scheduleTick("combat.health", settings_.healthTick,
                                         [this](std::stop_token st) { RunHealthTick(st); },
                                         JobPriority::High);
    if (health.hasError()) {
        return GameResult<void>::err(health.error());
    }
    auto effect = scheduler.scheduleTick("combat.effects", settings_.effectTick,
                                         [this](std::stop_token st) { RunEffectTick(st); });
    if (effect.hasError()) {
        return GameResult<void>::err(effect.error());
    }
    VIGOR_LOG_INFO(LogCategory::Scheduler,
                   "combat ticks registered (health " +
                   std::to_string(settings_.healthTick.count()) + " ms, effects " +
                   std::to_string(settings_.effectTick.count()) + " ms)");
    return GameResult<void>::ok();
}

// ── Health tick ─────────────────────────────────────────────────────────

HealthTickReport CombatTickService::RunHealthTick(std::stop_token stop) {
    HealthTickReport report;
    for (const auto& combatant : deps_.registry->All()) {
        if (stop.stop_requested()) {
            return report;
        }
        if (!combatant || !combatant->IsActive()) {
            continue;
        }
        try {
            if (tickPools(*combatant, report)) {
                ++report.deaths;
            }
        } catch (const std::exception& e) {
            ++report.failures;
            VIGOR_LOG_ERROR(LogCategory::Vitality,
                            "health tick failed for " + combatant->Name() + ": " + e.what());
        }
    }

    report.penaltiesPruned = deps_.sessions->PruneExpiredPenalties();
    deps_.sessions->DiscardEndedSessions(settings_.sessionRetention);

    if (deps_.npcPolicy) {
        runNpcDecisions(stop, report);
    }
    return report;
}

bool CombatTickService::tickPools(Combatant& combatant, HealthTickReport& report) {
    refreshMaxima(combatant);
    {
        std::lock_guard lock(combatant.Mutex());
        if (!vigor::game::HealthPoolProcessor::NeedsProcessing(combatant.Pools())) {
            return false;
        }
    }
    auto result = deps_.healthPools->Process(combatant);
    if (result.changed) {
        ++report.poolsChanged;
    }
    if (result.died) {
        handleTickDeath(combatant);
    }
    return result.died;
}

void CombatTickService::refreshMaxima(Combatant& combatant) {
    auto summary = deps_.effects->Summary(combatant.Id());
    std::lock_guard lock(combatant.Mutex());
    combatant.SetMaxima(combatant.BaseMaxFatigue() + summary.maxFatigueModifier,
                        combatant.BaseMaxVitality() + summary.maxVitalityModifier);
}

void CombatTickService::handleTickDeath(Combatant& combatant) {
    VIGOR_LOG_INFO(LogCategory::Vitality, combatant.Name() + " succumbed to their wounds");
    if (auto session = deps_.sessions->ActiveSessionFor(combatant.Id())) {
        auto ended = deps_.sessions->EndCombat(*session, combatant.Name() + " died");
        if (ended.hasError()) {
            VIGOR_LOG_WARN(LogCategory::Combat, std::string(ended.error().message()));
        }
    }

    // Players stay registered at zero vitality; only NPCs leave the world.
    auto* npc = dynamic_cast<NpcCombatant*>(&combatant);
    if (npc == nullptr) {
        return;
    }
    {
        std::lock_guard lock(npc->Mutex());
        npc->Despawn("Death");
    }
    deps_.effects->RemoveAllFor(npc->Id());
}

void CombatTickService::runNpcDecisions(std::stop_token stop, HealthTickReport& report) {
    for (auto sessionId : deps_.sessions->ActiveSessionIds()) {
        for (const auto& participant : deps_.sessions->ActiveParticipants(sessionId)) {
            if (stop.stop_requested()) {
                return;
            }
            if (participant.isPlayer) {
                continue;
            }
            auto npc = deps_.registry->FindAs<NpcCombatant>(participant.combatantId);
            if (!npc || !npc->IsActive()) {
                continue;
            }
            // An earlier decision this tick may have ended the session.
            if (deps_.sessions->ActiveSessionFor(npc->Id()) != sessionId) {
                continue;
            }
            try {
                auto decision = deps_.npcPolicy->DecideAndAct(npc, sessionId);
                if (decision != vigor::game::NpcDecision::NoAction) {
                    ++report.npcDecisions;
                }
            } catch (const std::exception& e) {
                ++report.failures;
                VIGOR_LOG_ERROR(LogCategory::AI,
                                "NPC decision failed for " + npc->Name() + ": " + e.what());
            }
        }
    }
}

// ── Effect tick ─────────────────────────────────────────────────────────

EffectTickReport CombatTickService::RunEffectTick(std::stop_token stop) {
    EffectTickReport report;
    for (auto id : deps_.effects->AffectedCombatants()) {
        if (stop.stop_requested()) {
            return report;
        }
        auto combatant = deps_.registry->Find(id);
        if (!combatant) {
            continue;
        }
        try {
            tickEffects(*combatant, report);
        } catch (const std::exception& e) {
            ++report.failures;
            VIGOR_LOG_ERROR(LogCategory::Effect,
                            "effect tick failed for " + combatant->Name() + ": " + e.what());
        }
    }

    report.expired = deps_.effects->CleanupExpired().size();
    return report;
}

void CombatTickService::tickEffects(Combatant& combatant, EffectTickReport& report) {
    auto periodic = deps_.effects->ProcessPeriodicEffects(combatant);
    if (periodic.fatigueDelta != 0 || periodic.vitalityDelta != 0) {
        ++report.combatantsTicked;
    }
    if (deps_.events) {
        for (auto& message : periodic.messages) {
            deps_.events->Publish(CombatNarration{combatant.Id(), combatant.Room(), message});
        }
    }

    report.woundsHealed += deps_.effects->ProcessNaturalWoundHealing(combatant);
}

}  // namespace vigor::service
