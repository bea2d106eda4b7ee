/// @file attack_resolver.cpp
/// @brief AttackResolver implementation.

#include "vigor/game/attack_resolver.hpp"

#include <algorithm>
#include <cmath>
#include <exception>
#include <limits>
#include <mutex>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::game {

using vigor::foundation::ErrorCode;
using vigor::foundation::GameError;
using vigor::foundation::LogCategory;
using vigor::foundation::LogContext;
using vigor::foundation::LogLevel;
using vigor::foundation::saturatingAdd;

namespace {

GameResult<AttackOutcome> attackError(ErrorCode code, std::string message) {
    return GameResult<AttackOutcome>::err(GameError(code, std::move(message)));
}

int skillOrDefault(const Combatant& combatant, std::string_view skill) {
    return combatant.SkillLevel(skill).value_or(kDefaultSkillLevel);
}

} // namespace

AttackResolver::AttackResolver(std::shared_ptr<CombatSessionManager> sessions,
                               std::shared_ptr<StatusEffectEngine> effects,
                               std::shared_ptr<const IEquipmentProvider> equipment,
                               std::shared_ptr<DiceRoller> dice,
                               std::shared_ptr<ActionGate> gate,
                               std::shared_ptr<EventBus> events,
                               std::shared_ptr<const IClock> clock)
    : sessions_(std::move(sessions)),
      effects_(std::move(effects)),
      equipment_(std::move(equipment)),
      dice_(std::move(dice)),
      gate_(std::move(gate)),
      events_(std::move(events)),
      clock_(std::move(clock)) {
    if (!dice_) {
        dice_ = std::make_shared<DiceRoller>(nullptr);
    }
    if (!clock_) {
        clock_ = std::make_shared<foundation::SystemClock>();
    }
    if (!gate_) {
        gate_ = std::make_shared<ActionGate>(dice_, events_);
    }
}

// ── Pure helpers ────────────────────────────────────────────────────────

std::optional<WeaponUse> AttackResolver::SelectWeapon(const Combatant& combatant,
                                                      const std::vector<EquippedItem>& items,
                                                      AttackHand hand, int physicalityModifier) {
    auto physicality = combatant.SkillLevel(skills::kPhysicality);
    const auto* item = FindAttackWeapon(items, hand);

    WeaponUse use;
    if (item != nullptr && item->weapon.has_value()) {
        const auto& weapon = *item->weapon;
        use.name = item->name;
        use.skillLevel = saturatingAdd(physicality.value_or(kDefaultSkillLevel), weapon.skillBonus);
        use.attackValueModifier = weapon.attackValueModifier;
        use.successValueModifier = weapon.baseSuccessValueModifier;
        use.damageType = weapon.damageType;
        use.damageClass = weapon.damageClass;
        use.broken = item->broken;
    } else {
        if (!physicality.has_value()) {
            return std::nullopt;
        }
        use.name = std::string(skills::kUnarmedCombat);
        use.skillLevel = *physicality;
    }
    use.skillLevel = saturatingAdd(use.skillLevel, physicalityModifier);
    return use;
}

int AttackResolver::BaseDefense(const Combatant& defender, const std::vector<EquippedItem>& items,
                                bool parrying, const EffectSummary& summary) {
    if (parrying) {
        auto weapon = SelectWeapon(defender, items, AttackHand::MainHand,
                                   summary.ModifierFor(skills::kPhysicality));
        return weapon ? weapon->skillLevel : kDefaultSkillLevel;
    }
    int dodge = saturatingAdd(skillOrDefault(defender, skills::kDodge),
                              summary.ModifierFor(skills::kDodge));
    return saturatingAdd(dodge, EquipmentDodgeModifier(items));
}

int AttackResolver::ScaleDamage(int rawDamage, double dealtModifier,
                                double receivedModifier) noexcept {
    double scaled = static_cast<double>(rawDamage) * (1.0 + dealtModifier) * (1.0 + receivedModifier);
    if (!(scaled > 0.0)) {
        return 0;
    }
    if (scaled >= static_cast<double>(std::numeric_limits<int>::max())) {
        return std::numeric_limits<int>::max();
    }
    return static_cast<int>(std::lround(scaled));
}

GameResult<std::vector<EquippedItem>> AttackResolver::loadEquipment(
    const Combatant& combatant) const {
    if (!equipment_) {
        return GameResult<std::vector<EquippedItem>>::ok({});
    }
    try {
        return equipment_->EquippedItems(combatant.Id());
    } catch (const std::exception& e) {
        VIGOR_LOG_ERROR(LogCategory::Combat,
                        "equipment lookup for " + combatant.Name() + " failed: " + e.what());
        return GameResult<std::vector<EquippedItem>>::err(
            GameError(ErrorCode::StorageUnavailable,
                      std::string("equipment lookup failed: ") + e.what()));
    }
}

// ── Melee ───────────────────────────────────────────────────────────────

GameResult<AttackOutcome> AttackResolver::ResolveMeleeAttack(const MeleeAttackRequest& request) {
    if (!request.attacker || !request.defender) {
        return attackError(ErrorCode::CombatantNotFound, "attack needs an attacker and a defender");
    }
    if (request.attacker.get() == request.defender.get() ||
        request.attacker->Id() == request.defender->Id()) {
        return attackError(ErrorCode::InvalidArgument, "a combatant cannot attack itself");
    }
    auto& attacker = *request.attacker;
    auto& defender = *request.defender;
    if (!attacker.IsActive() || !defender.IsActive()) {
        return attackError(ErrorCode::CombatantNotFound, "combatant is no longer present");
    }
    if (attacker.Room() != defender.Room()) {
        return attackError(ErrorCode::NotInSameRoom,
                           attacker.Name() + " and " + defender.Name() + " are in different rooms");
    }

    // 1. Session
    auto session = sessions_->InitiateCombat(attacker, defender);
    if (session.hasError()) {
        return GameResult<AttackOutcome>::err(session.error());
    }

    AttackOutcome outcome;
    outcome.sessionId = session.value();

    // Collaborator reads happen before any combatant lock is taken.
    auto attackerItems = loadEquipment(attacker);
    if (attackerItems.hasError()) {
        return GameResult<AttackOutcome>::err(attackerItems.error());
    }
    auto defenderItems = loadEquipment(defender);
    if (defenderItems.hasError()) {
        return GameResult<AttackOutcome>::err(defenderItems.error());
    }
    auto attackerEffects = effects_ ? effects_->Summary(attacker.Id()) : EffectSummary{};
    auto defenderEffects = effects_ ? effects_->Summary(defender.Id()) : EffectSummary{};
    bool parrying = sessions_->IsInParryMode(defender.Id());
    int timedPenalty = sessions_->TotalTimedPenalty(attacker.Id());

    LogContext ctx;
    ctx.combatantId = attacker.Id();
    ctx.targetId = defender.Id();
    ctx.sessionId = outcome.sessionId;
    ctx.room = attacker.Room();

    GateDecision gate;
    std::optional<CombatActionEvent> actionEvent;
    std::optional<CombatActionLog> actionLog;
    std::optional<GameError> failure;
    std::vector<std::pair<BodyLocation, int>> woundsToApply;

    {
        std::scoped_lock lock(attacker.Mutex(), defender.Mutex());
        auto& attackerPools = attacker.Pools();
        auto& defenderPools = defender.Pools();
        auto now = clock_->now();

        // 2. Action gates
        if (!attackerEffects.canAct) {
            failure = GameError(ErrorCode::ActionPrevented, attacker.Name() + " is unable to act");
        }
        if (!failure) {
            gate = gate_->Evaluate(attacker, attackerPools,
                                   attackerEffects.ModifierFor(skills::kFocus));
            if (!gate.allowed) {
                failure = GameError(gate.code, gate.message);
            }
        }

        // 3. Fatigue gate
        bool dualWielding = request.dualWield && IsDualWielding(attackerItems.value());
        int cost = CombatTables::AttackFatigueCost(dualWielding);
        if (!failure && attackerPools.currentFatigue < cost) {
            VIGOR_LOG_CTX(LogLevel::Debug, LogCategory::Combat,
                          attacker.Name() + " has insufficient fatigue (" +
                          std::to_string(attackerPools.currentFatigue) + ") for attack", ctx);
            failure = GameError(ErrorCode::InsufficientStamina,
                                attacker.Name() + " is too tired to attack");
        }

        // 4. Weapon
        std::optional<WeaponUse> weapon;
        if (!failure) {
            weapon = SelectWeapon(attacker, attackerItems.value(), request.hand,
                                  attackerEffects.ModifierFor(skills::kPhysicality));
            if (!weapon) {
                VIGOR_LOG_WARN(LogCategory::Combat, attacker.Name() + " has no usable weapon");
                failure = GameError(ErrorCode::NoUsableWeapon,
                                    attacker.Name() + " has no usable weapon");
            } else if (weapon->broken) {
                auto text = attacker.Name() + "'s " + weapon->name + " is broken and unusable!";
                actionEvent = CombatActionEvent{attacker.Id(), attacker.Name(), defender.Id(),
                                                defender.Name(), attacker.Room(), text, 0, false,
                                                weapon->name, SoundLevel::Quiet};
                failure = GameError(ErrorCode::BrokenEquipment, text);
            }
        }

        if (!failure) {
            outcome.weaponName = weapon->name;
            outcome.damageType = weapon->damageType;

            // 5-7. Attack and defense
            int attackSkill = weapon->skillLevel;
            if (request.hand == AttackHand::OffHand) {
                attackSkill -= kOffHandPenalty;
            }
            attackSkill = saturatingAdd(attackSkill, weapon->attackValueModifier);
            attackSkill = saturatingAdd(attackSkill, timedPenalty);
            attackSkill = saturatingAdd(attackSkill, attackerEffects.attackValueModifier);
            outcome.attackValue = saturatingAdd(attackSkill, dice_->RollExploding4dF());

            int defenseSkill = BaseDefense(defender, defenderItems.value(), parrying, defenderEffects);
            defenseSkill = saturatingAdd(defenseSkill, defenderEffects.defenseValueModifier);
            outcome.defenseValue = saturatingAdd(defenseSkill, dice_->RollExploding4dF());
            outcome.successValue = outcome.attackValue - outcome.defenseValue;

            // 8. Stamina
            attackerPools.currentFatigue = std::max(0, attackerPools.currentFatigue - cost);
            if (defenderPools.currentFatigue > 0 && !parrying) {
                defenderPools.currentFatigue = std::max(0, defenderPools.currentFatigue - 1);
            }

            // 9. Miss penalty
            if (outcome.successValue <= -3) {
                if (auto penalty = sessions_->ApplyTimedPenalty(attacker.Id(), outcome.successValue)) {
                    outcome.penaltiesApplied.push_back(*penalty);
                }
            }

            if (outcome.successValue < 0) {
                // 10. Miss
                outcome.description = attacker.Name() + " attacks " + defender.Name() + " but misses!";
                actionEvent = CombatActionEvent{attacker.Id(), attacker.Name(), defender.Id(),
                                                defender.Name(), attacker.Room(),
                                                outcome.description, 0, false, weapon->name,
                                                SoundLevel::Normal};
                CombatActionLog log;
                log.actorId = attacker.Id();
                log.targetId = defender.Id();
                log.attackValue = outcome.attackValue;
                log.defenseValue = outcome.defenseValue;
                log.successValue = outcome.successValue;
                log.description = outcome.description;
                actionLog = std::move(log);
            } else {
                // 11. Physicality check
                int physicality = saturatingAdd(skillOrDefault(attacker, skills::kPhysicality),
                                                attackerEffects.ModifierFor(skills::kPhysicality));
                int resultValue = saturatingAdd(physicality, dice_->RollExploding4dF()) -
                                  kPhysicalityCheckTarget;
                int modifiedSv = outcome.successValue + CombatTables::PhysicalityBonus(resultValue);
                modifiedSv = saturatingAdd(modifiedSv, weapon->successValueModifier);
                if (resultValue <= -3) {
                    if (auto penalty = sessions_->ApplyTimedPenalty(attacker.Id(), resultValue)) {
                        outcome.penaltiesApplied.push_back(*penalty);
                    }
                }

                // 12-13. Location and armor
                auto location = CombatTables::RollHitLocation(*dice_);
                auto absorbed = ApplyArmorAbsorption(defenderItems.value(), location,
                                                     weapon->damageType, weapon->damageClass,
                                                     modifiedSv);
                outcome.hitLocation = location;
                outcome.armorAbsorption = absorbed.totalAbsorption;
                outcome.finalSuccessValue = absorbed.successValue;

                // 14. Damage
                outcome.rawDamage = CombatTables::RollRawDamage(outcome.finalSuccessValue, *dice_);
                int damage = ScaleDamage(outcome.rawDamage, attackerEffects.damageDealtModifier,
                                         defenderEffects.damageReceivedModifier);
                outcome.damage = CombatTables::SplitDamage(damage);
                outcome.hit = true;

                // 15. Pending damage
                defenderPools.pendingFatigue = saturatingAdd(defenderPools.pendingFatigue,
                                                             outcome.damage.fatigue);
                defenderPools.pendingVitality = saturatingAdd(defenderPools.pendingVitality,
                                                              outcome.damage.vitality);
                defenderPools.wounds = saturatingAdd(defenderPools.wounds, outcome.damage.wounds);
                if (outcome.damage.wounds > 0) {
                    woundsToApply.emplace_back(location, outcome.damage.wounds);
                }

                // 16. Report and death
                int total = saturatingAdd(outcome.damage.fatigue, outcome.damage.vitality);
                outcome.description = attacker.Name() + " hits " + defender.Name() + " dealing " +
                                      std::to_string(outcome.damage.fatigue) + " FAT and " +
                                      std::to_string(outcome.damage.vitality) + " VIT damage!";
                actionEvent = CombatActionEvent{attacker.Id(), attacker.Name(), defender.Id(),
                                                defender.Name(), attacker.Room(),
                                                outcome.description, total, true, weapon->name,
                                                SoundLevel::Normal};
                CombatActionLog log;
                log.actorId = attacker.Id();
                log.targetId = defender.Id();
                log.attackValue = outcome.attackValue;
                log.defenseValue = outcome.defenseValue;
                log.successValue = outcome.successValue;
                log.damageTotal = total;
                log.fatigueDamage = outcome.damage.fatigue;
                log.vitalityDamage = outcome.damage.vitality;
                log.wounds = outcome.damage.wounds;
                log.hitLocation = location;
                log.damageType = weapon->damageType;
                log.description = attacker.Name() + " hits " + defender.Name() + " for " +
                                  std::to_string(total) + " damage!";
                actionLog = std::move(log);

                if (defenderPools.currentVitality <= 0) {
                    outcome.defenderDied = true;
                    if (auto* npc = dynamic_cast<NpcCombatant*>(&defender)) {
                        npc->Despawn("Death");
                    }
                }
            }
        }
        if (actionLog) {
            actionLog->timestamp = now;
        }
    }

    // Publication happens with no combatant lock held.
    gate_->Publish(gate);
    if (actionEvent && events_) {
        events_->Publish(*actionEvent);
    }
    if (failure) {
        return GameResult<AttackOutcome>::err(std::move(*failure));
    }

    if (actionLog) {
        auto appended = sessions_->AppendAction(outcome.sessionId, std::move(*actionLog));
        if (appended.hasError()) {
            VIGOR_LOG_WARN(LogCategory::Combat,
                           "could not record combat action: " +
                           std::string(appended.error().message()));
        }
    }

    if (effects_) {
        for (const auto& [location, count] : woundsToApply) {
            for (int i = 0; i < count; ++i) {
                auto wound = effects_->ApplyWound(defender.Id(), location, attacker.Id());
                if (wound.hasError()) {
                    // No Wound definition registered: the pool wound count still stands.
                    VIGOR_LOG_DEBUG(LogCategory::Effect, std::string(wound.error().message()));
                    break;
                }
            }
        }
    }

    VIGOR_LOG_CTX(LogLevel::Debug, LogCategory::Combat,
                  outcome.hit ? "melee hit" : "melee miss", ctx);

    if (outcome.defenderDied) {
        VIGOR_LOG_INFO(LogCategory::Combat, defender.Name() + " has died in combat");
        if (!defender.IsPlayer() && effects_) {
            effects_->RemoveAllFor(defender.Id());
        }
        auto ended = sessions_->EndCombat(outcome.sessionId, defender.Name() + " died");
        if (ended.hasError()) {
            VIGOR_LOG_WARN(LogCategory::Combat, std::string(ended.error().message()));
        }
    }
    return GameResult<AttackOutcome>::ok(std::move(outcome));
}

// ── Unimplemented attack forms ──────────────────────────────────────────

GameResult<AttackOutcome> AttackResolver::ResolveRangedAttack(const MeleeAttackRequest& /*request*/,
                                                              int /*range*/) {
    VIGOR_LOG_WARN(LogCategory::Combat, "ranged combat is not implemented");
    return attackError(ErrorCode::NotImplemented, "ranged combat is not implemented");
}

GameResult<AttackOutcome> AttackResolver::ResolveKnockback(const MeleeAttackRequest& /*request*/) {
    VIGOR_LOG_WARN(LogCategory::Combat, "knockback is not implemented");
    return attackError(ErrorCode::NotImplemented, "knockback is not implemented");
}

}  // namespace vigor::game
