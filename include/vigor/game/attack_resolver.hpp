#pragma once

/// @file attack_resolver.hpp
/// @brief AttackResolver: the melee pipeline from attack roll to pending damage.
///
/// Resolution order:
///   1. Ensure a combat session (same room required)
///   2. Action gates: PreventActions effects, vitality/fatigue Focus checks
///   3. Fatigue cost check (2 when dual wielding, else 1)
///   4. Weapon lookup (unarmed fallback, broken weapons refuse)
///   5. Attack value vs defense value, both with exploding 4dF
///   6. Stamina costs, miss penalties, miss
///   7. Physicality check, hit location, armor, damage tables
///   8. Pending damage, wounds, death

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "vigor/foundation/event_bus.hpp"
#include "vigor/foundation/game_result.hpp"
#include "vigor/game/action_gate.hpp"
#include "vigor/game/combat_events.hpp"
#include "vigor/game/combat_session_manager.hpp"
#include "vigor/game/combat_tables.hpp"
#include "vigor/game/combatant.hpp"
#include "vigor/game/dice.hpp"
#include "vigor/game/equipment.hpp"
#include "vigor/game/status_effect_engine.hpp"

namespace vigor::game {

/// Who attacks whom, and with which hand.
struct MeleeAttackRequest {
    std::shared_ptr<Combatant> attacker;
    std::shared_ptr<Combatant> defender;
    AttackHand hand = AttackHand::MainHand;
    /// Swing with both weapons. Honoured only when both hands hold one.
    bool dualWield = false;
};

/// Everything a resolved attack produced.
struct AttackOutcome {
    CombatSessionId sessionId;
    bool hit = false;
    std::string weaponName;
    int attackValue = 0;
    int defenseValue = 0;
    /// Attack value minus defense value, before physicality and armor.
    int successValue = 0;
    /// Success value after the physicality bonus and armor absorption.
    int finalSuccessValue = 0;
    int armorAbsorption = 0;
    std::optional<BodyLocation> hitLocation;
    DamageType damageType = DamageType::Bashing;
    int rawDamage = 0;
    DamageSplit damage;
    std::vector<TimedPenalty> penaltiesApplied;
    bool defenderDied = false;
    std::string description;
};

/// Weapon as used by one attack.
struct WeaponUse {
    std::string name;
    int skillLevel = kDefaultSkillLevel;
    int attackValueModifier = 0;
    int successValueModifier = 0;
    DamageType damageType = DamageType::Bashing;
    DamageClass damageClass = DamageClass::Class1;
    bool broken = false;
};

class AttackResolver {
public:
    AttackResolver(std::shared_ptr<CombatSessionManager> sessions,
                   std::shared_ptr<StatusEffectEngine> effects,
                   std::shared_ptr<const IEquipmentProvider> equipment,
                   std::shared_ptr<DiceRoller> dice,
                   std::shared_ptr<ActionGate> gate,
                   std::shared_ptr<EventBus> events,
                   std::shared_ptr<const IClock> clock);

    /// Resolve one melee attack. Never throws.
    GameResult<AttackOutcome> ResolveMeleeAttack(const MeleeAttackRequest& request);

    /// @return NotImplemented.
    GameResult<AttackOutcome> ResolveRangedAttack(const MeleeAttackRequest& request, int range);

    /// @return NotImplemented.
    GameResult<AttackOutcome> ResolveKnockback(const MeleeAttackRequest& request);

    /// Weapon a combatant attacks with from @p hand, or the unarmed
    /// fallback. std::nullopt when the combatant has no Physicality at all.
    ///
    /// This is a pure function exposed for testability.
    [[nodiscard]] static std::optional<WeaponUse> SelectWeapon(
        const Combatant& combatant, const std::vector<EquippedItem>& items,
        AttackHand hand, int physicalityModifier = 0);

    /// Base defense: weapon skill when parrying, else Dodge plus equipment
    /// dodge modifiers. Missing skills count as 10.
    [[nodiscard]] static int BaseDefense(const Combatant& defender,
                                         const std::vector<EquippedItem>& items,
                                         bool parrying, const EffectSummary& summary);

    /// round(raw * (1 + dealt) * (1 + received)), floored at 0.
    [[nodiscard]] static int ScaleDamage(int rawDamage, double dealtModifier,
                                         double receivedModifier) noexcept;

private:
    GameResult<std::vector<EquippedItem>> loadEquipment(const Combatant& combatant) const;

    std::shared_ptr<CombatSessionManager> sessions_;
    std::shared_ptr<StatusEffectEngine> effects_;
    std::shared_ptr<const IEquipmentProvider> equipment_;
    std::shared_ptr<DiceRoller> dice_;
    std::shared_ptr<ActionGate> gate_;
    std::shared_ptr<EventBus> events_;
    std::shared_ptr<const IClock> clock_;
};

}  // namespace vigor::game
