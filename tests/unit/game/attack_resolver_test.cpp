/// @file attack_resolver_test.cpp
/// @brief Unit tests for melee resolution with scripted dice.

#include <gtest/gtest.h>

#include <memory>

#include "vigor/game/attack_resolver.hpp"
#include "vigor/game/effect_catalog.hpp"

#include "support/test_helpers.hpp"

using namespace vigor::game;
using vigor::foundation::ErrorCode;
using vigor::foundation::EventBus;
using vigor::foundation::ManualClock;
using vigor::test::EventRecorder;
using vigor::test::MakeNpc;
using vigor::test::MakePlayer;
using vigor::test::ScriptedRandomSource;
using vigor::test::SetPools;
using vigor::test::ThrowingEquipmentProvider;

class AttackResolverTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = std::make_shared<EventBus>();
        clock_ = std::make_shared<ManualClock>();
        random_ = std::make_shared<ScriptedRandomSource>();
        dice_ = std::make_shared<DiceRoller>(random_);
        catalog_ = std::make_shared<EffectCatalog>();
        catalog_->SeedDefaults();
        sessions_ = std::make_shared<CombatSessionManager>(bus_, clock_);
        effects_ = std::make_shared<StatusEffectEngine>(catalog_, clock_);
        equipment_ = std::make_shared<InMemoryEquipmentProvider>();
        resolver_ = makeResolver(equipment_);

        hero_ = MakePlayer(1, "Aldric");
        wolf_ = MakeNpc(2, "Nightwolf");
    }

    std::unique_ptr<AttackResolver> makeResolver(std::shared_ptr<const IEquipmentProvider> equipment) {
        return std::make_unique<AttackResolver>(sessions_, effects_, std::move(equipment), dice_,
                                                std::make_shared<ActionGate>(dice_, bus_), bus_,
                                                clock_);
    }

    /// AV +3 against DV -3, a neutral physicality roll, torso, 2d8 = 8.
    void scriptSolidHit() {
        random_->PushFudge(3);    // attack
        random_->PushFudge(-3);   // defense
        random_->PushFudge(0);    // physicality
        random_->PushDie(4);      // location: torso
        random_->PushDie(4);      // 2d8
        random_->PushDie(4);
    }

    MeleeAttackRequest heroAttacksWolf() const { return {hero_, wolf_, AttackHand::MainHand}; }

    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<ScriptedRandomSource> random_;
    std::shared_ptr<DiceRoller> dice_;
    std::shared_ptr<EffectCatalog> catalog_;
    std::shared_ptr<CombatSessionManager> sessions_;
    std::shared_ptr<StatusEffectEngine> effects_;
    std::shared_ptr<InMemoryEquipmentProvider> equipment_;
    std::unique_ptr<AttackResolver> resolver_;
    std::shared_ptr<PlayerCombatant> hero_;
    std::shared_ptr<NpcCombatant> wolf_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Hits and misses
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AttackResolverTest, SolidHitQueuesDamage) {
    EventRecorder<CombatActionEvent> actions(*bus_);
    scriptSolidHit();

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue()) << result.error().message();
    const auto& outcome = result.value();

    EXPECT_TRUE(outcome.hit);
    EXPECT_EQ(outcome.weaponName, "Unarmed Combat");
    EXPECT_EQ(outcome.attackValue, 13);
    EXPECT_EQ(outcome.defenseValue, 7);
    EXPECT_EQ(outcome.successValue, 6);
    EXPECT_EQ(outcome.finalSuccessValue, 7);
    EXPECT_EQ(outcome.hitLocation, BodyLocation::Torso);
    EXPECT_EQ(outcome.rawDamage, 8);
    EXPECT_EQ(outcome.damage.fatigue, 8);
    EXPECT_EQ(outcome.damage.vitality, 6);
    EXPECT_EQ(outcome.damage.wounds, 1);
    EXPECT_FALSE(outcome.defenderDied);
    EXPECT_EQ(random_->Remaining(), 0u);

    auto heroPools = hero_->SnapshotPools();
    EXPECT_EQ(heroPools.currentFatigue, 14);

    auto wolfPools = wolf_->SnapshotPools();
    EXPECT_EQ(wolfPools.currentFatigue, 14);
    EXPECT_EQ(wolfPools.pendingFatigue, 8);
    EXPECT_EQ(wolfPools.pendingVitality, 6);
    EXPECT_EQ(wolfPools.wounds, 1);
    EXPECT_EQ(wolfPools.currentVitality, wolfPools.maxVitality);

    EXPECT_EQ(effects_->WoundsByLocation(wolf_->Id())[BodyLocation::Torso], 1);

    ASSERT_EQ(actions.Count(), 1u);
    auto event = actions.Events()[0];
    EXPECT_TRUE(event.isHit);
    EXPECT_EQ(event.damage, 14);
    EXPECT_EQ(event.description, "Aldric hits Nightwolf dealing 8 FAT and 6 VIT damage!");

    auto session = sessions_->Session(outcome.sessionId);
    ASSERT_TRUE(session.has_value());
    ASSERT_EQ(session->actions.size(), 1u);
    EXPECT_EQ(session->actions[0].damageTotal, 14);
}

TEST_F(AttackResolverTest, MissCostsStaminaOnly) {
    EventRecorder<CombatActionEvent> actions(*bus_);
    random_->PushFudge(0);
    random_->PushFudge(2);

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_FALSE(result.value().hit);
    EXPECT_EQ(result.value().successValue, -2);
    EXPECT_TRUE(result.value().penaltiesApplied.empty());

    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 14);
    EXPECT_EQ(wolf_->SnapshotPools().currentFatigue, 14);
    EXPECT_EQ(wolf_->SnapshotPools().pendingVitality, 0);

    ASSERT_EQ(actions.Count(), 1u);
    EXPECT_EQ(actions.Events()[0].description, "Aldric attacks Nightwolf but misses!");
}

TEST_F(AttackResolverTest, BadMissLeavesTimedPenalty) {
    random_->PushFudge(-2);
    random_->PushFudge(2);

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().successValue, -4);
    ASSERT_EQ(result.value().penaltiesApplied.size(), 1u);
    EXPECT_EQ(result.value().penaltiesApplied[0].amount, -1);
    EXPECT_EQ(sessions_->TotalTimedPenalty(hero_->Id()), -1);

    // The penalty weighs on the next attack.
    random_->PushFudge(0);
    random_->PushFudge(0);
    auto next = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(next.hasValue());
    EXPECT_EQ(next.value().attackValue, 9);
}

TEST_F(AttackResolverTest, WeakPhysicalityCheckPenalizes) {
    PlayerAttributes weak;
    weak.physicality = 6;
    auto scrawny = MakePlayer(3, "Pip", 1, weak);

    random_->PushFudge(3);    // AV 9
    random_->PushFudge(-3);   // DV 7
    random_->PushFudge(-1);   // 6 - 1 - 8 = -3
    random_->PushDie(7);      // left arm
    random_->PushDie(5);      // d6

    auto result = resolver_->ResolveMeleeAttack({scrawny, wolf_, AttackHand::MainHand});
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().finalSuccessValue, 2);
    EXPECT_EQ(result.value().hitLocation, BodyLocation::LeftArm);
    EXPECT_EQ(result.value().damage.fatigue, 5);
    EXPECT_EQ(result.value().damage.vitality, 1);
    ASSERT_EQ(result.value().penaltiesApplied.size(), 1u);
    EXPECT_EQ(result.value().penaltiesApplied[0].amount, -1);
}

TEST_F(AttackResolverTest, ParryingDefenderSavesFatigue) {
    ASSERT_TRUE(sessions_->InitiateCombat(*hero_, *wolf_).hasValue());
    ASSERT_TRUE(sessions_->SetParryMode(wolf_->Id(), true).hasValue());
    random_->PushFudge(0);
    random_->PushFudge(0);

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().defenseValue, 10);
    EXPECT_EQ(wolf_->SnapshotPools().currentFatigue, 15);
}

// ═══════════════════════════════════════════════════════════════════════════
// Equipment
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AttackResolverTest, WeaponModifiersApply) {
    EquippedItem sword;
    sword.name = "Longsword";
    sword.slot = EquipSlot::MainHand;
    WeaponProperties props;
    props.skillBonus = 2;
    props.attackValueModifier = 1;
    props.damageType = DamageType::Cutting;
    sword.weapon = props;
    equipment_->Equip(hero_->Id(), sword);

    random_->PushFudge(0);
    random_->PushFudge(0);
    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().weaponName, "Longsword");
    EXPECT_EQ(result.value().attackValue, 13);
    EXPECT_EQ(result.value().damageType, DamageType::Cutting);
}

TEST_F(AttackResolverTest, ArmorAbsorbsSuccess) {
    EquippedItem mail;
    mail.name = "Chainmail";
    mail.slot = EquipSlot::Chest;
    ArmorProperties armor;
    armor.SetAbsorption(DamageType::Bashing, 3);
    mail.armor = armor;
    equipment_->Equip(wolf_->Id(), mail);

    random_->PushFudge(3);
    random_->PushFudge(-3);
    random_->PushFudge(0);
    random_->PushDie(4);   // torso
    random_->PushDie(6);   // d10 for SV 4

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().armorAbsorption, 3);
    EXPECT_EQ(result.value().finalSuccessValue, 4);
    EXPECT_EQ(result.value().damage.fatigue, 6);
    EXPECT_EQ(result.value().damage.vitality, 2);
}

TEST_F(AttackResolverTest, BrokenWeaponRefuses) {
    EventRecorder<CombatActionEvent> actions(*bus_);
    EquippedItem sword;
    sword.name = "Rusty Sword";
    sword.slot = EquipSlot::MainHand;
    sword.broken = true;
    sword.weapon = WeaponProperties{};
    equipment_->Equip(hero_->Id(), sword);

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::BrokenEquipment);
    EXPECT_EQ(result.error().message(), "Aldric's Rusty Sword is broken and unusable!");
    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 15);
    ASSERT_EQ(actions.Count(), 1u);
    EXPECT_EQ(actions.Events()[0].soundLevel, SoundLevel::Quiet);
}

TEST_F(AttackResolverTest, DualWieldSwingCostsTwoFatigue) {
    EquippedItem blade;
    blade.name = "Dagger";
    blade.weapon = WeaponProperties{};
    blade.slot = EquipSlot::MainHand;
    equipment_->Equip(hero_->Id(), blade);
    blade.slot = EquipSlot::OffHand;
    equipment_->Equip(hero_->Id(), blade);

    random_->PushFudge(0);
    random_->PushFudge(0);
    auto request = heroAttacksWolf();
    request.dualWield = true;
    ASSERT_TRUE(resolver_->ResolveMeleeAttack(request).hasValue());
    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 13);
}

TEST_F(AttackResolverTest, MainHandSwingWithTwoWeaponsCostsOneFatigue) {
    EquippedItem blade;
    blade.name = "Dagger";
    blade.weapon = WeaponProperties{};
    blade.slot = EquipSlot::MainHand;
    equipment_->Equip(hero_->Id(), blade);
    blade.slot = EquipSlot::OffHand;
    equipment_->Equip(hero_->Id(), blade);

    random_->PushFudge(0);
    random_->PushFudge(0);
    ASSERT_TRUE(resolver_->ResolveMeleeAttack(heroAttacksWolf()).hasValue());
    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 14);
}

TEST_F(AttackResolverTest, DualWieldClaimNeedsTwoWeapons) {
    EquippedItem blade;
    blade.name = "Dagger";
    blade.weapon = WeaponProperties{};
    blade.slot = EquipSlot::MainHand;
    equipment_->Equip(hero_->Id(), blade);

    random_->PushFudge(0);
    random_->PushFudge(0);
    auto request = heroAttacksWolf();
    request.dualWield = true;
    ASSERT_TRUE(resolver_->ResolveMeleeAttack(request).hasValue());
    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 14);
}

TEST_F(AttackResolverTest, EquipmentStoreFailureIsReported) {
    auto resolver = makeResolver(std::make_shared<ThrowingEquipmentProvider>());
    auto result = resolver->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::StorageUnavailable);
    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 15);
}

// ═══════════════════════════════════════════════════════════════════════════
// Refusals
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AttackResolverTest, SelfAttackIsRejected) {
    auto result = resolver_->ResolveMeleeAttack({hero_, hero_, AttackHand::MainHand});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidArgument);
}

TEST_F(AttackResolverTest, DifferentRoomsAreRejected) {
    auto distant = MakeNpc(5, "Bandit", 9);
    auto result = resolver_->ResolveMeleeAttack({hero_, distant, AttackHand::MainHand});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotInSameRoom);
    EXPECT_FALSE(sessions_->IsInCombat(hero_->Id()));
}

TEST_F(AttackResolverTest, MissingCombatantIsRejected) {
    auto result = resolver_->ResolveMeleeAttack({hero_, nullptr, AttackHand::MainHand});
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CombatantNotFound);
}

TEST_F(AttackResolverTest, StunnedAttackerCannotAct) {
    ASSERT_TRUE(effects_->ApplyEffect(hero_->Id(), "Stunned").hasValue());
    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::ActionPrevented);
    EXPECT_EQ(random_->Calls(), 0u);
}

TEST_F(AttackResolverTest, ExhaustedAttackerCannotSwing) {
    SetPools(*hero_, 0, 15);
    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::InsufficientStamina);
}

TEST_F(AttackResolverTest, FailedFocusCheckStopsAttack) {
    SetPools(*hero_, 15, 2);
    random_->PushFudge(0);   // 10 vs 12
    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::FocusCheckFailed);
    EXPECT_EQ(hero_->SnapshotPools().currentFatigue, 15);
}

TEST_F(AttackResolverTest, RangedAndKnockbackAreNotImplemented) {
    auto ranged = resolver_->ResolveRangedAttack(heroAttacksWolf(), 3);
    ASSERT_TRUE(ranged.hasError());
    EXPECT_EQ(ranged.error().code(), ErrorCode::NotImplemented);

    auto knockback = resolver_->ResolveKnockback(heroAttacksWolf());
    ASSERT_TRUE(knockback.hasError());
    EXPECT_EQ(knockback.error().code(), ErrorCode::NotImplemented);
}

// ═══════════════════════════════════════════════════════════════════════════
// Effects and death
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(AttackResolverTest, DamageModifiersScaleDamage) {
    ASSERT_TRUE(effects_->ApplyEffect(hero_->Id(), "Curse").hasValue());
    scriptSolidHit();
    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_EQ(result.value().rawDamage, 8);
    EXPECT_EQ(result.value().damage.fatigue, 6);   // round(8 * 0.75)
}

TEST_F(AttackResolverTest, ScaleDamageRoundsAndFloors) {
    EXPECT_EQ(AttackResolver::ScaleDamage(10, 0.0, 0.0), 10);
    EXPECT_EQ(AttackResolver::ScaleDamage(10, 0.25, -0.2), 10);
    EXPECT_EQ(AttackResolver::ScaleDamage(7, -0.5, 0.0), 4);
    EXPECT_EQ(AttackResolver::ScaleDamage(5, -2.0, 0.0), 0);
}

TEST_F(AttackResolverTest, NpcAtZeroVitalityDiesAndDespawns) {
    EventRecorder<CombatEnded> ended(*bus_);
    SetPools(*wolf_, 15, 0);
    scriptSolidHit();

    auto result = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(result.hasValue());
    EXPECT_TRUE(result.value().defenderDied);
    EXPECT_FALSE(wolf_->IsActive());
    EXPECT_TRUE(effects_->ActiveEffects(wolf_->Id()).empty());
    EXPECT_FALSE(sessions_->IsInCombat(hero_->Id()));
    ASSERT_EQ(ended.Count(), 1u);
    EXPECT_EQ(ended.Events()[0].reason, "Nightwolf died");

    auto again = resolver_->ResolveMeleeAttack(heroAttacksWolf());
    ASSERT_TRUE(again.hasError());
    EXPECT_EQ(again.error().code(), ErrorCode::CombatantNotFound);
}

TEST_F(AttackResolverTest, SelectWeaponFallsBackToUnarmed) {
    auto weapon = AttackResolver::SelectWeapon(*hero_, {}, AttackHand::MainHand, 2);
    ASSERT_TRUE(weapon.has_value());
    EXPECT_EQ(weapon->name, "Unarmed Combat");
    EXPECT_EQ(weapon->skillLevel, 12);
    EXPECT_EQ(weapon->damageType, DamageType::Bashing);
}

TEST_F(AttackResolverTest, BaseDefenseUsesDodgeUnlessParrying) {
    EffectSummary summary;
    summary.attributeModifiers["Dodge"] = -3;
    EXPECT_EQ(AttackResolver::BaseDefense(*wolf_, {}, false, summary), 7);
    EXPECT_EQ(AttackResolver::BaseDefense(*wolf_, {}, true, summary), 10);
}
