/// @file combat_tick_service_test.cpp
/// @brief Unit tests for the recurring health and effect ticks.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

#include "vigor/foundation/config_manager.hpp"
#include "vigor/foundation/job_scheduler.hpp"
#include "vigor/game/action_gate.hpp"
#include "vigor/game/attack_resolver.hpp"
#include "vigor/game/combat_events.hpp"
#include "vigor/game/effect_catalog.hpp"
#include "vigor/service/combat_tick_service.hpp"

#include "support/test_helpers.hpp"

using namespace vigor::game;
using namespace vigor::service;
using namespace std::chrono_literals;
using vigor::foundation::ConfigManager;
using vigor::foundation::EventBus;
using vigor::foundation::GameJobScheduler;
using vigor::foundation::ManualClock;
using vigor::test::EventRecorder;
using vigor::test::MakeNpc;
using vigor::test::MakePlayer;
using vigor::test::ScriptedRandomSource;
using vigor::test::SetPools;

// ============================================================================
// CombatTickSettings
// ============================================================================

TEST(CombatTickSettingsTest, DefaultsWhenKeysMissing) {
    ConfigManager config;
    auto settings = CombatTickSettings::FromConfig(config);
    EXPECT_EQ(settings.healthTick, 3000ms);
    EXPECT_EQ(settings.effectTick, 1000ms);
    EXPECT_EQ(settings.sessionRetention, 300s);
}

TEST(CombatTickSettingsTest, ReadsCombatKeys) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "combat:\n"
        "  health_tick_ms: 500\n"
        "  effect_tick_ms: 250\n"
        "  session_retention_s: 60\n").hasValue());

    auto settings = CombatTickSettings::FromConfig(config);
    EXPECT_EQ(settings.healthTick, 500ms);
    EXPECT_EQ(settings.effectTick, 250ms);
    EXPECT_EQ(settings.sessionRetention, 60s);
}

TEST(CombatTickSettingsTest, NonPositiveTicksKeepDefaults) {
    ConfigManager config;
    ASSERT_TRUE(config.loadFromString(
        "combat:\n"
        "  health_tick_ms: 0\n"
        "  effect_tick_ms: -10\n").hasValue());

    auto settings = CombatTickSettings::FromConfig(config);
    EXPECT_EQ(settings.healthTick, 3000ms);
    EXPECT_EQ(settings.effectTick, 1000ms);
}

// ============================================================================
// CombatTickService
// ============================================================================

class CombatTickServiceTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = std::make_shared<EventBus>();
        clock_ = std::make_shared<ManualClock>();
        random_ = std::make_shared<ScriptedRandomSource>();
        auto catalog = std::make_shared<EffectCatalog>();
        catalog->SeedDefaults();
        effects_ = std::make_shared<StatusEffectEngine>(catalog, clock_);
        registry_ = std::make_shared<CombatantRegistry>();
        sessions_ = std::make_shared<CombatSessionManager>(bus_, clock_);
        auto dice = std::make_shared<DiceRoller>(random_);
        auto resolver = std::make_shared<AttackResolver>(
            sessions_, effects_, std::make_shared<InMemoryEquipmentProvider>(), dice,
            std::make_shared<ActionGate>(dice, bus_), bus_, clock_);
        policy_ = std::make_shared<NpcDecisionPolicy>(sessions_, resolver, registry_, bus_);

        hero_ = MakePlayer(1, "Aldric");
        wolf_ = MakeNpc(2, "Nightwolf");
        registry_->Add(hero_);
        registry_->Add(wolf_);
    }

    std::unique_ptr<CombatTickService> makeService(bool withNpcPolicy = true) {
        CombatTickDependencies deps;
        deps.registry = registry_;
        deps.sessions = sessions_;
        deps.effects = effects_;
        deps.healthPools = std::make_shared<HealthPoolProcessor>(clock_, 3s);
        deps.npcPolicy = withNpcPolicy ? policy_ : nullptr;
        deps.events = bus_;
        return std::make_unique<CombatTickService>(std::move(deps), CombatTickSettings{});
    }

    void engage() {
        ASSERT_TRUE(sessions_->InitiateCombat(*hero_, *wolf_).hasValue());
    }

    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<ManualClock> clock_;
    std::shared_ptr<ScriptedRandomSource> random_;
    std::shared_ptr<StatusEffectEngine> effects_;
    std::shared_ptr<CombatantRegistry> registry_;
    std::shared_ptr<CombatSessionManager> sessions_;
    std::shared_ptr<NpcDecisionPolicy> policy_;
    std::shared_ptr<PlayerCombatant> hero_;
    std::shared_ptr<NpcCombatant> wolf_;
};

// -- Health tick -------------------------------------------------------------

TEST_F(CombatTickServiceTest, HealthTickAppliesPendingDamage) {
    auto service = makeService();
    hero_->AddPending(0, 4);

    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.poolsChanged, 1u);
    EXPECT_EQ(report.deaths, 0u);
    EXPECT_EQ(report.failures, 0u);

    auto pools = hero_->SnapshotPools();
    EXPECT_EQ(pools.currentVitality, 13);
    EXPECT_EQ(pools.pendingVitality, 2);
}

TEST_F(CombatTickServiceTest, HealthTickLeavesIdleCombatantsAlone) {
    auto service = makeService();
    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.poolsChanged, 0u);
    EXPECT_EQ(hero_->SnapshotPools().currentVitality, 15);
}

TEST_F(CombatTickServiceTest, NpcDyingOnTickIsDespawned) {
    auto service = makeService();
    EventRecorder<CombatEnded> ended(*bus_);
    engage();
    ASSERT_TRUE(effects_->ApplyEffect(wolf_->Id(), "Poison").hasValue());
    SetPools(*wolf_, 15, 1);
    wolf_->AddPending(0, 3);

    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.deaths, 1u);
    EXPECT_FALSE(wolf_->IsActive());
    EXPECT_EQ(wolf_->DespawnReason(), "Death");
    EXPECT_FALSE(effects_->HasEffect(wolf_->Id(), "Poison"));
    EXPECT_FALSE(sessions_->IsInCombat(hero_->Id()));

    ASSERT_EQ(ended.Count(), 1u);
    EXPECT_EQ(ended.Events()[0].reason, "Nightwolf died");
}

TEST_F(CombatTickServiceTest, PlayerDyingOnTickStaysRegistered) {
    auto service = makeService(false);
    SetPools(*hero_, 15, 1);
    hero_->AddPending(0, 3);

    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.deaths, 1u);
    EXPECT_TRUE(hero_->IsActive());
    EXPECT_NE(registry_->Find(hero_->Id()), nullptr);
    EXPECT_EQ(hero_->SnapshotPools().currentVitality, 0);
}

TEST_F(CombatTickServiceTest, PlayerDyingOnTickEndsSession) {
    auto service = makeService(false);
    EventRecorder<CombatEnded> ended(*bus_);
    engage();
    SetPools(*hero_, 15, 1);
    hero_->AddPending(0, 3);

    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.deaths, 1u);
    EXPECT_FALSE(sessions_->IsInCombat(hero_->Id()));
    EXPECT_FALSE(sessions_->IsInCombat(wolf_->Id()));
    EXPECT_TRUE(hero_->IsActive());
    EXPECT_TRUE(wolf_->IsActive());

    ASSERT_EQ(ended.Count(), 1u);
    EXPECT_EQ(ended.Events()[0].reason, "Aldric died");
}

TEST_F(CombatTickServiceTest, HealthTickPrunesExpiredPenalties) {
    auto service = makeService(false);
    engage();
    ASSERT_TRUE(sessions_->ApplyTimedPenalty(hero_->Id(), -4).has_value());

    clock_->advance(4s);
    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.penaltiesPruned, 1u);
    EXPECT_EQ(sessions_->TotalTimedPenalty(hero_->Id()), 0);
}

TEST_F(CombatTickServiceTest, WoundedNpcDecidesToFlee) {
    auto service = makeService();
    EventRecorder<CombatActionEvent> actions(*bus_);
    engage();
    SetPools(*wolf_, 15, 3);

    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.npcDecisions, 1u);
    EXPECT_FALSE(sessions_->IsInCombat(wolf_->Id()));

    ASSERT_EQ(actions.Count(), 1u);
    EXPECT_EQ(actions.Events()[0].skillUsed, "Flee");
}

TEST_F(CombatTickServiceTest, NoDecisionsWithoutPolicy) {
    auto service = makeService(false);
    engage();
    SetPools(*wolf_, 15, 3);

    auto report = service->RunHealthTick({});
    EXPECT_EQ(report.npcDecisions, 0u);
    EXPECT_TRUE(sessions_->IsInCombat(wolf_->Id()));
}

TEST_F(CombatTickServiceTest, HealthTickHonoursStopRequest) {
    auto service = makeService();
    hero_->AddPending(0, 4);
    std::stop_source source;
    source.request_stop();

    auto report = service->RunHealthTick(source.get_token());
    EXPECT_EQ(report.poolsChanged, 0u);
    EXPECT_EQ(hero_->SnapshotPools().pendingVitality, 4);
}

// -- Effect tick -------------------------------------------------------------

TEST_F(CombatTickServiceTest, EffectTickQueuesPeriodicDamage) {
    auto service = makeService();
    EventRecorder<CombatNarration> narration(*bus_);
    ASSERT_TRUE(effects_->ApplyEffect(hero_->Id(), "Poison").hasValue());
    clock_->advance(6s);

    auto report = service->RunEffectTick({});
    EXPECT_EQ(report.combatantsTicked, 1u);
    EXPECT_EQ(hero_->SnapshotPools().pendingVitality, 2);

    ASSERT_EQ(narration.Count(), 1u);
    EXPECT_EQ(narration.Events()[0].message, "Poison deals 2 vitality damage");
    EXPECT_EQ(narration.Events()[0].room, hero_->Room());
}

TEST_F(CombatTickServiceTest, EffectTickCleansUpExpired) {
    auto service = makeService();
    ASSERT_TRUE(effects_->ApplyEffect(hero_->Id(), "Stunned").hasValue());
    clock_->advance(7s);

    auto report = service->RunEffectTick({});
    EXPECT_EQ(report.expired, 1u);
    EXPECT_FALSE(effects_->HasEffect(hero_->Id(), "Stunned"));
}

TEST_F(CombatTickServiceTest, EffectTickHealsWoundsNaturally) {
    auto service = makeService();
    ASSERT_TRUE(effects_->ApplyWound(hero_->Id(), BodyLocation::Torso).hasValue());
    {
        std::lock_guard lock(hero_->Mutex());
        hero_->Pools().wounds = 1;
    }
    clock_->advance(4h);

    auto report = service->RunEffectTick({});
    EXPECT_EQ(report.woundsHealed, 1);
    EXPECT_EQ(effects_->WoundCount(hero_->Id()), 0);
    EXPECT_EQ(hero_->SnapshotPools().wounds, 0);
}

TEST_F(CombatTickServiceTest, EffectTickSkipsUnregisteredCombatants) {
    auto service = makeService();
    ASSERT_TRUE(effects_->ApplyEffect(vigor::foundation::CombatantId(99), "Poison").hasValue());
    clock_->advance(6s);

    auto report = service->RunEffectTick({});
    EXPECT_EQ(report.combatantsTicked, 0u);
    EXPECT_EQ(report.failures, 0u);
}

// -- Scheduling --------------------------------------------------------------

TEST_F(CombatTickServiceTest, RegisteredTicksRunFromScheduler) {
    auto service = makeService(false);
    hero_->AddPending(0, 4);

    GameJobScheduler scheduler(2);
    ASSERT_TRUE(service->Register(scheduler).hasValue());

    scheduler.processTick(service->Settings().healthTick);

    auto deadline = std::chrono::steady_clock::now() + 2s;
    while (hero_->SnapshotPools().currentVitality == 15 &&
           std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(1ms);
    }
    EXPECT_EQ(hero_->SnapshotPools().currentVitality, 13);
    scheduler.requestStop();
}
