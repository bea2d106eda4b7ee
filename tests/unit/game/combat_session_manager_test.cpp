/// @file combat_session_manager_test.cpp
/// @brief Unit tests for CombatSessionManager.

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

#include "vigor/game/combat_session_manager.hpp"

#include "support/test_helpers.hpp"

using namespace vigor::game;
using namespace std::chrono_literals;
using vigor::foundation::CombatantId;
using vigor::foundation::CombatSessionId;
using vigor::foundation::ErrorCode;
using vigor::foundation::EventBus;
using vigor::foundation::ManualClock;
using vigor::foundation::RoomId;
using vigor::test::EventRecorder;
using vigor::test::MakeNpc;
using vigor::test::MakePlayer;

class CombatSessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        bus_ = std::make_shared<EventBus>();
        clock_ = std::make_shared<ManualClock>();
        manager_ = std::make_unique<CombatSessionManager>(bus_, clock_);
    }

    CombatSessionId start(const Combatant& attacker, const Combatant& target) {
        auto result = manager_->InitiateCombat(attacker, target);
        EXPECT_TRUE(result.hasValue());
        return result.hasValue() ? result.value() : CombatSessionId{};
    }

    std::shared_ptr<EventBus> bus_;
    std::shared_ptr<ManualClock> clock_;
    std::unique_ptr<CombatSessionManager> manager_;
    std::shared_ptr<PlayerCombatant> hero_ = MakePlayer(1, "Aldric");
    std::shared_ptr<NpcCombatant> wolf_ = MakeNpc(2, "Nightwolf");
};

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSessionManagerTest, InitiateCreatesSessionAndPublishes) {
    EventRecorder<CombatStarted> started(*bus_);

    auto id = start(*hero_, *wolf_);
    EXPECT_TRUE(manager_->IsInCombat(hero_->Id()));
    EXPECT_TRUE(manager_->IsInCombat(wolf_->Id()));
    EXPECT_EQ(manager_->ActiveParticipants(id).size(), 2u);

    ASSERT_EQ(started.Count(), 1u);
    auto event = started.Events()[0];
    EXPECT_EQ(event.sessionId, id);
    EXPECT_EQ(event.attackerName, "Aldric");
    EXPECT_EQ(event.defenderName, "Nightwolf");
    EXPECT_EQ(event.room, RoomId(1));
}

TEST_F(CombatSessionManagerTest, DifferentRoomsAreRejected) {
    auto stranger = MakeNpc(3, "Bandit", 2);
    auto result = manager_->InitiateCombat(*hero_, *stranger);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotInSameRoom);
    EXPECT_FALSE(manager_->IsInCombat(hero_->Id()));
}

TEST_F(CombatSessionManagerTest, EngagedAttackerKeepsItsSession) {
    EventRecorder<CombatStarted> started(*bus_);
    auto first = start(*hero_, *wolf_);

    auto rat = MakeNpc(3, "Rat");
    auto second = start(*hero_, *rat);
    EXPECT_EQ(first, second);
    EXPECT_FALSE(manager_->IsInCombat(rat->Id()));
    EXPECT_EQ(started.Count(), 1u);
}

TEST_F(CombatSessionManagerTest, AttackerJoinsTargetSession) {
    auto id = start(*hero_, *wolf_);
    auto ally = MakePlayer(3, "Brenna");

    EXPECT_EQ(start(*ally, *wolf_), id);
    EXPECT_EQ(manager_->ActiveParticipants(id).size(), 3u);
}

TEST_F(CombatSessionManagerTest, JoiningFromAnotherRoomFails) {
    start(*hero_, *wolf_);
    auto archer = MakePlayer(3, "Brenna", 5);
    auto result = manager_->InitiateCombat(*archer, *wolf_);
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::NotInSameRoom);
}

TEST_F(CombatSessionManagerTest, FleeingLastOpponentEndsSession) {
    EventRecorder<CombatEnded> ended(*bus_);
    auto id = start(*hero_, *wolf_);

    EXPECT_TRUE(manager_->Flee(wolf_->Id()));
    EXPECT_FALSE(manager_->IsInCombat(hero_->Id()));
    EXPECT_FALSE(manager_->IsInCombat(wolf_->Id()));

    ASSERT_EQ(ended.Count(), 1u);
    EXPECT_EQ(ended.Events()[0].reason, "One participant fled");
    EXPECT_FALSE(ended.Events()[0].winnerId.has_value());

    auto session = manager_->Session(id);
    ASSERT_TRUE(session.has_value());
    EXPECT_FALSE(session->active);
    EXPECT_EQ(session->FindParticipant(wolf_->Id())->leaveReason, "Fled");
}

TEST_F(CombatSessionManagerTest, FleeWithoutCombatReturnsFalse) {
    EXPECT_FALSE(manager_->Flee(hero_->Id()));
}

TEST_F(CombatSessionManagerTest, FleeingFromCrowdKeepsSessionOpen) {
    auto id = start(*hero_, *wolf_);
    auto ally = MakePlayer(3, "Brenna");
    start(*ally, *wolf_);

    EXPECT_TRUE(manager_->Flee(hero_->Id()));
    EXPECT_TRUE(manager_->IsInCombat(wolf_->Id()));
    EXPECT_EQ(manager_->ActiveParticipants(id).size(), 2u);
}

TEST_F(CombatSessionManagerTest, RejoinReusesParticipantRecord) {
    auto id = start(*hero_, *wolf_);
    auto ally = MakePlayer(3, "Brenna");
    start(*ally, *wolf_);
    manager_->Flee(hero_->Id());

    EXPECT_EQ(start(*hero_, *wolf_), id);
    auto session = manager_->Session(id);
    ASSERT_TRUE(session.has_value());
    EXPECT_EQ(session->participants.size(), 3u);
    EXPECT_TRUE(session->FindParticipant(hero_->Id())->active);
    EXPECT_TRUE(session->FindParticipant(hero_->Id())->leaveReason.empty());
}

TEST_F(CombatSessionManagerTest, EndCombatNamesWinner) {
    EventRecorder<CombatEnded> ended(*bus_);
    auto id = start(*hero_, *wolf_);

    ASSERT_TRUE(manager_->EndCombat(id, "Nightwolf was slain", hero_->Id()).hasValue());
    ASSERT_EQ(ended.Count(), 1u);
    EXPECT_EQ(ended.Events()[0].winnerName, "Aldric");
    EXPECT_TRUE(manager_->ActiveSessionIds().empty());

    // Ending twice is a no-op.
    ASSERT_TRUE(manager_->EndCombat(id, "again").hasValue());
    EXPECT_EQ(ended.Count(), 1u);
}

TEST_F(CombatSessionManagerTest, EndUnknownSessionFails) {
    auto result = manager_->EndCombat(CombatSessionId(99), "gone");
    ASSERT_TRUE(result.hasError());
    EXPECT_EQ(result.error().code(), ErrorCode::CombatSessionNotFound);
}

TEST_F(CombatSessionManagerTest, NewSessionAfterEnd) {
    auto first = start(*hero_, *wolf_);
    ASSERT_TRUE(manager_->EndCombat(first, "truce").hasValue());
    auto second = start(*hero_, *wolf_);
    EXPECT_NE(first, second);
}

// ═══════════════════════════════════════════════════════════════════════════
// Stance and state
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSessionManagerTest, ParryModeRequiresCombat) {
    auto outside = manager_->SetParryMode(hero_->Id(), true);
    ASSERT_TRUE(outside.hasError());
    EXPECT_EQ(outside.error().code(), ErrorCode::NotInCombat);

    start(*hero_, *wolf_);
    ASSERT_TRUE(manager_->SetParryMode(hero_->Id(), true).hasValue());
    EXPECT_TRUE(manager_->IsInParryMode(hero_->Id()));
    EXPECT_FALSE(manager_->IsInParryMode(wolf_->Id()));
}

TEST_F(CombatSessionManagerTest, StateReportsOpponent) {
    EXPECT_FALSE(manager_->StateOf(hero_->Id()).inCombat);

    auto id = start(*hero_, *wolf_);
    ASSERT_TRUE(manager_->SetParryMode(hero_->Id(), true).hasValue());
    auto state = manager_->StateOf(hero_->Id());
    EXPECT_TRUE(state.inCombat);
    EXPECT_EQ(state.sessionId, id);
    EXPECT_TRUE(state.parrying);
    EXPECT_EQ(state.opponentName, "Nightwolf");
}

// ═══════════════════════════════════════════════════════════════════════════
// Timed penalties
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSessionManagerTest, PenaltiesAccumulateAndExpire) {
    start(*hero_, *wolf_);

    EXPECT_FALSE(manager_->ApplyTimedPenalty(hero_->Id(), -2).has_value());
    auto light = manager_->ApplyTimedPenalty(hero_->Id(), -4);
    ASSERT_TRUE(light.has_value());
    EXPECT_EQ(light->amount, -1);
    auto heavy = manager_->ApplyTimedPenalty(hero_->Id(), -10);
    ASSERT_TRUE(heavy.has_value());
    EXPECT_EQ(heavy->amount, -3);

    EXPECT_EQ(manager_->TotalTimedPenalty(hero_->Id()), -4);

    clock_->advance(kRoundDuration);
    EXPECT_EQ(manager_->TotalTimedPenalty(hero_->Id()), -3);

    clock_->advance(kRoundDuration * 2);
    EXPECT_EQ(manager_->TotalTimedPenalty(hero_->Id()), 0);
}

TEST_F(CombatSessionManagerTest, PenaltiesNeedCombat) {
    EXPECT_FALSE(manager_->ApplyTimedPenalty(hero_->Id(), -9).has_value());
    EXPECT_EQ(manager_->TotalTimedPenalty(hero_->Id()), 0);
}

TEST_F(CombatSessionManagerTest, PruneCountsExpiredPenalties) {
    start(*hero_, *wolf_);
    manager_->ApplyTimedPenalty(hero_->Id(), -3);
    manager_->ApplyTimedPenalty(wolf_->Id(), -5);
    manager_->ApplyTimedPenalty(wolf_->Id(), -9);

    clock_->advance(4s);
    EXPECT_EQ(manager_->PruneExpiredPenalties(), 2u);
    EXPECT_EQ(manager_->TotalTimedPenalty(wolf_->Id()), -3);
}

// ═══════════════════════════════════════════════════════════════════════════
// Action log and retention
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(CombatSessionManagerTest, AppendActionToSession) {
    auto id = start(*hero_, *wolf_);
    CombatActionLog action;
    action.actorId = hero_->Id();
    action.targetId = wolf_->Id();
    action.description = "Aldric misses Nightwolf";
    ASSERT_TRUE(manager_->AppendAction(id, action).hasValue());
    EXPECT_EQ(manager_->Session(id)->actions.size(), 1u);

    auto missing = manager_->AppendAction(CombatSessionId(99), action);
    ASSERT_TRUE(missing.hasError());
    EXPECT_EQ(missing.error().code(), ErrorCode::CombatSessionNotFound);
}

TEST_F(CombatSessionManagerTest, DiscardEndedSessionsAfterRetention) {
    auto active = start(*hero_, *wolf_);
    auto rat = MakeNpc(3, "Rat");
    auto ally = MakePlayer(4, "Brenna");
    auto ended = start(*ally, *rat);
    ASSERT_TRUE(manager_->EndCombat(ended, "truce").hasValue());

    clock_->advance(60s);
    EXPECT_EQ(manager_->DiscardEndedSessions(300s), 0u);

    clock_->advance(300s);
    EXPECT_EQ(manager_->DiscardEndedSessions(300s), 1u);
    EXPECT_FALSE(manager_->Session(ended).has_value());
    EXPECT_TRUE(manager_->Session(active).has_value());
}
