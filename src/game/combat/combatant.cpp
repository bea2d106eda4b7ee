/// @file combatant.cpp
/// @brief Combatant, PlayerCombatant and NpcCombatant implementation.

#include "vigor/game/combatant.hpp"

#include <algorithm>
#include <utility>

#include "vigor/foundation/game_logger.hpp"
#include "vigor/game/combat_types.hpp"

namespace vigor::game {

using vigor::foundation::LogCategory;
using vigor::foundation::saturatingAdd;

// ── Combatant ───────────────────────────────────────────────────────────

Combatant::Combatant(CombatantId id, std::string name, RoomId room)
    : id_(id), name_(std::move(name)), room_(room.value()) {}

void Combatant::SetMaxima(int maxFatigue, int maxVitality) noexcept {
    pools_.maxFatigue = std::max(1, maxFatigue);
    pools_.maxVitality = std::max(1, maxVitality);
    pools_.currentFatigue = std::clamp(pools_.currentFatigue, 0, pools_.maxFatigue);
    pools_.currentVitality = std::clamp(pools_.currentVitality, 0, pools_.maxVitality);
}

VitalPools Combatant::SnapshotPools() const {
    std::lock_guard lock(mutex_);
    return pools_;
}

void Combatant::AddPending(int fatigue, int vitality, int wounds) {
    std::lock_guard lock(mutex_);
    pools_.pendingFatigue = saturatingAdd(pools_.pendingFatigue, fatigue);
    pools_.pendingVitality = saturatingAdd(pools_.pendingVitality, vitality);
    pools_.wounds = std::max(0, saturatingAdd(pools_.wounds, wounds));
}

void Combatant::InitializePools() {
    pools_.maxFatigue = std::max(1, BaseMaxFatigue());
    pools_.maxVitality = std::max(1, BaseMaxVitality());
    pools_.currentFatigue = pools_.maxFatigue;
    pools_.currentVitality = pools_.maxVitality;
}

// ── PlayerCombatant ─────────────────────────────────────────────────────

PlayerCombatant::PlayerCombatant(CombatantId id, std::string name, RoomId room,
                                 PlayerAttributes attributes)
    : Combatant(id, std::move(name), room), attributes_(attributes) {
    skills_[asciiLower(skills::kPhysicality)] = attributes_.physicality;
    skills_[asciiLower(skills::kDodge)] = attributes_.dodge;
    skills_[asciiLower(skills::kDrive)] = attributes_.drive;
    skills_[asciiLower(skills::kReasoning)] = attributes_.reasoning;
    skills_[asciiLower(skills::kAwareness)] = attributes_.awareness;
    skills_[asciiLower(skills::kFocus)] = attributes_.focus;
    skills_[asciiLower(skills::kBearing)] = attributes_.bearing;
    InitializePools();
}

std::optional<int> PlayerCombatant::SkillLevel(std::string_view skill) const {
    auto it = skills_.find(asciiLower(skill));
    if (it == skills_.end()) {
        return std::nullopt;
    }
    return it->second;
}

int PlayerCombatant::BaseMaxFatigue() const {
    return storedMaxFatigue_ ? std::max(1, *storedMaxFatigue_)
                             : DerivedMaxFatigue(attributes_);
}

int PlayerCombatant::BaseMaxVitality() const {
    return storedMaxVitality_ ? std::max(1, *storedMaxVitality_)
                              : DerivedMaxVitality(attributes_);
}

void PlayerCombatant::SetSkill(std::string_view skill, int level) {
    skills_[asciiLower(skill)] = level;
}

void PlayerCombatant::SetStoredMaxima(std::optional<int> maxFatigue,
                                      std::optional<int> maxVitality) {
    storedMaxFatigue_ = maxFatigue;
    storedMaxVitality_ = maxVitality;
    SetMaxima(BaseMaxFatigue(), BaseMaxVitality());
}

int PlayerCombatant::DerivedMaxFatigue(const PlayerAttributes& attributes) noexcept {
    return std::max(1, attributes.drive + attributes.focus - 5);
}

int PlayerCombatant::DerivedMaxVitality(const PlayerAttributes& attributes) noexcept {
    return std::max(1, attributes.physicality * 2 - 5);
}

// ── NpcCombatant ────────────────────────────────────────────────────────

NpcCombatant::NpcCombatant(CombatantId id, std::string name, RoomId room, NpcTemplate stats)
    : Combatant(id, std::move(name), room), template_(std::move(stats)) {
    InitializePools();
}

std::optional<int> NpcCombatant::SkillLevel(std::string_view skill) const {
    auto lower = asciiLower(skill);
    if (lower == "physicality" || lower == "strength") return template_.strength;
    if (lower == "dodge" || lower == "quickness") return template_.quickness;
    if (lower == "drive" || lower == "endurance") return template_.endurance;
    if (lower == "reasoning" || lower == "intelligence") return template_.intelligence;
    if (lower == "awareness" || lower == "coordination") return template_.coordination;
    if (lower == "focus" || lower == "willpower") return template_.willpower;
    if (lower == "bearing" || lower == "charisma") return template_.charisma;
    return std::nullopt;
}

int NpcCombatant::BaseMaxFatigue() const {
    return std::max(1, template_.endurance + template_.willpower - 5);
}

int NpcCombatant::BaseMaxVitality() const {
    return std::max(1, template_.strength * 2 - 5);
}

void NpcCombatant::Despawn(std::string reason) {
    if (despawned_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    despawnReason_ = std::move(reason);
    VIGOR_LOG_INFO(LogCategory::Combat,
                   "NPC " + Name() + " despawned (" + despawnReason_ + ")");
}

std::optional<double> NpcCombatant::FleeThreshold() const noexcept {
    if (template_.neverFlee) {
        return std::nullopt;
    }
    return template_.fleeThreshold.value_or(kDefaultFleeThreshold);
}

}  // namespace vigor::game
