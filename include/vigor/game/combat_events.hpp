#pragma once

/// @file combat_events.hpp
/// @brief Events published on the EventBus by the combat core.
///
/// Delivery to players (room broadcast, sound propagation) is handled by
/// subscribers outside this library.

#include <optional>
#include <string>

#include "vigor/foundation/types.hpp"
#include "vigor/game/combat_types.hpp"

namespace vigor::game {

using vigor::foundation::CombatantId;
using vigor::foundation::CombatSessionId;
using vigor::foundation::RoomId;

/// A new combat session was created.
struct CombatStarted {
    CombatSessionId sessionId;
    CombatantId attackerId;
    std::string attackerName;
    CombatantId defenderId;
    std::string defenderName;
    RoomId room;
};

/// An attack (or attempt) happened.
struct CombatActionEvent {
    CombatantId attackerId;
    std::string attackerName;
    std::optional<CombatantId> defenderId;
    std::string defenderName;
    RoomId room;
    std::string description;
    int damage = 0;
    bool isHit = false;
    std::string skillUsed;
    SoundLevel soundLevel = SoundLevel::Normal;
};

/// A session ended.
struct CombatEnded {
    CombatSessionId sessionId;
    RoomId room;
    std::string reason;
    std::optional<CombatantId> winnerId;
    std::string winnerName;
};

/// Skill exercise reported to the progression subsystem.
struct SkillUsageEvent {
    CombatantId combatantId;
    std::string skillName;
    SkillUsageType usageType = SkillUsageType::RoutineUse;
    int baseUsagePoints = 1;
    std::string context;
};

/// Free-form narration for a single combatant (e.g. "Poison deals 2
/// vitality damage", "Nightwolf flees from combat!").
struct CombatNarration {
    std::optional<CombatantId> combatantId;
    RoomId room;
    std::string message;
};

}  // namespace vigor::game
