#pragma once

/// @file combatant.hpp
/// @brief Combatant abstraction shared by player characters and NPCs.
///
/// Every combat subsystem (attack resolution, pool reconciliation, effect
/// ticks, NPC decisions) works through Combatant, so players and NPCs run
/// the same code paths and differ only in where their skills and pool
/// maxima come from.

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "vigor/foundation/clock.hpp"
#include "vigor/foundation/types.hpp"

namespace vigor::game {

using vigor::foundation::CombatantId;
using vigor::foundation::GameTime;
using vigor::foundation::RoomId;

/// Stamina (fatigue) and health (vitality) pools plus queued changes.
///
/// Current values stay within [0, max]. Pending values are signed:
/// positive is queued damage, negative is queued healing.
struct VitalPools {
    int currentFatigue = 1;
    int maxFatigue = 1;
    int currentVitality = 1;
    int maxVitality = 1;
    int pendingFatigue = 0;
    int pendingVitality = 0;
    int wounds = 0;

    [[nodiscard]] bool HasPending() const noexcept {
        return pendingFatigue != 0 || pendingVitality != 0;
    }

    [[nodiscard]] bool BelowMax() const noexcept {
        return currentFatigue < maxFatigue || currentVitality < maxVitality;
    }

    /// Fraction of vitality remaining, 0 when the maximum is not positive.
    [[nodiscard]] double VitalityFraction() const noexcept {
        return maxVitality > 0
            ? static_cast<double>(currentVitality) / static_cast<double>(maxVitality)
            : 0.0;
    }
};

/// Passive regeneration timestamps. Empty means "not started".
struct RegenTimers {
    std::optional<GameTime> lastFatigueRegen;
    std::optional<GameTime> lastVitalityRegen;
};

enum class CombatantKind : uint8_t { Player, Npc };

/// A participant in combat.
///
/// Pools(), Regen() and the other mutable accessors require the caller to
/// hold Mutex(). Identity and room are safe to read without it.
class Combatant {
public:
    Combatant(CombatantId id, std::string name, RoomId room);
    virtual ~Combatant() = default;

    Combatant(const Combatant&) = delete;
    Combatant& operator=(const Combatant&) = delete;

    [[nodiscard]] CombatantId Id() const noexcept { return id_; }
    [[nodiscard]] const std::string& Name() const noexcept { return name_; }
    [[nodiscard]] virtual CombatantKind Kind() const noexcept = 0;
    [[nodiscard]] bool IsPlayer() const noexcept { return Kind() == CombatantKind::Player; }

    [[nodiscard]] RoomId Room() const noexcept {
        return RoomId(room_.load(std::memory_order_acquire));
    }
    void SetRoom(RoomId room) noexcept {
        room_.store(room.value(), std::memory_order_release);
    }

    /// Skill or attribute level by name (case-insensitive).
    [[nodiscard]] virtual std::optional<int> SkillLevel(std::string_view skill) const = 0;

    /// Base pool maxima before effect modifiers.
    [[nodiscard]] virtual int BaseMaxFatigue() const = 0;
    [[nodiscard]] virtual int BaseMaxVitality() const = 0;

    /// False once the combatant has left the world (e.g. a despawned NPC).
    [[nodiscard]] virtual bool IsActive() const { return true; }

    [[nodiscard]] std::mutex& Mutex() const noexcept { return mutex_; }

    [[nodiscard]] VitalPools& Pools() noexcept { return pools_; }
    [[nodiscard]] const VitalPools& Pools() const noexcept { return pools_; }
    [[nodiscard]] RegenTimers& Regen() noexcept { return regen_; }

    /// Set the pool maxima and clamp current values into range.
    void SetMaxima(int maxFatigue, int maxVitality) noexcept;

    /// Copy of the pools, taken under the lock.
    [[nodiscard]] VitalPools SnapshotPools() const;

    /// Queue damage (positive) or healing (negative), taking the lock.
    void AddPending(int fatigue, int vitality, int wounds = 0);

protected:
    /// Fill pools to the base maxima. Called by subclasses once their
    /// attributes are in place.
    void InitializePools();

private:
    CombatantId id_;
    std::string name_;
    std::atomic<uint64_t> room_;
    mutable std::mutex mutex_;
    VitalPools pools_;
    RegenTimers regen_;
};

// ── Player ──────────────────────────────────────────────────────────────

/// The seven core attributes of a player character.
struct PlayerAttributes {
    int physicality = 10;
    int dodge = 10;
    int drive = 10;
    int reasoning = 10;
    int awareness = 10;
    int focus = 10;
    int bearing = 10;
};

class PlayerCombatant final : public Combatant {
public:
    PlayerCombatant(CombatantId id, std::string name, RoomId room,
                    PlayerAttributes attributes);

    [[nodiscard]] CombatantKind Kind() const noexcept override { return CombatantKind::Player; }

    [[nodiscard]] std::optional<int> SkillLevel(std::string_view skill) const override;

    [[nodiscard]] int BaseMaxFatigue() const override;
    [[nodiscard]] int BaseMaxVitality() const override;

    /// Learn or change a skill. Requires Mutex().
    void SetSkill(std::string_view skill, int level);

    /// Override the derived maxima with stored values. Requires Mutex().
    void SetStoredMaxima(std::optional<int> maxFatigue, std::optional<int> maxVitality);

    [[nodiscard]] const PlayerAttributes& Attributes() const noexcept { return attributes_; }

    /// max(1, Drive + Focus - 5).
    [[nodiscard]] static int DerivedMaxFatigue(const PlayerAttributes& attributes) noexcept;

    /// max(1, Physicality * 2 - 5).
    [[nodiscard]] static int DerivedMaxVitality(const PlayerAttributes& attributes) noexcept;

private:
    PlayerAttributes attributes_;
    std::unordered_map<std::string, int> skills_;
    std::optional<int> storedMaxFatigue_;
    std::optional<int> storedMaxVitality_;
};

// ── NPC ─────────────────────────────────────────────────────────────────

/// Stat block shared by every NPC spawned from a template.
struct NpcTemplate {
    std::string name;
    int strength = 10;
    int quickness = 10;
    int endurance = 10;
    int intelligence = 10;
    int coordination = 10;
    int willpower = 10;
    int charisma = 10;
    std::optional<double> fleeThreshold;
    bool neverFlee = false;
};

class NpcCombatant final : public Combatant {
public:
    NpcCombatant(CombatantId id, std::string name, RoomId room, NpcTemplate stats);

    [[nodiscard]] CombatantKind Kind() const noexcept override { return CombatantKind::Npc; }

    /// Core skills map onto template stats: Physicality=Strength,
    /// Dodge=Quickness, Drive=Endurance, Reasoning=Intelligence,
    /// Awareness=Coordination, Focus=Willpower, Bearing=Charisma.
    [[nodiscard]] std::optional<int> SkillLevel(std::string_view skill) const override;

    /// max(1, Endurance + Willpower - 5).
    [[nodiscard]] int BaseMaxFatigue() const override;

    /// max(1, Strength * 2 - 5).
    [[nodiscard]] int BaseMaxVitality() const override;

    [[nodiscard]] bool IsActive() const override {
        return !despawned_.load(std::memory_order_acquire);
    }

    /// Remove the NPC from the world. Idempotent. Requires Mutex().
    void Despawn(std::string reason);

    /// Reason given at despawn; empty while active. Requires Mutex().
    [[nodiscard]] const std::string& DespawnReason() const noexcept { return despawnReason_; }

    [[nodiscard]] const NpcTemplate& Template() const noexcept { return template_; }

    /// Health fraction at or below which this NPC flees, or std::nullopt
    /// when it never flees.
    [[nodiscard]] std::optional<double> FleeThreshold() const noexcept;

private:
    NpcTemplate template_;
    std::atomic<bool> despawned_{false};
    std::string despawnReason_;
};

}  // namespace vigor::game
