#pragma once

/// @file combat_tables.hpp
/// @brief Lookup tables of the melee system: penalties, hit location, damage.
///
/// All functions are pure apart from the dice they are handed, and are
/// exposed individually for testability.

#include <optional>

#include "vigor/game/combat_types.hpp"
#include "vigor/game/dice.hpp"

namespace vigor::game {

/// A short-lived attack-value penalty.
struct PenaltySpec {
    int amount = 0;  ///< Negative modifier to attack value.
    int rounds = 0;  ///< Duration in combat rounds.
};

/// Damage dealt to each pool by one hit.
struct DamageSplit {
    int fatigue = 0;
    int vitality = 0;
    int wounds = 0;

    friend bool operator==(const DamageSplit&, const DamageSplit&) = default;
};

class CombatTables {
public:
    /// Penalty for a bad margin (success value or physicality result).
    ///
    /// | Margin    | Penalty | Rounds |
    /// |-----------|---------|--------|
    /// | <= -9     | -3      | 3      |
    /// | -8 .. -7  | -2      | 2      |
    /// | -6 .. -5  | -2      | 1      |
    /// | -4 .. -3  | -1      | 1      |
    /// | > -3      | none    |        |
    [[nodiscard]] static std::optional<PenaltySpec> PenaltyForMargin(int margin) noexcept;

    /// Success-value bonus from the physicality check result.
    [[nodiscard]] static int PhysicalityBonus(int resultValue) noexcept;

    /// Fatigue spent by an attacker: 2 when dual wielding, else 1.
    [[nodiscard]] static int AttackFatigueCost(bool dualWielding) noexcept {
        return dualWielding ? 2 : 1;
    }

    /// Body location for a d12 roll; @p headOrTorsoRoll is the second d12
    /// consulted only when @p locationRoll is 1 (<= 6 head, else torso).
    [[nodiscard]] static BodyLocation HitLocationFor(int locationRoll, int headOrTorsoRoll) noexcept;

    /// Roll the hit location with real dice.
    [[nodiscard]] static BodyLocation RollHitLocation(DiceRoller& dice);

    /// Raw damage for a non-negative success value.
    ///
    /// 0: d6/3, 1: d6/2, 2: d6, 3: d8, 4: d10, 5: d12, 6: d6+d8, 7: 2d8,
    /// 8: 2d10, 9: 2d12, 10: 3d10, 11: 3d12, 12-14: 4d10, 15+: d6x10.
    /// Negative values deal nothing.
    [[nodiscard]] static int RollRawDamage(int successValue, DiceRoller& dice);

    /// Split raw damage over the pools.
    ///
    /// <=4 all fatigue; 5..10 and 15 fixed rows; 11..14 full damage to both
    /// with 2 wounds; 16+ full damage to both with 3 + (d-16)/5 wounds.
    [[nodiscard]] static DamageSplit SplitDamage(int damage) noexcept;
};

}  // namespace vigor::game
