/// @file combat_tables.cpp
/// @brief CombatTables implementation.

#include "vigor/game/combat_tables.hpp"

#include <algorithm>

namespace vigor::game {

// ── Penalties ───────────────────────────────────────────────────────────

std::optional<PenaltySpec> CombatTables::PenaltyForMargin(int margin) noexcept {
    if (margin <= -9) return PenaltySpec{-3, 3};
    if (margin <= -7) return PenaltySpec{-2, 2};
    if (margin <= -5) return PenaltySpec{-2, 1};
    if (margin <= -3) return PenaltySpec{-1, 1};
    return std::nullopt;
}

int CombatTables::PhysicalityBonus(int resultValue) noexcept {
    if (resultValue >= 12) return 4;
    if (resultValue >= 8) return 3;
    if (resultValue >= 4) return 2;
    if (resultValue >= 2) return 1;
    return 0;
}

// ── Hit location ────────────────────────────────────────────────────────

BodyLocation CombatTables::HitLocationFor(int locationRoll, int headOrTorsoRoll) noexcept {
    switch (locationRoll) {
        case 1:
            return headOrTorsoRoll <= 6 ? BodyLocation::Head : BodyLocation::Torso;
        case 2: case 3: case 4: case 5: case 6:
            return BodyLocation::Torso;
        case 7:
            return BodyLocation::LeftArm;
        case 8:
            return BodyLocation::RightArm;
        case 9: case 10:
            return BodyLocation::LeftLeg;
        default:
            return BodyLocation::RightLeg;
    }
}

BodyLocation CombatTables::RollHitLocation(DiceRoller& dice) {
    int primary = dice.RollDie(12);
    int secondary = primary == 1 ? dice.RollDie(12) : 0;
    return HitLocationFor(primary, secondary);
}

// ── Damage ──────────────────────────────────────────────────────────────

int CombatTables::RollRawDamage(int successValue, DiceRoller& dice) {
    if (successValue < 0) {
        return 0;
    }
    switch (successValue) {
        case 0:  return dice.RollDie(6) / 3;
        case 1:  return dice.RollDie(6) / 2;
        case 2:  return dice.RollDie(6);
        case 3:  return dice.RollDie(8);
        case 4:  return dice.RollDie(10);
        case 5:  return dice.RollDie(12);
        case 6:  return dice.RollDie(6) + dice.RollDie(8);
        case 7:  return dice.RollDice(2, 8);
        case 8:  return dice.RollDice(2, 10);
        case 9:  return dice.RollDice(2, 12);
        case 10: return dice.RollDice(3, 10);
        case 11: return dice.RollDice(3, 12);
        case 12: case 13: case 14:
            return dice.RollDice(4, 10);
        default:
            return dice.RollDie(6) * 10;
    }
}

DamageSplit CombatTables::SplitDamage(int damage) noexcept {
    damage = std::max(0, damage);
    if (damage <= 4) {
        return {damage, 0, 0};
    }
    switch (damage) {
        case 5:  return {5, 1, 0};
        case 6:  return {6, 2, 0};
        case 7:  return {7, 4, 1};
        case 8:  return {8, 6, 1};
        case 9:  return {9, 8, 1};
        case 10: return {10, 10, 2};
        case 11: case 12: case 13: case 14:
            return {damage, damage, 2};
        case 15: return {15, 15, 3};
        default:
            return {damage, damage, 3 + (damage - 16) / 5};
    }
}

}  // namespace vigor::game
