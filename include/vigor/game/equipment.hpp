#pragma once

/// @file equipment.hpp
/// @brief Equipped weapons and armor as seen by melee resolution.
///
/// Inventory management lives outside the combat core; resolution only
/// reads what a combatant has equipped through IEquipmentProvider.

#include <array>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vigor/foundation/game_result.hpp"
#include "vigor/foundation/types.hpp"
#include "vigor/game/combat_types.hpp"

namespace vigor::game {

using vigor::foundation::CombatantId;
using vigor::foundation::GameResult;

/// Combat properties of a weapon.
struct WeaponProperties {
    /// Flat bonus added to Physicality for the attack skill.
    int skillBonus = 0;
    int attackValueModifier = 0;
    /// Added to the success value once a hit is confirmed.
    int baseSuccessValueModifier = 0;
    int dodgeModifier = 0;
    DamageType damageType = DamageType::Cutting;
    DamageClass damageClass = DamageClass::Class1;
};

/// Combat properties of an armor piece.
struct ArmorProperties {
    DamageClass damageClass = DamageClass::Class1;
    /// Absorption per damage type, indexed by DamageType.
    std::array<int, kDamageTypeCount> absorption{};
    int dodgeModifier = 0;
    /// Explicit coverage ("Head,Torso|arms"); empty means "infer from slot".
    std::string hitLocationCoverage;
    /// Lower priorities are evaluated first.
    int layerPriority = 0;

    [[nodiscard]] int AbsorptionFor(DamageType type) const noexcept {
        auto idx = static_cast<std::size_t>(type);
        return idx < absorption.size() ? absorption[idx] : 0;
    }

    void SetAbsorption(DamageType type, int value) noexcept {
        auto idx = static_cast<std::size_t>(type);
        if (idx < absorption.size()) {
            absorption[idx] = value;
        }
    }
};

/// An item in one of a combatant's equipment slots.
struct EquippedItem {
    std::string name;
    EquipSlot slot = EquipSlot::MainHand;
    bool broken = false;
    std::optional<WeaponProperties> weapon;
    std::optional<ArmorProperties> armor;
};

/// Read access to equipped items.
///
/// Implementations must be thread-safe. Failures (e.g. an unreachable
/// backing store) are reported as StorageUnavailable.
class IEquipmentProvider {
public:
    virtual ~IEquipmentProvider() = default;

    [[nodiscard]] virtual GameResult<std::vector<EquippedItem>> EquippedItems(
        CombatantId combatant) const = 0;
};

/// Thread-safe in-memory provider, used by the standalone service and tests.
class InMemoryEquipmentProvider : public IEquipmentProvider {
public:
    [[nodiscard]] GameResult<std::vector<EquippedItem>> EquippedItems(
        CombatantId combatant) const override;

    /// Equip @p item, replacing whatever occupied its slot.
    void Equip(CombatantId combatant, EquippedItem item);

    /// Empty a slot. Returns false if it was already empty.
    bool Unequip(CombatantId combatant, EquipSlot slot);

    /// Mark the item in @p slot broken or repaired.
    bool SetBroken(CombatantId combatant, EquipSlot slot, bool broken);

private:
    mutable std::mutex mutex_;
    std::unordered_map<CombatantId, std::vector<EquippedItem>> items_;
};

// ── Pure equipment rules ────────────────────────────────────────────────

/// Weapon used for an attack with @p hand: the item in that hand's slot,
/// otherwise a two-handed weapon. Null when unarmed.
[[nodiscard]] const EquippedItem* FindAttackWeapon(const std::vector<EquippedItem>& items,
                                                   AttackHand hand);

/// True when weapons occupy both the main-hand and off-hand slots.
[[nodiscard]] bool IsDualWielding(const std::vector<EquippedItem>& items);

/// Sum of dodge modifiers from every non-broken weapon and armor piece.
[[nodiscard]] int EquipmentDodgeModifier(const std::vector<EquippedItem>& items);

/// Whether an armor piece protects @p location.
///
/// The coverage list is split on ',', ';' and '|', compared
/// case-insensitively against location names, and accepts the aliases
/// torso/chest/body, arm/arms and leg/legs. Without a coverage list the
/// slot decides (Head, Chest, ArmLeft, ArmRight, Legs).
[[nodiscard]] bool ArmorCoversLocation(const EquippedItem& item, BodyLocation location);

/// Armor pieces covering @p location, ordered by layer priority.
[[nodiscard]] std::vector<const EquippedItem*> CoveringArmor(
    const std::vector<EquippedItem>& items, BodyLocation location);

/// Result of running a blow through the armor layers.
struct AbsorptionResult {
    int totalAbsorption = 0;
    int successValue = 0;  ///< max(0, incoming SV - total absorption)
};

/// Reduce @p successValue by the absorption of every non-broken covering
/// piece. Each piece loses max(0, weaponClass - armorClass) absorption,
/// floored at 0.
[[nodiscard]] AbsorptionResult ApplyArmorAbsorption(
    const std::vector<EquippedItem>& items, BodyLocation location,
    DamageType damageType, DamageClass weaponClass, int successValue);

}  // namespace vigor::game
