/// @file equipment.cpp
/// @brief In-memory equipment provider and armor coverage rules.

#include "vigor/game/equipment.hpp"

#include <algorithm>
#include <unordered_set>

namespace vigor::game {

// ── InMemoryEquipmentProvider ───────────────────────────────────────────

GameResult<std::vector<EquippedItem>> InMemoryEquipmentProvider::EquippedItems(
    CombatantId combatant) const {
    std::lock_guard lock(mutex_);
    auto it = items_.find(combatant);
    if (it == items_.end()) {
        return GameResult<std::vector<EquippedItem>>::ok({});
    }
    return GameResult<std::vector<EquippedItem>>::ok(it->second);
}

void InMemoryEquipmentProvider::Equip(CombatantId combatant, EquippedItem item) {
    std::lock_guard lock(mutex_);
    auto& slots = items_[combatant];
    std::erase_if(slots, [&](const EquippedItem& e) { return e.slot == item.slot; });
    slots.push_back(std::move(item));
}

bool InMemoryEquipmentProvider::Unequip(CombatantId combatant, EquipSlot slot) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(combatant);
    if (it == items_.end()) {
        return false;
    }
    return std::erase_if(it->second, [slot](const EquippedItem& e) { return e.slot == slot; }) > 0;
}

bool InMemoryEquipmentProvider::SetBroken(CombatantId combatant, EquipSlot slot, bool broken) {
    std::lock_guard lock(mutex_);
    auto it = items_.find(combatant);
    if (it == items_.end()) {
        return false;
    }
    for (auto& item : it->second) {
        if (item.slot == slot) {
            item.broken = broken;
            return true;
        }
    }
    return false;
}

// ── Weapon selection ────────────────────────────────────────────────────

namespace {

const EquippedItem* findWeaponIn(const std::vector<EquippedItem>& items, EquipSlot slot) {
    for (const auto& item : items) {
        if (item.slot == slot && item.weapon) {
            return &item;
        }
    }
    return nullptr;
}

std::unordered_set<std::string> splitCoverage(std::string_view coverage) {
    std::unordered_set<std::string> tokens;
    std::string current;
    auto flush = [&]() {
        auto first = current.find_first_not_of(" \t");
        auto last = current.find_last_not_of(" \t");
        if (first != std::string::npos) {
            tokens.insert(asciiLower(current.substr(first, last - first + 1)));
        }
        current.clear();
    };
    for (char c : coverage) {
        if (c == ',' || c == ';' || c == '|') {
            flush();
        } else {
            current += c;
        }
    }
    flush();
    return tokens;
}

} // namespace

const EquippedItem* FindAttackWeapon(const std::vector<EquippedItem>& items, AttackHand hand) {
    auto slot = hand == AttackHand::OffHand ? EquipSlot::OffHand : EquipSlot::MainHand;
    if (const auto* weapon = findWeaponIn(items, slot)) {
        return weapon;
    }
    return findWeaponIn(items, EquipSlot::TwoHand);
}

bool IsDualWielding(const std::vector<EquippedItem>& items) {
    return findWeaponIn(items, EquipSlot::MainHand) != nullptr &&
           findWeaponIn(items, EquipSlot::OffHand) != nullptr;
}

int EquipmentDodgeModifier(const std::vector<EquippedItem>& items) {
    int total = 0;
    for (const auto& item : items) {
        if (item.broken) {
            continue;
        }
        if (item.weapon) {
            total += item.weapon->dodgeModifier;
        }
        if (item.armor) {
            total += item.armor->dodgeModifier;
        }
    }
    return total;
}

// ── Armor coverage ──────────────────────────────────────────────────────

bool ArmorCoversLocation(const EquippedItem& item, BodyLocation location) {
    if (!item.armor) {
        return false;
    }

    const auto& coverage = item.armor->hitLocationCoverage;
    if (coverage.find_first_not_of(" \t") == std::string::npos) {
        switch (item.slot) {
            case EquipSlot::Head:     return location == BodyLocation::Head;
            case EquipSlot::Chest:    return location == BodyLocation::Torso;
            case EquipSlot::ArmLeft:  return location == BodyLocation::LeftArm;
            case EquipSlot::ArmRight: return location == BodyLocation::RightArm;
            case EquipSlot::Legs:
                return location == BodyLocation::LeftLeg || location == BodyLocation::RightLeg;
            default: return false;
        }
    }

    auto tokens = splitCoverage(coverage);
    if (tokens.count(asciiLower(bodyLocationName(location))) > 0) {
        return true;
    }

    switch (location) {
        case BodyLocation::Torso:
            return tokens.count("torso") || tokens.count("chest") || tokens.count("body");
        case BodyLocation::LeftArm:
        case BodyLocation::RightArm:
            return tokens.count("arms") || tokens.count("arm");
        case BodyLocation::LeftLeg:
        case BodyLocation::RightLeg:
            return tokens.count("legs") || tokens.count("leg");
        default:
            return false;
    }
}

std::vector<const EquippedItem*> CoveringArmor(const std::vector<EquippedItem>& items,
                                               BodyLocation location) {
    std::vector<const EquippedItem*> covering;
    for (const auto& item : items) {
        if (ArmorCoversLocation(item, location)) {
            covering.push_back(&item);
        }
    }
    std::stable_sort(covering.begin(), covering.end(),
                     [](const EquippedItem* a, const EquippedItem* b) {
                         return a->armor->layerPriority < b->armor->layerPriority;
                     });
    return covering;
}

AbsorptionResult ApplyArmorAbsorption(const std::vector<EquippedItem>& items,
                                      BodyLocation location, DamageType damageType,
                                      DamageClass weaponClass, int successValue) {
    AbsorptionResult result;
    for (const auto* piece : CoveringArmor(items, location)) {
        if (piece->broken) {
            continue;
        }
        int absorption = piece->armor->AbsorptionFor(damageType);
        int classGap = static_cast<int>(weaponClass) - static_cast<int>(piece->armor->damageClass);
        if (classGap > 0) {
            absorption = std::max(0, absorption - classGap);
        }
        result.totalAbsorption += absorption;
    }
    result.successValue = std::max(0, successValue - result.totalAbsorption);
    return result;
}

}  // namespace vigor::game
