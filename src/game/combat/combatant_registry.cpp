/// @file combatant_registry.cpp
/// @brief CombatantRegistry implementation.

#include "vigor/game/combatant_registry.hpp"

#include <mutex>

namespace vigor::game {

bool CombatantRegistry::Add(std::shared_ptr<Combatant> combatant) {
    if (!combatant || !combatant->Id().isValid()) {
        return false;
    }
    std::unique_lock lock(mutex_);
    auto id = combatant->Id();
    return combatants_.emplace(id, std::move(combatant)).second;
}

bool CombatantRegistry::Remove(CombatantId id) {
    std::unique_lock lock(mutex_);
    return combatants_.erase(id) > 0;
}

std::shared_ptr<Combatant> CombatantRegistry::Find(CombatantId id) const {
    std::shared_lock lock(mutex_);
    auto it = combatants_.find(id);
    return it == combatants_.end() ? nullptr : it->second;
}

std::vector<std::shared_ptr<Combatant>> CombatantRegistry::All() const {
    std::shared_lock lock(mutex_);
    std::vector<std::shared_ptr<Combatant>> out;
    out.reserve(combatants_.size());
    for (const auto& [_, combatant] : combatants_) {
        out.push_back(combatant);
    }
    return out;
}

std::size_t CombatantRegistry::Size() const {
    std::shared_lock lock(mutex_);
    return combatants_.size();
}

}  // namespace vigor::game
