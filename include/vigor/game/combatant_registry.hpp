#pragma once

/// @file combatant_registry.hpp
/// @brief Thread-safe lookup of live combatants by id.

#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "vigor/game/combatant.hpp"

namespace vigor::game {

/// Owns the combatants currently loaded into the simulation.
///
/// The registry hands out shared_ptr so a combatant stays valid for the
/// duration of an attack or tick even if it is removed concurrently.
class CombatantRegistry {
public:
    /// Register a combatant. Returns false if the id is already taken.
    bool Add(std::shared_ptr<Combatant> combatant);

    /// Remove a combatant. Returns false if it was not registered.
    bool Remove(CombatantId id);

    [[nodiscard]] std::shared_ptr<Combatant> Find(CombatantId id) const;

    /// Typed lookup; null if missing or of another kind.
    template <typename T>
    [[nodiscard]] std::shared_ptr<T> FindAs(CombatantId id) const {
        return std::dynamic_pointer_cast<T>(Find(id));
    }

    /// Every registered combatant, in no particular order.
    [[nodiscard]] std::vector<std::shared_ptr<Combatant>> All() const;

    [[nodiscard]] std::size_t Size() const;

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<CombatantId, std::shared_ptr<Combatant>> combatants_;
};

}  // namespace vigor::game
