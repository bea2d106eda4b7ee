#pragma once

/// @file effect_catalog.hpp
/// @brief Lookup table of status effect definitions.

#include <filesystem>
#include <memory>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "vigor/foundation/game_result.hpp"
#include "vigor/game/status_effect_types.hpp"

namespace vigor::game {

using vigor::foundation::GameResult;

/// Definitions by id and by name, filled at startup from the built-in set
/// and/or a YAML catalog, then only read.
///
/// Example catalog:
/// @code
///   effects:
///     - name: Poison
///       category: DamageOverTime
///       stackable: true
///       max_stacks: 5
///       tick_interval_seconds: 6
///       default_duration_seconds: 60
///       impacts:
///         - type: PeriodicVitalityDamage
///           value: 2
/// @endcode
class EffectCatalog {
public:
    using DefinitionPtr = std::shared_ptr<const StatusEffectDefinition>;

    /// Add a definition, assigning the next id when it has none.
    /// @return The id, or AlreadyExists for a duplicate name or id.
    GameResult<EffectDefinitionId> Register(StatusEffectDefinition definition);

    [[nodiscard]] DefinitionPtr FindById(EffectDefinitionId id) const;

    /// Case-insensitive name lookup.
    [[nodiscard]] DefinitionPtr FindByName(std::string_view name) const;

    /// All definitions, ordered by id.
    [[nodiscard]] std::vector<DefinitionPtr> All() const;

    [[nodiscard]] std::size_t Size() const;

    /// Register the built-in definitions (Wound, attribute buffs, Poison,
    /// Burning, Stunned, ...). Existing names are kept.
    /// @return Number of definitions added.
    int SeedDefaults();

    /// Register every definition in a YAML catalog file.
    /// @return Number added, or EffectCatalogLoadFailed.
    GameResult<int> LoadFromYaml(const std::filesystem::path& path);

    /// Register every definition in an in-memory YAML document.
    GameResult<int> LoadFromYamlString(std::string_view yaml);

    /// The built-in definitions, without registering them.
    [[nodiscard]] static std::vector<StatusEffectDefinition> DefaultDefinitions();

private:
    int registerLoaded(std::vector<StatusEffectDefinition> definitions);

    mutable std::shared_mutex mutex_;
    std::unordered_map<EffectDefinitionId, DefinitionPtr> byId_;
    std::unordered_map<std::string, DefinitionPtr> byName_;
    uint64_t nextId_ = 1;
};

}  // namespace vigor::game
