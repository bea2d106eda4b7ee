#pragma once

/// @file config_manager.hpp
/// @brief YAML-backed configuration with dotted-key typed access.

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <yaml-cpp/yaml.h>

#include "vigor/foundation/game_result.hpp"

namespace vigor::foundation {

/// YAML configuration manager providing typed access to tick rates,
/// thread counts and catalog paths.
///
/// The YAML tree is flattened into dotted keys ("combat.health_tick_ms")
/// so lookups never walk yaml-cpp's reference-semantic nodes.
class ConfigManager {
public:
    ConfigManager() = default;

    /// Load configuration from a YAML file, replacing current entries.
    GameResult<void> load(const std::filesystem::path& path);

    /// Load configuration from an in-memory YAML document.
    GameResult<void> loadFromString(std::string_view yaml);

    /// Retrieve a typed value by dotted key.
    /// @return The value or ConfigKeyNotFound/ConfigTypeMismatch error.
    template <typename T>
    GameResult<T> get(std::string_view key) const;

    /// Retrieve a typed value, falling back when missing or mistyped.
    template <typename T>
    [[nodiscard]] T getOr(std::string_view key, T fallback) const {
        return get<T>(key).valueOr(std::move(fallback));
    }

    [[nodiscard]] bool hasKey(std::string_view key) const;

    /// Sorted leaf keys nested under @p section ("logging.categories"
    /// yields "logging.categories.combat", ...).
    [[nodiscard]] std::vector<std::string> keysUnder(std::string_view section) const;

private:
    void flatten(const std::string& prefix, const YAML::Node& node);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, YAML::Node> entries_;
};

// --- Template implementations ---

template <typename T>
GameResult<T> ConfigManager::get(std::string_view key) const {
    std::lock_guard lock(mutex_);
    auto it = entries_.find(std::string(key));
    if (it == entries_.end()) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigKeyNotFound,
                      std::string("config key not found: ") + std::string(key)));
    }
    try {
        return GameResult<T>::ok(it->second.as<T>());
    } catch (const YAML::BadConversion&) {
        return GameResult<T>::err(
            GameError(ErrorCode::ConfigTypeMismatch,
                      std::string("type mismatch for key: ") + std::string(key)));
    }
}

} // namespace vigor::foundation
