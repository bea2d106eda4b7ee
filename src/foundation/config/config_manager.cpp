/// @file config_manager.cpp
/// @brief ConfigManager implementation on top of yaml-cpp.

#include "vigor/foundation/config_manager.hpp"

#include "vigor/foundation/game_logger.hpp"

#include <algorithm>

namespace vigor::foundation {

namespace {

GameResult<void> parseError(const YAML::ParserException& e) {
    return GameResult<void>::err(
        GameError(ErrorCode::ConfigLoadFailed, std::string("YAML parse error: ") + e.what()));
}

} // namespace

GameResult<void> ConfigManager::load(const std::filesystem::path& path) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::LoadFile(path.string());
        entries_.clear();
        flatten("", root);
    } catch (const YAML::BadFile&) {
        return GameResult<void>::err(
            GameError(ErrorCode::ConfigLoadFailed, "failed to open config file: " + path.string()));
    } catch (const YAML::ParserException& e) {
        return parseError(e);
    }
    VIGOR_LOG_INFO(LogCategory::Config,
                   "loaded " + std::to_string(entries_.size()) + " keys from " + path.string());
    return GameResult<void>::ok();
}

GameResult<void> ConfigManager::loadFromString(std::string_view yaml) {
    std::lock_guard lock(mutex_);
    try {
        auto root = YAML::Load(std::string(yaml));
        entries_.clear();
        flatten("", root);
        return GameResult<void>::ok();
    } catch (const YAML::ParserException& e) {
        return parseError(e);
    }
}

bool ConfigManager::hasKey(std::string_view key) const {
    std::lock_guard lock(mutex_);
    return entries_.count(std::string(key)) > 0;
}

std::vector<std::string> ConfigManager::keysUnder(std::string_view section) const {
    auto prefix = std::string(section) + ".";
    std::vector<std::string> keys;
    std::lock_guard lock(mutex_);
    for (const auto& [key, node] : entries_) {
        if (key.size() > prefix.size() && key.compare(0, prefix.size(), prefix) == 0) {
            keys.push_back(key);
        }
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

void ConfigManager::flatten(const std::string& prefix, const YAML::Node& node) {
    if (node.IsMap()) {
        for (auto it = node.begin(); it != node.end(); ++it) {
            auto childKey = it->first.as<std::string>();
            auto fullKey = prefix.empty() ? childKey : prefix + "." + childKey;
            flatten(fullKey, it->second);
        }
    } else if (!prefix.empty()) {
        entries_[prefix] = YAML::Clone(node);
    }
}

}  // namespace vigor::foundation
