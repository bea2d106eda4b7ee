/// @file combat_types.cpp
/// @brief Name parsing for combat enumerations.

#include "vigor/game/combat_types.hpp"

#include <cctype>

namespace vigor::game {

std::string asciiLower(std::string_view text) {
    std::string out;
    out.reserve(text.size());
    for (char c : text) {
        out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return out;
}

std::optional<DamageType> parseDamageType(std::string_view name) {
    auto lower = asciiLower(name);
    for (std::size_t i = 0; i < kDamageTypeCount; ++i) {
        auto type = static_cast<DamageType>(i);
        if (asciiLower(damageTypeName(type)) == lower) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<BodyLocation> parseBodyLocation(std::string_view name) {
    auto lower = asciiLower(name);
    for (std::size_t i = 0; i < kBodyLocationCount; ++i) {
        auto location = static_cast<BodyLocation>(i);
        if (asciiLower(bodyLocationName(location)) == lower) {
            return location;
        }
    }
    return std::nullopt;
}

}  // namespace vigor::game
