#pragma once

/// @file types.hpp
/// @brief Strong ID types and saturating arithmetic shared by the combat core.

#include <cstdint>
#include <functional>
#include <limits>

namespace vigor::foundation {

/// Tag-based strong typedef for type-safe ID values.
///
/// Keeps a combatant id from being passed where a session id is expected
/// while sharing the same underlying representation.
template <typename Tag, typename T = uint64_t>
class StrongId {
public:
    constexpr StrongId() = default;
    constexpr explicit StrongId(T value) : value_(value) {}

    [[nodiscard]] constexpr T value() const noexcept { return value_; }
    [[nodiscard]] constexpr bool isValid() const noexcept { return value_ != 0; }

    constexpr auto operator<=>(const StrongId&) const = default;

private:
    T value_ = 0;
};

struct CombatantIdTag {};
struct CombatSessionIdTag {};
struct RoomIdTag {};
struct EffectDefinitionIdTag {};
struct EffectInstanceIdTag {};

/// Identifies a player character or NPC taking part in combat.
using CombatantId = StrongId<CombatantIdTag>;

/// Identifies a combat session.
using CombatSessionId = StrongId<CombatSessionIdTag>;

/// Identifies the room a combatant occupies.
using RoomId = StrongId<RoomIdTag>;

using EffectDefinitionId = StrongId<EffectDefinitionIdTag>;
using EffectInstanceId = StrongId<EffectInstanceIdTag>;

/// Add two ints, clamping to the int range instead of overflowing.
[[nodiscard]] constexpr int saturatingAdd(int a, int b) noexcept {
    if (b > 0 && a > std::numeric_limits<int>::max() - b) {
        return std::numeric_limits<int>::max();
    }
    if (b < 0 && a < std::numeric_limits<int>::min() - b) {
        return std::numeric_limits<int>::min();
    }
    return a + b;
}

} // namespace vigor::foundation

// Hash support for use in unordered containers.
template <typename Tag, typename T>
struct std::hash<vigor::foundation::StrongId<Tag, T>> {
    std::size_t operator()(const vigor::foundation::StrongId<Tag, T>& id) const noexcept {
        return std::hash<T>{}(id.value());
    }
};
