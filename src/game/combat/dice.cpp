/// @file dice.cpp
/// @brief DiceRoller and DefaultRandomSource implementation.

#include "vigor/game/dice.hpp"

#include <algorithm>
#include <utility>

#include "vigor/foundation/game_logger.hpp"

namespace vigor::game {

using vigor::foundation::LogCategory;

// ── DefaultRandomSource ─────────────────────────────────────────────────

DefaultRandomSource::DefaultRandomSource()
    : engine_(std::random_device{}()) {}

DefaultRandomSource::DefaultRandomSource(uint64_t seed)
    : engine_(seed) {}

int DefaultRandomSource::NextInt(int minInclusive, int maxInclusive) {
    if (maxInclusive < minInclusive) {
        std::swap(minInclusive, maxInclusive);
    }
    std::uniform_int_distribution<int> dist(minInclusive, maxInclusive);
    std::lock_guard lock(mutex_);
    return dist(engine_);
}

// ── DiceRoller ──────────────────────────────────────────────────────────

DiceRoller::DiceRoller(std::shared_ptr<IRandomSource> source)
    : source_(source ? std::move(source) : std::make_shared<DefaultRandomSource>()) {}

int DiceRoller::FudgeFaceValue(int face) noexcept {
    int normalized = face % 6;
    if (normalized < 0) {
        normalized += 6;
    }
    // Faces 0-1 blank, 2-3 plus, 4-5 minus.
    if (normalized < 2) {
        return 0;
    }
    return normalized < 4 ? 1 : -1;
}

int DiceRoller::RollFudgeDie() {
    return FudgeFaceValue(source_->NextInt(0, 5));
}

int DiceRoller::Roll4dF() {
    int total = 0;
    for (int i = 0; i < 4; ++i) {
        total += RollFudgeDie();
    }
    return total;
}

int DiceRoller::RollExploding4dF() {
    int total = Roll4dF();
    if (total != 4 && total != -4) {
        return total;
    }

    const int sign = total > 0 ? 1 : -1;
    for (int reroll = 0; reroll < kMaxExplodingRerolls; ++reroll) {
        int matching = 0;
        for (int i = 0; i < 4; ++i) {
            if (RollFudgeDie() == sign) {
                ++matching;
            }
        }
        total += sign * matching;
        if (matching != 4) {
            return total;
        }
    }

    VIGOR_LOG_WARN(LogCategory::Combat,
                   "exploding roll hit the re-roll cap at " + std::to_string(total));
    return total;
}

int DiceRoller::Roll4dFWithModifier(int modifier, int minValue, int maxValue) {
    return std::clamp(Roll4dF() + modifier, minValue, std::max(minValue, maxValue));
}

std::vector<int> DiceRoller::RollMultiple4dF(int count) {
    std::vector<int> results;
    if (count <= 0) {
        return results;
    }
    results.reserve(static_cast<std::size_t>(count));
    for (int i = 0; i < count; ++i) {
        results.push_back(Roll4dF());
    }
    return results;
}

int DiceRoller::RollDie(int sides) {
    if (sides < 1) {
        return 0;
    }
    return source_->NextInt(1, sides);
}

int DiceRoller::RollDice(int count, int sides) {
    int total = 0;
    for (int i = 0; i < count; ++i) {
        total += RollDie(sides);
    }
    return total;
}

}  // namespace vigor::game
