#pragma once

/// @file dice.hpp
/// @brief Symmetric (4dF), exploding and polyhedral dice rolls.

#include <cstdint>
#include <memory>
#include <mutex>
#include <random>
#include <vector>

namespace vigor::game {

/// Upper bound on exploding re-rolls for a single roll.
constexpr int kMaxExplodingRerolls = 100;

/// Source of uniformly distributed integers.
///
/// Implementations must be thread-safe; one source is shared by every
/// roller in the process.
class IRandomSource {
public:
    virtual ~IRandomSource() = default;

    /// Uniform integer in [minInclusive, maxInclusive].
    virtual int NextInt(int minInclusive, int maxInclusive) = 0;
};

/// Mersenne Twister source seeded from std::random_device.
class DefaultRandomSource final : public IRandomSource {
public:
    DefaultRandomSource();

    /// Deterministic source for reproducible simulations.
    explicit DefaultRandomSource(uint64_t seed);

    int NextInt(int minInclusive, int maxInclusive) override;

private:
    std::mutex mutex_;
    std::mt19937_64 engine_;
};

/// Dice used by combat resolution.
///
/// A fudge die has six faces: two blank (0), two plus (+1), two minus (-1).
/// Four of them summed give the symmetric [-4, +4] roll every skill check
/// is built on.
class DiceRoller {
public:
    /// A null @p source falls back to a DefaultRandomSource.
    explicit DiceRoller(std::shared_ptr<IRandomSource> source);

    /// Single fudge die: -1, 0 or +1.
    int RollFudgeDie();

    /// Sum of four fudge dice, in [-4, +4].
    int Roll4dF();

    /// 4dF that keeps going on an extreme result.
    ///
    /// On +4 (or -4) four more dice are rolled and the number of plus
    /// (minus) faces is added (subtracted). The chain continues only while
    /// a re-roll shows that sign on all four dice, and stops after
    /// kMaxExplodingRerolls re-rolls.
    int RollExploding4dF();

    /// 4dF plus @p modifier, clamped to [minValue, maxValue].
    int Roll4dFWithModifier(int modifier, int minValue, int maxValue);

    /// @p count independent 4dF rolls.
    std::vector<int> RollMultiple4dF(int count);

    /// One die with @p sides faces, in [1, sides]. Fewer than one side yields 0.
    int RollDie(int sides);

    /// Sum of @p count dice with @p sides faces each.
    int RollDice(int count, int sides);

    /// Value of fudge-die face @p face (any int, reduced modulo 6).
    [[nodiscard]] static int FudgeFaceValue(int face) noexcept;

    [[nodiscard]] IRandomSource& Source() noexcept { return *source_; }

private:
    std::shared_ptr<IRandomSource> source_;
};

}  // namespace vigor::game
