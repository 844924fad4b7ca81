#pragma once

#include <bit>
#include <cstdint>
#include <string>

#include "runelore/core.hpp"
#include "runelore/lanes.hpp"

namespace runelore {

// Othello position relative to the side to move: `mine` holds the discs of the
// player to move, `opponent` the other player's. Values are never mutated;
// makeMove() and pass() return the successor with the perspective swapped.
class Bitboard {
public:
  // Standard opening: e4/d5 to move, d4/e5 for the opponent.
  constexpr Bitboard() = default;
  constexpr Bitboard(std::uint64_t mine, std::uint64_t opponent) : mine_(mine), opponent_(opponent) {}

  [[nodiscard]] constexpr std::uint64_t mine() const { return mine_; }
  [[nodiscard]] constexpr std::uint64_t opponent() const { return opponent_; }

  [[nodiscard]] constexpr std::uint64_t empties() const { return ~(mine_ | opponent_); }

  // Mask of every square where the side to move may place a disc.
  [[nodiscard]] constexpr std::uint64_t getMoves() const {
    const Lanes fillUp = fill<Dir::Up>(mine_, opponent_);
    const Lanes fillDown = fill<Dir::Down>(mine_, opponent_);

    // Runs of opponent discs, stepped once past their far end.
    const std::uint64_t up = shift<Dir::Up>(fillUp & opponent_).reduceOr();
    const std::uint64_t down = shift<Dir::Down>(fillDown & opponent_).reduceOr();

    return (up | down) & empties();
  }

  // Plays the single-bit `moveMask`, which must come from getMoves(). Not validated.
  [[nodiscard]] constexpr Bitboard makeMove(std::uint64_t moveMask) const {
    const Lanes fillUp = fill<Dir::Up>(moveMask, opponent_);
    const Lanes fillDown = fill<Dir::Down>(moveMask, opponent_);

    // A run flips only if a friendly disc sits right past it.
    const Lanes flankedUp = shift<Dir::Up>(fillUp) & mine_;
    const Lanes flankedDown = shift<Dir::Down>(fillDown) & mine_;

    const std::uint64_t flips = flankedUp.selectNonZero(fillUp).reduceOr() | flankedDown.selectNonZero(fillDown).reduceOr();

    return Bitboard{opponent_ & ~flips, mine_ | flips | moveMask};
  }

  // Hands the turn over. Only meaningful when getMoves() is empty; not validated.
  [[nodiscard]] constexpr Bitboard pass() const { return Bitboard{opponent_, mine_}; }

  // Disc differential from the side to move's point of view.
  [[nodiscard]] constexpr int score() const { return std::popcount(mine_) - std::popcount(opponent_); }

  [[nodiscard]] constexpr bool operator==(const Bitboard& o) const { return mine_ == o.mine_ && opponent_ == o.opponent_; }
  [[nodiscard]] constexpr bool operator!=(const Bitboard& o) const { return !(*this == o); }

private:
  std::uint64_t mine_ = 0x0000000810000000ULL;
  std::uint64_t opponent_ = 0x0000001008000000ULL;
};

// Debug dump: X = mine, O = opponent, # = both (corrupt), . = empty.
[[nodiscard]] std::string pretty(const Bitboard& b);

} // namespace runelore
