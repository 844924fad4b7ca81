#pragma once

#include <cstdint>

#include "runelore/core.hpp"

namespace runelore {

enum class MoveType : std::uint8_t { Play, Pass };

// Side to move and the kind of the previous ply. Advance it together with the
// Bitboard: two passes in a row end the game, and that is only detectable here.
class GameState {
public:
  constexpr GameState() = default;
  constexpr GameState(Side side, MoveType last) : side_(side), last_(last) {}

  [[nodiscard]] constexpr GameState play() const { return GameState{other(side_), MoveType::Play}; }
  [[nodiscard]] constexpr GameState pass() const { return GameState{other(side_), MoveType::Pass}; }

  [[nodiscard]] constexpr Side side() const { return side_; }
  [[nodiscard]] constexpr MoveType last() const { return last_; }

  [[nodiscard]] constexpr bool operator==(const GameState& o) const { return side_ == o.side_ && last_ == o.last_; }

private:
  Side side_ = Side::Black;
  MoveType last_ = MoveType::Play;
};

} // namespace runelore
