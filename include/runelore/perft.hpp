#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "runelore/bitboard.hpp"
#include "runelore/board.hpp"
#include "runelore/move.hpp"
#include "runelore/state.hpp"

namespace runelore {

struct PerftStats {
  std::uint64_t nodes = 0;
  double seconds = 0.0;
  double nps = 0.0;
};

// Leaf count at `depth` plies. A forced pass counts as a ply; a finished game is a single leaf.
[[nodiscard]] std::uint64_t perft(const Bitboard& bb, const GameState& state, int depth);
[[nodiscard]] std::uint64_t perft(const Board& board, int depth);
[[nodiscard]] std::vector<std::pair<Move, std::uint64_t>> perftDivide(const Board& board, int depth);
[[nodiscard]] PerftStats perftTimed(const Board& board, int depth);

} // namespace runelore
