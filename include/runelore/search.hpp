#pragma once

#include <cstdint>
#include <optional>

#include "runelore/bitboard.hpp"
#include "runelore/board.hpp"
#include "runelore/move.hpp"
#include "runelore/state.hpp"

namespace runelore {

struct SearchResult {
  Move best = Move::pass();
  int score = 0; // disc differential, side-to-move perspective
  std::uint64_t nodes = 0;
  double seconds = 0.0;
};

// Fixed-depth fail-hard alpha-beta. Returns `beta` on a cutoff, not the child score.
// A node with no moves whose previous ply was a pass is terminal and scores
// immediately, whatever depth remains.
[[nodiscard]] int alphaBeta(const Bitboard& bitboard, const GameState& state, int alpha, int beta, int depth);

// Searches every root move with a full window and returns the best one (the
// earliest in square order on ties). Empty when depth <= 0 or the game is
// already over at the root.
[[nodiscard]] std::optional<SearchResult> negamax(const Board& board, int depth);

} // namespace runelore
