#include "runelore/search.hpp"

#include <chrono>
#include <limits>

namespace runelore {

static constexpr int SCORE_MIN = std::numeric_limits<int>::min() + 1;
static constexpr int SCORE_MAX = std::numeric_limits<int>::max();

static int search(const Bitboard& bb, const GameState& state, int alpha, int beta, int depth, std::uint64_t& nodes) {
  ++nodes;
  if (depth <= 0) return bb.score();

  std::uint64_t moves = bb.getMoves();

  if (moves == 0) {
    // Two passes in a row: nobody can move.
    if (state.last() == MoveType::Pass) return bb.score();
    return -search(bb.pass(), state.pass(), -beta, -alpha, depth - 1, nodes);
  }

  while (moves) {
    const std::uint64_t m = isolateLsb(moves);
    moves &= ~m;
    const int score = -search(bb.makeMove(m), state.play(), -beta, -alpha, depth - 1, nodes);
    if (score >= beta) return beta;
    if (score > alpha) alpha = score;
  }

  return alpha;
}

int alphaBeta(const Bitboard& bitboard, const GameState& state, int alpha, int beta, int depth) {
  std::uint64_t nodes = 0;
  return search(bitboard, state, alpha, beta, depth, nodes);
}

std::optional<SearchResult> negamax(const Board& board, int depth) {
  if (depth <= 0) return std::nullopt;

  const auto t0 = std::chrono::steady_clock::now();

  const Bitboard& bb = board.bitboard();
  const GameState& state = board.gameState();

  MoveList moves;
  board.legalMoves(moves);
  if (moves.buf[0].isPass() && state.last() == MoveType::Pass) return std::nullopt;

  SearchResult res;
  for (std::uint32_t i = 0; i < moves.size; ++i) {
    const Move m = moves.buf[i];
    int score = 0;
    if (m.isPass()) score = -search(bb.pass(), state.pass(), SCORE_MIN, SCORE_MAX, depth - 1, res.nodes);
    else score = -search(bb.makeMove(m.mask()), state.play(), SCORE_MIN, SCORE_MAX, depth - 1, res.nodes);

    if (i == 0 || score > res.score) {
      res.score = score;
      res.best = m;
    }
  }

  const auto t1 = std::chrono::steady_clock::now();
  const std::chrono::duration<double> dt = t1 - t0;
  res.seconds = dt.count();
  return res;
}

} // namespace runelore
