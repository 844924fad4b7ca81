#include "runelore/perft.hpp"

#include <chrono>

namespace runelore {

std::uint64_t perft(const Bitboard& bb, const GameState& state, int depth) {
  if (depth <= 0) return 1;

  std::uint64_t moves = bb.getMoves();
  if (moves == 0) {
    if (state.last() == MoveType::Pass) return 1;
    return perft(bb.pass(), state.pass(), depth - 1);
  }

  std::uint64_t nodes = 0;
  while (moves) {
    const std::uint64_t m = isolateLsb(moves);
    moves &= ~m;
    nodes += perft(bb.makeMove(m), state.play(), depth - 1);
  }
  return nodes;
}

std::uint64_t perft(const Board& board, int depth) {
  return perft(board.bitboard(), board.gameState(), depth);
}

std::vector<std::pair<Move, std::uint64_t>> perftDivide(const Board& board, int depth) {
  std::vector<std::pair<Move, std::uint64_t>> out;
  if (depth <= 0) return out;

  const Bitboard& bb = board.bitboard();
  const GameState& state = board.gameState();

  MoveList moves;
  board.legalMoves(moves);
  if (moves.buf[0].isPass() && state.last() == MoveType::Pass) return out;
  out.reserve(moves.size);

  for (std::uint32_t i = 0; i < moves.size; ++i) {
    const Move m = moves.buf[i];
    const std::uint64_t n = m.isPass() ? perft(bb.pass(), state.pass(), depth - 1)
                                       : perft(bb.makeMove(m.mask()), state.play(), depth - 1);
    out.push_back({m, n});
  }
  return out;
}

PerftStats perftTimed(const Board& board, int depth) {
  const auto t0 = std::chrono::steady_clock::now();
  const std::uint64_t nodes = perft(board, depth);
  const auto t1 = std::chrono::steady_clock::now();

  const std::chrono::duration<double> dt = t1 - t0;
  PerftStats st;
  st.nodes = nodes;
  st.seconds = dt.count();
  st.nps = (st.seconds > 0.0) ? (static_cast<double>(nodes) / st.seconds) : 0.0;
  return st;
}

} // namespace runelore
