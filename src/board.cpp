#include "runelore/board.hpp"

#include <bit>
#include <iomanip>
#include <sstream>

namespace runelore {

void Board::legalMoves(MoveList& out) const {
  movesFromMask(bitboard_.getMoves(), out);
}

bool Board::isLegal(const Move& m) const {
  const std::uint64_t moves = bitboard_.getMoves();
  if (m.isPass()) return moves == 0;
  if (m.square >= SQ_N) return false;
  return (moves & m.mask()) != 0;
}

void Board::play(const Move& m) {
  if (!isLegal(m)) throw InvalidMoveError{};
  if (m.isPass()) {
    bitboard_ = bitboard_.pass();
    state_ = state_.pass();
  } else {
    bitboard_ = bitboard_.makeMove(m.mask());
    state_ = state_.play();
  }
}

bool Board::gameOver() const {
  return bitboard_.getMoves() == 0 && bitboard_.pass().getMoves() == 0;
}

int Board::discCount(Side s) const {
  return std::popcount(discs(s));
}

std::optional<Side> Board::winner() const {
  if (!gameOver()) return std::nullopt;
  const int black = discCount(Side::Black);
  const int white = discCount(Side::White);
  if (black > white) return Side::Black;
  if (white > black) return Side::White;
  return std::nullopt;
}

std::string Board::pretty() const {
  const std::uint64_t black = discs(Side::Black);
  const std::uint64_t white = discs(Side::White);
  const bool blackToMove = turn() == Side::Black;

  std::ostringstream oss;
  for (int r = 0; r < N; ++r) {
    oss << (r + 1) << ' ';
    for (int c = 0; c < N; ++c) {
      const std::uint64_t m = squareMask(sq(r, c));
      char ch = '.';
      if (black & m) ch = 'X';
      else if (white & m) ch = 'O';
      oss << ch << ' ';
    }
    if (r == 3) oss << "B: " << std::setw(2) << discCount(Side::Black) << (blackToMove ? " <-" : "   ");
    if (r == 4) oss << "W: " << std::setw(2) << discCount(Side::White) << (blackToMove ? "   " : " <-");
    oss << "\n";
  }
  oss << "  a b c d e f g h\n";
  return oss.str();
}

} // namespace runelore
