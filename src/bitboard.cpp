#include "runelore/bitboard.hpp"

#include <sstream>

namespace runelore {

std::string pretty(const Bitboard& b) {
  std::ostringstream oss;
  for (int r = 0; r < N; ++r) {
    oss << (r + 1);
    for (int c = 0; c < N; ++c) {
      const std::uint64_t m = squareMask(sq(r, c));
      const bool mine = (b.mine() & m) != 0;
      const bool opp = (b.opponent() & m) != 0;
      char ch = '.';
      if (mine && opp) ch = '#';
      else if (mine) ch = 'X';
      else if (opp) ch = 'O';
      oss << ch;
    }
    oss << "\n";
  }
  oss << " abcdefgh\n";
  return oss.str();
}

} // namespace runelore
