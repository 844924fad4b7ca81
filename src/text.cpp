#include "runelore/board.hpp"

#include <cctype>
#include <sstream>
#include <stdexcept>

namespace runelore {

std::string Board::toText() const {
  const std::uint64_t black = discs(Side::Black);
  const std::uint64_t white = discs(Side::White);

  std::string out;
  out.reserve(SQ_N + 2);
  for (std::uint8_t s = 0; s < SQ_N; ++s) {
    const std::uint64_t m = squareMask(s);
    if (black & m) out.push_back('X');
    else if (white & m) out.push_back('O');
    else out.push_back('-');
  }
  out.push_back(' ');
  out.push_back(turn() == Side::Black ? 'X' : 'O');
  return out;
}

Board Board::fromText(std::string_view text) {
  std::istringstream iss{std::string(text)};
  std::string squaresStr, sideStr;
  if (!(iss >> squaresStr >> sideStr)) throw std::runtime_error("Invalid position: expected <squares> <side>");
  if (squaresStr.size() != SQ_N) throw std::runtime_error("Invalid position: expected 64 squares");

  std::uint64_t black = 0;
  std::uint64_t white = 0;
  for (std::uint8_t s = 0; s < SQ_N; ++s) {
    const char ch = static_cast<char>(std::toupper(static_cast<unsigned char>(squaresStr[s])));
    switch (ch) {
      case 'X': black |= squareMask(s); break;
      case 'O': white |= squareMask(s); break;
      case '-':
      case '.': break;
      default: throw std::runtime_error(std::string("Invalid position: unknown square '") + squaresStr[s] + "'");
    }
  }

  if (sideStr.size() != 1) throw std::runtime_error("Invalid position: side must be 'X' or 'O'");
  const char t = static_cast<char>(std::toupper(static_cast<unsigned char>(sideStr[0])));
  Side side = Side::Black;
  if (t == 'X' || t == 'B') side = Side::Black;
  else if (t == 'O' || t == 'W') side = Side::White;
  else throw std::runtime_error("Invalid position: side must be 'X' or 'O'");

  const Bitboard bb = (side == Side::Black) ? Bitboard{black, white} : Bitboard{white, black};
  return Board{bb, GameState{side, MoveType::Play}};
}

} // namespace runelore
