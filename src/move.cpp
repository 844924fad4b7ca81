#include "runelore/move.hpp"

#include <bit>
#include <cctype>

namespace runelore {

std::string coordToString(std::uint8_t s) {
  if (s == SQ_NONE || s >= SQ_N) return "--";
  const char file = static_cast<char>('a' + col(s));
  const char rank = static_cast<char>('1' + row(s));
  return std::string{file, rank};
}

static std::string_view trim(std::string_view sv) {
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
  while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
  return sv;
}

std::optional<std::uint8_t> parseCoord(std::string_view sv) {
  sv = trim(sv);
  if (sv.size() != 2) return std::nullopt;

  const char f0 = static_cast<char>(std::tolower(static_cast<unsigned char>(sv[0])));
  const char r0 = sv[1];
  if (f0 < 'a' || f0 >= static_cast<char>('a' + N)) return std::nullopt;
  if (r0 < '1' || r0 >= static_cast<char>('1' + N)) return std::nullopt;

  const int c = f0 - 'a';
  const int r = r0 - '1';
  if (!inBounds(r, c)) return std::nullopt;
  return sq(r, c);
}

void movesFromMask(std::uint64_t mask, MoveList& out) {
  out.clear();
  while (mask) {
    const std::uint64_t m = isolateLsb(mask);
    mask &= ~m;
    out.push(Move::play(static_cast<std::uint8_t>(std::countr_zero(m))));
  }
  if (out.empty()) out.push(Move::pass());
}

std::string moveToString(const Move& m) {
  if (m.isPass()) return "pass";
  return coordToString(m.square);
}

std::optional<Move> parseMove(std::string_view sv) {
  sv = trim(sv);
  if (sv.size() == 4) {
    std::string lower;
    for (const char ch : sv) lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
    if (lower == "pass") return Move::pass();
    return std::nullopt;
  }
  if (auto s = parseCoord(sv)) return Move::play(*s);
  return std::nullopt;
}

} // namespace runelore
