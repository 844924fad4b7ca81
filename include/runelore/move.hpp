#pragma once

#include <array>
#include <cassert>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "runelore/core.hpp"
#include "runelore/state.hpp"

namespace runelore {

struct Move {
  MoveType type;
  std::uint8_t square; // SQ_NONE for a pass

  [[nodiscard]] static constexpr Move play(std::uint8_t s) { return Move{MoveType::Play, s}; }
  [[nodiscard]] static constexpr Move pass() { return Move{MoveType::Pass, SQ_NONE}; }

  [[nodiscard]] constexpr bool isPass() const { return type == MoveType::Pass; }
  [[nodiscard]] constexpr std::uint64_t mask() const { return isPass() ? 0 : squareMask(square); }

  [[nodiscard]] constexpr bool operator==(const Move& o) const { return type == o.type && square == o.square; }
  [[nodiscard]] constexpr bool operator!=(const Move& o) const { return !(*this == o); }
};

// At most 60 empty squares remain once the game starts, so 64 slots always suffice.
struct MoveList {
  std::array<Move, SQ_N> buf;
  std::uint32_t size = 0;

  void clear() { size = 0; }
  [[nodiscard]] bool empty() const { return size == 0; }
  void push(const Move& m) {
    assert(size < buf.size());
    buf[size++] = m;
  }
};

// Expands a legal-move mask in ascending square order; a single Pass when the mask is empty.
void movesFromMask(std::uint64_t mask, MoveList& out);

[[nodiscard]] std::string moveToString(const Move& m);
[[nodiscard]] std::optional<Move> parseMove(std::string_view s);

} // namespace runelore
