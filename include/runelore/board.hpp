#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "runelore/bitboard.hpp"
#include "runelore/core.hpp"
#include "runelore/move.hpp"
#include "runelore/state.hpp"

namespace runelore {

struct InvalidMoveError : std::runtime_error {
  InvalidMoveError() : std::runtime_error("Invalid move played.") {}
};

// High-level game: a Bitboard plus the GameState that tracks whose turn it is.
// Unlike the raw Bitboard, play() checks legality.
class Board {
public:
  Board() = default;
  Board(const Bitboard& bitboard, const GameState& state) : bitboard_(bitboard), state_(state) {}

  [[nodiscard]] static Board initial() { return Board{}; }

  // Text form: 64 squares from a1 to h8 (X = black, O = white, - = empty),
  // a space, then the side to move (X or O).
  [[nodiscard]] std::string toText() const;
  [[nodiscard]] static Board fromText(std::string_view text);

  [[nodiscard]] const Bitboard& bitboard() const { return bitboard_; }
  [[nodiscard]] const GameState& gameState() const { return state_; }
  [[nodiscard]] Side turn() const { return state_.side(); }

  // Ascending square order; a lone Pass when nothing else is legal.
  void legalMoves(MoveList& out) const;
  [[nodiscard]] bool isLegal(const Move& m) const;

  // Throws InvalidMoveError and leaves the board untouched if `m` is not legal.
  void play(const Move& m);

  [[nodiscard]] bool gameOver() const;
  [[nodiscard]] int discCount(Side s) const;
  // Side with more discs once the game is over; empty on a draw or while play continues.
  [[nodiscard]] std::optional<Side> winner() const;

  [[nodiscard]] std::uint64_t discs(Side s) const {
    return (s == state_.side()) ? bitboard_.mine() : bitboard_.opponent();
  }

  [[nodiscard]] std::string pretty() const;

private:
  Bitboard bitboard_{};
  GameState state_{};
};

} // namespace runelore
