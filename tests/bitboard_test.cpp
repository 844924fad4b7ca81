#include <gtest/gtest.h>

#include <bit>
#include <cstddef>
#include <cstdint>

#include "random_positions.hpp"
#include "runelore/bitboard.hpp"
#include "runelore/lanes.hpp"

namespace runelore {
namespace {

constexpr std::uint64_t bit(int s) { return 1ULL << s; }

constexpr std::uint64_t D3 = bit(19);
constexpr std::uint64_t C4 = bit(26);
constexpr std::uint64_t D4 = bit(27);
constexpr std::uint64_t E4 = bit(28);
constexpr std::uint64_t D5 = bit(35);
constexpr std::uint64_t E5 = bit(36);
constexpr std::uint64_t F5 = bit(37);
constexpr std::uint64_t E6 = bit(44);

TEST(Lanes, FillStopsAtFirstGap) {
  // a1 generator, b1..d1 and f1 propagators: the horizontal lane stops at d1.
  const Lanes f = fill<Dir::Up>(bit(0), bit(1) | bit(2) | bit(3) | bit(5));
  EXPECT_EQ(f.v[0], bit(0) | bit(1) | bit(2) | bit(3));
  EXPECT_EQ(f.v[2], bit(0));
}

TEST(Lanes, FillCrossesWholeFile) {
  std::uint64_t file = 0;
  for (int r = 1; r < 8; ++r) file |= bit(8 * r);
  const Lanes f = fill<Dir::Up>(bit(0), file);
  EXPECT_EQ(f.v[2], bit(0) | file);
  EXPECT_EQ(shift<Dir::Up>(Lanes::splat(bit(56))).v[2], 0ULL);
}

TEST(Lanes, ShiftMasksWrapAround) {
  // h1 -> a2 (horizontal) and a1 -> h1 going down are both wraps.
  EXPECT_EQ(shift<Dir::Up>(Lanes::splat(bit(7))).v[0], 0ULL);
  EXPECT_EQ(shift<Dir::Down>(Lanes::splat(bit(8))).v[0], 0ULL);
  EXPECT_EQ(shift<Dir::Up>(Lanes::splat(bit(0))).v[3], bit(9));
  EXPECT_EQ(shift<Dir::Down>(Lanes::splat(bit(9))).v[1], bit(2));
}

TEST(Lanes, SelectAndReduce) {
  const Lanes sel{{0, 1, 0, 4}};
  const Lanes values{{10, 20, 30, 40}};
  const Lanes r = sel.selectNonZero(values);
  EXPECT_EQ(r, (Lanes{{0, 20, 0, 40}}));
  EXPECT_EQ(r.reduceOr(), 20ULL | 40ULL);
}

TEST(Bitboard, OpeningPosition) {
  const Bitboard b;
  EXPECT_EQ(b.mine(), E4 | D5);
  EXPECT_EQ(b.opponent(), D4 | E5);
  EXPECT_EQ(b.score(), 0);
  EXPECT_EQ(std::popcount(b.empties()), 60);
}

TEST(Bitboard, OpeningHasFourMoves) {
  const Bitboard b;
  EXPECT_EQ(b.getMoves(), D3 | C4 | F5 | E6);
  EXPECT_EQ(std::popcount(b.getMoves()), 4);
}

TEST(Bitboard, MakeMoveFlipsAndSwapsPerspective) {
  const Bitboard next = Bitboard{}.makeMove(D3);
  EXPECT_EQ(next.mine(), E5);
  EXPECT_EQ(next.opponent(), D3 | D4 | E4 | D5);
  EXPECT_EQ(next.score(), -3);
}

TEST(Bitboard, MakeMoveFlipsWholeFile) {
  std::uint64_t file = 0;
  for (int r = 1; r < 7; ++r) file |= bit(8 * r);
  const Bitboard b{bit(0), file};
  EXPECT_EQ(b.getMoves(), bit(56));

  const Bitboard next = b.makeMove(bit(56));
  EXPECT_EQ(next.mine(), 0ULL);
  EXPECT_EQ(next.opponent(), bit(0) | file | bit(56));
}

TEST(Bitboard, MakeMoveOnlyFlipsFlankedRuns) {
  // Playing d4 with a friendly disc at f4 but an empty a4 beyond b4/c4:
  // only e4 flips.
  const Bitboard b{bit(29), bit(25) | bit(26) | bit(28)};
  ASSERT_NE(b.getMoves() & bit(27), 0ULL);
  const Bitboard next = b.makeMove(bit(27));
  EXPECT_EQ(next.opponent(), bit(29) | bit(28) | bit(27));
  EXPECT_EQ(next.mine(), bit(25) | bit(26));
}

TEST(Bitboard, NoMovesAcrossBoardEdge) {
  // h1 and a2 are not neighbours, and nothing lies west of a1.
  EXPECT_EQ((Bitboard{bit(7), bit(8)}.getMoves()), 0ULL);
  EXPECT_EQ((Bitboard{bit(1), bit(0)}.getMoves()), 0ULL);
  EXPECT_EQ((Bitboard{bit(0), bit(1)}.getMoves()), bit(2));
}

TEST(Bitboard, PassSwapsSides) {
  const Bitboard b;
  EXPECT_EQ(b.pass().mine(), b.opponent());
  EXPECT_EQ(b.pass().opponent(), b.mine());
  EXPECT_EQ(b.pass().pass(), b);
  EXPECT_EQ(b.pass().score(), -b.score());
}

TEST(Bitboard, ReachablePositionsStayConsistent) {
  for (std::uint32_t seed = 1; seed <= 50; ++seed) {
    const auto game = test::randomGame(seed);
    for (std::size_t i = 0; i < game.size(); ++i) {
      const Bitboard& b = game[i].bitboard();
      EXPECT_EQ(b.mine() & b.opponent(), 0ULL);
      EXPECT_EQ(b.pass().pass(), b);
      EXPECT_EQ(b.getMoves() & ~b.empties(), 0ULL);
      if (i == 0) continue;

      // A play adds exactly one disc, a pass none.
      const Bitboard& prev = game[i - 1].bitboard();
      const int added = std::popcount(b.mine() | b.opponent()) - std::popcount(prev.mine() | prev.opponent());
      EXPECT_EQ(added, game[i].gameState().last() == MoveType::Play ? 1 : 0);
    }
  }
}

} // namespace
} // namespace runelore
