#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "runelore/core.hpp"

namespace runelore {

// Four 64-bit lanes, one per line direction. Lane i shifts by LANE_SHIFTS[i]:
// 1 = horizontal, 7 = anti-diagonal, 8 = vertical, 9 = diagonal.
constexpr std::size_t LANE_N = 4;
constexpr std::array<int, LANE_N> LANE_SHIFTS = {1, 7, 8, 9};

// Up shifts toward higher square indices (<<), Down toward lower ones (>>).
// Running both covers all 8 board directions.
enum class Dir : std::uint8_t { Up, Down };

struct Lanes {
  std::array<std::uint64_t, LANE_N> v{};

  [[nodiscard]] static constexpr Lanes splat(std::uint64_t x) { return Lanes{{x, x, x, x}}; }

  [[nodiscard]] constexpr Lanes operator&(Lanes o) const {
    Lanes r;
    for (std::size_t i = 0; i < LANE_N; ++i) r.v[i] = v[i] & o.v[i];
    return r;
  }
  [[nodiscard]] constexpr Lanes operator&(std::uint64_t x) const { return *this & splat(x); }

  [[nodiscard]] constexpr std::uint64_t reduceOr() const { return v[0] | v[1] | v[2] | v[3]; }

  // Keeps lane i of `values` where this lane is non-zero, zero elsewhere.
  [[nodiscard]] constexpr Lanes selectNonZero(Lanes values) const {
    Lanes r;
    for (std::size_t i = 0; i < LANE_N; ++i) r.v[i] = (v[i] != 0) ? values.v[i] : 0;
    return r;
  }

  [[nodiscard]] constexpr bool operator==(const Lanes& o) const { return v == o.v; }
};

// Edge masks clear the squares a shift would wrap into from the opposite file.
template <Dir D>
[[nodiscard]] constexpr Lanes laneMasks() {
  if constexpr (D == Dir::Up) return Lanes{{NOT_A_FILE, NOT_H_FILE, FILLED, NOT_A_FILE}};
  else return Lanes{{NOT_H_FILE, NOT_A_FILE, FILLED, NOT_H_FILE}};
}

template <Dir D>
[[nodiscard]] constexpr std::uint64_t shiftBy(std::uint64_t x, int s) {
  if constexpr (D == Dir::Up) return x << s;
  else return x >> s;
}

// Kogge-Stone occluded fill in 4 directions at once.
// For every lane, returns `generator` plus the contiguous run of `propagator`
// squares reachable from it along the lane's line. Three doubling rounds
// (s, 2s, 4s) saturate an 8x8 board.
template <Dir D>
[[nodiscard]] constexpr Lanes fill(std::uint64_t generator, std::uint64_t propagator) {
  constexpr Lanes masks = laneMasks<D>();
  Lanes out;
  for (std::size_t i = 0; i < LANE_N; ++i) {
    const int s = LANE_SHIFTS[i];
    std::uint64_t gen = generator;
    std::uint64_t pro = propagator & masks.v[i];
    gen |= pro & shiftBy<D>(gen, s);
    pro &= shiftBy<D>(pro, s);
    gen |= pro & shiftBy<D>(gen, s << 1);
    pro &= shiftBy<D>(pro, s << 1);
    out.v[i] = gen | (pro & shiftBy<D>(gen, s << 2));
  }
  return out;
}

// One step along each lane's line, no accumulation.
template <Dir D>
[[nodiscard]] constexpr Lanes shift(Lanes gen) {
  constexpr Lanes masks = laneMasks<D>();
  Lanes out;
  for (std::size_t i = 0; i < LANE_N; ++i) out.v[i] = shiftBy<D>(gen.v[i], LANE_SHIFTS[i]) & masks.v[i];
  return out;
}

} // namespace runelore
