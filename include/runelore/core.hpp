#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace runelore {

constexpr int N = 8;
constexpr int SQ_N = N * N; // 64
constexpr std::uint8_t SQ_NONE = 0xFF;

// Square 0 is a1, square 7 is h1, square 63 is h8.
constexpr std::uint64_t NOT_A_FILE = 0xfefefefefefefefeULL;
constexpr std::uint64_t NOT_H_FILE = 0x7f7f7f7f7f7f7f7fULL;
constexpr std::uint64_t FILLED = ~0ULL;

enum class Side : std::uint8_t { Black = 0, White = 1 };

[[nodiscard]] constexpr Side other(Side s) {
  return (s == Side::Black) ? Side::White : Side::Black;
}

[[nodiscard]] constexpr std::string_view sideName(Side s) {
  return (s == Side::Black) ? "Black" : "White";
}

[[nodiscard]] constexpr bool inBounds(int r, int c) {
  return r >= 0 && r < N && c >= 0 && c < N;
}

[[nodiscard]] constexpr std::uint8_t sq(int r, int c) {
  return static_cast<std::uint8_t>(r * N + c);
}

[[nodiscard]] constexpr int row(std::uint8_t s) {
  return static_cast<int>(s) / N;
}

[[nodiscard]] constexpr int col(std::uint8_t s) {
  return static_cast<int>(s) % N;
}

[[nodiscard]] constexpr std::uint64_t squareMask(std::uint8_t s) {
  return 1ULL << s;
}

// Lowest set bit of x, or 0 when x is 0.
[[nodiscard]] constexpr std::uint64_t isolateLsb(std::uint64_t x) {
  return x & (0ULL - x);
}

[[nodiscard]] std::string coordToString(std::uint8_t s);
[[nodiscard]] std::optional<std::uint8_t> parseCoord(std::string_view s);

} // namespace runelore
