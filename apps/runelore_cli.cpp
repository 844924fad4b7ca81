#include <cstdint>
#include <cstdlib>
#include <exception>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include "runelore/board.hpp"
#include "runelore/perft.hpp"
#include "runelore/search.hpp"

using runelore::Board;
using runelore::MoveList;

static void usage(std::string_view exe) {
  std::cerr << "Usage:\n"
            << "  " << exe << " perft <depth> [--board <text>] [--divide]\n"
            << "  " << exe << " bestmove [--depth N] [--board <text>]\n"
            << "  " << exe << " play [--engine black|white|none] [--depth N] [--board <text>]\n"
            << "  " << exe << " selfplay [--depth N] [--board <text>]\n"
            << "       <text> is 64 squares a1..h8 (X, O or -) followed by the side to move, e.g.\n"
            << "       \"---------------------------OX------XO--------------------------- X\"\n";
}

static std::optional<std::string> argValue(int argc, char** argv, std::string_view key) {
  for (int i = 1; i + 1 < argc; ++i) {
    if (std::string_view(argv[i]) == key) return std::string(argv[i + 1]);
  }
  return std::nullopt;
}

static bool hasFlag(int argc, char** argv, std::string_view key) {
  for (int i = 1; i < argc; ++i) {
    if (std::string_view(argv[i]) == key) return true;
  }
  return false;
}

static int intArg(int argc, char** argv, std::string_view key, int def) {
  if (auto v = argValue(argc, argv, key)) return std::atoi(v->c_str());
  return def;
}

static Board loadBoardFromArgs(int argc, char** argv) {
  if (auto text = argValue(argc, argv, "--board")) return Board::fromText(*text);
  return Board::initial();
}

static void printBoard(const Board& board) {
  std::cout << board.pretty() << "\n";
  std::cout << "Board: " << board.toText() << "\n";
}

static void printResult(const Board& board) {
  std::cout << "Black " << board.discCount(runelore::Side::Black) << " - " << board.discCount(runelore::Side::White) << " White\n";
  if (const auto w = board.winner()) std::cout << "Game over. Winner: " << runelore::sideName(*w) << "\n";
  else std::cout << "Game over. Draw\n";
}

static void cmdPerft(int argc, char** argv) {
  if (argc < 3) throw std::runtime_error("perft: missing depth");
  const int depth = std::atoi(argv[2]);
  const Board board = loadBoardFromArgs(argc, argv);

  printBoard(board);
  std::cout << "\n";

  if (hasFlag(argc, argv, "--divide")) {
    const auto rows = runelore::perftDivide(board, depth);
    std::uint64_t total = 0;
    for (const auto& [m, n] : rows) {
      std::cout << runelore::moveToString(m) << "  " << n << "\n";
      total += n;
    }
    std::cout << "Total: " << total << "\n";
  } else {
    const auto st = runelore::perftTimed(board, depth);
    std::cout << "Nodes: " << st.nodes << "\n";
    std::cout << "Time : " << st.seconds << " s\n";
    std::cout << "NPS  : " << static_cast<std::uint64_t>(st.nps) << "\n";
  }
}

static void cmdBestmove(int argc, char** argv) {
  const int depth = intArg(argc, argv, "--depth", 6);
  const Board board = loadBoardFromArgs(argc, argv);

  printBoard(board);
  std::cout << "\n";

  const auto r = runelore::negamax(board, depth);
  if (!r) {
    std::cout << "bestmove (none)\n";
    return;
  }
  std::cout << "bestmove " << runelore::moveToString(r->best) << "\n";
  std::cout << "score    " << r->score << "\n";
  std::cout << "nodes    " << r->nodes << "\n";
  std::cout << "time     " << r->seconds << " s\n";
  if (r->seconds > 0.0) std::cout << "nps      " << static_cast<std::uint64_t>(static_cast<double>(r->nodes) / r->seconds) << "\n";
}

static std::optional<runelore::Side> parseSide(std::string_view s) {
  if (s == "black") return runelore::Side::Black;
  if (s == "white") return runelore::Side::White;
  if (s != "none") std::cerr << "warning: unknown --engine '" << s << "', engine disabled\n";
  return std::nullopt;
}

static void cmdPlay(int argc, char** argv) {
  const int depth = intArg(argc, argv, "--depth", 6);
  const auto engineSide = parseSide(argValue(argc, argv, "--engine").value_or("white"));

  Board board = loadBoardFromArgs(argc, argv);

  while (!board.gameOver()) {
    std::cout << "\n";
    printBoard(board);

    if (engineSide && *engineSide == board.turn()) {
      const auto r = runelore::negamax(board, depth);
      if (!r) break;
      std::cout << "Engine plays: " << runelore::moveToString(r->best) << " (score " << r->score << ")\n";
      board.play(r->best);
      continue;
    }

    MoveList moves;
    board.legalMoves(moves);
    std::cout << "Moves:";
    for (std::uint32_t i = 0; i < moves.size; ++i) std::cout << ' ' << runelore::moveToString(moves.buf[i]);
    std::cout << "\n" << runelore::sideName(board.turn()) << " to move (or 'q' to quit): ";

    std::string line;
    if (!std::getline(std::cin, line)) break;
    if (line == "q" || line == "quit" || line == "exit") break;

    const auto m = runelore::parseMove(line);
    if (!m) {
      std::cout << "Cannot parse '" << line << "'.\n";
      continue;
    }
    try {
      board.play(*m);
    } catch (const runelore::InvalidMoveError&) {
      std::cout << "Invalid move.\n";
    }
  }

  std::cout << "\n" << board.pretty() << "\n";
  if (board.gameOver()) printResult(board);
}

static void cmdSelfplay(int argc, char** argv) {
  const int depth = intArg(argc, argv, "--depth", 4);
  Board board = loadBoardFromArgs(argc, argv);

  int ply = 0;
  while (const auto r = runelore::negamax(board, depth)) {
    std::cout << ++ply << ". " << runelore::sideName(board.turn()) << "  " << runelore::moveToString(r->best) << "  (score " << r->score
              << ")\n";
    board.play(r->best);
  }

  std::cout << "\n" << board.pretty() << "\n";
  printResult(board);
}

int main(int argc, char** argv) {
  try {
    if (argc < 2) {
      usage(argv[0]);
      return 1;
    }
    const std::string_view cmd = argv[1];
    if (cmd == "perft") {
      cmdPerft(argc, argv);
      return 0;
    }
    if (cmd == "bestmove") {
      cmdBestmove(argc, argv);
      return 0;
    }
    if (cmd == "play") {
      cmdPlay(argc, argv);
      return 0;
    }
    if (cmd == "selfplay") {
      cmdSelfplay(argc, argv);
      return 0;
    }

    usage(argv[0]);
    return 1;
  } catch (const std::exception& e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
}
