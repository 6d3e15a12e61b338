#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "chesslib/move.hpp"
#include "chesslib/position.hpp"

namespace chesslib {

// A played move with its short algebraic text on the board it was played on.
struct MoveRecord {
  Move move;
  std::string notation;
};

// Positions reached during a game, the starting one first, and the moves
// leading between them.
class GameHistory {
public:
  explicit GameHistory(Position start);

  // Records the move played from the last position and the position it led to.
  void push(const Move& move, Position next);

  [[nodiscard]] const std::vector<Position>& positions() const noexcept { return positions_; }
  [[nodiscard]] const std::vector<MoveRecord>& moves() const noexcept { return moves_; }
  [[nodiscard]] const Position& start() const noexcept { return positions_.front(); }
  [[nodiscard]] const Position& last() const noexcept { return positions_.back(); }

  // Numbered move list, e.g. "1.e4 e5 2.Nf3 ", or "1. ... e5 2.Nf3 " when
  // the game started with Black to move.
  [[nodiscard]] std::string to_string() const;

private:
  std::vector<Position> positions_;
  std::vector<MoveRecord> moves_;
};

inline std::ostream& operator<<(std::ostream& os, const GameHistory& history) {
  return os << history.to_string();
}

} // namespace chesslib
