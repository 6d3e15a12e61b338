#pragma once

#include <ostream>
#include <string>

#include "chesslib/move.hpp"
#include "chesslib/position.hpp"

namespace chesslib {

// What a legal move means on the board it is played on.
struct MoveAnnotation {
  bool is_capture{false};
  bool is_check{false};
  bool is_checkmate{false};
  AmbiguityType ambiguity{AmbiguityType::Neither};

  friend bool operator==(const MoveAnnotation& lhs, const MoveAnnotation& rhs) = default;
};

// Throws IllegalMoveError when the move is not legal in `before`.
[[nodiscard]] MoveAnnotation annotate(const Position& before, const Move& move);

// Same, reusing `after`, which must be before.make_move(move); legality is
// not checked again.
[[nodiscard]] MoveAnnotation annotate(const Position& before, const Move& move,
                                      const Position& after);

// Short algebraic notation: "e4", "Nbd7", "exd5", "e8=Q+", "O-O-O#".
// Throws IllegalMoveError when the move is not legal in `before`.
[[nodiscard]] std::string to_algebraic(const Position& before, const Move& move);
[[nodiscard]] std::string to_algebraic(const Position& before, const Move& move,
                                       const Position& after);

} // namespace chesslib
