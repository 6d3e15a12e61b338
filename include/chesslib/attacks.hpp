#pragma once

// =============================================================================
// ATTACK AND RAY TABLES
// =============================================================================
//
// Every question of the form "where can a piece on S go?" is answered by a
// table lookup. The tables are computed once by the compiler and never change.
//
//   rays[dir][S]        squares from S to the board edge in one direction
//   bishop/rook/queen   union of the diagonal / orthogonal / all rays
//   knight/king         fixed offset patterns
//   pawn_advances       one step forward, plus two from the start rank
//   pawn_captures       the two forward diagonals
//   between[A][B]       squares strictly between A and B on a shared line
//
// Sliding reach ignores occupancy. Blocking is applied at query time:
//
//   destination D is reachable from S  ⇔  D ∈ reach[S] and
//                                          between(S, D) & occupancy == 0
//
// =============================================================================

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>

#include "chesslib/bitboard.hpp"
#include "chesslib/colour.hpp"
#include "chesslib/piece.hpp"
#include "chesslib/square.hpp"

namespace chesslib {

enum class Direction : std::uint8_t {
  North,
  South,
  East,
  West,
  NorthEast,
  NorthWest,
  SouthEast,
  SouthWest,
};

inline constexpr std::size_t DIRECTIONS_NUMBER = 8;

using SquareTable = std::array<Bitboard, SQUARES_NUMBER>;

struct AttackTables {
  std::array<SquareTable, DIRECTIONS_NUMBER> rays{};
  SquareTable bishop{};
  SquareTable rook{};
  SquareTable queen{};
  SquareTable knight{};
  SquareTable king{};
  std::array<SquareTable, COLOURS_NUMBER> pawn_advances{};
  std::array<SquareTable, COLOURS_NUMBER> pawn_captures{};
  std::array<SquareTable, SQUARES_NUMBER> between{};
};

// The process-wide tables.
const AttackTables& attack_tables() noexcept;

Bitboard ray(Direction direction, Square square) noexcept;

// Destinations of a non-pawn piece type on an empty board.
Bitboard piece_reach(PieceType type, Square square) noexcept;

Bitboard pawn_advances(Colour colour, Square square) noexcept;
Bitboard pawn_captures(Colour colour, Square square) noexcept;

/// nullopt when the squares share no rank, file or diagonal; an empty set
/// when they are identical or adjacent; otherwise the squares strictly between.
std::optional<Bitboard> between(Square from, Square to) noexcept;

} // namespace chesslib
