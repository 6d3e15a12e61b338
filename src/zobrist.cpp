#include "chesslib/zobrist.hpp"

#include "chesslib/position.hpp"

namespace chesslib {

PositionHash ZobristHasher::hash(const Position& position) const {
  PositionHash result = 0;

  Bitboard occupied = position.occupancy();
  while (occupied != 0) {
    const Square square = Square::pop_first_occupied(occupied);
    if (const auto piece = position.piece_at(square); piece.has_value()) {
      result ^= piece_square(*piece, square);
    }
  }

  for (const auto colour : {Colour::White, Colour::Black}) {
    result ^= castling(position.castling_rights(colour), colour);
  }

  if (const auto target = position.en_passant(); target.has_value()) {
    result ^= en_passant(*target);
  }

  if (position.side_to_move() == Colour::Black) {
    result ^= black_to_move();
  }

  return result;
}

} // namespace chesslib
