#include "chesslib/perft.hpp"

namespace chesslib {

// =============================================================================
// PERFT: Move Generation Validation
// =============================================================================
// Counts every legal move sequence of the given length. Published node counts
// for well-known positions catch generation bugs that single-position checks
// miss: castling through check, en passant discoveries, promotion captures.
// =============================================================================

std::uint64_t perft(const Position& position, std::uint8_t depth) {
  if (depth == 0) {
    return 1;
  }

  const MoveList moves = position.legal_moves();
  if (depth == 1) {
    return moves.size();
  }

  std::uint64_t nodes = 0;
  for (const auto& move : moves) {
    nodes += perft(position.make_move(move), static_cast<std::uint8_t>(depth - 1));
  }
  return nodes;
}

} // namespace chesslib
