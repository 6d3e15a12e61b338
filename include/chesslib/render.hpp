#pragma once

#include <ostream>
#include <string>

#include "chesslib/bitboard.hpp"
#include "chesslib/position.hpp"

namespace chesslib {

struct RenderOptions {
  // Rank 1 at the top and the h-file on the left.
  bool flipped{false};
  // ANSI background on light squares.
  bool shading{true};
};

// Header with side to move and castling rights, a framed 8x8 grid with rank
// labels, and a file footer.
void render(std::ostream& os, const Position& position, RenderOptions options = {});
[[nodiscard]] std::string render_to_string(const Position& position, RenderOptions options = {});

// One row per rank, rank 8 first, "X " for members and ". " otherwise.
[[nodiscard]] std::string render_bitboard(Bitboard bitboard);

std::ostream& operator<<(std::ostream& os, const Position& position);

} // namespace chesslib
