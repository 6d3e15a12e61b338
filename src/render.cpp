#include "chesslib/render.hpp"

#include <sstream>
#include <string_view>

namespace chesslib {
namespace {

constexpr std::string_view LIGHT_BACKGROUND = "\x1b[47m";
constexpr std::string_view LIGHT_BACKGROUND_DARK_TEXT = "\x1b[47;30m";
constexpr std::string_view RESET = "\x1b[0m";

constexpr std::string_view TOP_FRAME = "   ╔════════════════════════╗";
constexpr std::string_view BOTTOM_FRAME = "   ╚════════════════════════╝";
constexpr std::string_view FOOTER = "     a  b  c  d  e  f  g  h";
constexpr std::string_view FLIPPED_FOOTER = "     h  g  f  e  d  c  b  a";

void render_square(std::ostream& os, const Position& position, Square square, bool shading) {
  std::string cell = "   ";
  const auto piece = position.piece_at(square);
  if (piece.has_value()) {
    cell[1] = to_char(*piece);
  }

  if (!shading || !square.is_light()) {
    os << cell;
    return;
  }
  os << (piece.has_value() ? LIGHT_BACKGROUND_DARK_TEXT : LIGHT_BACKGROUND) << cell << RESET;
}

} // namespace

void render(std::ostream& os, const Position& position, RenderOptions options) {
  os << "   " << position.side_to_move() << "  "
     << to_string(position.castling_rights(Colour::White), Colour::White)
     << to_string(position.castling_rights(Colour::Black), Colour::Black) << '\n';
  os << TOP_FRAME << '\n';

  for (int row = 0; row < RANKS_NUMBER; ++row) {
    const int rank = options.flipped ? row : RANKS_NUMBER - 1 - row;
    os << rank + 1 << "  ║";

    for (int column = 0; column < FILES_NUMBER; ++column) {
      const int file = options.flipped ? FILES_NUMBER - 1 - column : column;
      render_square(os, position,
                    Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                               static_cast<std::uint8_t>(rank)),
                    options.shading);
    }
    os << "║\n";
  }

  os << BOTTOM_FRAME << '\n';
  os << (options.flipped ? FLIPPED_FOOTER : FOOTER) << '\n';
}

std::string render_to_string(const Position& position, RenderOptions options) {
  std::ostringstream oss;
  render(oss, position, options);
  return oss.str();
}

std::string render_bitboard(Bitboard bitboard) {
  std::string output;
  output.reserve(SQUARES_NUMBER * 2 + RANKS_NUMBER);

  for (int rank = RANKS_NUMBER - 1; rank >= 0; --rank) {
    for (int file = 0; file < FILES_NUMBER; ++file) {
      const Square square = Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                                       static_cast<std::uint8_t>(rank));
      output += (bitboard & square) != 0 ? "X " : ". ";
    }
    output.push_back('\n');
  }
  return output;
}

std::ostream& operator<<(std::ostream& os, const Position& position) {
  render(os, position);
  return os;
}

} // namespace chesslib
