#pragma once

// =============================================================================
// PIECE PLACEMENT: Bitboards by Type and by Colour
// =============================================================================
//
// Piece placement is stored as eight bitboards plus their union:
//
//   - types_[6]:   one per piece type, both colours together
//   - colours_[2]: all white pieces, all black pieces
//   - combined_:   every occupied square
//
// "Where are the white knights?" is then a single AND:
//
//   types_[Knight] & colours_[White]
//
// and "what is on E4?" tests the square against at most six type boards.
//
// put_piece/clear_square keep all three views in sync. Hashing is layered on
// top by Position, which calls these whenever a piece appears or disappears.
//
// =============================================================================

#include <array>
#include <optional>

#include "chesslib/bitboard.hpp"
#include "chesslib/colour.hpp"
#include "chesslib/piece.hpp"
#include "chesslib/square.hpp"

namespace chesslib {

class Board {
public:
  [[nodiscard]] static constexpr Board empty() noexcept { return Board{}; }

  [[nodiscard]] Bitboard pieces(PieceType type) const noexcept {
    return types_[piece_type_index(type)];
  }
  [[nodiscard]] Bitboard pieces(Colour colour) const noexcept {
    return colours_[colour_index(colour)];
  }
  [[nodiscard]] Bitboard pieces(PieceType type, Colour colour) const noexcept {
    return pieces(type) & pieces(colour);
  }
  [[nodiscard]] Bitboard occupancy() const noexcept { return combined_; }

  [[nodiscard]] bool is_empty(Square square) const noexcept { return (combined_ & square) == 0; }

  [[nodiscard]] std::optional<PieceType> piece_type_at(Square square) const noexcept {
    if (is_empty(square)) {
      return std::nullopt;
    }
    for (const auto type : ALL_PIECE_TYPES) {
      if ((pieces(type) & square) != 0) {
        return type;
      }
    }
    return std::nullopt;
  }

  [[nodiscard]] std::optional<Colour> colour_at(Square square) const noexcept {
    if ((pieces(Colour::White) & square) != 0) {
      return Colour::White;
    }
    if ((pieces(Colour::Black) & square) != 0) {
      return Colour::Black;
    }
    return std::nullopt;
  }

  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    const auto type = piece_type_at(square);
    const auto colour = colour_at(square);
    if (!type.has_value() || !colour.has_value()) {
      return std::nullopt;
    }
    return Piece{*type, *colour};
  }

  /// Precondition: the square is empty.
  void put_piece(Piece piece, Square square) noexcept {
    types_[piece_type_index(piece.type)] |= square;
    colours_[colour_index(piece.colour)] |= square;
    combined_ |= square;
  }

  /// Returns the piece that stood on the square, if any.
  std::optional<Piece> clear_square(Square square) noexcept {
    const auto piece = piece_at(square);
    if (!piece.has_value()) {
      return std::nullopt;
    }

    const Bitboard mask = ~Bitboard(square);
    types_[piece_type_index(piece->type)] &= mask;
    colours_[colour_index(piece->colour)] &= mask;
    combined_ &= mask;
    return piece;
  }

  friend bool operator==(const Board& lhs, const Board& rhs) = default;

private:
  std::array<Bitboard, PIECE_TYPES_NUMBER> types_{};
  std::array<Bitboard, COLOURS_NUMBER> colours_{};
  Bitboard combined_{EMPTY};
};

} // namespace chesslib
