#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "chesslib/castling.hpp"
#include "chesslib/colour.hpp"
#include "chesslib/piece.hpp"
#include "chesslib/square.hpp"

namespace chesslib {

// Unchecked staging area for a position. Anything can be written here; only
// Position::from_builder decides whether it describes a legal position.
class BoardBuilder {
public:
  // Standard starting position FEN.
  inline static constexpr std::string_view START_POS_FEN =
      "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1";

  // Empty board, white to move, no rights, counters 0 and 1.
  BoardBuilder() = default;

  static BoardBuilder startpos() { return from_fen(START_POS_FEN); }

  // Parse the six FEN fields, throwing FenParseError on malformed input.
  static BoardBuilder from_fen(std::string_view fen);

  [[nodiscard]] std::string to_fen() const;

  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    return squares_[square.index()];
  }
  [[nodiscard]] std::optional<Piece> operator[](Square square) const noexcept {
    return piece_at(square);
  }
  BoardBuilder& set_piece(Square square, std::optional<Piece> piece) noexcept {
    squares_[square.index()] = piece;
    return *this;
  }
  BoardBuilder& clear() noexcept {
    squares_.fill(std::nullopt);
    return *this;
  }

  [[nodiscard]] Colour side_to_move() const noexcept { return side_to_move_; }
  BoardBuilder& set_side_to_move(Colour colour) noexcept {
    side_to_move_ = colour;
    return *this;
  }

  [[nodiscard]] CastlingRights castling_rights(Colour colour) const noexcept {
    return castling_rights_[colour_index(colour)];
  }
  BoardBuilder& set_castling_rights(Colour colour, CastlingRights rights) noexcept {
    castling_rights_[colour_index(colour)] = rights;
    return *this;
  }

  [[nodiscard]] std::optional<Square> en_passant() const noexcept { return en_passant_; }
  BoardBuilder& set_en_passant(std::optional<Square> square) noexcept {
    en_passant_ = square;
    return *this;
  }

  [[nodiscard]] std::uint32_t half_move_clock() const noexcept { return half_move_clock_; }
  BoardBuilder& set_half_move_clock(std::uint32_t value) noexcept {
    half_move_clock_ = value;
    return *this;
  }

  [[nodiscard]] std::uint32_t full_move_number() const noexcept { return full_move_number_; }
  BoardBuilder& set_full_move_number(std::uint32_t value) noexcept {
    full_move_number_ = value;
    return *this;
  }

  friend bool operator==(const BoardBuilder& lhs, const BoardBuilder& rhs) = default;

private:
  std::array<std::optional<Piece>, SQUARES_NUMBER> squares_{};
  Colour side_to_move_{Colour::White};
  std::array<CastlingRights, COLOURS_NUMBER> castling_rights_{};
  std::optional<Square> en_passant_{};
  std::uint32_t half_move_clock_{0};
  std::uint32_t full_move_number_{1};
};

inline std::ostream& operator<<(std::ostream& os, const BoardBuilder& builder) {
  return os << builder.to_fen();
}

} // namespace chesslib
