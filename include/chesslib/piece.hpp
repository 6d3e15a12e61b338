#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>

#include "chesslib/colour.hpp"

namespace chesslib {

/// Piece types, in the order used to index the per-type bitboards.
/// Letters: P = Pawn, N = Knight (N to avoid confusion with King),
///          B = Bishop, R = Rook, Q = Queen, K = King
enum class PieceType : std::uint8_t {
  Pawn,
  Knight,
  Bishop,
  Rook,
  Queen,
  King,
};

inline constexpr std::size_t PIECE_TYPES_NUMBER = 6;

inline constexpr std::array<PieceType, PIECE_TYPES_NUMBER> ALL_PIECE_TYPES = {
    PieceType::Pawn, PieceType::Knight, PieceType::Bishop,
    PieceType::Rook, PieceType::Queen,  PieceType::King,
};

// Generation order for promotions.
inline constexpr std::array<PieceType, 4> PROMOTION_TYPES = {
    PieceType::Knight,
    PieceType::Bishop,
    PieceType::Rook,
    PieceType::Queen,
};

constexpr std::size_t piece_type_index(PieceType type) {
  return static_cast<std::size_t>(type);
}

constexpr bool is_slider(PieceType type) {
  return type == PieceType::Bishop || type == PieceType::Rook || type == PieceType::Queen;
}

constexpr bool is_promotion_type(PieceType type) {
  return type != PieceType::Pawn && type != PieceType::King;
}

// Upper-case letter of the piece type.
constexpr char to_char(PieceType type) {
  switch (type) {
  case PieceType::Pawn:
    return 'P';
  case PieceType::Knight:
    return 'N';
  case PieceType::Bishop:
    return 'B';
  case PieceType::Rook:
    return 'R';
  case PieceType::Queen:
    return 'Q';
  case PieceType::King:
    return 'K';
  }
  return '?';
}

// Accepts either case.
constexpr std::optional<PieceType> piece_type_from_char(char letter) {
  switch (letter) {
  case 'P':
  case 'p':
    return PieceType::Pawn;
  case 'N':
  case 'n':
    return PieceType::Knight;
  case 'B':
  case 'b':
    return PieceType::Bishop;
  case 'R':
  case 'r':
    return PieceType::Rook;
  case 'Q':
  case 'q':
    return PieceType::Queen;
  case 'K':
  case 'k':
    return PieceType::King;
  default:
    return std::nullopt;
  }
}

struct Piece {
  PieceType type{PieceType::Pawn};
  Colour colour{Colour::White};

  friend constexpr bool operator==(const Piece& lhs, const Piece& rhs) = default;
};

// FEN letter: upper case for White, lower case for Black.
constexpr char to_char(Piece piece) {
  const char letter = to_char(piece.type);
  return piece.colour == Colour::White ? letter : static_cast<char>(letter - 'A' + 'a');
}

constexpr std::optional<Piece> piece_from_char(char letter) {
  const auto type = piece_type_from_char(letter);
  if (!type.has_value()) {
    return std::nullopt;
  }
  const Colour colour = (letter >= 'A' && letter <= 'Z') ? Colour::White : Colour::Black;
  return Piece{*type, colour};
}

inline std::string to_string(Piece piece) {
  return std::string(1, to_char(piece));
}

inline std::ostream& operator<<(std::ostream& os, PieceType type) {
  return os << to_char(type);
}

inline std::ostream& operator<<(std::ostream& os, Piece piece) {
  return os << to_char(piece);
}

} // namespace chesslib
