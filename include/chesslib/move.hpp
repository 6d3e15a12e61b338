#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "chesslib/piece.hpp"
#include "chesslib/square.hpp"

namespace chesslib {

enum class MoveKind : std::uint8_t {
  Piece,
  CastleKingSide,
  CastleQueenSide,
};

// Moving one piece from a source to a destination square. Captures and
// en passant are implied by the board the move is played on.
struct PieceMove {
  PieceType piece_type{PieceType::Pawn};
  Square from{};
  Square to{};
  std::optional<PieceType> promotion{};

  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(const PieceMove& lhs, const PieceMove& rhs) = default;
};

// A move carries no board-dependent metadata; see notation.hpp for that.
class Move {
public:
  constexpr Move() = default;

  [[nodiscard]] static constexpr Move piece(PieceType piece_type, Square from, Square to,
                                            std::optional<PieceType> promotion = std::nullopt) {
    return Move(MoveKind::Piece, PieceMove{piece_type, from, to, promotion});
  }

  [[nodiscard]] static constexpr Move piece(const PieceMove& piece_move) {
    return Move(MoveKind::Piece, piece_move);
  }

  [[nodiscard]] static constexpr Move castle_king_side() {
    return Move(MoveKind::CastleKingSide, std::nullopt);
  }

  [[nodiscard]] static constexpr Move castle_queen_side() {
    return Move(MoveKind::CastleQueenSide, std::nullopt);
  }

  /// Parses "e2e4", "Ng1f3", "e7e8=Q", "O-O" or "O-O-O".
  /// Throws MoveParseError.
  [[nodiscard]] static Move parse(std::string_view text);

  [[nodiscard]] constexpr MoveKind kind() const noexcept { return kind_; }
  [[nodiscard]] constexpr bool is_castling() const noexcept { return kind_ != MoveKind::Piece; }

  /// Empty for castling moves.
  [[nodiscard]] constexpr const std::optional<PieceMove>& piece_move() const noexcept {
    return piece_move_;
  }

  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(const Move& lhs, const Move& rhs) = default;

private:
  constexpr Move(MoveKind kind, std::optional<PieceMove> piece_move)
      : kind_(kind), piece_move_(piece_move) {}

  MoveKind kind_{MoveKind::Piece};
  std::optional<PieceMove> piece_move_{PieceMove{}};
};

using MoveList = std::vector<Move>;

inline std::ostream& operator<<(std::ostream& os, const PieceMove& piece_move) {
  return os << piece_move.to_string();
}

inline std::ostream& operator<<(std::ostream& os, const Move& move) {
  return os << move.to_string();
}

} // namespace chesslib

template <>
struct std::hash<chesslib::Move> {
  std::size_t operator()(const chesslib::Move& move) const noexcept {
    std::size_t value = static_cast<std::size_t>(move.kind());
    if (const auto& piece_move = move.piece_move(); piece_move.has_value()) {
      value = (value << 3) | chesslib::piece_type_index(piece_move->piece_type);
      value = (value << 6) | piece_move->from.index();
      value = (value << 6) | piece_move->to.index();
      value = (value << 3) |
              (piece_move->promotion.has_value()
                   ? chesslib::piece_type_index(*piece_move->promotion) + 1
                   : 0);
    }
    return value;
  }
};
