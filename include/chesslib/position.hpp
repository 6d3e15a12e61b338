#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "chesslib/bitboard.hpp"
#include "chesslib/board.hpp"
#include "chesslib/board_builder.hpp"
#include "chesslib/castling.hpp"
#include "chesslib/colour.hpp"
#include "chesslib/move.hpp"
#include "chesslib/piece.hpp"
#include "chesslib/square.hpp"
#include "chesslib/zobrist.hpp"

namespace chesslib {

enum class BoardStatus : std::uint8_t {
  Ongoing,
  Checkmate,
  Stalemate,
};

// How much of the source square a written move needs to be unambiguous.
enum class AmbiguityType : std::uint8_t {
  Neither,
  ExtraFile,
  ExtraSquare,
};

// A validated chess position. Instances are only produced by validated
// construction or by applying a legal move, and never change afterwards.
class Position {
public:
  // The standard starting position.
  Position();

  static Position startpos() { return Position(); }

  // Throws FenParseError for malformed text, PositionError for an impossible position.
  static Position from_fen(std::string_view fen);

  // Throws PositionError naming the first broken invariant.
  static Position from_builder(const BoardBuilder& builder);

  [[nodiscard]] BoardBuilder to_builder() const;
  [[nodiscard]] std::string to_fen() const;

  [[nodiscard]] const Board& board() const noexcept { return board_; }
  [[nodiscard]] Bitboard pieces(PieceType type) const noexcept { return board_.pieces(type); }
  [[nodiscard]] Bitboard pieces(Colour colour) const noexcept { return board_.pieces(colour); }
  [[nodiscard]] Bitboard pieces(PieceType type, Colour colour) const noexcept {
    return board_.pieces(type, colour);
  }
  [[nodiscard]] Bitboard occupancy() const noexcept { return board_.occupancy(); }
  [[nodiscard]] bool is_empty(Square square) const noexcept { return board_.is_empty(square); }
  [[nodiscard]] std::optional<PieceType> piece_type_at(Square square) const noexcept {
    return board_.piece_type_at(square);
  }
  [[nodiscard]] std::optional<Colour> colour_at(Square square) const noexcept {
    return board_.colour_at(square);
  }
  [[nodiscard]] std::optional<Piece> piece_at(Square square) const noexcept {
    return board_.piece_at(square);
  }
  [[nodiscard]] Square king_square(Colour colour) const;

  [[nodiscard]] Colour side_to_move() const noexcept { return side_to_move_; }
  [[nodiscard]] CastlingRights castling_rights(Colour colour) const noexcept {
    return castling_rights_[colour_index(colour)];
  }
  [[nodiscard]] std::optional<Square> en_passant() const noexcept { return en_passant_; }
  [[nodiscard]] std::uint32_t half_move_clock() const noexcept { return half_move_clock_; }
  [[nodiscard]] std::uint32_t full_move_number() const noexcept { return full_move_number_; }
  [[nodiscard]] PositionHash hash() const noexcept { return hash_; }

  // Enemy pieces giving check to the side to move.
  [[nodiscard]] Bitboard checkers() const noexcept { return checkers_; }
  // Pieces of the side to move pinned against their own king.
  [[nodiscard]] Bitboard pinned() const noexcept { return pinned_; }
  [[nodiscard]] bool is_check() const noexcept { return checkers_ != 0; }

  [[nodiscard]] bool is_legal_move(const Move& move) const;
  [[nodiscard]] MoveList legal_moves() const;

  // Returns the position after the move; throws IllegalMoveError.
  [[nodiscard]] Position make_move(const Move& move) const;

  // True when the side to move has no legal move.
  [[nodiscard]] bool is_terminal() const noexcept { return is_terminal_; }
  [[nodiscard]] BoardStatus status() const noexcept;

  // Neither side has more than a king and one minor piece.
  [[nodiscard]] bool is_theoretical_draw() const noexcept;

  // Throws IllegalMoveError when the move is not legal here.
  [[nodiscard]] AmbiguityType move_ambiguity(const PieceMove& piece_move) const;

  // Precondition: the move is legal here. Only the rivals are checked.
  [[nodiscard]] AmbiguityType legal_move_ambiguity(const PieceMove& piece_move) const;

  // True when the opponent of the side to move attacks the square.
  [[nodiscard]] bool is_under_attack(Square square) const;

  friend bool operator==(const Position& lhs, const Position& rhs) noexcept;

private:
  struct PinsAndChecks {
    Bitboard pinned{EMPTY};
    Bitboard checkers{EMPTY};
  };

  struct EmptyTag {};
  explicit Position(EmptyTag) noexcept {}

  void validate() const;

  // Mutators; each keeps hash_ in step with the feature it changes.
  void put_piece(Piece piece, Square square);
  void clear_square(Square square);
  void set_side_to_move(Colour colour);
  void set_castling_rights(Colour colour, CastlingRights rights);
  void set_en_passant(std::optional<Square> square);

  // Relocates the piece, including promotion and the en passant capture.
  void move_piece(const PieceMove& piece_move);
  void apply(const Move& move);
  void update_pins_and_checks();
  void update_terminal_status();

  [[nodiscard]] PinsAndChecks pins_and_checks(Square square, Colour defender) const;
  [[nodiscard]] Bitboard destinations(PieceType type, Square from) const;
  [[nodiscard]] bool leaves_king_safe(const PieceMove& piece_move) const;
  [[nodiscard]] bool is_legal_piece_move(const PieceMove& piece_move) const;
  [[nodiscard]] bool can_castle(MoveKind kind) const;
  [[nodiscard]] bool is_en_passant_capture(const PieceMove& piece_move) const noexcept;

  // Calls visitor(move) for each legal move until it returns false.
  // Returns false when the walk was stopped early.
  template <typename Visitor>
  bool for_each_legal_move(Visitor&& visitor) const;

  Board board_{};
  Colour side_to_move_{Colour::White};
  std::array<CastlingRights, COLOURS_NUMBER> castling_rights_{};
  std::optional<Square> en_passant_{};
  std::uint32_t half_move_clock_{0};
  std::uint32_t full_move_number_{1};
  Bitboard pinned_{EMPTY};
  Bitboard checkers_{EMPTY};
  bool is_terminal_{false};
  PositionHash hash_{0};
};

std::ostream& operator<<(std::ostream& os, BoardStatus status);
std::ostream& operator<<(std::ostream& os, AmbiguityType ambiguity);

} // namespace chesslib
