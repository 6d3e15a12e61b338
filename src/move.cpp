#include "chesslib/move.hpp"

#include "chesslib/errors.hpp"

namespace chesslib {

namespace {

constexpr std::string_view CASTLE_KING_SIDE_TEXT = "O-O";
constexpr std::string_view CASTLE_QUEEN_SIDE_TEXT = "O-O-O";

// "<from><to>" with an optional leading piece letter.
constexpr std::size_t BARE_BODY_LENGTH = 4;

std::optional<PieceType> parse_promotion(std::string_view text, std::string_view& body) {
  if (body.size() < 2 || body[body.size() - 2] != '=') {
    return std::nullopt;
  }

  const char letter = body.back();
  const auto type = piece_type_from_char(letter);
  if (!type.has_value() || letter != to_char(*type) || !is_promotion_type(*type)) {
    throw MoveParseError(MoveParseErrorKind::InvalidPromotion, text);
  }

  body.remove_suffix(2);
  return type;
}

Square parse_square(std::string_view text, std::string_view algebraic) {
  const auto square = Square::parse(algebraic);
  if (!square.has_value()) {
    throw MoveParseError(MoveParseErrorKind::InvalidSquare, text);
  }
  return *square;
}

} // namespace

std::string PieceMove::to_string() const {
  std::string output;
  if (piece_type != PieceType::Pawn) {
    output.push_back(to_char(piece_type));
  }
  output += from.to_string();
  output += to.to_string();
  if (promotion.has_value()) {
    output.push_back('=');
    output.push_back(to_char(*promotion));
  }
  return output;
}

Move Move::parse(std::string_view text) {
  if (text == CASTLE_KING_SIDE_TEXT) {
    return castle_king_side();
  }
  if (text == CASTLE_QUEEN_SIDE_TEXT) {
    return castle_queen_side();
  }

  std::string_view body = text;
  const auto promotion = parse_promotion(text, body);

  PieceType piece_type = PieceType::Pawn;
  if (body.size() == BARE_BODY_LENGTH + 1) {
    const auto type = piece_type_from_char(body.front());
    // Piece letters are upper case; lower case would read as a file.
    if (!type.has_value() || body.front() != to_char(*type)) {
      throw MoveParseError(MoveParseErrorKind::InvalidPiece, text);
    }
    piece_type = *type;
    body.remove_prefix(1);
  } else if (body.size() != BARE_BODY_LENGTH) {
    throw MoveParseError(MoveParseErrorKind::InvalidLength, text);
  }

  const Square from = parse_square(text, body.substr(0, 2));
  const Square to = parse_square(text, body.substr(2, 2));
  return piece(piece_type, from, to, promotion);
}

std::string Move::to_string() const {
  switch (kind_) {
  case MoveKind::CastleKingSide:
    return std::string(CASTLE_KING_SIDE_TEXT);
  case MoveKind::CastleQueenSide:
    return std::string(CASTLE_QUEEN_SIDE_TEXT);
  case MoveKind::Piece:
    break;
  }
  return piece_move_->to_string();
}

} // namespace chesslib
