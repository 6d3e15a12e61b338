#include "chesslib/notation.hpp"


namespace chesslib {
namespace {

std::string check_suffix(const MoveAnnotation& annotation) {
  if (annotation.is_checkmate) {
    return "#";
  }
  return annotation.is_check ? "+" : "";
}

} // namespace

MoveAnnotation annotate(const Position& before, const Move& move) {
  return annotate(before, move, before.make_move(move));
}

MoveAnnotation annotate(const Position& before, const Move& move, const Position& after) {
  MoveAnnotation annotation;
  annotation.is_check = after.is_check();
  annotation.is_checkmate = after.status() == BoardStatus::Checkmate;

  if (const auto& piece_move = move.piece_move(); move.kind() == MoveKind::Piece) {
    const bool takes_en_passant = piece_move->piece_type == PieceType::Pawn &&
                                  before.en_passant() == piece_move->to &&
                                  piece_move->from.file() != piece_move->to.file();
    annotation.is_capture = !before.is_empty(piece_move->to) || takes_en_passant;
    annotation.ambiguity = before.legal_move_ambiguity(*piece_move);
  }

  return annotation;
}

std::string to_algebraic(const Position& before, const Move& move) {
  return to_algebraic(before, move, before.make_move(move));
}

std::string to_algebraic(const Position& before, const Move& move, const Position& after) {
  const MoveAnnotation annotation = annotate(before, move, after);

  switch (move.kind()) {
  case MoveKind::CastleKingSide:
    return "O-O" + check_suffix(annotation);
  case MoveKind::CastleQueenSide:
    return "O-O-O" + check_suffix(annotation);
  case MoveKind::Piece:
    break;
  }

  const PieceMove& piece_move = *move.piece_move();
  std::string output;
  if (piece_move.piece_type != PieceType::Pawn) {
    output.push_back(to_char(piece_move.piece_type));
  }

  switch (annotation.ambiguity) {
  case AmbiguityType::Neither:
    break;
  case AmbiguityType::ExtraFile:
    output.push_back(to_char(piece_move.from.file()));
    break;
  case AmbiguityType::ExtraSquare:
    output += piece_move.from.to_string();
    break;
  }

  if (annotation.is_capture) {
    output.push_back('x');
  }
  output += piece_move.to.to_string();

  if (piece_move.promotion.has_value()) {
    output.push_back('=');
    output.push_back(to_char(*piece_move.promotion));
  }

  return output + check_suffix(annotation);
}

} // namespace chesslib
