#include "chesslib/errors.hpp"

namespace chesslib {

std::string_view to_string(CoordinateErrorKind kind) {
  switch (kind) {
  case CoordinateErrorKind::InvalidFileIndex:
    return "invalid file index";
  case CoordinateErrorKind::InvalidFileName:
    return "invalid file name";
  case CoordinateErrorKind::InvalidRankIndex:
    return "invalid rank index";
  case CoordinateErrorKind::InvalidRankName:
    return "invalid rank name";
  case CoordinateErrorKind::InvalidSquareIndex:
    return "invalid square index";
  case CoordinateErrorKind::InvalidSquareName:
    return "invalid square name";
  }
  return "invalid coordinate";
}

std::string_view to_string(MoveParseErrorKind kind) {
  switch (kind) {
  case MoveParseErrorKind::InvalidLength:
    return "invalid move length";
  case MoveParseErrorKind::InvalidSquare:
    return "invalid move square";
  case MoveParseErrorKind::InvalidPiece:
    return "invalid move piece";
  case MoveParseErrorKind::InvalidPromotion:
    return "invalid promotion piece";
  }
  return "invalid move";
}

std::string_view to_string(PositionErrorKind kind) {
  switch (kind) {
  case PositionErrorKind::ColoursOverlap:
    return "colours overlap";
  case PositionErrorKind::PieceTypesOverlap:
    return "piece types overlap";
  case PositionErrorKind::InconsistentOccupancy:
    return "combined occupancy is not self-consistent";
  case PositionErrorKind::InvalidKingCount:
    return "each side must have exactly one king";
  case PositionErrorKind::OpponentInCheck:
    return "side not to move is in check";
  case PositionErrorKind::InconsistentEnPassant:
    return "en passant square has no pawn behind it";
  case PositionErrorKind::InconsistentCastlingRights:
    return "castling rights do not match king and rook placement";
  }
  return "invalid position";
}

std::string_view to_string(GameErrorKind kind) {
  switch (kind) {
  case GameErrorKind::GameAlreadyFinished:
    return "game is already finished";
  case GameErrorKind::DrawOfferNotDetected:
    return "no draw offer to answer";
  case GameErrorKind::DrawOfferNeedsAnswer:
    return "draw offer needs an answer";
  }
  return "invalid game action";
}

CoordinateError::CoordinateError(CoordinateErrorKind kind, std::string_view input)
    : Error(std::string(to_string(kind)) + " '" + std::string(input) + "'"), kind_(kind) {}

MoveParseError::MoveParseError(MoveParseErrorKind kind, std::string_view text)
    : Error(std::string(to_string(kind)) + " '" + std::string(text) + "'"), kind_(kind),
      text_(text) {}

FenParseError::FenParseError(std::string_view fen, const std::string& detail)
    : Error("invalid FEN '" + std::string(fen) + "': " + detail), fen_(fen) {}

PositionError::PositionError(PositionErrorKind kind)
    : Error("invalid position: " + std::string(to_string(kind))), kind_(kind) {}

IllegalMoveError::IllegalMoveError(const std::string& move_text)
    : Error("illegal move '" + move_text + "'"), move_text_(move_text) {}

GameError::GameError(GameErrorKind kind) : Error(std::string(to_string(kind))), kind_(kind) {}

} // namespace chesslib
