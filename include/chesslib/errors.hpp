#pragma once

// =============================================================================
// ERRORS
// =============================================================================
//
// Every fallible public operation reports failure by throwing one of the
// exceptions below. Each family carries a kind enum so callers can tell which
// rule was broken without parsing the message:
//
//   CoordinateError   bad file/rank/square text or out-of-range index
//   MoveParseError    malformed move text
//   FenParseError     malformed position string (carries the string)
//   PositionError     a well-formed string describing an impossible position
//   IllegalMoveError  applying a move the position does not allow
//   GameError         acting out of turn in the game protocol
//
// =============================================================================

#include <stdexcept>
#include <string>
#include <string_view>

namespace chesslib {

class Error : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

enum class CoordinateErrorKind {
  InvalidFileIndex,
  InvalidFileName,
  InvalidRankIndex,
  InvalidRankName,
  InvalidSquareIndex,
  InvalidSquareName,
};

enum class MoveParseErrorKind {
  InvalidLength,
  InvalidSquare,
  InvalidPiece,
  InvalidPromotion,
};

enum class PositionErrorKind {
  ColoursOverlap,
  PieceTypesOverlap,
  InconsistentOccupancy,
  InvalidKingCount,
  OpponentInCheck,
  InconsistentEnPassant,
  InconsistentCastlingRights,
};

enum class GameErrorKind {
  GameAlreadyFinished,
  DrawOfferNotDetected,
  DrawOfferNeedsAnswer,
};

std::string_view to_string(CoordinateErrorKind kind);
std::string_view to_string(MoveParseErrorKind kind);
std::string_view to_string(PositionErrorKind kind);
std::string_view to_string(GameErrorKind kind);

class CoordinateError : public Error {
public:
  CoordinateError(CoordinateErrorKind kind, std::string_view input);

  [[nodiscard]] CoordinateErrorKind kind() const noexcept { return kind_; }

private:
  CoordinateErrorKind kind_;
};

class MoveParseError : public Error {
public:
  MoveParseError(MoveParseErrorKind kind, std::string_view text);

  [[nodiscard]] MoveParseErrorKind kind() const noexcept { return kind_; }
  [[nodiscard]] const std::string& text() const noexcept { return text_; }

private:
  MoveParseErrorKind kind_;
  std::string text_;
};

class FenParseError : public Error {
public:
  FenParseError(std::string_view fen, const std::string& detail);

  [[nodiscard]] const std::string& fen() const noexcept { return fen_; }

private:
  std::string fen_;
};

class PositionError : public Error {
public:
  explicit PositionError(PositionErrorKind kind);

  [[nodiscard]] PositionErrorKind kind() const noexcept { return kind_; }

private:
  PositionErrorKind kind_;
};

class IllegalMoveError : public Error {
public:
  explicit IllegalMoveError(const std::string& move_text);

  [[nodiscard]] const std::string& move_text() const noexcept { return move_text_; }

private:
  std::string move_text_;
};

class GameError : public Error {
public:
  explicit GameError(GameErrorKind kind);

  [[nodiscard]] GameErrorKind kind() const noexcept { return kind_; }

private:
  GameErrorKind kind_;
};

} // namespace chesslib
