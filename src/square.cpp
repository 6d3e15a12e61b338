#include "chesslib/square.hpp"

#include <string>

#include "chesslib/errors.hpp"

namespace chesslib {

File file_from_index(int index) {
  if (index < 0 || index >= FILES_NUMBER) {
    throw CoordinateError(CoordinateErrorKind::InvalidFileIndex, std::to_string(index));
  }
  return static_cast<File>(index);
}

Rank rank_from_index(int index) {
  if (index < 0 || index >= RANKS_NUMBER) {
    throw CoordinateError(CoordinateErrorKind::InvalidRankIndex, std::to_string(index));
  }
  return static_cast<Rank>(index);
}

File file_from_char(char name) {
  if (name < 'a' || name > 'h') {
    throw CoordinateError(CoordinateErrorKind::InvalidFileName, std::string(1, name));
  }
  return static_cast<File>(name - 'a');
}

Rank rank_from_char(char name) {
  if (name < '1' || name > '8') {
    throw CoordinateError(CoordinateErrorKind::InvalidRankName, std::string(1, name));
  }
  return static_cast<Rank>(name - '1');
}

Square Square::at(int index) {
  if (index < 0 || index >= SQUARES_NUMBER) {
    throw CoordinateError(CoordinateErrorKind::InvalidSquareIndex, std::to_string(index));
  }
  return Square(static_cast<std::uint8_t>(index));
}

Square Square::from_string(std::string_view algebraic) {
  if (algebraic.size() != 2) {
    throw CoordinateError(CoordinateErrorKind::InvalidSquareName, algebraic);
  }
  return from_file_and_rank(file_from_char(algebraic[0]), rank_from_char(algebraic[1]));
}

} // namespace chesslib
