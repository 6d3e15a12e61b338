#include "chesslib/game_history.hpp"

#include <sstream>
#include <utility>

#include "chesslib/notation.hpp"

namespace chesslib {
namespace {

constexpr std::size_t HISTORY_CAPACITY = 80;

} // namespace

GameHistory::GameHistory(Position start) {
  positions_.reserve(HISTORY_CAPACITY);
  moves_.reserve(HISTORY_CAPACITY);
  positions_.push_back(std::move(start));
}

void GameHistory::push(const Move& move, Position next) {
  moves_.push_back(MoveRecord{move, to_algebraic(positions_.back(), move, next)});
  positions_.push_back(std::move(next));
}

std::string GameHistory::to_string() const {
  std::ostringstream oss;

  // With Black first, the move number changes before White's moves.
  const bool black_first = start().side_to_move() == Colour::Black;
  if (black_first) {
    oss << start().full_move_number() << ". ... ";
  }

  for (std::size_t i = 0; i < moves_.size(); ++i) {
    const std::size_t ply = black_first ? i + 1 : i;
    if (ply % 2 == 0) {
      oss << start().full_move_number() + ply / 2 << '.';
    }
    oss << moves_[i].notation << ' ';
  }
  return oss.str();
}

} // namespace chesslib
