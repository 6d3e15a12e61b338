#include "chesslib/game.hpp"

#include <utility>

#include "chesslib/errors.hpp"

namespace chesslib {
namespace {

constexpr std::size_t REPETITIONS_FOR_DRAW = 3;
constexpr std::uint32_t FIFTY_MOVE_RULE_PLIES = 100;

} // namespace

std::string GameStatus::to_string() const {
  switch (kind_) {
  case GameStatusKind::Ongoing:
    return "the game is ongoing";
  case GameStatusKind::CheckMated:
    return std::string(chesslib::to_string(!*colour_)) + " won by checkmate";
  case GameStatusKind::Resigned:
    return std::string(chesslib::to_string(!*colour_)) + " won by resignation";
  case GameStatusKind::RepetitionDrawDeclared:
    return "draw declared by repetition of moves";
  case GameStatusKind::DrawAccepted:
    return "draw declared by agreement";
  case GameStatusKind::Stalemate:
    return "stalemate";
  }
  return {};
}

Game::Game() : Game(Position::startpos()) {}

Game::Game(Position start) : history_(std::move(start)) {
  occurrences_[position().hash()] = 1;
  update_status_after_move();
}

Game Game::from_fen(std::string_view fen) {
  return Game(Position::from_fen(fen));
}

std::size_t Game::occurrences(const Position& position) const {
  const auto it = occurrences_.find(position.hash());
  return it == occurrences_.end() ? 0 : it->second;
}

bool Game::is_draw_offered() const noexcept {
  return !actions_.empty() && actions_.back().kind() == ActionKind::OfferDraw;
}

bool Game::is_fifty_move_rule_reached() const noexcept {
  return position().half_move_clock() >= FIFTY_MOVE_RULE_PLIES;
}

void Game::check_allowed(const Action& action) const {
  if (!status_.is_ongoing()) {
    throw GameError(GameErrorKind::GameAlreadyFinished);
  }

  switch (action.kind()) {
  case ActionKind::MakeMove:
  case ActionKind::OfferDraw:
    if (is_draw_offered()) {
      throw GameError(GameErrorKind::DrawOfferNeedsAnswer);
    }
    break;
  case ActionKind::AcceptDraw:
  case ActionKind::DeclineDraw:
    if (!is_draw_offered()) {
      throw GameError(GameErrorKind::DrawOfferNotDetected);
    }
    break;
  case ActionKind::Resign:
    break;
  }
}

Game& Game::apply(const Action& action) {
  check_allowed(action);

  switch (action.kind()) {
  case ActionKind::MakeMove:
    play(*action.move());
    break;
  case ActionKind::OfferDraw:
  case ActionKind::DeclineDraw:
    break;
  case ActionKind::AcceptDraw:
    status_ = GameStatus::draw_accepted();
    break;
  case ActionKind::Resign:
    status_ = GameStatus::resigned(side_to_move());
    break;
  }

  actions_.push_back(action);
  return *this;
}

void Game::play(const Move& move) {
  // Throws before anything is recorded.
  Position next = position().make_move(move);

  ++occurrences_[next.hash()];
  history_.push(move, std::move(next));
  update_status_after_move();
}

void Game::update_status_after_move() {
  const Position& current = position();
  switch (current.status()) {
  case BoardStatus::Checkmate:
    status_ = GameStatus::check_mated(current.side_to_move());
    return;
  case BoardStatus::Stalemate:
    status_ = GameStatus::stalemate();
    return;
  case BoardStatus::Ongoing:
    break;
  }

  status_ = occurrences(current) >= REPETITIONS_FOR_DRAW ? GameStatus::repetition_draw()
                                                         : GameStatus::ongoing();
}

} // namespace chesslib
