#pragma once

// =============================================================================
// GAME: Action Protocol and Status Transitions
// =============================================================================
//
// A game owns the current position and reacts to player actions:
//
//   MakeMove(m)   plays m; the game may end by checkmate, stalemate or a
//                 third occurrence of the same position
//   OfferDraw     leaves the status alone but must be answered next
//   AcceptDraw    ends the game by agreement
//   DeclineDraw   the game continues
//   Resign        the side to move loses
//
// Occurrences are counted by position hash, so two positions with the same
// placement, side, rights and en passant file count as the same position.
// The starting position counts as the first occurrence of itself.
//
// =============================================================================

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "chesslib/colour.hpp"
#include "chesslib/game_history.hpp"
#include "chesslib/move.hpp"
#include "chesslib/position.hpp"
#include "chesslib/zobrist.hpp"

namespace chesslib {

enum class GameStatusKind : std::uint8_t {
  Ongoing,
  CheckMated,
  Resigned,
  RepetitionDrawDeclared,
  DrawAccepted,
  Stalemate,
};

class GameStatus {
public:
  constexpr GameStatus() = default;

  static constexpr GameStatus ongoing() { return GameStatus(GameStatusKind::Ongoing); }
  static constexpr GameStatus check_mated(Colour loser) {
    return GameStatus(GameStatusKind::CheckMated, loser);
  }
  static constexpr GameStatus resigned(Colour loser) {
    return GameStatus(GameStatusKind::Resigned, loser);
  }
  static constexpr GameStatus repetition_draw() {
    return GameStatus(GameStatusKind::RepetitionDrawDeclared);
  }
  static constexpr GameStatus draw_accepted() { return GameStatus(GameStatusKind::DrawAccepted); }
  static constexpr GameStatus stalemate() { return GameStatus(GameStatusKind::Stalemate); }

  [[nodiscard]] constexpr GameStatusKind kind() const noexcept { return kind_; }
  [[nodiscard]] constexpr bool is_ongoing() const noexcept {
    return kind_ == GameStatusKind::Ongoing;
  }
  // The side that lost, for CheckMated and Resigned.
  [[nodiscard]] constexpr std::optional<Colour> colour() const noexcept { return colour_; }

  [[nodiscard]] std::string to_string() const;

  friend constexpr bool operator==(const GameStatus& lhs, const GameStatus& rhs) = default;

private:
  constexpr explicit GameStatus(GameStatusKind kind, std::optional<Colour> colour = std::nullopt)
      : kind_(kind), colour_(colour) {}

  GameStatusKind kind_{GameStatusKind::Ongoing};
  std::optional<Colour> colour_{};
};

inline std::ostream& operator<<(std::ostream& os, const GameStatus& status) {
  return os << status.to_string();
}

enum class ActionKind : std::uint8_t {
  MakeMove,
  OfferDraw,
  AcceptDraw,
  DeclineDraw,
  Resign,
};

class Action {
public:
  static constexpr Action make_move(const Move& move) { return Action(ActionKind::MakeMove, move); }
  static constexpr Action offer_draw() { return Action(ActionKind::OfferDraw); }
  static constexpr Action accept_draw() { return Action(ActionKind::AcceptDraw); }
  static constexpr Action decline_draw() { return Action(ActionKind::DeclineDraw); }
  static constexpr Action resign() { return Action(ActionKind::Resign); }

  [[nodiscard]] constexpr ActionKind kind() const noexcept { return kind_; }
  // Set only for MakeMove.
  [[nodiscard]] constexpr const std::optional<Move>& move() const noexcept { return move_; }

  friend constexpr bool operator==(const Action& lhs, const Action& rhs) = default;

private:
  constexpr explicit Action(ActionKind kind, std::optional<Move> move = std::nullopt)
      : kind_(kind), move_(move) {}

  ActionKind kind_;
  std::optional<Move> move_;
};

class Game {
public:
  // A game from the standard starting position.
  Game();
  explicit Game(Position start);

  // Throws FenParseError or PositionError.
  static Game from_fen(std::string_view fen);

  // Applies one action. Throws GameError when the protocol forbids it and
  // IllegalMoveError for an illegal move; either way the game is unchanged.
  Game& apply(const Action& action);

  Game& make_move(const Move& move) { return apply(Action::make_move(move)); }
  Game& offer_draw() { return apply(Action::offer_draw()); }
  Game& accept_draw() { return apply(Action::accept_draw()); }
  Game& decline_draw() { return apply(Action::decline_draw()); }
  Game& resign() { return apply(Action::resign()); }

  [[nodiscard]] const Position& position() const noexcept { return history_.last(); }
  [[nodiscard]] const GameHistory& history() const noexcept { return history_; }
  [[nodiscard]] const std::vector<Action>& actions() const noexcept { return actions_; }
  [[nodiscard]] GameStatus status() const noexcept { return status_; }
  [[nodiscard]] Colour side_to_move() const noexcept { return position().side_to_move(); }

  // How many times the position has occurred in this game.
  [[nodiscard]] std::size_t occurrences(const Position& position) const;

  // True when the last action was an unanswered draw offer.
  [[nodiscard]] bool is_draw_offered() const noexcept;

  [[nodiscard]] MoveList legal_moves() const { return position().legal_moves(); }

  // Reported for callers; neither ends the game by itself.
  [[nodiscard]] bool is_fifty_move_rule_reached() const noexcept;
  [[nodiscard]] bool is_theoretical_draw() const noexcept { return position().is_theoretical_draw(); }

private:
  void check_allowed(const Action& action) const;
  void play(const Move& move);
  void update_status_after_move();

  GameHistory history_;
  std::vector<Action> actions_;
  std::unordered_map<PositionHash, std::size_t> occurrences_;
  GameStatus status_;
};

} // namespace chesslib
