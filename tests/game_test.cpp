#include <gtest/gtest.h>

#include <sstream>
#include <string_view>
#include <vector>

#include "chesslib/errors.hpp"
#include "chesslib/game.hpp"
#include "chesslib/move.hpp"

using namespace chesslib;

namespace {

void play(Game& game, std::initializer_list<std::string_view> moves) {
  for (const auto text : moves) {
    game.make_move(Move::parse(text));
  }
}

void expect_game_error(Game& game, const Action& action, GameErrorKind kind) {
  try {
    game.apply(action);
    FAIL() << "Expected GameError";
  } catch (const GameError& err) {
    EXPECT_EQ(err.kind(), kind);
  }
}

} // namespace

TEST(Game, StartsOngoing) {
  const Game game;
  EXPECT_EQ(game.status(), GameStatus::ongoing());
  EXPECT_EQ(game.side_to_move(), Colour::White);
  EXPECT_EQ(game.legal_moves().size(), 20U);
  EXPECT_EQ(game.occurrences(game.position()), 1U);
  EXPECT_FALSE(game.is_draw_offered());
}

TEST(Game, ScholarsMate) {
  Game game;
  play(game, {"e2e4", "e7e5", "Qd1h5", "Ke8e7", "Qh5e5"});
  EXPECT_EQ(game.status(), GameStatus::check_mated(Colour::Black));
  EXPECT_EQ(game.status().to_string(), "white won by checkmate");
}

TEST(Game, AnotherQuickMate) {
  Game game;
  play(game, {"e2e4", "e7e5", "Bf1c4", "Nb8c6", "Qd1f3", "Nc6d4", "Qf3f7"});
  EXPECT_EQ(game.status(), GameStatus::check_mated(Colour::Black));
}

TEST(Game, Stalemate) {
  auto game = Game::from_fen("3k4/3P4/4K3/8/8/8/8/8 w - - 0 1");
  play(game, {"Ke6d6"});
  EXPECT_EQ(game.status(), GameStatus::stalemate());
  EXPECT_EQ(game.status().to_string(), "stalemate");
}

TEST(Game, StartingInATerminalPosition) {
  const auto game = Game::from_fen("Q2k4/8/3K4/8/8/8/8/8 b - - 0 1");
  EXPECT_EQ(game.status(), GameStatus::check_mated(Colour::Black));
}

TEST(Game, ThreefoldRepetition) {
  auto game = Game::from_fen("8/8/8/p3k3/P7/4K3/8/8 w - - 0 1");
  const auto start = game.position();

  play(game, {"Ke3d3", "Ke5d5", "Kd3e3", "Kd5e5"});
  EXPECT_EQ(game.occurrences(start), 2U);
  EXPECT_EQ(game.status(), GameStatus::ongoing());

  play(game, {"Ke3d3", "Ke5d5", "Kd3e3", "Kd5e5"});
  EXPECT_EQ(game.occurrences(start), 3U);
  EXPECT_EQ(game.status(), GameStatus::repetition_draw());
  EXPECT_EQ(game.status().to_string(), "draw declared by repetition of moves");
}

TEST(Game, Resignation) {
  Game game;
  game.resign();
  EXPECT_EQ(game.status(), GameStatus::resigned(Colour::White));
  EXPECT_EQ(game.status().colour(), Colour::White);
  EXPECT_EQ(game.status().to_string(), "black won by resignation");
}

TEST(Game, DrawByAgreement) {
  Game game;
  play(game, {"e2e4"});
  game.offer_draw();
  EXPECT_TRUE(game.is_draw_offered());
  EXPECT_EQ(game.status(), GameStatus::ongoing());

  game.accept_draw();
  EXPECT_EQ(game.status(), GameStatus::draw_accepted());
  EXPECT_EQ(game.status().to_string(), "draw declared by agreement");
}

TEST(Game, DeclinedDrawContinues) {
  Game game;
  game.offer_draw().decline_draw();
  EXPECT_EQ(game.status(), GameStatus::ongoing());
  EXPECT_FALSE(game.is_draw_offered());

  play(game, {"e2e4"});
  EXPECT_EQ(game.actions().size(), 3U);
  EXPECT_EQ(game.actions().back(), Action::make_move(Move::parse("e2e4")));
}

TEST(Game, PendingOfferMustBeAnswered) {
  Game game;
  game.offer_draw();
  expect_game_error(game, Action::make_move(Move::parse("e2e4")),
                    GameErrorKind::DrawOfferNeedsAnswer);
  expect_game_error(game, Action::offer_draw(), GameErrorKind::DrawOfferNeedsAnswer);

  game.resign();
  EXPECT_EQ(game.status(), GameStatus::resigned(Colour::White));
}

TEST(Game, AnswerWithoutOffer) {
  Game game;
  expect_game_error(game, Action::accept_draw(), GameErrorKind::DrawOfferNotDetected);
  expect_game_error(game, Action::decline_draw(), GameErrorKind::DrawOfferNotDetected);
}

TEST(Game, FinishedGameRejectsActions) {
  Game game;
  game.resign();
  expect_game_error(game, Action::make_move(Move::parse("e2e4")),
                    GameErrorKind::GameAlreadyFinished);
  expect_game_error(game, Action::offer_draw(), GameErrorKind::GameAlreadyFinished);
  expect_game_error(game, Action::resign(), GameErrorKind::GameAlreadyFinished);
}

TEST(Game, IllegalMoveLeavesGameUnchanged) {
  Game game;
  EXPECT_THROW(game.make_move(Move::parse("e2e5")), IllegalMoveError);
  EXPECT_EQ(game.position(), Position::startpos());
  EXPECT_TRUE(game.actions().empty());
  EXPECT_TRUE(game.history().moves().empty());
}

TEST(Game, AlbinWinawer1896) {
  Game game;
  play(game, {
                 "e2e4",  "e7e5",  "Ng1f3", "Nb8c6", "Bf1c4", "Bf8c5", "c2c3",  "Ng8f6", "O-O",
                 "Nf6e4", "Bc4d5", "Ne4f2", "Rf1f2", "Bc5f2", "Kg1f2", "Nc6e7", "Qd1b3", "O-O",
                 "Bd5e4", "d7d5",  "Be4c2", "e5e4",  "Nf3e1", "Ne7g6", "c3c4",  "d5d4",  "Qb3g3",
                 "f7f5",  "Kf2g1", "c7c5",  "d2d3",  "f5f4",  "Qg3f2", "e4e3",  "Qf2f3", "Qd8h4",
                 "Qf3d5", "Kg8h8", "Ne1f3", "Qh4f2", "Kg1h1", "Ng6h4", "Qd5g5", "Bc8h3",
             });
  EXPECT_EQ(game.status(), GameStatus::ongoing());

  game.resign();
  EXPECT_EQ(game.status(), GameStatus::resigned(Colour::White));
  EXPECT_EQ(game.history().positions().size(), 45U);
}

TEST(Game, DrawPredicates) {
  const auto bare = Game::from_fen("4k3/8/6b1/8/8/3NK3/8/8 w - - 0 1");
  EXPECT_TRUE(bare.is_theoretical_draw());
  EXPECT_EQ(bare.status(), GameStatus::ongoing());

  const auto quiet = Game::from_fen("4k3/8/8/8/8/8/8/R3K3 w - - 100 80");
  EXPECT_TRUE(quiet.is_fifty_move_rule_reached());
  EXPECT_FALSE(Game().is_fifty_move_rule_reached());
}

TEST(GameHistory, DeRiviereMorphy1863) {
  Game game;
  play(game, {
                 "e2e4",  "e7e5",  "Ng1f3", "Nb8c6", "Bf1c4", "Ng8f6", "Nf3g5", "d7d5",
                 "e4d5",  "Nc6a5", "d2d3",  "h7h6",  "Ng5f3", "e5e4",  "Qd1e2", "Na5c4",
                 "d3c4",  "Bf8c5", "h2h3",  "O-O",   "Nf3h2", "Nf6h7", "Nb1d2", "f7f5",
                 "Nd2b3", "Bc5d6", "O-O",   "Bd6h2", "Kg1h2", "f5f4",  "Qe2e4", "Nh7g5",
                 "Qe4d4", "Ng5f3", "g2f3",  "Qd8h4", "Rf1h1", "Bc8h3", "Bc1d2", "Rf8f6",
             });

  EXPECT_EQ(game.history().to_string(),
            "1.e4 e5 2.Nf3 Nc6 3.Bc4 Nf6 4.Ng5 d5 5.exd5 Na5 6.d3 h6 7.Nf3 e4 8.Qe2 Nxc4 "
            "9.dxc4 Bc5 10.h3 O-O 11.Nh2 Nh7 12.Nd2 f5 13.Nb3 Bd6 14.O-O Bxh2+ 15.Kxh2 f4 "
            "16.Qxe4 Ng5 17.Qd4 Nf3+ 18.gxf3 Qh4 19.Rh1 Bxh3 20.Bd2 Rf6 ");
}

TEST(GameHistory, BlackMovesFirst) {
  auto game = Game::from_fen("4k3/4p3/8/8/8/8/4P3/4K3 b - - 0 1");
  play(game, {"e7e5", "e2e4", "Ke8e7"});

  std::ostringstream out;
  out << game.history();
  EXPECT_EQ(out.str(), "1. ... e5 2.e4 Ke7 ");
}
