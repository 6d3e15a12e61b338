#include <gtest/gtest.h>

#include <sstream>

#include "chesslib/castling.hpp"
#include "chesslib/move.hpp"
#include "chesslib/position.hpp"

using namespace chesslib;

namespace {

bool contains(const MoveList& moves, const Move& move) {
  for (const auto& candidate : moves) {
    if (candidate == move) {
      return true;
    }
  }
  return false;
}

void expect_castles(std::string_view fen, bool king_side, bool queen_side) {
  const auto position = Position::from_fen(fen);
  const auto moves = position.legal_moves();
  EXPECT_EQ(contains(moves, Move::castle_king_side()), king_side) << fen;
  EXPECT_EQ(contains(moves, Move::castle_queen_side()), queen_side) << fen;
  EXPECT_EQ(position.is_legal_move(Move::castle_king_side()), king_side) << fen;
  EXPECT_EQ(position.is_legal_move(Move::castle_queen_side()), queen_side) << fen;
}

} // namespace

TEST(CastlingRights, AddingAndRemovingSides) {
  EXPECT_EQ(CastlingRights::king_side() + CastlingRights::queen_side(),
            CastlingRights::both_sides());
  EXPECT_EQ(CastlingRights::both_sides() - CastlingRights::king_side(),
            CastlingRights::queen_side());
  EXPECT_EQ(CastlingRights::queen_side() - CastlingRights::queen_side(),
            CastlingRights::neither());
  EXPECT_EQ(CastlingRights::neither() - CastlingRights::king_side(), CastlingRights::neither());
  EXPECT_EQ(CastlingRights::king_side() + CastlingRights::king_side(),
            CastlingRights::king_side());
}

TEST(CastlingRights, CompoundAssignment) {
  CastlingRights rights = CastlingRights::neither();
  rights += CastlingRights::queen_side();
  EXPECT_TRUE(rights.has_queen_side());
  EXPECT_FALSE(rights.has_king_side());

  rights += CastlingRights::king_side();
  rights -= CastlingRights::queen_side();
  EXPECT_EQ(rights, CastlingRights::king_side());
}

TEST(CastlingRights, IndexOrder) {
  EXPECT_EQ(CastlingRights::neither().index(), 0U);
  EXPECT_EQ(CastlingRights::king_side().index(), 1U);
  EXPECT_EQ(CastlingRights::queen_side().index(), 2U);
  EXPECT_EQ(CastlingRights::both_sides().index(), 3U);
  for (std::size_t index = 0; index < CastlingRights::VALUES_NUMBER; ++index) {
    EXPECT_EQ(CastlingRights::from_index(index).index(), index);
  }
}

TEST(CastlingRights, Letters) {
  EXPECT_EQ(to_string(CastlingRights::both_sides(), Colour::White), "KQ");
  EXPECT_EQ(to_string(CastlingRights::both_sides(), Colour::Black), "kq");
  EXPECT_EQ(to_string(CastlingRights::queen_side(), Colour::White), "Q");
  EXPECT_EQ(to_string(CastlingRights::neither(), Colour::White), "");

  std::ostringstream out;
  out << CastlingRights::king_side();
  EXPECT_EQ(out.str(), "k");
}

TEST(Castling, BothSidesWhenPathIsClear) {
  expect_castles("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w KQkq - 0 1", true, true);
  expect_castles("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R b KQkq - 0 1", true, true);
}

TEST(Castling, NotWithoutRights) {
  expect_castles("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w kq - 0 1", false, false);
  expect_castles("r3k2r/pppppppp/8/8/8/8/PPPPPPPP/R3K2R w Q - 0 1", false, true);
}

TEST(Castling, NotOntoAttackedOrOccupiedSquares) {
  expect_castles("r3k1nr/pp1ppppp/8/8/8/2Q5/PPPPPPPP/R3K2R b KQkq - 0 1", false, false);
}

TEST(Castling, NotThroughAttackedSquare) {
  // The bishop on c4 covers f1 and the rook on d8 covers d1.
  expect_castles("3rk3/8/8/8/2b5/8/8/R3K2R w KQ - 0 1", false, false);
}

TEST(Castling, NotIntoCheck) {
  expect_castles("4k1r1/8/8/8/8/8/8/R3K2R w KQ - 0 1", false, true);
}

TEST(Castling, NotThroughPieces) {
  expect_castles("r3k2r/8/8/8/8/8/8/RN2K1NR w KQkq - 0 1", false, false);
}

TEST(Castling, QueenSideAllowsAttackedKnightSquare) {
  // b1 is passed only by the rook.
  expect_castles("1r2k3/8/8/8/8/8/8/R3K3 w Q - 0 1", false, true);
}

TEST(Castling, RelocatesKingAndRook) {
  const auto position = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

  const auto king_side = position.make_move(Move::castle_king_side());
  EXPECT_EQ(king_side.piece_at(Square::G1), (Piece{PieceType::King, Colour::White}));
  EXPECT_EQ(king_side.piece_at(Square::F1), (Piece{PieceType::Rook, Colour::White}));
  EXPECT_TRUE(king_side.is_empty(Square::E1));
  EXPECT_TRUE(king_side.is_empty(Square::H1));
  EXPECT_TRUE(king_side.castling_rights(Colour::White).is_neither());
  EXPECT_EQ(king_side.castling_rights(Colour::Black), CastlingRights::both_sides());

  const auto queen_side = position.make_move(Move::castle_queen_side());
  EXPECT_EQ(queen_side.piece_at(Square::C1), (Piece{PieceType::King, Colour::White}));
  EXPECT_EQ(queen_side.piece_at(Square::D1), (Piece{PieceType::Rook, Colour::White}));
  EXPECT_TRUE(queen_side.is_empty(Square::A1));
}

TEST(Castling, RookMovesRevokeOneSide) {
  const auto position = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");

  const auto after = position.make_move(Move::parse("Rh1h4"));
  EXPECT_EQ(after.castling_rights(Colour::White), CastlingRights::queen_side());

  const auto back = after.make_move(Move::parse("Ra8a5"));
  EXPECT_EQ(back.castling_rights(Colour::Black), CastlingRights::king_side());
}

TEST(Castling, KingMoveRevokesBothSides) {
  const auto position = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  const auto after = position.make_move(Move::parse("Ke1e2"));
  EXPECT_TRUE(after.castling_rights(Colour::White).is_neither());
}

TEST(Castling, CapturingARookRevokesItsRight) {
  const auto position = Position::from_fen("r3k2r/8/8/8/8/8/8/R3K2R w KQkq - 0 1");
  const auto after = position.make_move(Move::parse("Ra1a8"));
  EXPECT_EQ(after.castling_rights(Colour::White), CastlingRights::king_side());
  EXPECT_EQ(after.castling_rights(Colour::Black), CastlingRights::king_side());
}
