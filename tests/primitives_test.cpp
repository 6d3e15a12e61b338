#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string_view>

#include "chesslib/bitboard.hpp"
#include "chesslib/colour.hpp"
#include "chesslib/errors.hpp"
#include "chesslib/piece.hpp"
#include "chesslib/render.hpp"
#include "chesslib/square.hpp"

using namespace chesslib;

TEST(Colour, NegationSwapsSides) {
  EXPECT_EQ(!Colour::White, Colour::Black);
  EXPECT_EQ(!Colour::Black, Colour::White);
}

TEST(Colour, PrintsLowerCaseName) {
  std::ostringstream out;
  out << Colour::White << ' ' << Colour::Black;
  EXPECT_EQ(out.str(), "white black");
}

TEST(FileAndRank, CheckedConversionsAcceptTheBoard) {
  EXPECT_EQ(file_from_index(0), File::A);
  EXPECT_EQ(file_from_index(7), File::H);
  EXPECT_EQ(rank_from_index(3), Rank::Fourth);
  EXPECT_EQ(file_from_char('c'), File::C);
  EXPECT_EQ(rank_from_char('8'), Rank::Eighth);
}

TEST(FileAndRank, CheckedConversionsRejectOutOfRange) {
  try {
    (void)file_from_index(8);
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidFileIndex);
  }

  try {
    (void)rank_from_index(-1);
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidRankIndex);
  }

  try {
    (void)file_from_char('i');
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidFileName);
  }

  try {
    (void)rank_from_char('9');
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidRankName);
  }
}

TEST(FileAndRank, PromotionAndBackRanks) {
  EXPECT_EQ(promotion_rank(Colour::White), Rank::Eighth);
  EXPECT_EQ(promotion_rank(Colour::Black), Rank::First);
  EXPECT_EQ(back_rank(Colour::White), Rank::First);
  EXPECT_EQ(back_rank(Colour::Black), Rank::Eighth);
}

TEST(Square, CreateFromFileAndRank) {
  EXPECT_EQ(Square::from_file_and_rank(0, 0), Square::A1);
  EXPECT_EQ(Square::from_file_and_rank(7, 7), Square::H8);
  EXPECT_EQ(Square::from_file_and_rank(File::B, Rank::Fifth), Square::from_index(33));
}

TEST(Square, IndexLayoutIsRankMajor) {
  EXPECT_EQ(Square::A1.index(), 0);
  EXPECT_EQ(Square::H1.index(), 7);
  EXPECT_EQ(Square::A8.index(), 56);
  EXPECT_EQ(Square::E4.file(), File::E);
  EXPECT_EQ(Square::E4.rank(), Rank::Fourth);
}

TEST(Square, ParseAlgebraicNotation) {
  const auto a1 = Square::parse("a1");
  const auto h8 = Square::parse("h8");
  const auto b5 = Square::parse("b5");

  ASSERT_TRUE(a1.has_value());
  ASSERT_TRUE(h8.has_value());
  ASSERT_TRUE(b5.has_value());

  EXPECT_EQ(*a1, Square::A1);
  EXPECT_EQ(*h8, Square::H8);
  EXPECT_EQ(*b5, Square::from_index(33));
}

TEST(Square, RejectInvalidAlgebraicNotation) {
  for (std::string_view algebraic : {"", "a", "a1b", "a9", "i1", "A1"}) {
    EXPECT_FALSE(Square::parse(algebraic).has_value()) << algebraic;
  }
}

TEST(Square, FromStringNamesTheBrokenPart) {
  try {
    (void)Square::from_string("e44");
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidSquareName);
  }

  try {
    (void)Square::from_string("z4");
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidFileName);
  }

  EXPECT_EQ(Square::from_string("g7"), Square::G7);
}

TEST(Square, CheckedIndex) {
  EXPECT_EQ(Square::at(63), Square::H8);

  try {
    (void)Square::at(64);
    FAIL() << "Expected CoordinateError";
  } catch (const CoordinateError& err) {
    EXPECT_EQ(err.kind(), CoordinateErrorKind::InvalidSquareIndex);
  }
}

TEST(Square, ToStringRoundTripsEverySquare) {
  for (std::uint8_t index = 0; index < SQUARES_NUMBER; ++index) {
    const Square square = Square::from_index(index);
    EXPECT_EQ(Square::parse(square.to_string()), square);
  }
}

TEST(Square, FirstOccupiedBitInBitboard) {
  Bitboard bitboard = Square::A1 | Square::A8;
  EXPECT_EQ(Square::first_occupied(bitboard), Square::A1);
}

TEST(Square, LastOccupiedBitInBitboard) {
  Bitboard bitboard = Square::A1 | Square::A8;
  EXPECT_EQ(Square::last_occupied(bitboard), Square::A8);
}

TEST(Square, PopFirstOccupiedConsumesBitboard) {
  Bitboard bitboard = Square::A1 | Square::A8;

  EXPECT_EQ(Square::pop_first_occupied(bitboard), Square::A1);
  EXPECT_EQ(bitboard, Bitboard(Square::A8));

  EXPECT_EQ(Square::pop_first_occupied(bitboard), Square::A8);
  EXPECT_EQ(bitboard, 0U);
}

TEST(Square, NeighboursStopAtTheEdge) {
  EXPECT_EQ(Square::E4.up(), Square::E5);
  EXPECT_EQ(Square::E4.down(), Square::E3);
  EXPECT_EQ(Square::E4.left(), Square::D4);
  EXPECT_EQ(Square::E4.right(), Square::F4);

  EXPECT_FALSE(Square::A8.up().has_value());
  EXPECT_FALSE(Square::A1.down().has_value());
  EXPECT_FALSE(Square::A1.left().has_value());
  EXPECT_FALSE(Square::H1.right().has_value());
}

TEST(Square, AdvanceGivenColour) {
  EXPECT_EQ(Square::E2.advance(Colour::White), Square::E3);
  EXPECT_EQ(Square::E7.advance(Colour::Black), Square::E6);
}

TEST(Square, DistancesAlongFilesAndRanks) {
  EXPECT_EQ(Square::A1.file_diff(Square::H8), 7);
  EXPECT_EQ(Square::H8.rank_diff(Square::A1), 7);
  EXPECT_EQ(Square::E2.rank_diff(Square::E4), 2);
  EXPECT_EQ(Square::E2.file_diff(Square::E4), 0);
}

TEST(Square, Colours) {
  EXPECT_FALSE(Square::A1.is_light());
  EXPECT_TRUE(Square::H1.is_light());
  EXPECT_TRUE(Square::A8.is_light());
  EXPECT_FALSE(Square::H8.is_light());
  EXPECT_TRUE(Square::D1.is_light());
}

TEST(Square, BackRanks) {
  EXPECT_TRUE(Square::A1.is_back_rank());
  EXPECT_TRUE(Square::H8.is_back_rank());
  EXPECT_FALSE(Square::E4.is_back_rank());
}

TEST(Bitboard, CountAndMoreThanOne) {
  EXPECT_EQ(count(EMPTY), 0);
  EXPECT_EQ(count(FULL), 64);
  EXPECT_EQ(count(FILE_A), 8);
  EXPECT_FALSE(more_than_one(Square::E4));
  EXPECT_TRUE(more_than_one(Square::E4 | Square::E5));
}

TEST(Bitboard, MasksCoverTheBoard) {
  Bitboard files = EMPTY;
  Bitboard ranks = EMPTY;
  for (int i = 0; i < 8; ++i) {
    files |= FILE_MASKS[i];
    ranks |= RANK_MASKS[i];
  }
  EXPECT_EQ(files, FULL);
  EXPECT_EQ(ranks, FULL);
  EXPECT_EQ(BACK_RANKS, RANK_MASKS[0] | RANK_MASKS[7]);
  EXPECT_EQ(count(LIGHT_SQUARES), 32);
}

TEST(Bitboard, TextDumpPutsRankEightFirst) {
  const std::string text = render_bitboard(Square::A8 | Square::H1);
  EXPECT_EQ(text, "X . . . . . . . \n"
                  ". . . . . . . . \n"
                  ". . . . . . . . \n"
                  ". . . . . . . . \n"
                  ". . . . . . . . \n"
                  ". . . . . . . . \n"
                  ". . . . . . . . \n"
                  ". . . . . . . X \n");
}

TEST(Piece, LettersFollowColour) {
  EXPECT_EQ(to_char(Piece{PieceType::Knight, Colour::White}), 'N');
  EXPECT_EQ(to_char(Piece{PieceType::Knight, Colour::Black}), 'n');
  EXPECT_EQ(to_char(PieceType::Queen), 'Q');
}

TEST(Piece, ParseLetters) {
  EXPECT_EQ(piece_from_char('k'), (Piece{PieceType::King, Colour::Black}));
  EXPECT_EQ(piece_from_char('P'), (Piece{PieceType::Pawn, Colour::White}));
  EXPECT_FALSE(piece_from_char('x').has_value());
  EXPECT_EQ(piece_type_from_char('r'), PieceType::Rook);
}

TEST(Piece, PromotionTypes) {
  EXPECT_FALSE(is_promotion_type(PieceType::Pawn));
  EXPECT_FALSE(is_promotion_type(PieceType::King));
  for (const auto type : PROMOTION_TYPES) {
    EXPECT_TRUE(is_promotion_type(type));
  }
}

TEST(Piece, Sliders) {
  EXPECT_TRUE(is_slider(PieceType::Bishop));
  EXPECT_TRUE(is_slider(PieceType::Rook));
  EXPECT_TRUE(is_slider(PieceType::Queen));
  EXPECT_FALSE(is_slider(PieceType::Knight));
}
