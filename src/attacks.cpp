#include "chesslib/attacks.hpp"

#include <array>

namespace chesslib {

namespace {

struct Step {
  int file;
  int rank;
};

// Indexed by Direction.
constexpr std::array<Step, DIRECTIONS_NUMBER> STEPS = {{
    {0, 1},   // North
    {0, -1},  // South
    {1, 0},   // East
    {-1, 0},  // West
    {1, 1},   // NorthEast
    {-1, 1},  // NorthWest
    {1, -1},  // SouthEast
    {-1, -1}, // SouthWest
}};

constexpr bool on_board(int file, int rank) {
  return file >= 0 && file < FILES_NUMBER && rank >= 0 && rank < RANKS_NUMBER;
}

constexpr Square square_at(int file, int rank) {
  return Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                    static_cast<std::uint8_t>(rank));
}

constexpr std::size_t direction_index(Direction direction) {
  return static_cast<std::size_t>(direction);
}

// =============================================================================
// RAYS AND BETWEEN
// =============================================================================
// Walk outward from every square in each of the eight directions until the
// edge. The walk yields the ray, and at the same time the between-set for
// every square it reaches: the squares already passed on the way there.
// =============================================================================
constexpr void fill_rays_and_between(AttackTables& tables) {
  for (int index = 0; index < SQUARES_NUMBER; ++index) {
    const int from_file = index & 7;
    const int from_rank = index >> 3;

    for (std::size_t direction = 0; direction < DIRECTIONS_NUMBER; ++direction) {
      const Step step = STEPS[direction];
      Bitboard path = EMPTY;

      int file = from_file + step.file;
      int rank = from_rank + step.rank;
      while (on_board(file, rank)) {
        const Square to = square_at(file, rank);
        tables.between[index][to.index()] = path;
        path |= to;
        file += step.file;
        rank += step.rank;
      }

      tables.rays[direction][index] = path;
    }
  }
}

constexpr void fill_sliders(AttackTables& tables) {
  for (std::size_t index = 0; index < SQUARES_NUMBER; ++index) {
    const auto& rays = tables.rays;
    tables.rook[index] = rays[direction_index(Direction::North)][index] |
                         rays[direction_index(Direction::South)][index] |
                         rays[direction_index(Direction::East)][index] |
                         rays[direction_index(Direction::West)][index];
    tables.bishop[index] = rays[direction_index(Direction::NorthEast)][index] |
                           rays[direction_index(Direction::NorthWest)][index] |
                           rays[direction_index(Direction::SouthEast)][index] |
                           rays[direction_index(Direction::SouthWest)][index];
    tables.queen[index] = tables.rook[index] | tables.bishop[index];
  }
}

// =============================================================================
// FIXED PATTERNS
// =============================================================================
// Shifting a single-bit board moves the piece:
//   << 8 up a rank, >> 8 down a rank, << 1 towards H, >> 1 towards A.
// File masks stop wrap-around: a knight on the B-file moving "left 2" would
// otherwise land on the G or H file one rank away.
// =============================================================================
constexpr void fill_leapers(AttackTables& tables) {
  for (std::uint8_t index = 0; index < SQUARES_NUMBER; ++index) {
    const Bitboard bb = Square::from_index(index);

    tables.knight[index] = ((bb & ~FILE_A & ~FILE_B) << 6) | ((bb & ~FILE_G & ~FILE_H) << 10) |
                           ((bb & ~FILE_A) << 15) | ((bb & ~FILE_H) << 17) |
                           ((bb & ~FILE_G & ~FILE_H) >> 6) | ((bb & ~FILE_A & ~FILE_B) >> 10) |
                           ((bb & ~FILE_H) >> 15) | ((bb & ~FILE_A) >> 17);

    tables.king[index] = ((bb & ~FILE_H) << 1) | ((bb & ~FILE_A) >> 1) | (bb << 8) |
                         ((bb & ~FILE_A) << 7) | ((bb & ~FILE_H) << 9) | (bb >> 8) |
                         ((bb & ~FILE_H) >> 7) | ((bb & ~FILE_A) >> 9);
  }
}

// White pawns move towards rank 8 (<< 8), black pawns towards rank 1 (>> 8).
// A pawn standing on its start rank may also advance two squares; whether the
// square in between is free is checked with the between table at query time.
constexpr void fill_pawns(AttackTables& tables) {
  constexpr std::size_t white = colour_index(Colour::White);
  constexpr std::size_t black = colour_index(Colour::Black);

  for (std::uint8_t index = 0; index < SQUARES_NUMBER; ++index) {
    const Bitboard bb = Square::from_index(index);

    tables.pawn_captures[white][index] = ((bb & ~FILE_A) << 7) | ((bb & ~FILE_H) << 9);
    tables.pawn_captures[black][index] = ((bb & ~FILE_H) >> 7) | ((bb & ~FILE_A) >> 9);

    tables.pawn_advances[white][index] = bb << 8;
    if ((bb & RANK_MASKS[1]) != 0) {
      tables.pawn_advances[white][index] |= bb << 16;
    }

    tables.pawn_advances[black][index] = bb >> 8;
    if ((bb & RANK_MASKS[6]) != 0) {
      tables.pawn_advances[black][index] |= bb >> 16;
    }
  }
}

constexpr AttackTables make_attack_tables() {
  AttackTables tables{};
  fill_rays_and_between(tables);
  fill_sliders(tables);
  fill_leapers(tables);
  fill_pawns(tables);
  return tables;
}

constexpr AttackTables ATTACK_TABLES = make_attack_tables();

static_assert(ATTACK_TABLES.knight[0] == (Bitboard(Square::B3) | Square::C2));
static_assert(ATTACK_TABLES.between[Square::A1.index()][Square::H8.index()] ==
              (Bitboard(Square::B2) | Square::C3 | Square::D4 | Square::E5 | Square::F6 |
               Square::G7));

} // namespace

const AttackTables& attack_tables() noexcept {
  return ATTACK_TABLES;
}

Bitboard ray(Direction direction, Square square) noexcept {
  return ATTACK_TABLES.rays[direction_index(direction)][square.index()];
}

Bitboard piece_reach(PieceType type, Square square) noexcept {
  switch (type) {
  case PieceType::Knight:
    return ATTACK_TABLES.knight[square.index()];
  case PieceType::Bishop:
    return ATTACK_TABLES.bishop[square.index()];
  case PieceType::Rook:
    return ATTACK_TABLES.rook[square.index()];
  case PieceType::Queen:
    return ATTACK_TABLES.queen[square.index()];
  case PieceType::King:
    return ATTACK_TABLES.king[square.index()];
  case PieceType::Pawn:
    break;
  }
  return EMPTY;
}

Bitboard pawn_advances(Colour colour, Square square) noexcept {
  return ATTACK_TABLES.pawn_advances[colour_index(colour)][square.index()];
}

Bitboard pawn_captures(Colour colour, Square square) noexcept {
  return ATTACK_TABLES.pawn_captures[colour_index(colour)][square.index()];
}

std::optional<Bitboard> between(Square from, Square to) noexcept {
  if (from == to) {
    return EMPTY;
  }
  if ((ATTACK_TABLES.queen[from.index()] & to) == 0) {
    return std::nullopt;
  }
  return ATTACK_TABLES.between[from.index()][to.index()];
}

} // namespace chesslib
