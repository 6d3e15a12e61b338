#pragma once

// =============================================================================
// BITBOARDS
// =============================================================================
//
// A bitboard is a 64-bit integer where each bit represents one square:
//
//   - Bit 0 = square A1, Bit 7 = square H1, Bit 63 = square H8
//   - A "1" bit means the square is a member of the set
//
// Set algebra maps directly onto bitwise operators:
//
//   white & black        → intersection (must be empty for a valid position)
//   reach & ~own_pieces  → destinations not blocked by our own pieces
//   between & occupancy  → pieces standing on a line between two squares
//
// Iteration over members is least-significant-bit first, see
// Square::pop_first_occupied.
//
// =============================================================================

#include <bit>
#include <cstdint>

namespace chesslib {

using Bitboard = std::uint64_t;

inline constexpr Bitboard EMPTY = 0;
inline constexpr Bitboard FULL = ~Bitboard{0};

// Ranks 1 and 8: where pawns promote.
inline constexpr Bitboard BACK_RANKS = 0xFF00'0000'0000'00FFull;

// File masks guard against wrap-around when shifting for offset moves. A
// knight on A1 cannot move left, so file A is masked out before shifting:
// (bb & ~FILE_A) >> 17
inline constexpr Bitboard FILE_MASKS[8] = {
    0x0101'0101'0101'0101ull, // File A
    0x0202'0202'0202'0202ull, // File B
    0x0404'0404'0404'0404ull, // File C
    0x0808'0808'0808'0808ull, // File D
    0x1010'1010'1010'1010ull, // File E
    0x2020'2020'2020'2020ull, // File F
    0x4040'4040'4040'4040ull, // File G
    0x8080'8080'8080'8080ull, // File H
};

inline constexpr Bitboard RANK_MASKS[8] = {
    0x0000'0000'0000'00FFull, // Rank 1
    0x0000'0000'0000'FF00ull, // Rank 2
    0x0000'0000'00FF'0000ull, // Rank 3
    0x0000'0000'FF00'0000ull, // Rank 4
    0x0000'00FF'0000'0000ull, // Rank 5
    0x0000'FF00'0000'0000ull, // Rank 6
    0x00FF'0000'0000'0000ull, // Rank 7
    0xFF00'0000'0000'0000ull, // Rank 8
};

inline constexpr Bitboard FILE_A = FILE_MASKS[0];
inline constexpr Bitboard FILE_B = FILE_MASKS[1];
inline constexpr Bitboard FILE_G = FILE_MASKS[6];
inline constexpr Bitboard FILE_H = FILE_MASKS[7];

// a1 is dark, so light squares are those with odd file + rank.
inline constexpr Bitboard LIGHT_SQUARES = 0x55AA'55AA'55AA'55AAull;

// Population count maps to a single POPCNT instruction on modern CPUs.
[[nodiscard]] constexpr int count(Bitboard bitboard) noexcept {
  return std::popcount(bitboard);
}

[[nodiscard]] constexpr bool more_than_one(Bitboard bitboard) noexcept {
  return (bitboard & (bitboard - 1)) != 0;
}

} // namespace chesslib
