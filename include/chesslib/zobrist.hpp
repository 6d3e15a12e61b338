#pragma once

// =============================================================================
// ZOBRIST HASHING: Fingerprinting Chess Positions
// =============================================================================
//
// Repetition detection needs to recognise "this exact position again" without
// comparing every piece on every square.
//
// Zobrist hashing assigns a random 64-bit number to each feature a position
// can have:
//
//   - (colour, piece type, square)    2 × 6 × 64 values
//   - (colour, castling rights)       2 × 4 values, Neither included
//   - en passant file                 8 values
//   - black to move                   1 value
//
// The hash of a position is the XOR of the values of the features it has.
//
// XOR is self-inverse (A ^ A = 0), so a position keeps its hash current by
// XORing the old feature out and the new one in at every mutation. The
// from-scratch computation below must always agree with that running value.
//
// =============================================================================

#include <array>
#include <cstdint>

#include "chesslib/castling.hpp"
#include "chesslib/colour.hpp"
#include "chesslib/piece.hpp"
#include "chesslib/rng.hpp"
#include "chesslib/square.hpp"

namespace chesslib {

class Position;

using PositionHash = std::uint64_t;

struct ZobristTable {
  std::array<std::array<std::array<PositionHash, SQUARES_NUMBER>, PIECE_TYPES_NUMBER>,
             COLOURS_NUMBER>
      piece_square{};

  std::array<std::array<PositionHash, CastlingRights::VALUES_NUMBER>, COLOURS_NUMBER> castling{};

  std::array<PositionHash, FILES_NUMBER> en_passant{};

  // XORed in when black is to move; white-to-move positions don't include it.
  PositionHash black_to_move{};
};

// Generated by the compiler, so every build embeds the same values.
consteval ZobristTable make_zobrist_table(std::uint64_t seed) {
  ZobristTable table{};
  HashRng rng(seed);

  table.black_to_move = rng.next();

  for (auto& by_type : table.piece_square) {
    for (auto& by_square : by_type) {
      for (auto& entry : by_square) {
        entry = rng.next();
      }
    }
  }

  for (auto& by_rights : table.castling) {
    for (auto& entry : by_rights) {
      entry = rng.next();
    }
  }

  for (auto& entry : table.en_passant) {
    entry = rng.next();
  }

  return table;
}

// Per-feature accessors over one table plus the from-scratch computation.
class ZobristHasher {
public:
  explicit constexpr ZobristHasher(const ZobristTable& table) : table_(table) {}

  [[nodiscard]] constexpr PositionHash piece_square(Piece piece, Square square) const noexcept {
    return table_.piece_square[colour_index(piece.colour)][piece_type_index(piece.type)]
                              [square.index()];
  }

  [[nodiscard]] constexpr PositionHash castling(CastlingRights rights,
                                                Colour colour) const noexcept {
    return table_.castling[colour_index(colour)][rights.index()];
  }

  // Only the file of the en passant square contributes.
  [[nodiscard]] constexpr PositionHash en_passant(Square square) const noexcept {
    return table_.en_passant[to_index(square.file())];
  }

  [[nodiscard]] constexpr PositionHash black_to_move() const noexcept {
    return table_.black_to_move;
  }

  [[nodiscard]] PositionHash hash(const Position& position) const;

private:
  ZobristTable table_;
};

inline constexpr ZobristHasher ZOBRIST{make_zobrist_table(HASH_SEED)};

} // namespace chesslib
