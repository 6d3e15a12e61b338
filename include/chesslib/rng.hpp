#pragma once

// =============================================================================
// DETERMINISTIC RANDOM NUMBER GENERATOR
// =============================================================================
//
// Zobrist hashing needs a table of random-looking 64-bit values. The table is
// produced from a fixed seed so that:
//
//   - the same position hashes to the same value in every process
//   - a failing repetition test can be reproduced exactly
//   - the whole table can be built by the compiler (constexpr)
//
// xorshift64 is small, fast and mixes bits well enough for hashing. It is not
// cryptographically secure and does not need to be.
//
// =============================================================================

#include <cstdint>

namespace chesslib {

// Xorshift64: three XOR-shift steps per draw.
class HashRng {
public:
  explicit constexpr HashRng(std::uint64_t seed) : state_{seed} {}

  constexpr std::uint64_t next() {
    std::uint64_t x = state_;
    x ^= x << 13;
    x ^= x >> 7;
    x ^= x << 17;
    state_ = x;
    return x;
  }

private:
  std::uint64_t state_;
};

// Seed for the Zobrist table. Must be non-zero; changing it changes every hash.
inline constexpr std::uint64_t HASH_SEED = 0x0004'DE59'26A1'7F29ull;

} // namespace chesslib
