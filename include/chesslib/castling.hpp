#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

#include "chesslib/colour.hpp"

namespace chesslib {

// Castling rights of a single colour: a four-valued lattice
// {Neither, KingSide, QueenSide, BothSides}. Union is `+`, relative
// complement is `-`.
class CastlingRights {
public:
  inline static constexpr std::size_t VALUES_NUMBER = 4;

  constexpr CastlingRights() = default;

  static constexpr CastlingRights neither() { return CastlingRights(0); }
  static constexpr CastlingRights king_side() { return CastlingRights(KING_SIDE_BIT); }
  static constexpr CastlingRights queen_side() { return CastlingRights(QUEEN_SIDE_BIT); }
  static constexpr CastlingRights both_sides() {
    return CastlingRights(KING_SIDE_BIT | QUEEN_SIDE_BIT);
  }

  /// Precondition: index < VALUES_NUMBER.
  static constexpr CastlingRights from_index(std::size_t index) {
    return CastlingRights(static_cast<std::uint8_t>(index & 0b11));
  }

  [[nodiscard]] constexpr bool has_king_side() const noexcept {
    return (bits_ & KING_SIDE_BIT) != 0;
  }
  [[nodiscard]] constexpr bool has_queen_side() const noexcept {
    return (bits_ & QUEEN_SIDE_BIT) != 0;
  }
  [[nodiscard]] constexpr bool is_neither() const noexcept { return bits_ == 0; }

  // 0 Neither, 1 KingSide, 2 QueenSide, 3 BothSides.
  [[nodiscard]] constexpr std::size_t index() const noexcept { return bits_; }

  friend constexpr bool operator==(CastlingRights lhs, CastlingRights rhs) = default;

  friend constexpr CastlingRights operator+(CastlingRights lhs, CastlingRights rhs) {
    return CastlingRights(static_cast<std::uint8_t>(lhs.bits_ | rhs.bits_));
  }

  friend constexpr CastlingRights operator-(CastlingRights lhs, CastlingRights rhs) {
    return CastlingRights(static_cast<std::uint8_t>(lhs.bits_ & ~rhs.bits_ & 0b11));
  }

  constexpr CastlingRights& operator+=(CastlingRights other) {
    *this = *this + other;
    return *this;
  }

  constexpr CastlingRights& operator-=(CastlingRights other) {
    *this = *this - other;
    return *this;
  }

private:
  static constexpr std::uint8_t KING_SIDE_BIT = 0b01;
  static constexpr std::uint8_t QUEEN_SIDE_BIT = 0b10;

  explicit constexpr CastlingRights(std::uint8_t bits) : bits_{bits} {}

  std::uint8_t bits_{0};
};

// FEN letters for one colour: "KQ" style for White, "kq" for Black, "" for Neither.
inline std::string to_string(CastlingRights rights, Colour colour) {
  std::string output;
  if (rights.has_king_side()) {
    output.push_back(colour == Colour::White ? 'K' : 'k');
  }
  if (rights.has_queen_side()) {
    output.push_back(colour == Colour::White ? 'Q' : 'q');
  }
  return output;
}

inline std::ostream& operator<<(std::ostream& os, CastlingRights rights) {
  return os << to_string(rights, Colour::Black);
}

} // namespace chesslib
