#pragma once

#include <bit>
#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "chesslib/bitboard.hpp"
#include "chesslib/colour.hpp"

namespace chesslib {

inline constexpr std::uint8_t FILES_NUMBER = 8;
inline constexpr std::uint8_t RANKS_NUMBER = 8;
inline constexpr std::uint8_t SQUARES_NUMBER = 64;

enum class File : std::uint8_t { A, B, C, D, E, F, G, H };

enum class Rank : std::uint8_t { First, Second, Third, Fourth, Fifth, Sixth, Seventh, Eighth };

constexpr std::uint8_t to_index(File file) {
  return static_cast<std::uint8_t>(file);
}

constexpr std::uint8_t to_index(Rank rank) {
  return static_cast<std::uint8_t>(rank);
}

constexpr char to_char(File file) {
  return static_cast<char>('a' + to_index(file));
}

constexpr char to_char(Rank rank) {
  return static_cast<char>('1' + to_index(rank));
}

// Checked conversions; throw CoordinateError.
File file_from_index(int index);
Rank rank_from_index(int index);
File file_from_char(char name);
Rank rank_from_char(char name);

// The rank a pawn of the given colour promotes on.
constexpr Rank promotion_rank(Colour colour) {
  return colour == Colour::White ? Rank::Eighth : Rank::First;
}

// The rank the king and rooks of the given colour start on.
constexpr Rank back_rank(Colour colour) {
  return colour == Colour::White ? Rank::First : Rank::Eighth;
}

class Square {
public:
  // Named squares for convenience.
  static const Square A1;
  static const Square B1;
  static const Square C1;
  static const Square D1;
  static const Square E1;
  static const Square F1;
  static const Square G1;
  static const Square H1;

  static const Square A2;
  static const Square B2;
  static const Square C2;
  static const Square D2;
  static const Square E2;
  static const Square F2;
  static const Square G2;
  static const Square H2;

  static const Square A3;
  static const Square B3;
  static const Square C3;
  static const Square D3;
  static const Square E3;
  static const Square F3;
  static const Square G3;
  static const Square H3;

  static const Square A4;
  static const Square B4;
  static const Square C4;
  static const Square D4;
  static const Square E4;
  static const Square F4;
  static const Square G4;
  static const Square H4;

  static const Square A5;
  static const Square B5;
  static const Square C5;
  static const Square D5;
  static const Square E5;
  static const Square F5;
  static const Square G5;
  static const Square H5;

  static const Square A6;
  static const Square B6;
  static const Square C6;
  static const Square D6;
  static const Square E6;
  static const Square F6;
  static const Square G6;
  static const Square H6;

  static const Square A7;
  static const Square B7;
  static const Square C7;
  static const Square D7;
  static const Square E7;
  static const Square F7;
  static const Square G7;
  static const Square H7;

  static const Square A8;
  static const Square B8;
  static const Square C8;
  static const Square D8;
  static const Square E8;
  static const Square F8;
  static const Square G8;
  static const Square H8;

  constexpr Square() noexcept : index_(0) {}

  /// Precondition: index < 64.
  [[nodiscard]] static constexpr Square from_index(std::uint8_t index) noexcept {
    return Square(index);
  }

  /// Throws CoordinateError when index is outside 0..63.
  [[nodiscard]] static Square at(int index);

  [[nodiscard]] static constexpr Square from_file_and_rank(std::uint8_t file,
                                                           std::uint8_t rank) noexcept {
    return Square(static_cast<std::uint8_t>((rank << 3) | file));
  }

  [[nodiscard]] static constexpr Square from_file_and_rank(File file, Rank rank) noexcept {
    return from_file_and_rank(to_index(file), to_index(rank));
  }

  /// Returns the square corresponding to the least significant set bit in the bitboard.
  /// Precondition: bitboard != 0.
  [[nodiscard]] static constexpr Square first_occupied(Bitboard bitboard) {
    return Square(static_cast<std::uint8_t>(std::countr_zero(bitboard)));
  }

  /// Returns the square corresponding to the most significant set bit in the bitboard.
  /// Precondition: bitboard != 0.
  [[nodiscard]] static constexpr Square last_occupied(Bitboard bitboard) {
    return Square(static_cast<std::uint8_t>(63 - std::countl_zero(bitboard)));
  }

  /// Removes and returns the square corresponding to the least significant set bit.
  /// Modifies the bitboard by clearing that bit.
  /// Precondition: bitboard != 0.
  [[nodiscard]] static constexpr Square pop_first_occupied(Bitboard& bitboard) {
    const Square square = first_occupied(bitboard);
    bitboard ^= square;
    return square;
  }

  [[nodiscard]] constexpr std::uint8_t index() const noexcept { return index_; }

  /// Returns a bitboard with only this square's bit set.
  [[nodiscard]] constexpr Bitboard to_bitboard() const noexcept { return Bitboard{1} << index_; }

  constexpr operator Bitboard() const noexcept { return Bitboard{1} << index_; }

  [[nodiscard]] constexpr File file() const noexcept { return static_cast<File>(index_ & 7u); }

  [[nodiscard]] constexpr Rank rank() const noexcept { return static_cast<Rank>(index_ >> 3); }

  [[nodiscard]] constexpr std::uint8_t file_diff(Square other) const noexcept {
    const int diff = static_cast<int>(index_ & 7u) - static_cast<int>(other.index_ & 7u);
    return static_cast<std::uint8_t>(diff < 0 ? -diff : diff);
  }

  [[nodiscard]] constexpr std::uint8_t rank_diff(Square other) const noexcept {
    const int diff = static_cast<int>(index_ >> 3) - static_cast<int>(other.index_ >> 3);
    return static_cast<std::uint8_t>(diff < 0 ? -diff : diff);
  }

  // Adjacent squares; nullopt off the board.
  [[nodiscard]] constexpr std::optional<Square> up() const noexcept {
    return rank() == Rank::Eighth ? std::nullopt : std::optional<Square>(Square(index_ + 8));
  }

  [[nodiscard]] constexpr std::optional<Square> down() const noexcept {
    return rank() == Rank::First ? std::nullopt : std::optional<Square>(Square(index_ - 8));
  }

  [[nodiscard]] constexpr std::optional<Square> left() const noexcept {
    return file() == File::A ? std::nullopt : std::optional<Square>(Square(index_ - 1));
  }

  [[nodiscard]] constexpr std::optional<Square> right() const noexcept {
    return file() == File::H ? std::nullopt : std::optional<Square>(Square(index_ + 1));
  }

  /// Precondition: the square is not on the far rank for the colour.
  [[nodiscard]] constexpr Square advance(Colour colour) const noexcept {
    return colour == Colour::White ? Square(index_ + 8) : Square(index_ - 8);
  }

  [[nodiscard]] constexpr bool is_back_rank() const noexcept {
    return (Bitboard(*this) & BACK_RANKS) != 0;
  }

  [[nodiscard]] constexpr bool is_light() const noexcept {
    return (Bitboard(*this) & LIGHT_SQUARES) != 0;
  }

  [[nodiscard]] std::string to_string() const {
    return std::string{to_char(file()), to_char(rank())};
  }

  [[nodiscard]] static std::optional<Square> parse(std::string_view algebraic) noexcept {
    if (algebraic.size() != 2) {
      return std::nullopt;
    }

    const char file_char = algebraic[0];
    const char rank_char = algebraic[1];

    if (file_char < 'a' || file_char > 'h' || rank_char < '1' || rank_char > '8') {
      return std::nullopt;
    }

    const std::uint8_t file = static_cast<std::uint8_t>(file_char - 'a');
    const std::uint8_t rank = static_cast<std::uint8_t>(rank_char - '1');
    return from_file_and_rank(file, rank);
  }

  /// Like parse, but throws CoordinateError naming the offending part.
  [[nodiscard]] static Square from_string(std::string_view algebraic);

  friend constexpr bool operator==(Square lhs, Square rhs) noexcept {
    return lhs.index_ == rhs.index_;
  }
  friend constexpr bool operator!=(Square lhs, Square rhs) noexcept { return !(lhs == rhs); }

private:
  explicit constexpr Square(std::uint8_t index) noexcept : index_(index) {}

  std::uint8_t index_;
};

inline std::ostream& operator<<(std::ostream& os, Square square) {
  return os << square.to_string();
}

inline std::ostream& operator<<(std::ostream& os, File file) {
  return os << to_char(file);
}

inline std::ostream& operator<<(std::ostream& os, Rank rank) {
  return os << to_char(rank);
}

} // namespace chesslib

// Inline definitions of named squares (indices 0..63).
inline constexpr chesslib::Square chesslib::Square::A1{std::uint8_t{0}};
inline constexpr chesslib::Square chesslib::Square::B1{std::uint8_t{1}};
inline constexpr chesslib::Square chesslib::Square::C1{std::uint8_t{2}};
inline constexpr chesslib::Square chesslib::Square::D1{std::uint8_t{3}};
inline constexpr chesslib::Square chesslib::Square::E1{std::uint8_t{4}};
inline constexpr chesslib::Square chesslib::Square::F1{std::uint8_t{5}};
inline constexpr chesslib::Square chesslib::Square::G1{std::uint8_t{6}};
inline constexpr chesslib::Square chesslib::Square::H1{std::uint8_t{7}};

inline constexpr chesslib::Square chesslib::Square::A2{std::uint8_t{8}};
inline constexpr chesslib::Square chesslib::Square::B2{std::uint8_t{9}};
inline constexpr chesslib::Square chesslib::Square::C2{std::uint8_t{10}};
inline constexpr chesslib::Square chesslib::Square::D2{std::uint8_t{11}};
inline constexpr chesslib::Square chesslib::Square::E2{std::uint8_t{12}};
inline constexpr chesslib::Square chesslib::Square::F2{std::uint8_t{13}};
inline constexpr chesslib::Square chesslib::Square::G2{std::uint8_t{14}};
inline constexpr chesslib::Square chesslib::Square::H2{std::uint8_t{15}};

inline constexpr chesslib::Square chesslib::Square::A3{std::uint8_t{16}};
inline constexpr chesslib::Square chesslib::Square::B3{std::uint8_t{17}};
inline constexpr chesslib::Square chesslib::Square::C3{std::uint8_t{18}};
inline constexpr chesslib::Square chesslib::Square::D3{std::uint8_t{19}};
inline constexpr chesslib::Square chesslib::Square::E3{std::uint8_t{20}};
inline constexpr chesslib::Square chesslib::Square::F3{std::uint8_t{21}};
inline constexpr chesslib::Square chesslib::Square::G3{std::uint8_t{22}};
inline constexpr chesslib::Square chesslib::Square::H3{std::uint8_t{23}};

inline constexpr chesslib::Square chesslib::Square::A4{std::uint8_t{24}};
inline constexpr chesslib::Square chesslib::Square::B4{std::uint8_t{25}};
inline constexpr chesslib::Square chesslib::Square::C4{std::uint8_t{26}};
inline constexpr chesslib::Square chesslib::Square::D4{std::uint8_t{27}};
inline constexpr chesslib::Square chesslib::Square::E4{std::uint8_t{28}};
inline constexpr chesslib::Square chesslib::Square::F4{std::uint8_t{29}};
inline constexpr chesslib::Square chesslib::Square::G4{std::uint8_t{30}};
inline constexpr chesslib::Square chesslib::Square::H4{std::uint8_t{31}};

inline constexpr chesslib::Square chesslib::Square::A5{std::uint8_t{32}};
inline constexpr chesslib::Square chesslib::Square::B5{std::uint8_t{33}};
inline constexpr chesslib::Square chesslib::Square::C5{std::uint8_t{34}};
inline constexpr chesslib::Square chesslib::Square::D5{std::uint8_t{35}};
inline constexpr chesslib::Square chesslib::Square::E5{std::uint8_t{36}};
inline constexpr chesslib::Square chesslib::Square::F5{std::uint8_t{37}};
inline constexpr chesslib::Square chesslib::Square::G5{std::uint8_t{38}};
inline constexpr chesslib::Square chesslib::Square::H5{std::uint8_t{39}};

inline constexpr chesslib::Square chesslib::Square::A6{std::uint8_t{40}};
inline constexpr chesslib::Square chesslib::Square::B6{std::uint8_t{41}};
inline constexpr chesslib::Square chesslib::Square::C6{std::uint8_t{42}};
inline constexpr chesslib::Square chesslib::Square::D6{std::uint8_t{43}};
inline constexpr chesslib::Square chesslib::Square::E6{std::uint8_t{44}};
inline constexpr chesslib::Square chesslib::Square::F6{std::uint8_t{45}};
inline constexpr chesslib::Square chesslib::Square::G6{std::uint8_t{46}};
inline constexpr chesslib::Square chesslib::Square::H6{std::uint8_t{47}};

inline constexpr chesslib::Square chesslib::Square::A7{std::uint8_t{48}};
inline constexpr chesslib::Square chesslib::Square::B7{std::uint8_t{49}};
inline constexpr chesslib::Square chesslib::Square::C7{std::uint8_t{50}};
inline constexpr chesslib::Square chesslib::Square::D7{std::uint8_t{51}};
inline constexpr chesslib::Square chesslib::Square::E7{std::uint8_t{52}};
inline constexpr chesslib::Square chesslib::Square::F7{std::uint8_t{53}};
inline constexpr chesslib::Square chesslib::Square::G7{std::uint8_t{54}};
inline constexpr chesslib::Square chesslib::Square::H7{std::uint8_t{55}};

inline constexpr chesslib::Square chesslib::Square::A8{std::uint8_t{56}};
inline constexpr chesslib::Square chesslib::Square::B8{std::uint8_t{57}};
inline constexpr chesslib::Square chesslib::Square::C8{std::uint8_t{58}};
inline constexpr chesslib::Square chesslib::Square::D8{std::uint8_t{59}};
inline constexpr chesslib::Square chesslib::Square::E8{std::uint8_t{60}};
inline constexpr chesslib::Square chesslib::Square::F8{std::uint8_t{61}};
inline constexpr chesslib::Square chesslib::Square::G8{std::uint8_t{62}};
inline constexpr chesslib::Square chesslib::Square::H8{std::uint8_t{63}};
