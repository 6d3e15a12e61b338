#pragma once

#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string_view>

namespace chesslib {

enum class Colour : std::uint8_t { White = 0, Black = 1 };

inline constexpr std::size_t COLOURS_NUMBER = 2;

constexpr Colour operator!(Colour colour) {
  return colour == Colour::White ? Colour::Black : Colour::White;
}

constexpr std::size_t colour_index(Colour colour) {
  return static_cast<std::size_t>(colour);
}

constexpr std::string_view to_string(Colour colour) {
  return colour == Colour::White ? "white" : "black";
}

inline std::ostream& operator<<(std::ostream& os, Colour colour) {
  return os << to_string(colour);
}

} // namespace chesslib
