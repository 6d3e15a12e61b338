#pragma once

#include <cstdint>

#include "chesslib/position.hpp"

namespace chesslib {

// Number of leaf nodes of the legal move tree of the given depth.
std::uint64_t perft(const Position& position, std::uint8_t depth);

} // namespace chesslib
