#include "chesslib/about.hpp"

#ifndef CHESSLIB_VERSION
#define CHESSLIB_VERSION "0.0.0"
#endif

namespace chesslib {

std::string library_name() {
  return "chesslib";
}

std::string library_version() {
  return CHESSLIB_VERSION;
}

std::string about_message() {
  return library_name() + " " + library_version() + " - chess positions, moves and games";
}

void print_about(std::ostream& os) {
  os << about_message() << '\n';
}

} // namespace chesslib
