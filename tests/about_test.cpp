#include <gtest/gtest.h>

#include <sstream>

#include "chesslib/about.hpp"

TEST(About, MessageIncludesNameAndVersion) {
  const auto message = chesslib::about_message();
  EXPECT_NE(message.find("chesslib"), std::string::npos);
  EXPECT_NE(message.find(chesslib::library_version()), std::string::npos);
}

TEST(About, PrintWritesMessageWithNewline) {
  std::ostringstream buffer;
  chesslib::print_about(buffer);
  EXPECT_EQ(buffer.str(), chesslib::about_message() + '\n');
}
