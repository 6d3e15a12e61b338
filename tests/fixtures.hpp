#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chesslib::fixtures {

struct PerftRecord {
  std::string name;
  std::string fen;
  int depth{};
  std::uint64_t nodes{};
};

std::filesystem::path fixtures_root();
std::filesystem::path perft_path();

std::vector<PerftRecord> load_perft(const std::filesystem::path& file);

} // namespace chesslib::fixtures
