#include "fixtures.hpp"

#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace chesslib::fixtures {
namespace {

// Field separator inside a record line.
constexpr char SEPARATOR = '|';

std::vector<std::string> fields_of(std::string_view line) {
  std::vector<std::string> fields;
  std::size_t start = 0;
  while (true) {
    const std::size_t end = line.find(SEPARATOR, start);
    fields.emplace_back(line.substr(start, end - start));
    if (end == std::string_view::npos) {
      break;
    }
    start = end + 1;
  }
  return fields;
}

std::string where(const std::filesystem::path& file, int line_number) {
  return file.string() + ":" + std::to_string(line_number);
}

} // namespace

std::filesystem::path fixtures_root() {
#ifdef CHESSLIB_FIXTURE_DIR
  return std::filesystem::path{CHESSLIB_FIXTURE_DIR};
#else
  return std::filesystem::path{"tests/fixtures"};
#endif
}

std::filesystem::path perft_path() {
  return fixtures_root() / "perft.txt";
}

std::vector<PerftRecord> load_perft(const std::filesystem::path& file) {
  std::ifstream in(file);
  if (!in) {
    throw std::runtime_error("cannot open fixture " + file.string());
  }

  std::vector<PerftRecord> records;
  std::string line;
  int line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }

    auto fields = fields_of(line);
    if (fields.size() != 4) {
      throw std::runtime_error(where(file, line_number) + ": expected name|fen|depth|nodes");
    }

    PerftRecord record{std::move(fields[0]), std::move(fields[1]), std::stoi(fields[2]),
                       std::stoull(fields[3])};
    if (record.depth < 1) {
      throw std::runtime_error(where(file, line_number) + ": depth must be positive");
    }
    records.push_back(std::move(record));
  }

  if (records.empty()) {
    throw std::runtime_error("no records in fixture " + file.string());
  }
  return records;
}

} // namespace chesslib::fixtures
