#include "chesslib/board_builder.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "chesslib/errors.hpp"

namespace chesslib {
namespace {

class FenReader {
public:
  explicit FenReader(std::string_view fen) : fen_(fen) {}

  [[nodiscard]] FenParseError error(const std::string& detail) const {
    return FenParseError(fen_, detail);
  }

  std::vector<std::string_view> split_fields() const {
    std::vector<std::string_view> parts;
    parts.reserve(6);

    std::size_t start = 0;
    while (start < fen_.size()) {
      const auto pos = fen_.find(' ', start);
      if (pos == std::string_view::npos) {
        parts.emplace_back(fen_.substr(start));
        break;
      }
      parts.emplace_back(fen_.substr(start, pos - start));
      start = pos + 1;
    }
    return parts;
  }

  void parse_placement(std::string_view str, BoardBuilder& builder) const {
    const auto row_count = static_cast<std::size_t>(std::count(str.begin(), str.end(), '/')) + 1U;
    if (row_count != RANKS_NUMBER) {
      std::ostringstream oss;
      oss << "board must contain 8 rows, got " << row_count;
      throw error(oss.str());
    }

    int rank = RANKS_NUMBER - 1;
    int file = 0;

    for (const char c : str) {
      if (c == '/') {
        if (file != FILES_NUMBER) {
          throw error("rank " + std::to_string(rank + 1) + " does not contain 8 squares");
        }
        --rank;
        file = 0;
        continue;
      }

      if (std::isdigit(static_cast<unsigned char>(c)) != 0) {
        const int run = c - '0';
        if (run < 1 || run > FILES_NUMBER) {
          throw error(std::string("invalid empty-square run '") + c + "'");
        }
        file += run;
      } else {
        const auto piece = piece_from_char(c);
        if (!piece.has_value()) {
          throw error(std::string("invalid piece '") + c + "'");
        }
        if (file < FILES_NUMBER) {
          builder.set_piece(Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                                       static_cast<std::uint8_t>(rank)),
                            piece);
        }
        ++file;
      }

      if (file > FILES_NUMBER) {
        throw error("rank " + std::to_string(rank + 1) + " does not contain 8 squares");
      }
    }

    if (file != FILES_NUMBER) {
      throw error("rank 1 does not contain 8 squares");
    }
  }

  Colour parse_side_to_move(std::string_view colour) const {
    if (colour == "w") {
      return Colour::White;
    }
    if (colour == "b") {
      return Colour::Black;
    }
    throw error("invalid colour to move '" + std::string(colour) + "'");
  }

  void parse_castling_rights(std::string_view str, BoardBuilder& builder) const {
    builder.set_castling_rights(Colour::White, CastlingRights::neither());
    builder.set_castling_rights(Colour::Black, CastlingRights::neither());
    if (str == "-") {
      return;
    }
    if (str.empty()) {
      throw error("invalid castling rights");
    }

    for (const char c : str) {
      switch (c) {
      case 'K':
        add_right(builder, Colour::White, CastlingRights::king_side());
        break;
      case 'Q':
        add_right(builder, Colour::White, CastlingRights::queen_side());
        break;
      case 'k':
        add_right(builder, Colour::Black, CastlingRights::king_side());
        break;
      case 'q':
        add_right(builder, Colour::Black, CastlingRights::queen_side());
        break;
      default:
        throw error("invalid castling rights '" + std::string(str) + "'");
      }
    }
  }

  std::optional<Square> parse_en_passant(std::string_view square) const {
    if (square == "-") {
      return std::nullopt;
    }

    const auto parsed = Square::parse(square);
    if (!parsed.has_value()) {
      throw error("invalid en passant square '" + std::string(square) + "'");
    }
    return parsed;
  }

  std::uint32_t parse_counter(std::string_view str, std::string_view name) const {
    std::uint32_t value = 0;
    const auto* const first = str.data();
    const auto* const last = str.data() + str.size();
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (str.empty() || ec != std::errc{} || ptr != last) {
      throw error("invalid " + std::string(name) + " '" + std::string(str) + "'");
    }
    return value;
  }

private:
  static void add_right(BoardBuilder& builder, Colour colour, CastlingRights right) {
    builder.set_castling_rights(colour, builder.castling_rights(colour) + right);
  }

  std::string_view fen_;
};

std::string placement_to_fen(const BoardBuilder& builder) {
  std::string output;
  output.reserve(64 + 7); // pieces plus slashes

  for (int rank = RANKS_NUMBER - 1; rank >= 0; --rank) {
    std::uint8_t empty_run = 0;

    for (int file = 0; file < FILES_NUMBER; ++file) {
      const Square square = Square::from_file_and_rank(static_cast<std::uint8_t>(file),
                                                       static_cast<std::uint8_t>(rank));

      if (const auto piece = builder.piece_at(square); piece.has_value()) {
        if (empty_run > 0) {
          output.push_back(static_cast<char>('0' + empty_run));
          empty_run = 0;
        }
        output.push_back(to_char(*piece));
      } else {
        ++empty_run;
      }
    }

    if (empty_run > 0) {
      output.push_back(static_cast<char>('0' + empty_run));
    }

    if (rank > 0) {
      output.push_back('/');
    }
  }

  return output;
}

} // namespace

BoardBuilder BoardBuilder::from_fen(std::string_view fen) {
  const FenReader reader(fen);
  const auto parts = reader.split_fields();

  constexpr std::size_t NUM_PARTS = 6;
  if (parts.size() != NUM_PARTS) {
    std::ostringstream oss;
    oss << "FEN must contain " << NUM_PARTS << " fields, got " << parts.size();
    throw reader.error(oss.str());
  }

  BoardBuilder builder;
  reader.parse_placement(parts[0], builder);
  builder.set_side_to_move(reader.parse_side_to_move(parts[1]));
  reader.parse_castling_rights(parts[2], builder);
  builder.set_en_passant(reader.parse_en_passant(parts[3]));
  builder.set_half_move_clock(reader.parse_counter(parts[4], "half-move clock"));
  builder.set_full_move_number(reader.parse_counter(parts[5], "full move number"));
  return builder;
}

std::string BoardBuilder::to_fen() const {
  std::string castling = to_string(castling_rights(Colour::White), Colour::White) +
                         to_string(castling_rights(Colour::Black), Colour::Black);
  if (castling.empty()) {
    castling = "-";
  }

  std::ostringstream oss;
  oss << placement_to_fen(*this) << ' ' << (side_to_move_ == Colour::White ? 'w' : 'b') << ' '
      << castling << ' ' << (en_passant_.has_value() ? en_passant_->to_string() : "-") << ' '
      << half_move_clock_ << ' ' << full_move_number_;
  return oss.str();
}

} // namespace chesslib
