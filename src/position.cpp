// =============================================================================
// POSITION: Legality, Generation and Move Application
// =============================================================================
//
// A position answers three questions for the side to move:
//
// 1. IS THIS MOVE LEGAL?
//    The piece must stand on the source square, the destination must be in
//    its reach given the current occupancy, and a promotion must be named
//    exactly when a pawn reaches the last rank. Finally the move is played on
//    a scratch copy: if the mover's king is attacked there, the move is
//    illegal. That single test rules out moving into check, moving a pinned
//    piece off its line and ignoring an existing check.
//
// 2. WHAT ARE THE LEGAL MOVES?
//    The same reach computation for every piece of the side to move, each
//    candidate filtered through the scratch-copy test, plus castling.
//
// 3. WHAT DOES THE MOVE LEAD TO?
//    A copy of the position with pieces relocated, rights and en passant
//    updated, the side flipped and the derived fields (checks, pins, terminal
//    flag) recomputed. The hash is updated at every mutation.
//
// Pins and checks come from one routine, pins_and_checks(square, defender):
//
//   - an enemy slider whose line to the square is empty gives check
//   - an enemy slider whose line holds exactly one defender piece pins it
//   - enemy knights, pawns and the king give check by lookup alone
//
// The castling "is this transit square attacked?" test reuses it.
//
// =============================================================================

#include "chesslib/position.hpp"

#include <cassert>

#include "chesslib/attacks.hpp"
#include "chesslib/errors.hpp"

namespace chesslib {

namespace {

constexpr Square home_king_square(Colour colour) {
  return Square::from_file_and_rank(File::E, back_rank(colour));
}

constexpr Square king_side_rook_square(Colour colour) {
  return Square::from_file_and_rank(File::H, back_rank(colour));
}

constexpr Square queen_side_rook_square(Colour colour) {
  return Square::from_file_and_rank(File::A, back_rank(colour));
}

// King and rook travel for one castling move.
struct CastlingPath {
  Square king_from;
  Square king_to;
  Square rook_from;
  Square rook_to;
};

constexpr CastlingPath castling_path(MoveKind kind, Colour colour) {
  const Rank rank = back_rank(colour);
  if (kind == MoveKind::CastleKingSide) {
    return {Square::from_file_and_rank(File::E, rank), Square::from_file_and_rank(File::G, rank),
            Square::from_file_and_rank(File::H, rank), Square::from_file_and_rank(File::F, rank)};
  }
  return {Square::from_file_and_rank(File::E, rank), Square::from_file_and_rank(File::C, rank),
          Square::from_file_and_rank(File::A, rank), Square::from_file_and_rank(File::D, rank)};
}

} // namespace

Position::Position() : Position(from_fen(BoardBuilder::START_POS_FEN)) {}

Position Position::from_fen(std::string_view fen) {
  return from_builder(BoardBuilder::from_fen(fen));
}

Position Position::from_builder(const BoardBuilder& builder) {
  Position position{EmptyTag{}};

  for (std::uint8_t index = 0; index < SQUARES_NUMBER; ++index) {
    const Square square = Square::from_index(index);
    if (const auto piece = builder.piece_at(square); piece.has_value()) {
      position.board_.put_piece(*piece, square);
    }
  }

  position.side_to_move_ = builder.side_to_move();
  position.castling_rights_[colour_index(Colour::White)] = builder.castling_rights(Colour::White);
  position.castling_rights_[colour_index(Colour::Black)] = builder.castling_rights(Colour::Black);
  position.en_passant_ = builder.en_passant();
  position.half_move_clock_ = builder.half_move_clock();
  position.full_move_number_ = builder.full_move_number();

  position.validate();

  // From here on the hash is maintained incrementally.
  position.hash_ = ZOBRIST.hash(position);
  position.update_pins_and_checks();
  position.update_terminal_status();
  return position;
}

BoardBuilder Position::to_builder() const {
  BoardBuilder builder;
  Bitboard occupied = occupancy();
  while (occupied != 0) {
    const Square square = Square::pop_first_occupied(occupied);
    builder.set_piece(square, piece_at(square));
  }

  builder.set_side_to_move(side_to_move_)
      .set_castling_rights(Colour::White, castling_rights(Colour::White))
      .set_castling_rights(Colour::Black, castling_rights(Colour::Black))
      .set_en_passant(en_passant_)
      .set_half_move_clock(half_move_clock_)
      .set_full_move_number(full_move_number_);
  return builder;
}

std::string Position::to_fen() const {
  return to_builder().to_fen();
}

Square Position::king_square(Colour colour) const {
  const Bitboard king = pieces(PieceType::King, colour);
  assert(count(king) == 1);
  return Square::first_occupied(king);
}

// =============================================================================
// VALIDATION
// =============================================================================
// Invariants are checked in a fixed order and the first one broken is
// reported, so a caller can tell exactly which rule the input violates.
// =============================================================================
void Position::validate() const {
  const Bitboard white = pieces(Colour::White);
  const Bitboard black = pieces(Colour::Black);
  if ((white & black) != 0) {
    throw PositionError(PositionErrorKind::ColoursOverlap);
  }

  Bitboard typed = EMPTY;
  for (const auto type : ALL_PIECE_TYPES) {
    if ((pieces(type) & typed) != 0) {
      throw PositionError(PositionErrorKind::PieceTypesOverlap);
    }
    typed |= pieces(type);
  }

  if (typed != occupancy() || (white | black) != occupancy()) {
    throw PositionError(PositionErrorKind::InconsistentOccupancy);
  }

  for (const auto colour : {Colour::White, Colour::Black}) {
    if (count(pieces(PieceType::King, colour)) != 1) {
      throw PositionError(PositionErrorKind::InvalidKingCount);
    }
  }

  const Colour opponent = !side_to_move_;
  if (pins_and_checks(king_square(opponent), opponent).checkers != 0) {
    throw PositionError(PositionErrorKind::OpponentInCheck);
  }

  // The opponent's pawn has just made a double step past the target square.
  if (en_passant_.has_value()) {
    const Square target = *en_passant_;
    const Rank expected = side_to_move_ == Colour::White ? Rank::Sixth : Rank::Third;
    if (target.rank() != expected || !is_empty(target) ||
        (pieces(PieceType::Pawn, opponent) & target.advance(opponent)) == 0) {
      throw PositionError(PositionErrorKind::InconsistentEnPassant);
    }
  }

  for (const auto colour : {Colour::White, Colour::Black}) {
    const CastlingRights rights = castling_rights(colour);
    if (rights.is_neither()) {
      continue;
    }

    const Bitboard rooks = pieces(PieceType::Rook, colour);
    if (king_square(colour) != home_king_square(colour) ||
        (rights.has_king_side() && (rooks & king_side_rook_square(colour)) == 0) ||
        (rights.has_queen_side() && (rooks & queen_side_rook_square(colour)) == 0)) {
      throw PositionError(PositionErrorKind::InconsistentCastlingRights);
    }
  }
}

// =============================================================================
// MUTATORS
// =============================================================================
// Each mutator XORs the old feature value out and the new one in, so the hash
// never needs recomputing from scratch.
// =============================================================================
void Position::put_piece(Piece piece, Square square) {
  clear_square(square);
  board_.put_piece(piece, square);
  hash_ ^= ZOBRIST.piece_square(piece, square);
}

void Position::clear_square(Square square) {
  if (const auto removed = board_.clear_square(square); removed.has_value()) {
    hash_ ^= ZOBRIST.piece_square(*removed, square);
  }
}

void Position::set_side_to_move(Colour colour) {
  if (colour != side_to_move_) {
    hash_ ^= ZOBRIST.black_to_move();
  }
  side_to_move_ = colour;
}

void Position::set_castling_rights(Colour colour, CastlingRights rights) {
  const CastlingRights current = castling_rights(colour);
  if (current != rights) {
    hash_ ^= ZOBRIST.castling(current, colour);
    hash_ ^= ZOBRIST.castling(rights, colour);
  }
  castling_rights_[colour_index(colour)] = rights;
}

void Position::set_en_passant(std::optional<Square> square) {
  if (en_passant_.has_value()) {
    hash_ ^= ZOBRIST.en_passant(*en_passant_);
  }
  if (square.has_value()) {
    hash_ ^= ZOBRIST.en_passant(*square);
  }
  en_passant_ = square;
}

bool Position::is_en_passant_capture(const PieceMove& piece_move) const noexcept {
  return piece_move.piece_type == PieceType::Pawn && en_passant_.has_value() &&
         piece_move.to == *en_passant_ && piece_move.from.file() != piece_move.to.file();
}

void Position::move_piece(const PieceMove& piece_move) {
  const auto colour = colour_at(piece_move.from);
  assert(colour.has_value());

  const bool en_passant_capture = is_en_passant_capture(piece_move);

  clear_square(piece_move.from);
  put_piece(Piece{piece_move.promotion.value_or(piece_move.piece_type), *colour}, piece_move.to);

  // The captured pawn stands behind the target square.
  if (en_passant_capture) {
    clear_square(piece_move.to.advance(!*colour));
  }
}

void Position::apply(const Move& move) {
  const Colour mover = side_to_move_;
  const Colour opponent = !mover;

  CastlingRights mover_rights = castling_rights(mover);
  CastlingRights opponent_rights = castling_rights(opponent);
  std::optional<Square> next_en_passant;
  bool resets_clock = false;

  if (const auto& piece_move = move.piece_move(); move.kind() == MoveKind::Piece) {
    const PieceMove& pm = *piece_move;
    resets_clock =
        pm.piece_type == PieceType::Pawn || !is_empty(pm.to) || is_en_passant_capture(pm);

    if (pm.piece_type == PieceType::King) {
      mover_rights = CastlingRights::neither();
    } else if (pm.piece_type == PieceType::Rook) {
      if (pm.from == king_side_rook_square(mover)) {
        mover_rights -= CastlingRights::king_side();
      } else if (pm.from == queen_side_rook_square(mover)) {
        mover_rights -= CastlingRights::queen_side();
      }
    }

    // A rook captured on its home square takes its right with it.
    if (pm.to == king_side_rook_square(opponent)) {
      opponent_rights -= CastlingRights::king_side();
    } else if (pm.to == queen_side_rook_square(opponent)) {
      opponent_rights -= CastlingRights::queen_side();
    }

    if (pm.piece_type == PieceType::Pawn && pm.from.rank_diff(pm.to) == 2) {
      next_en_passant = pm.from.advance(mover);
    }

    move_piece(pm);
  } else {
    const CastlingPath path = castling_path(move.kind(), mover);
    move_piece(PieceMove{PieceType::King, path.king_from, path.king_to, std::nullopt});
    move_piece(PieceMove{PieceType::Rook, path.rook_from, path.rook_to, std::nullopt});
    mover_rights = CastlingRights::neither();
  }

  set_castling_rights(mover, mover_rights);
  set_castling_rights(opponent, opponent_rights);
  set_en_passant(next_en_passant);

  half_move_clock_ = resets_clock ? 0 : half_move_clock_ + 1;
  if (mover == Colour::Black) {
    ++full_move_number_;
  }

  set_side_to_move(opponent);
  update_pins_and_checks();
  update_terminal_status();
}

void Position::update_pins_and_checks() {
  const PinsAndChecks result = pins_and_checks(king_square(side_to_move_), side_to_move_);
  pinned_ = result.pinned;
  checkers_ = result.checkers;
}

// =============================================================================
// ATTACK DETECTION
// =============================================================================
Position::PinsAndChecks Position::pins_and_checks(Square square, Colour defender) const {
  PinsAndChecks result;

  const Bitboard enemies = pieces(!defender);
  const Bitboard diagonal = pieces(PieceType::Bishop) | pieces(PieceType::Queen);
  const Bitboard orthogonal = pieces(PieceType::Rook) | pieces(PieceType::Queen);

  Bitboard sliders = enemies & ((piece_reach(PieceType::Bishop, square) & diagonal) |
                                (piece_reach(PieceType::Rook, square) & orthogonal));
  while (sliders != 0) {
    const Square slider = Square::pop_first_occupied(sliders);
    const Bitboard blockers = between(square, slider).value_or(EMPTY) & occupancy();

    if (blockers == 0) {
      result.checkers |= slider;
    } else if (!more_than_one(blockers)) {
      result.pinned |= blockers & pieces(defender);
    }
  }

  // Non-sliding attackers cannot be blocked.
  result.checkers |= enemies & pieces(PieceType::Knight) & piece_reach(PieceType::Knight, square);
  result.checkers |= enemies & pieces(PieceType::Pawn) & pawn_captures(defender, square);
  result.checkers |= enemies & pieces(PieceType::King) & piece_reach(PieceType::King, square);

  return result;
}

bool Position::is_under_attack(Square square) const {
  return pins_and_checks(square, side_to_move_).checkers != 0;
}

// =============================================================================
// LEGALITY
// =============================================================================

// Pseudo-legal destinations for the side to move, occupancy applied.
Bitboard Position::destinations(PieceType type, Square from) const {
  const Bitboard own = pieces(side_to_move_);
  const Bitboard occupied = occupancy();

  const auto path_is_clear = [&](Square to) {
    const auto path = between(from, to);
    return path.has_value() && (*path & occupied) == 0;
  };

  Bitboard result = EMPTY;
  switch (type) {
  case PieceType::Pawn: {
    Bitboard advances = pawn_advances(side_to_move_, from) & ~occupied;
    while (advances != 0) {
      const Square to = Square::pop_first_occupied(advances);
      if (path_is_clear(to)) {
        result |= to;
      }
    }

    Bitboard targets = pieces(!side_to_move_);
    if (en_passant_.has_value()) {
      targets |= *en_passant_;
    }
    result |= pawn_captures(side_to_move_, from) & targets;
    break;
  }
  case PieceType::Knight:
  case PieceType::King:
    result = piece_reach(type, from) & ~own;
    break;
  case PieceType::Bishop:
  case PieceType::Rook:
  case PieceType::Queen: {
    Bitboard reach = piece_reach(type, from) & ~own;
    while (reach != 0) {
      const Square to = Square::pop_first_occupied(reach);
      if (path_is_clear(to)) {
        result |= to;
      }
    }
    break;
  }
  }
  return result;
}

// Plays the move on a disposable copy and looks for checks on the mover's king.
bool Position::leaves_king_safe(const PieceMove& piece_move) const {
  Position scratch = *this;
  scratch.move_piece(piece_move);
  return scratch.pins_and_checks(scratch.king_square(side_to_move_), side_to_move_).checkers == 0;
}

bool Position::is_legal_piece_move(const PieceMove& piece_move) const {
  if ((pieces(piece_move.piece_type, side_to_move_) & piece_move.from) == 0) {
    return false;
  }

  if ((destinations(piece_move.piece_type, piece_move.from) & piece_move.to) == 0) {
    return false;
  }

  const bool promotes = piece_move.piece_type == PieceType::Pawn &&
                        piece_move.to.rank() == promotion_rank(side_to_move_);
  if (promotes != piece_move.promotion.has_value()) {
    return false;
  }
  if (promotes && !is_promotion_type(*piece_move.promotion)) {
    return false;
  }

  return leaves_king_safe(piece_move);
}

bool Position::can_castle(MoveKind kind) const {
  const CastlingRights rights = castling_rights(side_to_move_);
  const bool has_right =
      kind == MoveKind::CastleKingSide ? rights.has_king_side() : rights.has_queen_side();
  if (!has_right || is_check()) {
    return false;
  }

  const CastlingPath path = castling_path(kind, side_to_move_);
  if ((between(path.king_from, path.rook_from).value_or(FULL) & occupancy()) != 0) {
    return false;
  }

  // The rook lands on the square the king passes over.
  return !is_under_attack(path.rook_to) && !is_under_attack(path.king_to);
}

bool Position::is_legal_move(const Move& move) const {
  if (move.kind() == MoveKind::Piece) {
    return is_legal_piece_move(*move.piece_move());
  }
  return can_castle(move.kind());
}

// =============================================================================
// GENERATION
// =============================================================================
template <typename Visitor>
bool Position::for_each_legal_move(Visitor&& visitor) const {
  const Bitboard own = pieces(side_to_move_);
  const Rank last_rank = promotion_rank(side_to_move_);

  for (const auto type : ALL_PIECE_TYPES) {
    Bitboard sources = pieces(type) & own;

    while (sources != 0) {
      const Square from = Square::pop_first_occupied(sources);
      Bitboard targets = destinations(type, from);

      while (targets != 0) {
        const Square to = Square::pop_first_occupied(targets);
        const PieceMove piece_move{type, from, to, std::nullopt};
        if (!leaves_king_safe(piece_move)) {
          continue;
        }

        if (type == PieceType::Pawn && to.rank() == last_rank) {
          for (const auto promotion : PROMOTION_TYPES) {
            if (!visitor(Move::piece(type, from, to, promotion))) {
              return false;
            }
          }
        } else if (!visitor(Move::piece(piece_move))) {
          return false;
        }
      }
    }
  }

  for (const auto kind : {MoveKind::CastleKingSide, MoveKind::CastleQueenSide}) {
    if (!can_castle(kind)) {
      continue;
    }
    const Move castle =
        kind == MoveKind::CastleKingSide ? Move::castle_king_side() : Move::castle_queen_side();
    if (!visitor(castle)) {
      return false;
    }
  }

  return true;
}

void Position::update_terminal_status() {
  is_terminal_ = for_each_legal_move([](const Move&) { return false; });
}

MoveList Position::legal_moves() const {
  MoveList moves;
  moves.reserve(64);
  for_each_legal_move([&moves](const Move& move) {
    moves.push_back(move);
    return true;
  });
  return moves;
}

Position Position::make_move(const Move& move) const {
  if (!is_legal_move(move)) {
    throw IllegalMoveError(move.to_string());
  }

  Position next = *this;
  next.apply(move);
  return next;
}

// =============================================================================
// STATUS AND NOTATION SUPPORT
// =============================================================================
BoardStatus Position::status() const noexcept {
  if (!is_terminal_) {
    return BoardStatus::Ongoing;
  }
  return is_check() ? BoardStatus::Checkmate : BoardStatus::Stalemate;
}

bool Position::is_theoretical_draw() const noexcept {
  const Bitboard minors = pieces(PieceType::Knight) | pieces(PieceType::Bishop);

  for (const auto colour : {Colour::White, Colour::Black}) {
    const Bitboard own = pieces(colour);
    const int number = count(own);
    if (number > 2 || (number == 2 && (own & minors) == 0)) {
      return false;
    }
  }
  return true;
}

AmbiguityType Position::move_ambiguity(const PieceMove& piece_move) const {
  if (!is_legal_piece_move(piece_move)) {
    throw IllegalMoveError(piece_move.to_string());
  }
  return legal_move_ambiguity(piece_move);
}

AmbiguityType Position::legal_move_ambiguity(const PieceMove& piece_move) const {
  switch (piece_move.piece_type) {
  case PieceType::Pawn:
    return piece_move.from.file() != piece_move.to.file() ? AmbiguityType::ExtraFile
                                                          : AmbiguityType::Neither;
  case PieceType::King:
    return AmbiguityType::Neither;
  default:
    break;
  }

  // Other pieces of the same type that could legally land on the same square.
  Bitboard rivals = pieces(piece_move.piece_type, side_to_move_) &
                    piece_reach(piece_move.piece_type, piece_move.to) & ~Bitboard(piece_move.from);
  Bitboard candidates = EMPTY;
  while (rivals != 0) {
    PieceMove rival = piece_move;
    rival.from = Square::pop_first_occupied(rivals);
    if (is_legal_piece_move(rival)) {
      candidates |= rival.from;
    }
  }

  if (candidates == 0) {
    return AmbiguityType::Neither;
  }
  if ((candidates & FILE_MASKS[to_index(piece_move.from.file())]) != 0) {
    return AmbiguityType::ExtraSquare;
  }
  return AmbiguityType::ExtraFile;
}

bool operator==(const Position& lhs, const Position& rhs) noexcept {
  return lhs.board_ == rhs.board_ && lhs.side_to_move_ == rhs.side_to_move_ &&
         lhs.castling_rights_ == rhs.castling_rights_ && lhs.en_passant_ == rhs.en_passant_ &&
         lhs.half_move_clock_ == rhs.half_move_clock_ &&
         lhs.full_move_number_ == rhs.full_move_number_;
}

std::ostream& operator<<(std::ostream& os, BoardStatus status) {
  switch (status) {
  case BoardStatus::Ongoing:
    return os << "ongoing";
  case BoardStatus::Checkmate:
    return os << "checkmate";
  case BoardStatus::Stalemate:
    return os << "stalemate";
  }
  return os;
}

std::ostream& operator<<(std::ostream& os, AmbiguityType ambiguity) {
  switch (ambiguity) {
  case AmbiguityType::Neither:
    return os << "neither";
  case AmbiguityType::ExtraFile:
    return os << "extra file";
  case AmbiguityType::ExtraSquare:
    return os << "extra square";
  }
  return os;
}

} // namespace chesslib
