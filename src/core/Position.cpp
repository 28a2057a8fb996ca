#include "Position.hpp"
#include "Zobrist.hpp"

#include <algorithm>
#include <mutex>


struct Position::LocationIndex {
    std::once_flag once;
    std::array<std::array<std::vector<Square>, PIECE_FACE_NB>, SIDE_NB> squares;
};

namespace {
    const std::vector<Square> NO_SQUARES;

    constexpr std::array<PieceFace, 9> BACK_RANK{
        PieceFace::Lance, PieceFace::Knight, PieceFace::Silver, PieceFace::Gold, PieceFace::King,
        PieceFace::Gold, PieceFace::Silver, PieceFace::Knight, PieceFace::Lance
    };
}

bool Hand::empty() const {
    return std::all_of(counts_.begin(), counts_.end(), [](uint8_t c) { return c == 0; });
}

Position::Position() : index_(std::make_unique<LocationIndex>()) {
    refresh_hash();
}

Position::Position(const Board& board, const Hand& sente_hand, const Hand& gote_hand, Side to_move)
    : board_(board),
      hands_{sente_hand, gote_hand},
      to_move_(to_move),
      index_(std::make_unique<LocationIndex>()) {
    refresh_hash();
}

// The location index is rebuilt for every new instance, never copied.
Position::Position(const Position& other)
    : board_(other.board_),
      hands_(other.hands_),
      to_move_(other.to_move_),
      key_(other.key_),
      index_(std::make_unique<LocationIndex>()) {}

Position& Position::operator=(const Position& other) {
    if (this == &other) return *this;
    board_ = other.board_;
    hands_ = other.hands_;
    to_move_ = other.to_move_;
    key_ = other.key_;
    index_ = std::make_unique<LocationIndex>();
    return *this;
}

Position::Position(Position&& other) noexcept = default;
Position& Position::operator=(Position&& other) noexcept = default;

Position::~Position() = default;

Position Position::startpos() {
    Board board{};

    for (int f = 0; f < FILE_NB; ++f) {
        // rank 1 and 9 back ranks, file index f runs from file 9 to file 1
        board[0 * FILE_NB + f] = SquareContent(Side::Gote, BACK_RANK[f]);
        board[8 * FILE_NB + f] = SquareContent(Side::Sente, BACK_RANK[f]);
        board[2 * FILE_NB + f] = SquareContent(Side::Gote, PieceFace::Pawn);
        board[6 * FILE_NB + f] = SquareContent(Side::Sente, PieceFace::Pawn);
    }

    board[static_cast<size_t>(Square::SQ82)] = SquareContent(Side::Gote, PieceFace::Rook);
    board[static_cast<size_t>(Square::SQ22)] = SquareContent(Side::Gote, PieceFace::Bishop);
    board[static_cast<size_t>(Square::SQ88)] = SquareContent(Side::Sente, PieceFace::Bishop);
    board[static_cast<size_t>(Square::SQ28)] = SquareContent(Side::Sente, PieceFace::Rook);

    return Position(board, Hand{}, Hand{}, Side::Sente);
}

void Position::refresh_hash() {
    key_ = 0;
    for (int sq = 0; sq < SQUARE_NB; ++sq) {
        key_ ^= Zobrist::square_key(board_[sq], static_cast<Square>(sq));
    }
    for (int s = 0; s < SIDE_NB; ++s) {
        for (int pt = 0; pt < PIECE_TYPE_NB; ++pt) {
            int n = hands_[s].count(static_cast<PieceType>(pt));
            if (n > 0) key_ ^= Zobrist::hand_key(static_cast<Side>(s), static_cast<PieceType>(pt), n);
        }
    }
    if (to_move_ == Side::Gote) {
        key_ ^= Zobrist::keys.side;
    }
}

const Position::LocationIndex& Position::location_index() const {
    std::call_once(index_->once, [this] {
        for (int sq = 0; sq < SQUARE_NB; ++sq) {
            const SquareContent& c = board_[sq];
            if (c.empty()) continue;
            index_->squares[static_cast<size_t>(c.side)][static_cast<size_t>(c.face)]
                .push_back(static_cast<Square>(sq));
        }
    });
    return *index_;
}

std::vector<Square> Position::search(std::span<const SquareContent> contents) const {
    std::vector<Square> found;
    for (int sq = 0; sq < SQUARE_NB; ++sq) {
        if (std::find(contents.begin(), contents.end(), board_[sq]) != contents.end()) {
            found.push_back(static_cast<Square>(sq));
        }
    }
    return found;
}

std::vector<Square> Position::search(std::initializer_list<SquareContent> contents) const {
    return search(std::span<const SquareContent>(contents.begin(), contents.size()));
}

int Position::pawn_count(Side side, int file) const {
    int count = 0;
    for (int rank = 1; rank <= RANK_NB; ++rank) {
        const SquareContent& c = (*this)[make_square(file, rank)];
        if (c.belongs_to(side) && c.face == PieceFace::Pawn) ++count;
    }
    return count;
}

const std::vector<Square>& Position::locations(Side side, PieceFace face) const {
    if (face == PieceFace::None) return NO_SQUARES;
    return location_index().squares[static_cast<size_t>(side)][static_cast<size_t>(face)];
}

std::optional<Square> Position::king_square(Side side) const {
    const std::vector<Square>& kings = locations(side, PieceFace::King);
    if (kings.empty()) return std::nullopt;
    return kings.front();
}

bool Position::operator==(const Position& other) const {
    return key_ == other.key_
        && to_move_ == other.to_move_
        && board_ == other.board_
        && hands_ == other.hands_;
}
