#include "Move.hpp"


namespace {
    inline void hash_combine(std::size_t& seed, std::size_t value) {
        seed ^= value + 0x9e3779b97f4a7c15ULL + (seed << 6) + (seed >> 2);
    }
}

bool Move::operator==(const Move& other) const {
    if (kind_ != other.kind_) return false;

    switch (kind_) {
        case MoveKind::Normal:
            return side_ == other.side_ && from_ == other.from_ && to_ == other.to_
                && face_ == other.face_ && promote_ == other.promote_;
        case MoveKind::Drop:
            return side_ == other.side_ && to_ == other.to_ && piece_ == other.piece_;
        case MoveKind::Terminal:
            return reason_ == other.reason_ && winner_ == other.winner_;
    }
    return false;
}

std::size_t Move::hash() const {
    std::size_t seed = static_cast<std::size_t>(kind_);

    switch (kind_) {
        case MoveKind::Normal:
            hash_combine(seed, static_cast<std::size_t>(side_));
            hash_combine(seed, static_cast<std::size_t>(from_));
            hash_combine(seed, static_cast<std::size_t>(to_));
            hash_combine(seed, static_cast<std::size_t>(face_));
            hash_combine(seed, promote_ ? 1 : 0);
            break;
        case MoveKind::Drop:
            hash_combine(seed, static_cast<std::size_t>(side_));
            hash_combine(seed, static_cast<std::size_t>(to_));
            hash_combine(seed, static_cast<std::size_t>(piece_));
            break;
        case MoveKind::Terminal:
            hash_combine(seed, static_cast<std::size_t>(reason_));
            hash_combine(seed, winner_ ? static_cast<std::size_t>(*winner_) + 1 : 0);
            break;
    }
    return seed;
}

std::ostream& operator<<(std::ostream& os, TerminalReason reason) {
    switch (reason) {
        case TerminalReason::Resignation:     return os << "resignation";
        case TerminalReason::Checkmate:       return os << "checkmate";
        case TerminalReason::KingLeftInCheck: return os << "king left in check";
        case TerminalReason::Repetition:      return os << "repetition";
    }
    return os;
}

std::ostream& operator<<(std::ostream& os, const Move& move) {
    switch (move.kind()) {
        case MoveKind::Normal:
            os << move.side() << ": " << move.from() << " -> " << move.to() << ' ' << move.face();
            if (move.promote()) os << " +";
            return os;
        case MoveKind::Drop:
            return os << move.side() << ": " << move.to() << ' ' << move.piece() << " drop";
        case MoveKind::Terminal:
            if (move.winner()) return os << *move.winner() << " wins (" << move.reason() << ')';
            return os << "no result (" << move.reason() << ')';
    }
    return os;
}
