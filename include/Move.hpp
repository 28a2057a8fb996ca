#pragma once

#include "Types.hpp"
#include "Piece.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <ostream>


enum class MoveKind : uint8_t { Normal, Drop, Terminal };

enum class TerminalReason : uint8_t {
    Resignation,
    Checkmate,
    KingLeftInCheck, // the side to move can capture the opposing king
    Repetition
};

// Closed set of move variants selected by kind(). Only the fields that belong
// to the kind take part in equality and hashing.
class Move {
public:
    [[nodiscard]] static constexpr Move normal(Side side, Square from, Square to, PieceFace face, bool promote) {
        Move m(MoveKind::Normal);
        m.side_ = side;
        m.from_ = from;
        m.to_ = to;
        m.face_ = face;
        m.promote_ = promote;
        return m;
    }

    [[nodiscard]] static constexpr Move drop(Side side, Square to, PieceType piece) {
        Move m(MoveKind::Drop);
        m.side_ = side;
        m.to_ = to;
        m.piece_ = piece;
        return m;
    }

    [[nodiscard]] static constexpr Move terminal(TerminalReason reason, std::optional<Side> winner) {
        Move m(MoveKind::Terminal);
        m.reason_ = reason;
        m.winner_ = winner;
        return m;
    }

    [[nodiscard]] constexpr MoveKind kind() const { return kind_; }
    [[nodiscard]] constexpr bool is_normal() const { return kind_ == MoveKind::Normal; }
    [[nodiscard]] constexpr bool is_drop() const { return kind_ == MoveKind::Drop; }
    [[nodiscard]] constexpr bool is_terminal() const { return kind_ == MoveKind::Terminal; }

    [[nodiscard]] constexpr Side side() const { return side_; }
    [[nodiscard]] constexpr Square from() const { return from_; }
    [[nodiscard]] constexpr Square to() const { return to_; }
    [[nodiscard]] constexpr PieceFace face() const { return face_; }
    [[nodiscard]] constexpr bool promote() const { return promote_; }
    [[nodiscard]] constexpr TerminalReason reason() const { return reason_; }
    [[nodiscard]] constexpr std::optional<Side> winner() const { return winner_; }

    // The captured-pool identity of the moving or dropped piece.
    [[nodiscard]] constexpr PieceType piece() const {
        return kind_ == MoveKind::Drop ? piece_ : base_type(face_);
    }

    // Face that ends up on the destination square.
    [[nodiscard]] constexpr PieceFace placed_face() const {
        if (kind_ == MoveKind::Drop) return base_face(piece_);
        return promote_ ? promoted_face(face_) : face_;
    }

    bool operator==(const Move& other) const;

    [[nodiscard]] std::size_t hash() const;

private:
    constexpr explicit Move(MoveKind kind) : kind_(kind) {}

    MoveKind kind_;
    Side side_ = Side::Sente;
    Square from_ = Square::None;
    Square to_ = Square::None;
    PieceFace face_ = PieceFace::None;
    PieceType piece_ = PieceType::None;
    bool promote_ = false;
    TerminalReason reason_ = TerminalReason::Resignation;
    std::optional<Side> winner_;
};

std::ostream& operator<<(std::ostream& os, TerminalReason reason);
std::ostream& operator<<(std::ostream& os, const Move& move);

template <>
struct std::hash<Move> {
    std::size_t operator()(const Move& m) const noexcept { return m.hash(); }
};
