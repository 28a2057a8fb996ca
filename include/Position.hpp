#pragma once

#include "Types.hpp"
#include "Piece.hpp"

#include <array>
#include <cstdint>
#include <functional>
#include <initializer_list>
#include <memory>
#include <optional>
#include <span>
#include <vector>


// Captured pieces available to one side. Promotion state is never stored.
class Hand {
public:
    [[nodiscard]] int count(PieceType pt) const { return counts_[static_cast<size_t>(pt)]; }
    [[nodiscard]] bool empty() const;

    void add(PieceType pt) { ++counts_[static_cast<size_t>(pt)]; }
    // Precondition: count(pt) > 0.
    void remove(PieceType pt) { --counts_[static_cast<size_t>(pt)]; }
    void set(PieceType pt, int count) { counts_[static_cast<size_t>(pt)] = static_cast<uint8_t>(count); }

    bool operator==(const Hand& other) const = default;

private:
    std::array<uint8_t, PIECE_TYPE_NB> counts_{};
};

// Immutable snapshot of a game: 81 squares, both hands and the side to move.
// Successors are built by the Executor; an existing Position never changes.
class Position {
public:
    using Board = std::array<SquareContent, SQUARE_NB>;

    Position();
    Position(const Board& board, const Hand& sente_hand, const Hand& gote_hand, Side to_move);

    Position(const Position& other);
    Position& operator=(const Position& other);
    // Takes over the source's index. A moved-from Position may only be
    // assigned to or destroyed.
    Position(Position&& other) noexcept;
    Position& operator=(Position&& other) noexcept;
    ~Position();

    // Standard even-game layout, Sente to move.
    [[nodiscard]] static Position startpos();

    [[nodiscard]] const SquareContent& operator[](Square sq) const { return board_[static_cast<size_t>(sq)]; }
    [[nodiscard]] const Board& board() const { return board_; }
    [[nodiscard]] const Hand& hand(Side side) const { return hands_[static_cast<size_t>(side)]; }
    [[nodiscard]] Side side_to_move() const { return to_move_; }
    [[nodiscard]] uint64_t key() const { return key_; }

    // All squares whose content is one of `contents`, in square order.
    [[nodiscard]] std::vector<Square> search(std::span<const SquareContent> contents) const;
    [[nodiscard]] std::vector<Square> search(std::initializer_list<SquareContent> contents) const;

    // Unpromoted pawns of `side` on the given file (1-9).
    [[nodiscard]] int pawn_count(Side side, int file) const;

    // Squares holding `face` for `side`, from the cached location index.
    [[nodiscard]] const std::vector<Square>& locations(Side side, PieceFace face) const;

    // None once the king has been captured.
    [[nodiscard]] std::optional<Square> king_square(Side side) const;

    bool operator==(const Position& other) const;

private:
    struct LocationIndex;

    void refresh_hash();
    const LocationIndex& location_index() const;

    Board board_{};
    std::array<Hand, SIDE_NB> hands_{};
    Side to_move_ = Side::Sente;
    uint64_t key_ = 0;

    // Built on first use and never shared between Position instances.
    mutable std::unique_ptr<LocationIndex> index_;
};

template <>
struct std::hash<Position> {
    std::size_t operator()(const Position& p) const noexcept { return static_cast<std::size_t>(p.key()); }
};
