#pragma once

#include "Move.hpp"
#include "Position.hpp"

#include <cstddef>
#include <optional>
#include <vector>


// Current position of a game plus everything played to reach it.
class Game {
public:
    Game();
    explicit Game(Position start);

    [[nodiscard]] const Position& start() const { return positions_.front(); }
    [[nodiscard]] const Position& position() const { return positions_.back(); }
    [[nodiscard]] const std::vector<Move>& moves() const { return moves_; }

    // Position in which moves()[ply] was played.
    [[nodiscard]] const Position& position_before(std::size_t ply) const { return positions_[ply]; }

    // Everything play() accepts right now: generated moves, the king capture
    // terminal, resignation, repetition and, when the detector reports it,
    // checkmate. Empty once the game is over.
    [[nodiscard]] std::vector<Move> available_moves() const;

    // Returns false, leaving the game untouched, for a move not offered by
    // available_moves().
    bool play(const Move& move);
    bool resign();
    bool undo();

    [[nodiscard]] bool is_over() const;
    [[nodiscard]] std::optional<Move> result() const;

private:
    std::vector<Position> positions_;
    std::vector<Move> moves_;
};
