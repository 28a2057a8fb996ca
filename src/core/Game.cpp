#include "Game.hpp"
#include "Check.hpp"
#include "Executor.hpp"

#include <algorithm>
#include <utility>


Game::Game() : Game(Position::startpos()) {}

Game::Game(Position start) {
    positions_.push_back(std::move(start));
}

std::vector<Move> Game::available_moves() const {
    if (is_over()) return {};

    const Position& pos = position();
    const Side winner = opposite(pos.side_to_move());

    std::vector<Move> moves = Check::moves_with_terminals(pos);
    moves.push_back(Move::terminal(TerminalReason::Resignation, winner));
    moves.push_back(Move::terminal(TerminalReason::Repetition, std::nullopt));
    if (Check::is_checkmate(pos)) {
        moves.push_back(Move::terminal(TerminalReason::Checkmate, winner));
    }
    return moves;
}

bool Game::play(const Move& move) {
    const std::vector<Move> moves = available_moves();
    if (std::find(moves.begin(), moves.end(), move) == moves.end()) return false;

    std::optional<Position> next = Executor::apply(position(), move);
    moves_.push_back(move);
    if (next) positions_.push_back(std::move(*next));
    return true;
}

bool Game::resign() {
    return play(Move::terminal(TerminalReason::Resignation, opposite(position().side_to_move())));
}

bool Game::undo() {
    if (moves_.empty()) return false;

    if (!moves_.back().is_terminal()) positions_.pop_back();
    moves_.pop_back();
    return true;
}

bool Game::is_over() const {
    return !moves_.empty() && moves_.back().is_terminal();
}

std::optional<Move> Game::result() const {
    if (!is_over()) return std::nullopt;
    return moves_.back();
}
