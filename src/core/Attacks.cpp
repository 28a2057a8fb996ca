#include "Attacks.hpp"

#include <algorithm>

namespace Attacks {

void destinations(const Position& pos, Square from, bool include_own, std::vector<Square>& out) {
    const SquareContent& mover = pos[from];
    if (mover.empty()) return;

    const Side us = mover.side;

    for (const Offset& o : step_offsets(mover.face)) {
        Square to = shift(from, o, us);
        if (to == Square::None) continue;
        if (pos[to].belongs_to(us) && !include_own) continue;
        out.push_back(to);
    }

    for (const Offset& v : slide_vectors(mover.face)) {
        Square to = shift(from, v, us);
        while (to != Square::None) {
            const SquareContent& target = pos[to];
            if (target.belongs_to(us)) {
                if (include_own) out.push_back(to);
                break;
            }
            out.push_back(to);
            if (!target.empty()) break;
            to = shift(to, v, us);
        }
    }
}

std::vector<Square> destinations(const Position& pos, Square from, bool include_own) {
    std::vector<Square> out;
    destinations(pos, from, include_own, out);
    return out;
}

SquareSet attacked_squares(const Position& pos, Side attacker, bool include_own) {
    SquareSet attacked;
    std::vector<Square> targets;
    targets.reserve(32);

    for (int sq = 0; sq < SQUARE_NB; ++sq) {
        if (!pos[static_cast<Square>(sq)].belongs_to(attacker)) continue;
        targets.clear();
        destinations(pos, static_cast<Square>(sq), include_own, targets);
        for (Square t : targets) attacked.set(static_cast<size_t>(t));
    }
    return attacked;
}

std::vector<Square> attackers_of(const Position& pos, Side attacker, Square target) {
    std::vector<Square> found;
    std::vector<Square> targets;
    targets.reserve(32);

    for (int sq = 0; sq < SQUARE_NB; ++sq) {
        Square from = static_cast<Square>(sq);
        if (!pos[from].belongs_to(attacker)) continue;
        targets.clear();
        destinations(pos, from, false, targets);
        if (std::find(targets.begin(), targets.end(), target) != targets.end()) {
            found.push_back(from);
        }
    }
    return found;
}

bool is_square_attacked(const Position& pos, Square target, Side attacker) {
    return !attackers_of(pos, attacker, target).empty();
}

}
