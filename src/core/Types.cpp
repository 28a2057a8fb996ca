#include "Types.hpp"

#include <array>
#include <string_view>


namespace {
    // CSA piece codes, indexed by PieceFace.
    constexpr std::array<std::string_view, PIECE_FACE_NB> FACE_CODES{
        "FU", "KY", "KE", "GI", "KI", "KA", "HI", "OU",
        "TO", "NY", "NK", "NG", "UM", "RY"
    };
}

std::string_view face_code(PieceFace face) {
    if (face == PieceFace::None) return "--";
    return FACE_CODES[static_cast<size_t>(face)];
}

PieceFace face_from_code(std::string_view code) {
    for (int f = 0; f < PIECE_FACE_NB; ++f) {
        if (FACE_CODES[f] == code) return static_cast<PieceFace>(f);
    }
    return PieceFace::None;
}

std::ostream& operator<<(std::ostream& os, Side side) {
    return os << (side == Side::Sente ? "Sente" : "Gote");
}

std::ostream& operator<<(std::ostream& os, Square sq) {
    if (sq == Square::None) return os << "--";
    return os << file_of(sq) << rank_of(sq);
}

std::ostream& operator<<(std::ostream& os, PieceType pt) {
    if (pt == PieceType::None) return os << "--";
    return os << face_code(static_cast<PieceFace>(pt));
}

std::ostream& operator<<(std::ostream& os, PieceFace face) {
    return os << face_code(face);
}
