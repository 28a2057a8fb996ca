#pragma once

#include "Types.hpp"

#include <array>
#include <span>


// File-index and rank-index deltas in Sente orientation (forward is rank - 1).
struct Offset {
    int8_t file;
    int8_t rank;

    bool operator==(const Offset& other) const = default;
};

struct PieceTraits {
    PieceType base;
    PieceFace promoted; // PieceFace::None when the face cannot promote
    std::array<Offset, 8> steps;
    uint8_t step_count;
    std::array<Offset, 4> slides;
    uint8_t slide_count;
};

namespace detail {
    inline constexpr Offset NW{-1, -1}, N{0, -1}, NE{1, -1};
    inline constexpr Offset W{-1, 0},             E{1, 0};
    inline constexpr Offset SW{-1, 1},  S{0, 1},  SE{1, 1};

    inline constexpr std::array<Offset, 8> GOLD_STEPS{NW, N, NE, W, E, S};
    inline constexpr std::array<Offset, 4> DIAGONALS{NW, NE, SW, SE};
    inline constexpr std::array<Offset, 4> ORTHOGONALS{N, W, E, S};
}

// Indexed by PieceFace. Every face is listed, so adding a face without a row
// fails to compile.
inline constexpr std::array<PieceTraits, PIECE_FACE_NB> PieceTable{{
    // Pawn
    {PieceType::Pawn, PieceFace::Tokin, {detail::N}, 1, {}, 0},
    // Lance
    {PieceType::Lance, PieceFace::PromotedLance, {}, 0, {detail::N}, 1},
    // Knight
    {PieceType::Knight, PieceFace::PromotedKnight, {Offset{-1, -2}, Offset{1, -2}}, 2, {}, 0},
    // Silver
    {PieceType::Silver, PieceFace::PromotedSilver,
     {detail::NW, detail::N, detail::NE, detail::SW, detail::SE}, 5, {}, 0},
    // Gold
    {PieceType::Gold, PieceFace::None, detail::GOLD_STEPS, 6, {}, 0},
    // Bishop
    {PieceType::Bishop, PieceFace::Horse, {}, 0, detail::DIAGONALS, 4},
    // Rook
    {PieceType::Rook, PieceFace::Dragon, {}, 0, detail::ORTHOGONALS, 4},
    // King
    {PieceType::King, PieceFace::None,
     {detail::NW, detail::N, detail::NE, detail::W, detail::E, detail::SW, detail::S, detail::SE}, 8, {}, 0},
    // Tokin, promoted lance, promoted knight and promoted silver move like gold
    {PieceType::Pawn, PieceFace::None, detail::GOLD_STEPS, 6, {}, 0},
    {PieceType::Lance, PieceFace::None, detail::GOLD_STEPS, 6, {}, 0},
    {PieceType::Knight, PieceFace::None, detail::GOLD_STEPS, 6, {}, 0},
    {PieceType::Silver, PieceFace::None, detail::GOLD_STEPS, 6, {}, 0},
    // Horse
    {PieceType::Bishop, PieceFace::None, {detail::N, detail::W, detail::E, detail::S}, 4, detail::DIAGONALS, 4},
    // Dragon
    {PieceType::Rook, PieceFace::None, {detail::NW, detail::NE, detail::SW, detail::SE}, 4, detail::ORTHOGONALS, 4},
}};

constexpr const PieceTraits& traits(PieceFace face) {
    return PieceTable[static_cast<size_t>(face)];
}

constexpr PieceType base_type(PieceFace face) {
    return face == PieceFace::None ? PieceType::None : traits(face).base;
}

constexpr PieceFace base_face(PieceType pt) {
    return static_cast<PieceFace>(pt);
}

constexpr bool can_promote(PieceFace face) {
    return face != PieceFace::None && traits(face).promoted != PieceFace::None;
}

constexpr bool is_promoted(PieceFace face) {
    return face >= PieceFace::Tokin && face <= PieceFace::Dragon;
}

constexpr PieceFace promoted_face(PieceFace face) {
    return traits(face).promoted;
}

inline std::span<const Offset> step_offsets(PieceFace face) {
    const PieceTraits& t = traits(face);
    return {t.steps.data(), t.step_count};
}

inline std::span<const Offset> slide_vectors(PieceFace face) {
    const PieceTraits& t = traits(face);
    return {t.slides.data(), t.slide_count};
}

// Mirrors a Sente-oriented offset for the given side.
constexpr Offset oriented(Offset o, Side side) {
    return {o.file, static_cast<int8_t>(o.rank * direction(side))};
}

// True when a piece of this face would have no move at all from `rank`.
// Backs both drop legality and forced promotion.
constexpr bool placement_prohibited(PieceFace face, Side side, int rank) {
    const int d = distance_to_far_rank(side, rank);
    switch (face) {
        case PieceFace::Pawn:
        case PieceFace::Lance:  return d == 0;
        case PieceFace::Knight: return d <= 1;
        default:                return false;
    }
}
