#pragma once

#include <cstdint>
#include <ostream>
#include <string_view>


inline constexpr int SIDE_NB = 2;
inline constexpr int FILE_NB = 9;
inline constexpr int RANK_NB = 9;
inline constexpr int SQUARE_NB = FILE_NB * RANK_NB;
inline constexpr int PIECE_TYPE_NB = 8;
inline constexpr int PIECE_FACE_NB = 14;

enum class Side : uint8_t { Sente, Gote };

enum class PieceType : uint8_t { Pawn, Lance, Knight, Silver, Gold, Bishop, Rook, King, None };

enum class PieceFace : uint8_t {
    Pawn, Lance, Knight, Silver, Gold, Bishop, Rook, King,
    Tokin, PromotedLance, PromotedKnight, PromotedSilver, Horse, Dragon,
    None
};

// Row-major from the top-left corner of the diagram: file 9 rank 1 first,
// file 1 rank 9 last. SQ76 is file 7, rank 6.
enum class Square : int8_t {
    SQ91 = 0, SQ81, SQ71, SQ61, SQ51, SQ41, SQ31, SQ21, SQ11,
    SQ92 = 9, SQ82, SQ72, SQ62, SQ52, SQ42, SQ32, SQ22, SQ12,
    SQ93 = 18, SQ83, SQ73, SQ63, SQ53, SQ43, SQ33, SQ23, SQ13,
    SQ94 = 27, SQ84, SQ74, SQ64, SQ54, SQ44, SQ34, SQ24, SQ14,
    SQ95 = 36, SQ85, SQ75, SQ65, SQ55, SQ45, SQ35, SQ25, SQ15,
    SQ96 = 45, SQ86, SQ76, SQ66, SQ56, SQ46, SQ36, SQ26, SQ16,
    SQ97 = 54, SQ87, SQ77, SQ67, SQ57, SQ47, SQ37, SQ27, SQ17,
    SQ98 = 63, SQ88, SQ78, SQ68, SQ58, SQ48, SQ38, SQ28, SQ18,
    SQ99 = 72, SQ89, SQ79, SQ69, SQ59, SQ49, SQ39, SQ29, SQ19,
    None = 81
};

constexpr Side opposite(Side s) {
    return s == Side::Sente ? Side::Gote : Side::Sente;
}

// Sign applied to the rank component of a forward-oriented offset.
// Offsets are written for Sente, who advances towards rank 1.
constexpr int direction(Side s) {
    return s == Side::Sente ? 1 : -1;
}

// Storage coordinates: file index 0 is file 9, rank index 0 is rank 1.
constexpr int file_index(Square sq) { return static_cast<int>(sq) % FILE_NB; }
constexpr int rank_index(Square sq) { return static_cast<int>(sq) / FILE_NB; }

constexpr int file_of(Square sq) { return FILE_NB - file_index(sq); }
constexpr int rank_of(Square sq) { return rank_index(sq) + 1; }

constexpr bool is_valid_coord(int file, int rank) {
    return file >= 1 && file <= FILE_NB && rank >= 1 && rank <= RANK_NB;
}

constexpr Square make_square(int file, int rank) {
    if (!is_valid_coord(file, rank)) return Square::None;
    return static_cast<Square>((rank - 1) * FILE_NB + (FILE_NB - file));
}

constexpr Square square_from_index(int idx) {
    return (idx >= 0 && idx < SQUARE_NB) ? static_cast<Square>(idx) : Square::None;
}

constexpr bool in_promotion_zone(Side side, int rank) {
    return side == Side::Sente ? rank <= 3 : rank >= 7;
}

// 0 on the side's farthest rank, 1 on the next one, and so on.
constexpr int distance_to_far_rank(Side side, int rank) {
    return side == Side::Sente ? rank - 1 : RANK_NB - rank;
}

struct SquareContent {
    PieceFace face = PieceFace::None;
    Side side = Side::Sente;

    constexpr SquareContent() = default;
    constexpr SquareContent(Side s, PieceFace f) : face(f), side(s) {}

    [[nodiscard]] constexpr bool empty() const { return face == PieceFace::None; }
    [[nodiscard]] constexpr bool belongs_to(Side s) const { return !empty() && side == s; }

    // 0 for an empty square, 1..28 for the occupied ones.
    [[nodiscard]] constexpr int index() const {
        if (empty()) return 0;
        return 1 + static_cast<int>(side) * PIECE_FACE_NB + static_cast<int>(face);
    }

    bool operator==(const SquareContent& other) const = default;
};

inline constexpr int SQUARE_CONTENT_NB = 1 + SIDE_NB * PIECE_FACE_NB;

// Two-letter CSA code ("FU", "RY", ...); "--" for None.
std::string_view face_code(PieceFace face);
// PieceFace::None when `code` names no piece.
PieceFace face_from_code(std::string_view code);

std::ostream& operator<<(std::ostream& os, Side side);
std::ostream& operator<<(std::ostream& os, Square sq);
std::ostream& operator<<(std::ostream& os, PieceType pt);
std::ostream& operator<<(std::ostream& os, PieceFace face);
