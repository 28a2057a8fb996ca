#pragma once
#include "Types.hpp"
#include <array>

namespace Zobrist {
    // Largest hand count with its own key (all eighteen pawns).
    inline constexpr int MAX_HAND_COUNT = 18;

    struct Keys {
        // [SquareContent::index() (0-28)][Square (0-80)]
        std::array<std::array<uint64_t, SQUARE_NB>, SQUARE_CONTENT_NB> squares;

        // [Side][PieceType][count]
        std::array<std::array<std::array<uint64_t, MAX_HAND_COUNT + 1>, PIECE_TYPE_NB>, SIDE_NB> hands;

        uint64_t side;
    };

    namespace detail {
        constexpr uint64_t splitmix64(uint64_t& state) {
            uint64_t z = (state += 0x9e3779b97f4a7c15ULL);
            z = (z ^ (z >> 30)) * 0xbf58476d1ce4e5b9ULL;
            z = (z ^ (z >> 27)) * 0x94d049bb133111ebULL;
            return z ^ (z >> 31);
        }

        constexpr Keys init_keys() {
            Keys k{};
            uint64_t state = 123456789ULL;

            // Empty squares contribute nothing.
            for (int c = 1; c < SQUARE_CONTENT_NB; ++c) {
                for (int sq = 0; sq < SQUARE_NB; ++sq) {
                    k.squares[c][sq] = splitmix64(state);
                }
            }

            for (int s = 0; s < SIDE_NB; ++s) {
                for (int pt = 0; pt < PIECE_TYPE_NB; ++pt) {
                    for (int n = 1; n <= MAX_HAND_COUNT; ++n) {
                        k.hands[s][pt][n] = splitmix64(state);
                    }
                }
            }

            k.side = splitmix64(state);
            return k;
        }
    }

    inline constexpr Keys keys = detail::init_keys();

    constexpr uint64_t square_key(SquareContent content, Square sq) {
        return keys.squares[content.index()][static_cast<int>(sq)];
    }

    constexpr uint64_t hand_key(Side side, PieceType pt, int count) {
        if (count > MAX_HAND_COUNT) count = MAX_HAND_COUNT;
        return keys.hands[static_cast<int>(side)][static_cast<int>(pt)][count];
    }
}
