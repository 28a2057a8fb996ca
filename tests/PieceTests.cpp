#include <gtest/gtest.h>
#include "MoveGen.hpp"
#include "Piece.hpp"
#include "TestHelpers.hpp"

#include <sstream>

TEST(PieceTest, SquareCoordinates) {
    EXPECT_EQ(file_of(Square::SQ91), 9);
    EXPECT_EQ(rank_of(Square::SQ91), 1);
    EXPECT_EQ(file_of(Square::SQ19), 1);
    EXPECT_EQ(rank_of(Square::SQ19), 9);
    EXPECT_EQ(make_square(7, 6), Square::SQ76);
    EXPECT_EQ(make_square(0, 5), Square::None);
    EXPECT_EQ(make_square(5, 10), Square::None);

    std::ostringstream os;
    os << Square::SQ76 << " " << Square::None;
    EXPECT_EQ(os.str(), "76 --");
}

TEST(PieceTest, PromotionZones) {
    for (int rank = 1; rank <= RANK_NB; ++rank) {
        EXPECT_EQ(in_promotion_zone(Side::Sente, rank), rank <= 3) << "rank " << rank;
        EXPECT_EQ(in_promotion_zone(Side::Gote, rank), rank >= 7) << "rank " << rank;
    }
}

TEST(PieceTest, PromotionTable) {
    EXPECT_EQ(promoted_face(PieceFace::Pawn), PieceFace::Tokin);
    EXPECT_EQ(promoted_face(PieceFace::Silver), PieceFace::PromotedSilver);
    EXPECT_EQ(promoted_face(PieceFace::Bishop), PieceFace::Horse);
    EXPECT_EQ(promoted_face(PieceFace::Rook), PieceFace::Dragon);

    EXPECT_FALSE(can_promote(PieceFace::Gold));
    EXPECT_FALSE(can_promote(PieceFace::King));
    EXPECT_FALSE(can_promote(PieceFace::Dragon));
    EXPECT_FALSE(can_promote(PieceFace::None));

    EXPECT_EQ(base_type(PieceFace::Tokin), PieceType::Pawn);
    EXPECT_EQ(base_type(PieceFace::PromotedKnight), PieceType::Knight);
    EXPECT_EQ(base_type(PieceFace::Horse), PieceType::Bishop);
    EXPECT_EQ(base_type(PieceFace::None), PieceType::None);
}

TEST(PieceTest, PromotedMinorsMoveLikeGold) {
    const auto gold = step_offsets(PieceFace::Gold);
    for (PieceFace f : {PieceFace::Tokin, PieceFace::PromotedLance, PieceFace::PromotedKnight, PieceFace::PromotedSilver}) {
        const auto steps = step_offsets(f);
        ASSERT_EQ(steps.size(), gold.size());
        EXPECT_TRUE(std::equal(steps.begin(), steps.end(), gold.begin()));
        EXPECT_TRUE(slide_vectors(f).empty());
    }
}

TEST(PieceTest, GoteOffsetsAreMirrored) {
    const Offset forward = step_offsets(PieceFace::Pawn)[0];
    EXPECT_EQ(oriented(forward, Side::Sente).rank, -1);
    EXPECT_EQ(oriented(forward, Side::Gote).rank, 1);
    EXPECT_EQ(oriented(forward, Side::Gote).file, forward.file);
}

// Every (face, side, rank) against the three rules that make a placement
// illegal: pawn and lance on the far rank, knight on the far two ranks.
TEST(PieceTest, PlacementProhibitionIsExhaustive) {
    for (int f = 0; f < PIECE_FACE_NB; ++f) {
        const PieceFace face = static_cast<PieceFace>(f);
        for (Side side : {Side::Sente, Side::Gote}) {
            for (int rank = 1; rank <= RANK_NB; ++rank) {
                const int far = (side == Side::Sente) ? rank - 1 : RANK_NB - rank;
                bool expected = false;
                if (face == PieceFace::Pawn || face == PieceFace::Lance) expected = far == 0;
                if (face == PieceFace::Knight) expected = far <= 1;

                EXPECT_EQ(placement_prohibited(face, side, rank), expected)
                    << face << " " << side << " rank " << rank;
            }
        }
    }
}

// A pawn walking up the file: two choices while touching the zone, only the
// promoted move onto the last rank.
TEST(PieceTest, ForcedPromotionForPawns) {
    for (int rank = 2; rank <= RANK_NB; ++rank) {
        Layout s;
        const Square from = make_square(5, rank);
        add_piece(s, from, Side::Sente, PieceFace::Pawn);
        const auto moves = MoveGen::generate(build(s));

        const size_t expected = (rank - 1 == 1) ? 1 : (rank <= 4 ? 2 : 1);
        ASSERT_EQ(moves.size(), expected) << "Sente pawn on rank " << rank;
        if (rank == 2) EXPECT_TRUE(moves[0].promote());
    }

    for (int rank = 1; rank <= RANK_NB - 1; ++rank) {
        Layout s;
        s.to_move = Side::Gote;
        add_piece(s, make_square(5, rank), Side::Gote, PieceFace::Pawn);
        const auto moves = MoveGen::generate(build(s));

        const size_t expected = (rank + 1 == 9) ? 1 : (rank >= 6 ? 2 : 1);
        ASSERT_EQ(moves.size(), expected) << "Gote pawn on rank " << rank;
    }
}

TEST(PieceTest, ForcedPromotionForKnights) {
    for (int rank = 3; rank <= RANK_NB; ++rank) {
        Layout s;
        add_piece(s, make_square(5, rank), Side::Sente, PieceFace::Knight);
        const auto moves = MoveGen::generate(build(s));

        // Two landing squares; both choices only when landing on rank 3.
        const size_t expected = (rank == 5) ? 4 : 2;
        ASSERT_EQ(moves.size(), expected) << "knight on rank " << rank;
        if (rank <= 4) {
            for (const Move& m : moves) EXPECT_TRUE(m.promote());
        }
    }
}
