#include <gtest/gtest.h>
#include "Position.hpp"
#include "TestHelpers.hpp"

#include <thread>
#include <utility>
#include <unordered_set>

TEST(PositionTest, StartingLayout) {
    const Position pos = Position::startpos();

    EXPECT_EQ(pos.side_to_move(), Side::Sente);
    EXPECT_TRUE(pos.hand(Side::Sente).empty());
    EXPECT_TRUE(pos.hand(Side::Gote).empty());

    EXPECT_EQ(pos[Square::SQ59], SquareContent(Side::Sente, PieceFace::King));
    EXPECT_EQ(pos[Square::SQ51], SquareContent(Side::Gote, PieceFace::King));
    EXPECT_EQ(pos[Square::SQ88], SquareContent(Side::Sente, PieceFace::Bishop));
    EXPECT_EQ(pos[Square::SQ28], SquareContent(Side::Sente, PieceFace::Rook));
    EXPECT_EQ(pos[Square::SQ82], SquareContent(Side::Gote, PieceFace::Rook));
    EXPECT_EQ(pos[Square::SQ22], SquareContent(Side::Gote, PieceFace::Bishop));
    EXPECT_EQ(pos[Square::SQ77], SquareContent(Side::Sente, PieceFace::Pawn));
    EXPECT_EQ(pos[Square::SQ13], SquareContent(Side::Gote, PieceFace::Pawn));
    EXPECT_TRUE(pos[Square::SQ55].empty());
}

TEST(PositionTest, LocationIndex) {
    const Position pos = Position::startpos();

    EXPECT_EQ(pos.locations(Side::Sente, PieceFace::Pawn).size(), 9u);
    EXPECT_EQ(pos.locations(Side::Gote, PieceFace::Gold).size(), 2u);
    EXPECT_TRUE(pos.locations(Side::Sente, PieceFace::Dragon).empty());
    EXPECT_TRUE(pos.locations(Side::Sente, PieceFace::None).empty());

    ASSERT_TRUE(pos.king_square(Side::Gote).has_value());
    EXPECT_EQ(*pos.king_square(Side::Gote), Square::SQ51);

    Layout s;
    EXPECT_FALSE(build(s).king_square(Side::Sente).has_value());
}

TEST(PositionTest, CopiesBuildTheirOwnIndex) {
    const Position original = Position::startpos();
    EXPECT_EQ(original.locations(Side::Sente, PieceFace::Rook).size(), 1u);

    Position copy = original;
    EXPECT_EQ(copy, original);
    EXPECT_EQ(copy.locations(Side::Sente, PieceFace::Rook), original.locations(Side::Sente, PieceFace::Rook));
    EXPECT_NE(&copy.locations(Side::Sente, PieceFace::Rook), &original.locations(Side::Sente, PieceFace::Rook));
}

TEST(PositionTest, MovesTakeOverTheIndex) {
    Position source = Position::startpos();
    const std::vector<Square>* built = &source.locations(Side::Gote, PieceFace::Silver);

    Position moved(std::move(source));
    EXPECT_EQ(moved, Position::startpos());
    EXPECT_EQ(&moved.locations(Side::Gote, PieceFace::Silver), built);
    EXPECT_EQ(moved.locations(Side::Gote, PieceFace::Silver).size(), 2u);

    // Assigned positions keep the index that matches their new contents.
    Layout s;
    add_piece(s, Square::SQ55, Side::Gote, PieceFace::Silver);
    Position target = build(s);
    EXPECT_EQ(target.locations(Side::Gote, PieceFace::Silver).size(), 1u);
    target = std::move(moved);
    EXPECT_EQ(target.locations(Side::Gote, PieceFace::Silver).size(), 2u);
    EXPECT_EQ(&target.locations(Side::Gote, PieceFace::Silver), built);

    // Independent of every other live instance.
    const Position copy = target;
    EXPECT_NE(&copy.locations(Side::Gote, PieceFace::Silver), built);
}

TEST(PositionTest, IndexIsSafeToBuildFromSeveralThreads) {
    const Position pos = Position::startpos();
    std::vector<std::thread> readers;
    std::vector<size_t> counts(4, 0);
    for (size_t i = 0; i < counts.size(); ++i) {
        readers.emplace_back([&pos, &counts, i] { counts[i] = pos.locations(Side::Gote, PieceFace::Pawn).size(); });
    }
    for (auto& t : readers) t.join();
    for (size_t c : counts) EXPECT_EQ(c, 9u);
}

TEST(PositionTest, SearchAndPawnCount) {
    const Position pos = Position::startpos();

    const auto rooks = pos.search({SquareContent(Side::Gote, PieceFace::Rook), SquareContent(Side::Sente, PieceFace::Rook)});
    ASSERT_EQ(rooks.size(), 2u);
    EXPECT_EQ(rooks[0], Square::SQ82);
    EXPECT_EQ(rooks[1], Square::SQ28);

    EXPECT_EQ(pos.pawn_count(Side::Sente, 7), 1);
    EXPECT_EQ(pos.pawn_count(Side::Gote, 1), 1);

    Layout s;
    add_piece(s, Square::SQ55, Side::Sente, PieceFace::Tokin);
    EXPECT_EQ(build(s).pawn_count(Side::Sente, 5), 0);
}

TEST(PositionTest, KeyReflectsEveryField) {
    Layout s;
    add_piece(s, Square::SQ55, Side::Sente, PieceFace::Silver);
    const Position a = build(s);

    s.to_move = Side::Gote;
    const Position b = build(s);
    EXPECT_NE(a.key(), b.key());
    EXPECT_NE(a, b);

    s.to_move = Side::Sente;
    add_to_hand(s, Side::Sente, PieceType::Pawn);
    const Position c = build(s);
    EXPECT_NE(a.key(), c.key());

    std::unordered_set<Position> set{a, b, c, build(s)};
    EXPECT_EQ(set.size(), 3u);
}
