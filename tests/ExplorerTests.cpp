#include <gtest/gtest.h>
#include "Explorer.hpp"
#include "TestHelpers.hpp"

#include <atomic>
#include <mutex>

TEST(ExplorerTest, StartPositionPerft) {
    const Position pos = Position::startpos();
    EXPECT_EQ(Explorer::perft(pos, 0), 1u);
    EXPECT_EQ(Explorer::perft(pos, 1), 30u);
    EXPECT_EQ(Explorer::perft(pos, 2), 900u);
}

TEST(ExplorerTest, ThreadsAgreeWithSingleWorker) {
    const Position pos = Position::startpos();

    Explorer::ExploreParams params;
    params.depth = 2;
    const Explorer::ExploreStats single = Explorer::explore(pos, params);

    params.threads = 4;
    const Explorer::ExploreStats parallel = Explorer::explore(pos, params);

    EXPECT_EQ(single.nodes_per_depth, (std::vector<std::uint64_t>{1, 30, 900}));
    EXPECT_EQ(parallel.nodes_per_depth, single.nodes_per_depth);
    EXPECT_EQ(parallel.total(), 931u);
    EXPECT_FALSE(parallel.cancelled);
}

TEST(ExplorerTest, Successors) {
    const auto next = Explorer::successors(Position::startpos());
    ASSERT_EQ(next.size(), 30u);
    for (const Position& p : next) EXPECT_EQ(p.side_to_move(), Side::Gote);
}

TEST(ExplorerTest, CollectVisitsRootFirst) {
    const Position pos = Position::startpos();
    const auto all = Explorer::collect(pos, 1);
    ASSERT_EQ(all.size(), 31u);
    EXPECT_EQ(all.front(), pos);
    EXPECT_EQ(Explorer::collect(pos, 0).size(), 1u);
}

TEST(ExplorerTest, VisitorSeesEveryPly) {
    Explorer::ExploreParams params;
    params.depth = 2;
    params.threads = 3;

    std::mutex mutex;
    std::vector<std::uint64_t> seen(3, 0);
    Explorer::explore(Position::startpos(), params, [&](const Position&, int ply) {
        std::lock_guard<std::mutex> lock(mutex);
        ++seen[ply];
    });
    EXPECT_EQ(seen, (std::vector<std::uint64_t>{1, 30, 900}));
}

TEST(ExplorerTest, StopFlagCancels) {
    std::atomic<bool> stop(true);
    Explorer::ExploreParams params;
    params.depth = 3;
    params.stop = &stop;

    const auto stats = Explorer::explore(Position::startpos(), params);
    EXPECT_TRUE(stats.cancelled);
    EXPECT_EQ(stats.total(), 0u);
}

TEST(ExplorerTest, MaxNodesCapsWork) {
    Explorer::ExploreParams params;
    params.depth = 3;
    params.max_nodes = 10;

    const auto stats = Explorer::explore(Position::startpos(), params);
    EXPECT_TRUE(stats.cancelled);
    EXPECT_EQ(stats.total(), 10u);

    params.threads = 4;
    const auto parallel = Explorer::explore(Position::startpos(), params);
    EXPECT_TRUE(parallel.cancelled);
    EXPECT_LE(parallel.total(), 10u);
}

TEST(ExplorerTest, CountsKingCaptures) {
    Layout s;
    add_piece(s, Square::SQ51, Side::Gote, PieceFace::King);
    add_piece(s, Square::SQ59, Side::Sente, PieceFace::Rook);

    Explorer::ExploreParams params;
    params.depth = 0;
    const auto stats = Explorer::explore(build(s), params);
    EXPECT_EQ(stats.terminals, 1u);
    EXPECT_EQ(stats.nodes_per_depth, (std::vector<std::uint64_t>{1}));
}
