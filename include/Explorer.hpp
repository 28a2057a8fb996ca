#pragma once

#include "Position.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <vector>


namespace Explorer {

    struct ExploreParams {
        int depth = 1;
        // Workers sharing the root's children; 0 picks the hardware count.
        unsigned threads = 1;
        // Stop after this many visited positions, root included. 0 = no cap.
        std::uint64_t max_nodes = 0;
        // Polled once per visited position.
        const std::atomic<bool>* stop = nullptr;
    };

    struct ExploreStats {
        // nodes_per_depth[ply] = positions visited at that ply, root at 0.
        std::vector<std::uint64_t> nodes_per_depth;
        // Visited positions in which the side to move can capture the king.
        std::uint64_t terminals = 0;
        bool cancelled = false;

        [[nodiscard]] std::uint64_t total() const;
    };

    // Called for every visited position with its ply. With more than one
    // worker it is called concurrently and must synchronise itself.
    using Visitor = std::function<void(const Position&, int)>;

    // One Position per generated move, in generation order.
    [[nodiscard]] std::vector<Position> successors(const Position& pos);

    // Walks every position reachable within params.depth plies through
    // generated moves, without deduplication. Each worker keeps an explicit
    // (Position, ply) stack, so no recursion depth grows with params.depth.
    ExploreStats explore(const Position& root, const ExploreParams& params, const Visitor& visitor = {});

    // Positions at exactly `depth` plies.
    [[nodiscard]] std::uint64_t perft(const Position& pos, int depth, unsigned threads = 1);

    // Every position within `depth` plies, root first, depth-first order.
    [[nodiscard]] std::vector<Position> collect(const Position& root, int depth);
}
