#include "Explorer.hpp"
#include "Notation.hpp"
#include "Position.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>


void run_perft(const Position& pos, int depth, unsigned threads) {
    std::cout << "Starting Perft (Depth " << depth << ", " << threads << " threads)..." << std::endl;
    auto start = std::chrono::high_resolution_clock::now();

    Explorer::ExploreParams params;
    params.depth = depth;
    params.threads = threads;
    const Explorer::ExploreStats stats = Explorer::explore(pos, params);

    auto end = std::chrono::high_resolution_clock::now();
    std::chrono::duration<double> elapsed = end - start;

    for (size_t ply = 0; ply < stats.nodes_per_depth.size(); ++ply) {
        std::cout << "  ply " << ply << ": " << stats.nodes_per_depth[ply] << std::endl;
    }
    std::cout << "Nodes: " << stats.nodes_per_depth.back()
              << " | King captures available: " << stats.terminals
              << " | Time: " << elapsed.count() << "s" << std::endl;
}

// Usage: shogi_perft [depth] [threads]
// Depth 1 from the start position is 30 nodes, depth 2 is 900.
int main(int argc, char** argv) {
    int depth = 3;
    unsigned threads = 1;

    if (argc > 1) depth = std::atoi(argv[1]);
    if (argc > 2) threads = static_cast<unsigned>(std::strtoul(argv[2], nullptr, 10));

    if (depth < 0) {
        std::cerr << "depth must be non-negative" << std::endl;
        return 1;
    }

    const Position pos = Position::startpos();
    std::cout << pos << std::endl;

    for (int d = 1; d <= depth; ++d) {
        run_perft(pos, d, threads);
    }
    return 0;
}
