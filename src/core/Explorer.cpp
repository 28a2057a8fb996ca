#include "Explorer.hpp"
#include "Check.hpp"
#include "Executor.hpp"
#include "MoveGen.hpp"

#include <algorithm>
#include <mutex>
#include <numeric>
#include <thread>
#include <utility>


namespace Explorer {

    std::uint64_t ExploreStats::total() const {
        return std::accumulate(nodes_per_depth.begin(), nodes_per_depth.end(), std::uint64_t{0});
    }

    std::vector<Position> successors(const Position& pos) {
        std::vector<Position> out;
        const std::vector<Move> moves = MoveGen::generate(pos);
        out.reserve(moves.size());
        for (const Move& m : moves) {
            if (auto next = Executor::apply(pos, m)) out.push_back(std::move(*next));
        }
        return out;
    }

    namespace {

        class Walk {
        public:
            Walk(const ExploreParams& params, const Visitor& visitor)
                : params_(params), visitor_(visitor) {}

            ExploreStats fresh_stats() const {
                ExploreStats s;
                s.nodes_per_depth.assign(static_cast<size_t>(params_.depth) + 1, 0);
                return s;
            }

            // False once the walk has to halt; the position is then not counted.
            bool visit(const Position& pos, int ply, ExploreStats& stats) {
                if (halted_.load(std::memory_order_relaxed)) return false;

                if (params_.stop && params_.stop->load(std::memory_order_relaxed)) {
                    halted_.store(true);
                    return false;
                }
                if (params_.max_nodes != 0 && visited_.fetch_add(1) >= params_.max_nodes) {
                    halted_.store(true);
                    return false;
                }

                ++stats.nodes_per_depth[ply];
                if (Check::is_check(pos, pos.side_to_move())) ++stats.terminals;
                if (visitor_) visitor_(pos, ply);
                return true;
            }

            void run(const Position& start, int ply, ExploreStats& stats) {
                std::vector<std::pair<Position, int>> stack;
                stack.emplace_back(start, ply);

                while (!stack.empty()) {
                    auto [pos, at] = std::move(stack.back());
                    stack.pop_back();

                    if (!visit(pos, at, stats)) return;
                    if (at >= params_.depth) continue;

                    std::vector<Position> next = successors(pos);
                    // Reversed so the first generated move is expanded first.
                    for (auto it = next.rbegin(); it != next.rend(); ++it) {
                        stack.emplace_back(std::move(*it), at + 1);
                    }
                }
            }

            void merge(const ExploreStats& local, ExploreStats& into) {
                std::lock_guard<std::mutex> lock(merge_mutex_);
                for (size_t i = 0; i < local.nodes_per_depth.size(); ++i) {
                    into.nodes_per_depth[i] += local.nodes_per_depth[i];
                }
                into.terminals += local.terminals;
            }

            [[nodiscard]] bool halted() const { return halted_.load(); }

        private:
            const ExploreParams& params_;
            const Visitor& visitor_;
            std::atomic<bool> halted_{false};
            std::atomic<std::uint64_t> visited_{0};
            std::mutex merge_mutex_;
        };

        unsigned worker_count(unsigned requested, size_t work) {
            unsigned n = requested;
            if (n == 0) n = std::max(1u, std::thread::hardware_concurrency());
            return static_cast<unsigned>(std::min<size_t>(n, std::max<size_t>(work, 1)));
        }
    }

    ExploreStats explore(const Position& root, const ExploreParams& params, const Visitor& visitor) {
        ExploreParams p = params;
        p.depth = std::max(p.depth, 0);

        Walk walk(p, visitor);
        ExploreStats stats = walk.fresh_stats();

        if (!walk.visit(root, 0, stats) || p.depth == 0) {
            stats.cancelled = walk.halted();
            return stats;
        }

        const std::vector<Position> children = successors(root);
        std::atomic<size_t> next{0};

        auto worker = [&] {
            ExploreStats local = walk.fresh_stats();
            while (!walk.halted()) {
                const size_t i = next.fetch_add(1);
                if (i >= children.size()) break;
                walk.run(children[i], 1, local);
            }
            walk.merge(local, stats);
        };

        const unsigned n = worker_count(p.threads, children.size());
        if (n == 1) {
            worker();
        } else {
            std::vector<std::thread> pool;
            pool.reserve(n);
            for (unsigned t = 0; t < n; ++t) pool.emplace_back(worker);
            for (auto& th : pool) th.join();
        }

        stats.cancelled = walk.halted();
        return stats;
    }

    std::uint64_t perft(const Position& pos, int depth, unsigned threads) {
        ExploreParams params;
        params.depth = depth;
        params.threads = threads;
        const ExploreStats stats = explore(pos, params);
        return stats.nodes_per_depth.back();
    }

    std::vector<Position> collect(const Position& root, int depth) {
        std::vector<Position> out;
        ExploreParams params;
        params.depth = depth;
        explore(root, params, [&out](const Position& pos, int) { out.push_back(pos); });
        return out;
    }
}
