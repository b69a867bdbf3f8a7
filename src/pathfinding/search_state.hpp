#pragma once

#include <cstddef>
#include <limits>
#include <optional>
#include <queue>
#include <unordered_map>
#include <utility>
#include <vector>

#include "core/types.hpp"

namespace streetnav::core {
    class WeightedGraph;
}

namespace streetnav::pathfinding {

using core::NodeKey;

// Exploration effort of one search call
struct SearchStats {
    std::size_t nodes_settled = 0;
    std::size_t queue_pushes = 0;
    std::size_t stale_pops = 0;
};

struct PathResult {
    // start..goal inclusive; empty optional when the goal cannot be reached
    std::optional<std::vector<NodeKey>> path;
    double cost = std::numeric_limits<double>::infinity();
    SearchStats stats;

    [[nodiscard]] bool found() const { return path.has_value(); }

    static PathResult unreachable() { return PathResult{}; }
};

// dijkstra and astar share this signature and can be swapped at the call site
using SearchFunction = PathResult (*)(const core::WeightedGraph& graph,
                                      const NodeKey& start,
                                      const NodeKey& goal);

// Bookkeeping for one discovered node
struct Search_Node {
    double best_cost = std::numeric_limits<double>::infinity();
    std::optional<NodeKey> previous;
    bool settled = false;
};

// Entry in the wave front. Stale copies stay queued and are dropped on pop.
struct Wave_Elm {
    double priority;
    NodeKey node_id;

    Wave_Elm(double p, NodeKey id) : priority(p), node_id(std::move(id)) {}
};

// Min-heap on priority; equal priorities pop in ascending key order
struct comparator {
    bool operator()(const Wave_Elm& a, const Wave_Elm& b) const {
        if (a.priority != b.priority) {
            return a.priority > b.priority;
        }
        return a.node_id > b.node_id;
    }
};

/**
 * Working state of a single label-setting search.
 *
 * Owns the cost/predecessor records, the settled flags and the wave front.
 * Lives on the stack of one search call and is never shared.
 */
class SearchState {
public:
    SearchState(const NodeKey& start, double start_priority);

    /**
     * Pop entries until one names an unsettled node, settle it and return it.
     * Returns an empty optional once the wave front is exhausted.
     */
    std::optional<Wave_Elm> settle_next();

    [[nodiscard]] bool is_settled(const NodeKey& id) const;
    [[nodiscard]] double best_cost(const NodeKey& id) const;

    /**
     * Record `cost` as the best way to reach `id` through `via` if it is
     * strictly cheaper than what is known, and queue `id` with `priority`.
     * Returns whether the record improved.
     */
    bool relax(const NodeKey& id, const NodeKey& via, double cost, double priority);

    // Reconstruct the start..goal path, or the unreachable result
    [[nodiscard]] PathResult finish(const NodeKey& start, const NodeKey& goal) const;

    [[nodiscard]] const SearchStats& stats() const { return stats_; }

private:
    std::unordered_map<NodeKey, Search_Node> records_;
    std::priority_queue<Wave_Elm, std::vector<Wave_Elm>, comparator> wave_front_;
    SearchStats stats_;
};

/**
 * Walk the predecessor chain back from `goal` and return it start-first.
 *
 * Throws std::logic_error if the chain loops or ends anywhere but `start`;
 * correct relaxation never produces either.
 */
std::vector<NodeKey> reconstruct_path(const std::unordered_map<NodeKey, Search_Node>& records,
                                      const NodeKey& start,
                                      const NodeKey& goal);

/**
 * Sum of the weights along a path, using the cheapest edge between each pair
 * of consecutive keys. Returns +infinity for an empty path or one that uses a
 * missing edge.
 */
double compute_path_cost(const core::WeightedGraph& graph, const std::vector<NodeKey>& path);

} // namespace streetnav::pathfinding
