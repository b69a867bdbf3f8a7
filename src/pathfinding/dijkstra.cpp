#include "dijkstra.hpp"
#include "core/weighted_graph.hpp"

namespace streetnav::pathfinding {

PathResult dijkstra(const core::WeightedGraph& graph, const NodeKey& start, const NodeKey& goal) {
    if (!graph.contains(start) || !graph.contains(goal)) {
        return PathResult::unreachable();
    }

    SearchState state(start, 0.0);

    // loop until the wave front is empty or the goal is settled
    while (auto current_elm = state.settle_next()) {
        const NodeKey& current_id = current_elm->node_id;

        // every remaining entry costs at least as much
        if (current_id == goal) {
            break;
        }

        const double current_cost = state.best_cost(current_id);

        for (const auto& edge : graph.outgoing_edges(current_id)) {
            if (state.is_settled(edge.to)) {
                continue;
            }

            const double candidate_cost = current_cost + edge.weight;
            state.relax(edge.to, current_id, candidate_cost, candidate_cost);
        }
    }

    return state.finish(start, goal);
}

} // namespace streetnav::pathfinding
