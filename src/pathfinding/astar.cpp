#include "astar.hpp"
#include "core/weighted_graph.hpp"

namespace streetnav::pathfinding {

// Main A* algorithm implementation
PathResult astar(const core::WeightedGraph& graph, const NodeKey& start, const NodeKey& goal) {
    if (!graph.contains(start) || !graph.contains(goal)) {
        return PathResult::unreachable();
    }

    auto heuristic = [&graph, &goal](const NodeKey& id) {
        return graph.straight_line_distance(id, goal);
    };

    SearchState state(start, heuristic(start));

    while (auto current_elm = state.settle_next()) {
        const NodeKey& current_id = current_elm->node_id;

        // safe to stop here only because the heuristic never overestimates
        if (current_id == goal) {
            break;
        }

        const double current_cost = state.best_cost(current_id);

        // loop through all the outgoing streets of the current node
        for (const auto& edge : graph.outgoing_edges(current_id)) {
            // if this node was popped from the wavefront before, no sense in checking it
            if (state.is_settled(edge.to)) {
                continue;
            }

            const double travel_cost = current_cost + edge.weight;

            // this incorporates the cost to get to this node, plus the estimate to the end
            const double estimated_cost = travel_cost + heuristic(edge.to);

            state.relax(edge.to, current_id, travel_cost, estimated_cost);
        }
    }

    return state.finish(start, goal);
}

} // namespace streetnav::pathfinding
