#pragma once

#include "search_state.hpp"

namespace streetnav::core {
    class WeightedGraph;
}

namespace streetnav::pathfinding {

// ==================== Pathfinding Functions ====================

/**
 * A* shortest path between two nodes, guided by straight-line distance.
 *
 * The wave front is ordered by f = g + h, where g is the best known cost from
 * the start and h the Euclidean distance from a node to the goal. The result
 * is optimal as long as no edge is cheaper than the straight line it spans,
 * which holds for distance-weighted street networks but is not checked here.
 *
 * @param graph Street network to search; read-only for the whole call
 * @param start Key of the starting node
 * @param goal Key of the destination node
 * @return Same contract as dijkstra(): the path and its weight, or an
 *         unreachable result (no path, +infinity)
 */
PathResult astar(const core::WeightedGraph& graph, const NodeKey& start, const NodeKey& goal);

} // namespace streetnav::pathfinding
