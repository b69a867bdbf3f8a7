#pragma once

#include "search_state.hpp"

namespace streetnav::core {
    class WeightedGraph;
}

namespace streetnav::pathfinding {

/**
 * Uniform-cost shortest path between two nodes.
 *
 * @param graph Street network to search; read-only for the whole call
 * @param start Key of the starting node
 * @param goal Key of the destination node
 * @return The cheapest start..goal path and its weight, or an unreachable
 *         result (no path, +infinity) when either key is unknown or no edge
 *         sequence connects them. start == goal yields [start] at cost 0.
 */
PathResult dijkstra(const core::WeightedGraph& graph, const NodeKey& start, const NodeKey& goal);

} // namespace streetnav::pathfinding
