#include "search_state.hpp"
#include "core/weighted_graph.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace streetnav::pathfinding {

SearchState::SearchState(const NodeKey& start, double start_priority) {
    Search_Node first_node;
    first_node.best_cost = 0.0;
    records_.emplace(start, first_node);

    wave_front_.emplace(start_priority, start);
    ++stats_.queue_pushes;
}

std::optional<Wave_Elm> SearchState::settle_next() {
    while (!wave_front_.empty()) {
        Wave_Elm current_elm = wave_front_.top();
        wave_front_.pop();

        Search_Node& record = records_[current_elm.node_id];
        if (record.settled) {
            ++stats_.stale_pops;
            continue;
        }

        record.settled = true;
        ++stats_.nodes_settled;
        return current_elm;
    }
    return std::nullopt;
}

bool SearchState::is_settled(const NodeKey& id) const {
    auto it = records_.find(id);
    return it != records_.end() && it->second.settled;
}

double SearchState::best_cost(const NodeKey& id) const {
    auto it = records_.find(id);
    if (it == records_.end()) {
        return std::numeric_limits<double>::infinity();
    }
    return it->second.best_cost;
}

bool SearchState::relax(const NodeKey& id, const NodeKey& via, double cost, double priority) {
    Search_Node& record = records_[id];

    // settled costs are final
    if (record.settled || !(cost < record.best_cost)) {
        return false;
    }

    record.best_cost = cost;
    record.previous = via;
    wave_front_.emplace(priority, id);
    ++stats_.queue_pushes;
    return true;
}

PathResult SearchState::finish(const NodeKey& start, const NodeKey& goal) const {
    PathResult result;
    result.stats = stats_;

    double goal_cost = best_cost(goal);
    if (std::isinf(goal_cost)) {
        return result;
    }

    result.path = reconstruct_path(records_, start, goal);
    result.cost = goal_cost;
    return result;
}

std::vector<NodeKey> reconstruct_path(const std::unordered_map<NodeKey, Search_Node>& records,
                                      const NodeKey& start,
                                      const NodeKey& goal) {
    std::vector<NodeKey> route_elements;
    NodeKey current_inter = goal;

    while (true) {
        route_elements.push_back(current_inter);

        // a simple path visits every record at most once
        if (route_elements.size() > records.size()) {
            throw std::logic_error("predecessor chain from " + goal + " contains a cycle");
        }

        auto it = records.find(current_inter);
        if (it == records.end() || !it->second.previous) {
            break;
        }
        current_inter = *it->second.previous;
    }

    if (current_inter != start) {
        throw std::logic_error("predecessor chain from " + goal + " ends at " + current_inter +
                               " instead of " + start);
    }

    std::reverse(route_elements.begin(), route_elements.end());
    return route_elements;
}

double compute_path_cost(const core::WeightedGraph& graph, const std::vector<NodeKey>& path) {
    if (path.empty()) {
        return std::numeric_limits<double>::infinity();
    }

    double total_cost = 0.0;
    for (std::size_t i = 1; i < path.size(); ++i) {
        const core::Edge* edge = graph.find_edge(path[i - 1], path[i]);
        if (!edge) {
            return std::numeric_limits<double>::infinity();
        }
        total_cost += edge->weight;
    }
    return total_cost;
}

} // namespace streetnav::pathfinding
