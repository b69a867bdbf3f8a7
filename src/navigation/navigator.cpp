#include "navigator.hpp"

#include "core/weighted_graph.hpp"
#include "pathfinding/astar.hpp"
#include "pathfinding/dijkstra.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <sstream>

namespace streetnav::navigation {

namespace {

std::string to_lower_copy(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<Algorithm> parse_algorithm(std::string_view name) {
    const std::string lower = to_lower_copy(name);
    if (lower == "dijkstra" || lower == "ucs") {
        return Algorithm::kDijkstra;
    }
    if (lower == "astar" || lower == "a*" || lower == "a-star") {
        return Algorithm::kAStar;
    }
    return std::nullopt;
}

const char* algorithm_name(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::kAStar:
            return "A*";
        case Algorithm::kDijkstra:
        default:
            return "Dijkstra";
    }
}

pathfinding::SearchFunction search_function(Algorithm algorithm) {
    switch (algorithm) {
        case Algorithm::kAStar:
            return &pathfinding::astar;
        case Algorithm::kDijkstra:
        default:
            return &pathfinding::dijkstra;
    }
}

Navigator::Navigator(const core::WeightedGraph& graph)
    : graph_(graph), config_(), log_callback_(nullptr) {}

Navigator::Navigator(const core::WeightedGraph& graph, const NavigatorConfig& config)
    : graph_(graph), config_(config), log_callback_(nullptr) {}

Navigator::Navigator(const core::WeightedGraph& graph, const NavigatorConfig& config, LogCallback log_callback)
    : graph_(graph), config_(config), log_callback_(std::move(log_callback)) {}

void Navigator::set_config(const NavigatorConfig& config) {
    config_ = config;
}

void Navigator::set_log_callback(LogCallback callback) {
    log_callback_ = std::move(callback);
}

pathfinding::PathResult Navigator::find_path_dijkstra(const std::string& start, const std::string& end) const {
    return find_path(start, end, Algorithm::kDijkstra);
}

pathfinding::PathResult Navigator::find_path_astar(const std::string& start, const std::string& end) const {
    return find_path(start, end, Algorithm::kAStar);
}

pathfinding::PathResult Navigator::find_path(const std::string& start, const std::string& end) const {
    return find_path(start, end, config_.default_algorithm);
}

pathfinding::PathResult Navigator::find_path(const std::string& start, const std::string& end,
                                             Algorithm algorithm) const {
    pathfinding::PathResult result = search_function(algorithm)(graph_, start, end);
    if (config_.verbose) {
        log_query(algorithm, start, end, result);
    }
    return result;
}

std::vector<std::string> Navigator::route_description(const std::optional<std::vector<std::string>>& path) const {
    return navigation::route_description(graph_, path, config_.directions);
}

std::vector<std::string> Navigator::turn_by_turn(const std::optional<std::vector<std::string>>& path) const {
    return navigation::turn_by_turn(graph_, path, config_.directions);
}

void Navigator::log_message(const std::string& message, bool is_error) const {
    if (log_callback_) {
        log_callback_(message, is_error);
    } else {
        if (is_error) {
            std::cerr << "[Navigator ERROR] " << message << std::endl;
        } else {
            std::cout << "[Navigator INFO] " << message << std::endl;
        }
    }
}

void Navigator::log_query(Algorithm algorithm, const std::string& start, const std::string& end,
                          const pathfinding::PathResult& result) const {
    std::ostringstream line;
    line << algorithm_name(algorithm) << " " << start << " -> " << end << ": ";

    if (!graph_.contains(start) || !graph_.contains(end)) {
        line << "unknown location";
        log_message(line.str(), true);
        return;
    }

    if (result.found()) {
        line << result.path->size() << " stops, cost " << result.cost;
    } else {
        line << "unreachable";
    }
    line << " (settled " << result.stats.nodes_settled << ", pushed " << result.stats.queue_pushes
         << ", stale " << result.stats.stale_pops << ")";
    log_message(line.str());
}

} // namespace streetnav::navigation
