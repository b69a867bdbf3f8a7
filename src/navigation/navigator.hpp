#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "directions.hpp"
#include "pathfinding/search_state.hpp"

namespace streetnav::core {
    class WeightedGraph;
}

namespace streetnav::navigation {

enum class Algorithm {
    kDijkstra,
    kAStar
};

std::optional<Algorithm> parse_algorithm(std::string_view name);
const char* algorithm_name(Algorithm algorithm);
pathfinding::SearchFunction search_function(Algorithm algorithm);

struct NavigatorConfig {
    Algorithm default_algorithm = Algorithm::kDijkstra;
    bool verbose = false;            // log a summary line per query
    DirectionsStyle directions;
};

/**
 * Street navigation front end.
 *
 * Holds a reference to a fully built graph; the graph must outlive the
 * navigator and must not be modified while a query is running.
 */
class Navigator {
public:
    // Logging callback type for query summaries and warnings
    using LogCallback = std::function<void(const std::string& message, bool is_error)>;

    explicit Navigator(const core::WeightedGraph& graph);
    Navigator(const core::WeightedGraph& graph, const NavigatorConfig& config);
    Navigator(const core::WeightedGraph& graph, const NavigatorConfig& config, LogCallback log_callback);

    void set_config(const NavigatorConfig& config);
    void set_log_callback(LogCallback callback);
    const NavigatorConfig& config() const { return config_; }

    pathfinding::PathResult find_path_dijkstra(const std::string& start, const std::string& end) const;
    pathfinding::PathResult find_path_astar(const std::string& start, const std::string& end) const;

    // Uses config().default_algorithm
    pathfinding::PathResult find_path(const std::string& start, const std::string& end) const;
    pathfinding::PathResult find_path(const std::string& start, const std::string& end, Algorithm algorithm) const;

    std::vector<std::string> route_description(const std::optional<std::vector<std::string>>& path) const;
    std::vector<std::string> turn_by_turn(const std::optional<std::vector<std::string>>& path) const;

    const core::WeightedGraph& graph() const { return graph_; }

private:
    const core::WeightedGraph& graph_;
    NavigatorConfig config_;
    LogCallback log_callback_;

    void log_message(const std::string& message, bool is_error = false) const;
    void log_query(Algorithm algorithm, const std::string& start, const std::string& end,
                   const pathfinding::PathResult& result) const;
};

} // namespace streetnav::navigation
