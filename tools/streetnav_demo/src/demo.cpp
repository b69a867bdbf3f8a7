#include "demo/demo.hpp"

#include "core/weighted_graph.hpp"
#include "navigation/sample_networks.hpp"

#include <algorithm>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace streetnav::demo {
namespace {

const std::string kRule(70, '=');
const std::string kThinRule(70, '-');

std::string join_path(const std::vector<std::string>& path) {
  std::ostringstream out;
  for (std::size_t i = 0; i < path.size(); ++i) {
    if (i > 0) {
      out << " -> ";
    }
    out << path[i];
  }
  return out.str();
}

std::string format_cost(double cost) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(1) << cost;
  return out.str();
}

// Same name and weight in the opposite direction
bool has_matching_reverse(const core::WeightedGraph& graph, const core::Edge& edge) {
  const auto& reverse = graph.outgoing_edges(edge.to);
  return std::any_of(reverse.begin(), reverse.end(), [&edge](const core::Edge& candidate) {
    return candidate.to == edge.from && candidate.name == edge.name && candidate.weight == edge.weight;
  });
}

void print_result(const char* label, const pathfinding::PathResult& result) {
  std::cout << "\n" << label << ":" << std::endl;
  if (!result.found()) {
    std::cout << "  No route found" << std::endl;
    return;
  }
  std::cout << "  Path: " << join_path(*result.path) << std::endl;
  std::cout << "  Distance: " << format_cost(result.cost) << " units" << std::endl;
  std::cout << "  Settled " << result.stats.nodes_settled << " locations, " << result.stats.queue_pushes
            << " queue pushes" << std::endl;
}

void run_route(const navigation::Navigator& navigator, const DemoConfig& config, const std::string& start,
               const std::string& end) {
  std::cout << "\n" << kThinRule << std::endl;
  std::cout << "Finding route from " << navigator.graph().display_name(start) << " to "
            << navigator.graph().display_name(end) << std::endl;
  std::cout << kThinRule << std::endl;

  const auto by_dijkstra = navigator.find_path_dijkstra(start, end);
  const auto by_astar = navigator.find_path_astar(start, end);

  print_result("Dijkstra's algorithm", by_dijkstra);
  print_result("A* search", by_astar);

  if (by_dijkstra.found() && by_astar.found()) {
    if (by_dijkstra.cost == by_astar.cost) {
      std::cout << "\n  Both algorithms found a route of the same cost" << std::endl;
    } else {
      std::cout << "\n  A* returned a costlier route: the straight-line estimate overshoots some streets"
                << std::endl;
    }
  }

  const auto algorithm = config.algorithm.value_or(navigator.config().default_algorithm);
  const auto& chosen = algorithm == navigation::Algorithm::kAStar ? by_astar : by_dijkstra;

  std::cout << "\n" << (config.turn_by_turn ? "Turn-by-turn directions" : "Directions") << " ("
            << navigation::algorithm_name(algorithm) << "):" << std::endl;
  const auto directions =
      config.turn_by_turn ? navigator.turn_by_turn(chosen.path) : navigator.route_description(chosen.path);
  for (std::size_t i = 0; i < directions.size(); ++i) {
    std::cout << "  " << (i + 1) << ". " << directions[i] << std::endl;
  }
}

}  // namespace

void print_network(const core::WeightedGraph& graph, std::ostream& out) {
  out << "\nLocations:" << std::endl;
  for (const auto& id : graph.node_ids()) {
    const auto* node = graph.find_node(id);
    out << "  " << std::left << std::setw(10) << node->name << std::right << " (" << node->position.x << ", "
        << node->position.y << ")" << std::endl;
  }

  out << "\nStreets:" << std::endl;
  for (const auto& id : graph.node_ids()) {
    for (const auto& edge : graph.outgoing_edges(id)) {
      const bool two_way = edge.from != edge.to && has_matching_reverse(graph, edge);
      if (two_way && edge.to < edge.from) {
        continue;
      }
      out << "  " << std::left << std::setw(15) << edge.name << std::right << " " << edge.from
          << (two_way ? " <-> " : " -> ") << edge.to << " (" << format_cost(edge.weight) << " units)" << std::endl;
    }
  }
}

int run_demo(const DemoConfig& config) {
  if (config.from.empty() != config.to.empty()) {
    std::cerr << "[demo] --from and --to must be given together" << std::endl;
    return 1;
  }

  const core::WeightedGraph graph = navigation::samples::build_town();

  std::vector<std::pair<std::string, std::string>> routes;
  if (!config.from.empty()) {
    for (const auto& key : {config.from, config.to}) {
      if (!graph.contains(key)) {
        std::cerr << "[demo] Unknown location: " << key << std::endl;
        return 1;
      }
    }
    routes.emplace_back(config.from, config.to);
  } else {
    routes = navigation::samples::town_demo_routes();
  }

  navigation::NavigatorConfig navigator_config;
  navigator_config.verbose = config.verbose;
  if (config.algorithm) {
    navigator_config.default_algorithm = *config.algorithm;
  }
  navigation::Navigator navigator(graph, navigator_config);

  std::cout << kRule << std::endl;
  std::cout << "STREET NAVIGATION DEMO" << std::endl;
  std::cout << kRule << std::endl;
  std::cout << "\n" << graph.node_count() << " locations, " << graph.edge_count() << " directed streets"
            << std::endl;

  print_network(graph, std::cout);

  for (const auto& [start, end] : routes) {
    run_route(navigator, config, start, end);
  }

  std::cout << "\n" << kRule << std::endl;
  std::cout << "Demo completed" << std::endl;
  std::cout << kRule << std::endl;
  return 0;
}

}  // namespace streetnav::demo
