#include "directions.hpp"
#include "navigator.hpp"
#include "sample_networks.hpp"
#include "pathfinding/dijkstra.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace streetnav {

namespace navigation_tests {

using core::Point2D;
using core::WeightedGraph;
using navigation::Algorithm;
using navigation::Navigator;
using navigation::NavigatorConfig;
using navigation::TurnDirection;
namespace samples = navigation::samples;

using Lines = std::vector<std::string>;

bool expect_lines(const char* label, const Lines& actual, const Lines& expected) {
    if (actual == expected) {
        return true;
    }
    std::cerr << label << ": got" << std::endl;
    for (const auto& line : actual) {
        std::cerr << "    " << line << std::endl;
    }
    return false;
}

bool test_find_path_dijkstra() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    auto result = navigator.find_path_dijkstra("Home", "Park");
    return result.found() && result.path->front() == "Home" && result.path->back() == "Park" &&
           result.cost == 3.5;
}

bool test_find_path_astar() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    auto result = navigator.find_path_astar("Home", "Park");
    return result.found() && result.path->front() == "Home" && result.path->back() == "Park" &&
           result.cost == 3.5;
}

bool test_default_algorithm_from_config() {
    const WeightedGraph graph = samples::build_grid();
    NavigatorConfig config;
    config.default_algorithm = Algorithm::kAStar;
    Navigator navigator(graph, config);

    auto by_default = navigator.find_path("A", "I");
    auto by_astar = navigator.find_path("A", "I", Algorithm::kAStar);
    return by_default.found() && by_default.path == by_astar.path &&
           by_default.stats.nodes_settled == by_astar.stats.nodes_settled;
}

bool test_route_description() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    auto directions = navigator.route_description(std::vector<std::string>{"Home", "Store", "Park"});
    return expect_lines("route_description", directions,
                        {"Start at Home",
                         "Go to Store via Main St (1.5 units)",
                         "Go to Park via Oak Ave (2.0 units)",
                         "Arrive at Park"});
}

bool test_route_description_no_path() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    return navigator.route_description(std::nullopt) == Lines{"No route found"} &&
           navigator.route_description(std::vector<std::string>{}) == Lines{"No route found"};
}

bool test_route_description_same_location() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    auto directions = navigator.route_description(std::vector<std::string>{"Home"});
    return directions.size() == 1 && directions[0].find("already at") != std::string::npos &&
           directions[0] == "You are already at Home";
}

bool test_route_description_unnamed_and_missing_edges() {
    WeightedGraph graph;
    graph.add_node("A", 0, 0, "Alpha");
    graph.add_node("B", 1, 0, "Beta");
    graph.add_node("C", 2, 0, "Gamma");
    graph.add_edge("A", "B", 1.3);

    auto directions = navigation::route_description(graph, std::vector<std::string>{"A", "B", "C"});
    return expect_lines("unnamed_and_missing", directions,
                        {"Start at Alpha",
                         "Go to Beta via the street (1.3 units)",
                         "Go to Gamma",
                         "Arrive at Gamma"});
}

bool test_directions_style() {
    const WeightedGraph graph = samples::build_chain();
    NavigatorConfig config;
    config.directions.unit = "km";
    config.directions.precision = 2;
    Navigator navigator(graph, config);

    auto directions = navigator.route_description(std::vector<std::string>{"Home", "Park"});
    return directions.size() == 3 && directions[1] == "Go to Park via Long Rd (4.00 km)";
}

bool test_classify_turn() {
    const Point2D from(0, 0);
    const Point2D via(1, 0);

    return navigation::classify_turn(from, via, Point2D(2, 0)) == TurnDirection::kStraight &&
           navigation::classify_turn(from, via, Point2D(2, 0.1)) == TurnDirection::kStraight &&
           navigation::classify_turn(from, via, Point2D(1, 1)) == TurnDirection::kLeft &&
           navigation::classify_turn(from, via, Point2D(1, -1)) == TurnDirection::kRight &&
           navigation::classify_turn(from, via, Point2D(0, 0)) == TurnDirection::kUTurn &&
           navigation::classify_turn(from, via, via) == TurnDirection::kStraight;
}

bool test_classify_turn_across_pi() {
    // heading west, then bearing slightly south-west and north-west
    const Point2D from(0, 0);
    const Point2D via(-1, 0);

    return navigation::classify_turn(from, via, Point2D(-2, -1)) == TurnDirection::kLeft &&
           navigation::classify_turn(from, via, Point2D(-2, 1)) == TurnDirection::kRight &&
           navigation::classify_turn(from, via, Point2D(-2, 0.05)) == TurnDirection::kStraight;
}

bool test_turn_by_turn() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    auto directions = navigator.turn_by_turn(std::vector<std::string>{"Home", "Store", "Park"});
    return expect_lines("turn_by_turn", directions,
                        {"Head toward Store on Main St (1.5 units)",
                         "Turn right onto Oak Ave toward Park (2.0 units)",
                         "Arrive at Park"});
}

bool test_turn_by_turn_on_town() {
    const WeightedGraph graph = samples::build_town();
    Navigator navigator(graph);

    // Home (0,0) -> Store (1,2) -> Hospital (2,4): same bearing the whole way
    auto result = navigator.find_path_dijkstra("Home", "Hospital");
    auto directions = navigator.turn_by_turn(result.path);
    return expect_lines("turn_by_turn_on_town", directions,
                        {"Head toward Store on Oak Avenue (2.0 units)",
                         "Continue straight onto Center Street toward Hospital (3.0 units)",
                         "Arrive at Hospital"});
}

bool test_turn_by_turn_edge_cases() {
    const WeightedGraph graph = samples::build_chain();
    Navigator navigator(graph);

    return navigator.turn_by_turn(std::nullopt) == Lines{"No route found"} &&
           navigator.turn_by_turn(std::vector<std::string>{"Park"}) == Lines{"You are already at Park"};
}

bool test_parse_algorithm() {
    return navigation::parse_algorithm("dijkstra") == Algorithm::kDijkstra &&
           navigation::parse_algorithm("Dijkstra") == Algorithm::kDijkstra &&
           navigation::parse_algorithm("astar") == Algorithm::kAStar &&
           navigation::parse_algorithm("A*") == Algorithm::kAStar &&
           !navigation::parse_algorithm("bfs").has_value() &&
           std::string(navigation::algorithm_name(Algorithm::kAStar)) == "A*" &&
           navigation::search_function(Algorithm::kDijkstra) == &pathfinding::dijkstra;
}

bool test_verbose_logging() {
    const WeightedGraph graph = samples::build_diamond();
    NavigatorConfig config;
    config.verbose = true;

    std::vector<std::pair<std::string, bool>> messages;
    Navigator navigator(graph, config, [&messages](const std::string& message, bool is_error) {
        messages.emplace_back(message, is_error);
    });

    navigator.find_path_dijkstra("A", "D");
    navigator.find_path_astar("A", "Nowhere");

    if (messages.size() != 2) {
        std::cerr << "Expected one log line per query, got " << messages.size() << std::endl;
        return false;
    }
    return !messages[0].second && messages[0].first.find("cost 3") != std::string::npos &&
           messages[1].second && messages[1].first.find("unknown location") != std::string::npos;
}

bool test_quiet_by_default() {
    const WeightedGraph graph = samples::build_diamond();
    int calls = 0;
    Navigator navigator(graph, NavigatorConfig{}, [&calls](const std::string&, bool) { ++calls; });
    navigator.find_path("A", "D");
    return calls == 0;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"find_path_dijkstra", &test_find_path_dijkstra},
        {"find_path_astar", &test_find_path_astar},
        {"default_algorithm_from_config", &test_default_algorithm_from_config},
        {"route_description", &test_route_description},
        {"route_description_no_path", &test_route_description_no_path},
        {"route_description_same_location", &test_route_description_same_location},
        {"route_description_unnamed_and_missing_edges", &test_route_description_unnamed_and_missing_edges},
        {"directions_style", &test_directions_style},
        {"classify_turn", &test_classify_turn},
        {"classify_turn_across_pi", &test_classify_turn_across_pi},
        {"turn_by_turn", &test_turn_by_turn},
        {"turn_by_turn_on_town", &test_turn_by_turn_on_town},
        {"turn_by_turn_edge_cases", &test_turn_by_turn_edge_cases},
        {"parse_algorithm", &test_parse_algorithm},
        {"verbose_logging", &test_verbose_logging},
        {"quiet_by_default", &test_quiet_by_default},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace navigation_tests

} // namespace streetnav

int main() {
    if (streetnav::navigation_tests::run_all_tests()) {
        std::cout << "All navigation tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Navigation tests failed" << std::endl;
    return 1;
}
