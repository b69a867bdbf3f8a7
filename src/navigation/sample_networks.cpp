#include "sample_networks.hpp"

namespace streetnav::navigation::samples {

namespace {

struct Place {
    const char* id;
    double x;
    double y;
};

struct Street {
    const char* from;
    const char* to;
    double length;
    const char* name;
};

} // namespace

core::WeightedGraph build_town() {
    static const Place places[] = {
        {"Home", 0, 0},
        {"School", 2, 1},
        {"Store", 1, 2},
        {"Park", 3, 3},
        {"Library", 4, 1},
        {"Hospital", 2, 4},
    };

    static const Street streets[] = {
        {"Home", "School", 2.5, "Main Street"},
        {"Home", "Store", 2.0, "Oak Avenue"},
        {"School", "Library", 2.0, "Elm Street"},
        {"Store", "School", 1.5, "Park Road"},
        {"Store", "Park", 2.5, "Lake Drive"},
        {"Store", "Hospital", 3.0, "Center Street"},
        {"Park", "Library", 2.0, "Pine Avenue"},
        {"Park", "Hospital", 1.5, "River Road"},
    };

    core::WeightedGraph graph;
    for (const auto& place : places) {
        graph.add_node(place.id, place.x, place.y, place.id);
    }
    for (const auto& street : streets) {
        graph.add_edge(street.from, street.to, street.length, street.name);
    }
    return graph;
}

std::vector<std::pair<std::string, std::string>> town_demo_routes() {
    return {
        {"Home", "Hospital"},
        {"Home", "Library"},
        {"Store", "Library"},
    };
}

core::WeightedGraph build_diamond() {
    core::WeightedGraph graph;
    graph.add_node("A", 0, 0, "A");
    graph.add_node("B", 1, 1, "B");
    graph.add_node("C", 1, -1, "C");
    graph.add_node("D", 2, 0, "D");

    graph.add_edge("A", "B", 1.0);
    graph.add_edge("A", "C", 2.0);
    graph.add_edge("B", "D", 3.0);
    graph.add_edge("C", "D", 1.0);
    return graph;
}

core::WeightedGraph build_grid() {
    //   A---B---C
    //   |   |   |
    //   D---E---F
    //   |   |   |
    //   G---H---I
    static const Place nodes[] = {
        {"A", 0, 2}, {"B", 1, 2}, {"C", 2, 2},
        {"D", 0, 1}, {"E", 1, 1}, {"F", 2, 1},
        {"G", 0, 0}, {"H", 1, 0}, {"I", 2, 0},
    };

    static const Street edges[] = {
        {"A", "B", 1.0, ""}, {"B", "C", 1.0, ""},
        {"D", "E", 1.0, ""}, {"E", "F", 1.0, ""},
        {"G", "H", 1.0, ""}, {"H", "I", 1.0, ""},
        {"A", "D", 1.0, ""}, {"B", "E", 1.0, ""}, {"C", "F", 1.0, ""},
        {"D", "G", 1.0, ""}, {"E", "H", 1.0, ""}, {"F", "I", 1.0, ""},
    };

    core::WeightedGraph graph;
    for (const auto& node : nodes) {
        graph.add_node(node.id, node.x, node.y, std::string("Location ") + node.id);
    }
    for (const auto& edge : edges) {
        graph.add_edge(edge.from, edge.to, edge.length, edge.name);
    }
    return graph;
}

core::WeightedGraph build_chain() {
    core::WeightedGraph graph;
    graph.add_node("Home", 0, 0, "Home");
    graph.add_node("Store", 1, 1, "Store");
    graph.add_node("Park", 2, 0, "Park");

    graph.add_edge("Home", "Store", 1.5, "Main St");
    graph.add_edge("Store", "Park", 2.0, "Oak Ave");
    graph.add_edge("Home", "Park", 4.0, "Long Rd");
    return graph;
}

} // namespace streetnav::navigation::samples
