#include "demo/demo.hpp"
#include "navigation/sample_networks.hpp"

#include <algorithm>
#include <iostream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace streetnav {

namespace demo_tests {

using core::WeightedGraph;

// Lines after the "Streets:" heading
std::vector<std::string> street_lines(const WeightedGraph& graph) {
    std::ostringstream out;
    demo::print_network(graph, out);

    std::istringstream in(out.str());
    std::vector<std::string> lines;
    bool in_streets = false;
    for (std::string line; std::getline(in, line);) {
        if (line == "Streets:") {
            in_streets = true;
        } else if (in_streets && !line.empty()) {
            lines.push_back(line);
        }
    }
    return lines;
}

long count_matching(const std::vector<std::string>& lines, const std::string& name, const std::string& link) {
    return std::count_if(lines.begin(), lines.end(), [&](const std::string& line) {
        return line.find(name) != std::string::npos && line.find(link) != std::string::npos;
    });
}

bool test_opposite_one_way_streets() {
    WeightedGraph graph;
    graph.add_edge("A", "B", 1.0, "North Road", false);
    graph.add_edge("B", "A", 1.0, "South Road", false);

    auto lines = street_lines(graph);
    if (lines.size() != 2) {
        std::cerr << "Expected 2 street lines, got " << lines.size() << std::endl;
        return false;
    }
    return count_matching(lines, "North Road", " A -> B ") == 1 && count_matching(lines, "South Road", " B -> A ") == 1;
}

bool test_two_way_street_with_cheaper_reverse() {
    WeightedGraph graph;
    graph.add_edge("A", "B", 2.0, "Main Street");
    graph.add_edge("B", "A", 1.0, "Shortcut", false);

    auto lines = street_lines(graph);
    if (lines.size() != 2) {
        std::cerr << "Expected 2 street lines, got " << lines.size() << std::endl;
        return false;
    }
    return count_matching(lines, "Main Street", " A <-> B ") == 1 && count_matching(lines, "Shortcut", " B -> A ") == 1;
}

bool test_same_name_different_weight_is_one_way() {
    WeightedGraph graph;
    graph.add_edge("A", "B", 1.0, "Hill Road", false);
    graph.add_edge("B", "A", 3.0, "Hill Road", false);

    auto lines = street_lines(graph);
    return lines.size() == 2 && count_matching(lines, "Hill Road", " <-> ") == 0;
}

bool test_town_streets_listed_once() {
    const WeightedGraph town = navigation::samples::build_town();
    auto lines = street_lines(town);

    // every town street is two-way
    if (static_cast<std::size_t>(count_matching(lines, "", " <-> ")) != lines.size()) {
        std::cerr << "Expected only two-way streets in the town" << std::endl;
        return false;
    }
    return lines.size() * 2 == town.edge_count();
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"opposite_one_way_streets", &test_opposite_one_way_streets},
        {"two_way_street_with_cheaper_reverse", &test_two_way_street_with_cheaper_reverse},
        {"same_name_different_weight_is_one_way", &test_same_name_different_weight_is_one_way},
        {"town_streets_listed_once", &test_town_streets_listed_once},
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

} // namespace demo_tests

} // namespace streetnav

int main() {
    if (streetnav::demo_tests::run_all_tests()) {
        std::cout << "All demo tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Demo tests failed" << std::endl;
    return 1;
}
