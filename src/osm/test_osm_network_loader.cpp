#include "osm_network_loader.hpp"
#include "pathfinding/astar.hpp"
#include "pathfinding/dijkstra.hpp"

#include <cstdio>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

namespace streetnav {

namespace osm_loader_tests {

using core::WeightedGraph;

const char* const kExtractPath = "/tmp/streetnav_test_extract.osm";
const char* const kBrokenPath = "/tmp/streetnav_test_broken.osm";

// Four corners of a ~111 m square around the equator, plus one node no way uses.
// Main Street runs 1-2-3, One Way 3->4, Back Lane 4-1 tagged oneway=-1 (so 1->4),
// and a footway 4-1 that is excluded by default.
const char* const kExtract = R"(<?xml version="1.0" encoding="UTF-8"?>
<osm version="0.6" generator="streetnav-tests">
  <node id="1" version="1" lat="0.0" lon="0.0">
    <tag k="name" v="Origin"/>
  </node>
  <node id="2" version="1" lat="0.0" lon="0.001"/>
  <node id="3" version="1" lat="0.001" lon="0.001"/>
  <node id="4" version="1" lat="0.001" lon="0.0"/>
  <node id="5" version="1" lat="0.5" lon="0.5"/>
  <way id="10" version="1">
    <nd ref="1"/>
    <nd ref="2"/>
    <nd ref="3"/>
    <tag k="highway" v="residential"/>
    <tag k="name" v="Main Street"/>
  </way>
  <way id="11" version="1">
    <nd ref="3"/>
    <nd ref="4"/>
    <tag k="highway" v="primary"/>
    <tag k="oneway" v="yes"/>
    <tag k="name" v="One Way"/>
  </way>
  <way id="12" version="1">
    <nd ref="4"/>
    <nd ref="1"/>
    <tag k="highway" v="footway"/>
  </way>
  <way id="13" version="1">
    <nd ref="4"/>
    <nd ref="1"/>
    <tag k="highway" v="service"/>
    <tag k="oneway" v="-1"/>
    <tag k="name" v="Back Lane"/>
  </way>
  <way id="14" version="1">
    <nd ref="1"/>
    <nd ref="2"/>
    <nd ref="5"/>
    <tag k="building" v="yes"/>
  </way>
  <way id="15" version="1">
    <nd ref="3"/>
    <nd ref="99"/>
    <tag k="highway" v="residential"/>
  </way>
</osm>
)";

bool write_file(const char* path, const char* contents) {
    std::ofstream out(path);
    out << contents;
    return static_cast<bool>(out);
}

osm::LogCallback silent() {
    return [](const std::string&, bool) {};
}

bool test_loads_highway_nodes() {
    auto graph = osm::load_osm_network(kExtractPath, {}, silent());
    if (!graph) {
        std::cerr << "Expected the extract to load" << std::endl;
        return false;
    }

    if (graph->node_count() != 4 || graph->contains("5") || graph->contains("99")) {
        std::cerr << "Expected only the four located highway nodes, got " << graph->node_count() << std::endl;
        return false;
    }

    return graph->node_ids() == std::vector<std::string>{"1", "2", "3", "4"} &&
           graph->display_name("1") == "Origin" && graph->display_name("2") == "Node 2";
}

bool test_projection_and_weights() {
    auto graph = osm::load_osm_network(kExtractPath, {}, silent());
    if (!graph) return false;

    const auto* edge = graph->find_edge("1", "2");
    if (!edge || edge->name != "Main Street") {
        std::cerr << "Expected a Main Street edge from 1 to 2" << std::endl;
        return false;
    }

    // 0.001 degrees of longitude near the equator is about 111 m
    if (edge->weight < 110.0 || edge->weight > 112.5) {
        std::cerr << "Unexpected edge length " << edge->weight << std::endl;
        return false;
    }

    // eastward is +x and northward is +y
    const auto* origin = graph->find_node("1");
    const auto* east = graph->find_node("2");
    const auto* north_east = graph->find_node("3");
    return edge->weight == graph->straight_line_distance("1", "2") &&
           east->position.x > origin->position.x && north_east->position.y > east->position.y;
}

bool test_oneway_handling() {
    auto graph = osm::load_osm_network(kExtractPath, {}, silent());
    if (!graph) return false;

    bool forward = graph->find_edge("3", "4") != nullptr && graph->find_edge("4", "3") == nullptr;
    bool reversed = graph->find_edge("1", "4") != nullptr && graph->find_edge("4", "1") == nullptr;
    bool two_way = graph->find_edge("2", "1") != nullptr;
    return forward && reversed && two_way && graph->find_edge("1", "4")->name == "Back Lane";
}

bool test_routes_on_loaded_network() {
    auto graph = osm::load_osm_network(kExtractPath, {}, silent());
    if (!graph) return false;

    auto by_dijkstra = pathfinding::dijkstra(*graph, "1", "4");
    auto by_astar = pathfinding::astar(*graph, "1", "4");
    auto blocked = pathfinding::dijkstra(*graph, "4", "1");

    return by_dijkstra.found() && *by_dijkstra.path == std::vector<std::string>{"1", "4"} &&
           by_astar.cost == by_dijkstra.cost && !blocked.found();
}

bool test_excluded_highways_configurable() {
    osm::OsmLoaderConfig config;
    config.excluded_highways.clear();

    auto graph = osm::load_osm_network(kExtractPath, config, silent());
    if (!graph) return false;

    // the footway now links 4 back to 1
    return pathfinding::dijkstra(*graph, "4", "1").found();
}

bool test_summary_and_missing_nodes() {
    std::vector<std::pair<std::string, bool>> messages;
    osm::OsmLoadSummary summary;
    auto graph = osm::load_osm_network(kExtractPath, {}, [&messages](const std::string& message, bool is_error) {
        messages.emplace_back(message, is_error);
    }, &summary);
    if (!graph) return false;

    bool warned = false;
    for (const auto& [message, is_error] : messages) {
        if (is_error && message.find("missing 1 node") != std::string::npos) {
            warned = true;
        }
    }

    // ways 10, 11 and 13 are used; the footway and the way to node 99 are not
    return warned && summary.ways_used == 3 && summary.ways_skipped == 2 && summary.missing_nodes == 1;
}

bool test_missing_file() {
    std::vector<std::pair<std::string, bool>> messages;
    auto graph = osm::load_osm_network("/tmp/streetnav-no-such-file.osm", {},
                                       [&messages](const std::string& message, bool is_error) {
                                           messages.emplace_back(message, is_error);
                                       });
    return !graph && messages.size() == 1 && messages[0].second &&
           messages[0].first.find("does not exist") != std::string::npos;
}

bool test_unreadable_file() {
    if (!write_file(kBrokenPath, "<osm version=\"0.6\"><node id=\"1\" lat=\"0\" lon=\"0\">")) {
        return false;
    }

    bool reported = false;
    auto graph = osm::load_osm_network(kBrokenPath, {}, [&reported](const std::string&, bool is_error) {
        reported = reported || is_error;
    });
    std::remove(kBrokenPath);
    return !graph && reported;
}

bool run_all_tests() {
    if (!write_file(kExtractPath, kExtract)) {
        std::cerr << "Could not write " << kExtractPath << std::endl;
        return false;
    }

    const std::pair<const char*, bool (*)()> tests[] = {
        {"loads_highway_nodes", &test_loads_highway_nodes},
        {"projection_and_weights", &test_projection_and_weights},
        {"oneway_handling", &test_oneway_handling},
        {"routes_on_loaded_network", &test_routes_on_loaded_network},
        {"excluded_highways_configurable", &test_excluded_highways_configurable},
        {"summary_and_missing_nodes", &test_summary_and_missing_nodes},
        {"missing_file", &test_missing_file},
        {"unreadable_file", &test_unreadable_file},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    std::remove(kExtractPath);
    return all_passed;
}

} // namespace osm_loader_tests

} // namespace streetnav

int main() {
    if (streetnav::osm_loader_tests::run_all_tests()) {
        std::cout << "All OSM loader tests passed" << std::endl;
        return 0;
    }

    std::cerr << "OSM loader tests failed" << std::endl;
    return 1;
}
