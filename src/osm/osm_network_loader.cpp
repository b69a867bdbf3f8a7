#include "osm_network_loader.hpp"

#include <osmium/handler.hpp>
#include <osmium/io/any_input.hpp>
#include <osmium/io/reader.hpp>
#include <osmium/osm/node.hpp>
#include <osmium/osm/tag.hpp>
#include <osmium/osm/way.hpp>
#include <osmium/visitor.hpp>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <exception>
#include <iostream>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace fs = std::filesystem;

namespace streetnav::osm {
namespace {

using osm_id = osmium::object_id_type;

enum class WayDirection {
    kBoth,
    kForward,
    kBackward
};

struct WayRecord {
    std::string name;
    WayDirection direction = WayDirection::kBoth;
    std::vector<osm_id> node_refs;
};

struct NodeRecord {
    double lat = 0.0;
    double lon = 0.0;
    std::string name;
};

struct NetworkDataInternal {
    std::vector<WayRecord> ways;
    std::unordered_set<osm_id> referenced_nodes;
    std::unordered_map<osm_id, NodeRecord> nodes;
    std::size_t ways_skipped = 0;
};

std::string to_lower_copy(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

WayDirection encode_direction(const osmium::TagList& tags) {
    if (const char* oneway = tags.get_value_by_key("oneway")) {
        const std::string lower = to_lower_copy(oneway);
        if (lower == "yes" || lower == "1" || lower == "true") return WayDirection::kForward;
        if (lower == "-1" || lower == "reverse") return WayDirection::kBackward;
        return WayDirection::kBoth;
    }

    // roundabouts are one-way unless tagged otherwise
    const char* junction = tags.get_value_by_key("junction");
    if (junction && to_lower_copy(junction) == "roundabout") {
        return WayDirection::kForward;
    }
    return WayDirection::kBoth;
}

class HighwayCollector final : public osmium::handler::Handler {
public:
    HighwayCollector(NetworkDataInternal& internal, const OsmLoaderConfig& config)
        : internal_(internal), config_(config) {}

    void way(const osmium::Way& way) {
        const char* highway = way.tags().get_value_by_key("highway");
        if (!highway) {
            return;
        }

        const std::string category = to_lower_copy(highway);
        const auto& excluded = config_.excluded_highways;
        if (std::find(excluded.begin(), excluded.end(), category) != excluded.end() ||
            way.nodes().size() < 2) {
            ++internal_.ways_skipped;
            return;
        }

        WayRecord record;
        record.direction = encode_direction(way.tags());
        if (const char* name = way.tags().get_value_by_key("name")) {
            record.name = name;
        }

        for (const auto& node_ref : way.nodes()) {
            internal_.referenced_nodes.insert(node_ref.ref());
            record.node_refs.push_back(node_ref.ref());
        }

        internal_.ways.emplace_back(std::move(record));
    }

private:
    NetworkDataInternal& internal_;
    const OsmLoaderConfig& config_;
};

class NodeCollector final : public osmium::handler::Handler {
public:
    explicit NodeCollector(NetworkDataInternal& internal)
        : internal_(internal) {}

    void node(const osmium::Node& node) {
        if (!node.location().valid() || !internal_.referenced_nodes.contains(node.id())) {
            return;
        }

        NodeRecord record;
        record.lat = node.location().lat();
        record.lon = node.location().lon();
        if (const char* name = node.tags().get_value_by_key("name")) {
            record.name = name;
        }
        internal_.nodes.emplace(node.id(), std::move(record));
    }

private:
    NetworkDataInternal& internal_;
};

NetworkDataInternal read_extract(const fs::path& input, const OsmLoaderConfig& config) {
    NetworkDataInternal internal;

    {
        osmium::io::Reader way_reader{input.string(), osmium::osm_entity_bits::way};
        HighwayCollector highway_handler{internal, config};
        osmium::apply(way_reader, highway_handler);
        way_reader.close();
    }

    {
        osmium::io::Reader node_reader{input.string(), osmium::osm_entity_bits::node};
        NodeCollector node_handler{internal};
        osmium::apply(node_reader, node_handler);
        node_reader.close();
    }

    return internal;
}

core::WeightedGraph build_network(const NetworkDataInternal& internal, OsmLoadSummary& summary) {
    core::WeightedGraph graph;
    if (internal.nodes.empty()) {
        return graph;
    }

    double lat_sum = 0.0;
    double lon_sum = 0.0;
    for (const auto& [id, record] : internal.nodes) {
        lat_sum += record.lat;
        lon_sum += record.lon;
    }
    const double center_lat = lat_sum / internal.nodes.size();
    const double center_lon = lon_sum / internal.nodes.size();
    const double cos_center_lat = std::cos(center_lat * kDegreeToRadian);

    std::unordered_set<osm_id> missing;

    // nodes go in by first appearance along the ways so node_ids() is stable across runs
    for (const auto& way : internal.ways) {
        for (osm_id ref : way.node_refs) {
            auto iter = internal.nodes.find(ref);
            if (iter == internal.nodes.end()) {
                missing.insert(ref);
                continue;
            }

            const NodeRecord& record = iter->second;
            const double x = kEarthRadiusInMeters * (record.lon - center_lon) * kDegreeToRadian * cos_center_lat;
            const double y = kEarthRadiusInMeters * (record.lat - center_lat) * kDegreeToRadian;
            const std::string key = std::to_string(ref);
            graph.add_node(key, x, y, record.name.empty() ? "Node " + key : record.name);
        }
    }

    for (const auto& way : internal.ways) {
        bool used = false;
        for (std::size_t i = 1; i < way.node_refs.size(); ++i) {
            const std::string from = std::to_string(way.node_refs[i - 1]);
            const std::string to = std::to_string(way.node_refs[i]);
            if (from == to || !graph.contains(from) || !graph.contains(to)) {
                continue;
            }

            const double weight = graph.straight_line_distance(from, to);
            switch (way.direction) {
                case WayDirection::kForward:
                    graph.add_edge(from, to, weight, way.name, false);
                    break;
                case WayDirection::kBackward:
                    graph.add_edge(to, from, weight, way.name, false);
                    break;
                case WayDirection::kBoth:
                    graph.add_edge(from, to, weight, way.name, true);
                    break;
            }
            used = true;
        }
        if (used) {
            ++summary.ways_used;
        } else {
            ++summary.ways_skipped;
        }
    }

    summary.ways_skipped += internal.ways_skipped;
    summary.missing_nodes = missing.size();
    return graph;
}

} // namespace

std::optional<core::WeightedGraph> load_osm_network(const fs::path& input, const OsmLoaderConfig& config,
                                                    LogCallback log_callback, OsmLoadSummary* summary) {
    auto log = [&](const std::string& message, bool is_error) {
        if (log_callback) {
            log_callback(message, is_error);
        } else if (is_error) {
            std::cerr << "[osm_loader] " << message << std::endl;
        } else if (!config.quiet) {
            std::cout << "[osm_loader] " << message << std::endl;
        }
    };

    if (input.empty()) {
        log("Missing input file", true);
        return std::nullopt;
    }

    if (!fs::exists(input)) {
        log("Input file does not exist: " + input.string(), true);
        return std::nullopt;
    }

    const auto start_time = std::chrono::steady_clock::now();

    OsmLoadSummary local_summary;
    std::optional<core::WeightedGraph> graph;
    try {
        NetworkDataInternal internal = read_extract(input, config);
        graph = build_network(internal, local_summary);
    } catch (const std::exception& ex) {
        log("Failed to read " + input.string() + ": " + ex.what(), true);
        return std::nullopt;
    }

    if (local_summary.missing_nodes > 0) {
        log("Warning: missing " + std::to_string(local_summary.missing_nodes) +
            " node locations referenced by highway ways", true);
    }

    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_time);

    log("Loaded " + std::to_string(graph->node_count()) + " nodes, " + std::to_string(graph->edge_count()) +
        " edges from " + std::to_string(local_summary.ways_used) + " ways in " +
        std::to_string(elapsed.count()) + "ms", false);

    if (summary) {
        *summary = local_summary;
    }
    return graph;
}

} // namespace streetnav::osm
