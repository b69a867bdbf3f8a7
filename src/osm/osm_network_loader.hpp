#pragma once

#include <cstddef>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

#include "core/weighted_graph.hpp"

namespace streetnav::osm {

constexpr double kDegreeToRadian = 0.017453292519943295; // PI / 180
constexpr double kEarthRadiusInMeters = 6371000.0;

struct OsmLoaderConfig {
    // highway=* values whose ways are left out of the network
    std::vector<std::string> excluded_highways = {"footway", "path", "cycleway"};
    bool quiet = false;
};

struct OsmLoadSummary {
    std::size_t ways_used = 0;
    std::size_t ways_skipped = 0;
    std::size_t missing_nodes = 0;   // referenced by a way but absent from the file
};

using LogCallback = std::function<void(const std::string& message, bool is_error)>;

/**
 * Build a street network from the highway ways of an OSM extract (XML or PBF).
 *
 * Node keys are decimal OSM node ids. Positions are an equirectangular
 * projection in metres around the mean latitude of the loaded nodes, and
 * every edge weighs exactly the straight-line distance between its ends.
 * Returns an empty optional, with the reason logged, when the file is
 * missing or cannot be parsed.
 */
std::optional<core::WeightedGraph> load_osm_network(const std::filesystem::path& input,
                                                    const OsmLoaderConfig& config = {},
                                                    LogCallback log_callback = nullptr,
                                                    OsmLoadSummary* summary = nullptr);

} // namespace streetnav::osm
