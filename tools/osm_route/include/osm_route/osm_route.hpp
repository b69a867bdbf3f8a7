#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "navigation/navigator.hpp"

namespace streetnav::osm_route {

struct OsmRouteConfig {
  std::filesystem::path input;
  std::string from;                 // OSM node id
  std::string to;
  std::optional<navigation::Algorithm> algorithm;
  std::filesystem::path png_output;
  int png_width = 1024;
  int png_height = 768;
  bool include_paths = false;       // keep footway/path/cycleway ways
  bool quiet = false;
};

int run_osm_route(const OsmRouteConfig& config);

}  // namespace streetnav::osm_route
