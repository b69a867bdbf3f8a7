#include "osm_route/osm_route.hpp"

#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <string>
#include <string_view>

namespace fs = std::filesystem;

namespace {

void print_usage() {
  std::cout << "Usage: osm_route --input <file.osm|file.osm.pbf> --from <node id> --to <node id> [options]\n"
               "\n"
               "Options:\n"
               "  -i, --input <path>        OSM extract to route on (XML or PBF)\n"
               "  -f, --from <id>           Start OSM node id\n"
               "  -t, --to <id>             Goal OSM node id\n"
               "  -a, --algorithm <name>    dijkstra or astar (default: $STREETNAV_ALGORITHM, then dijkstra)\n"
               "  -p, --png <path>          Also draw the network and route to a PNG file\n"
               "      --size <w>x<h>        PNG size in pixels (default: 1024x768)\n"
               "      --include-paths       Route over footways, paths and cycleways too\n"
               "  -q, --quiet               Suppress progress logging\n"
               "  -h, --help                Show this help text\n";
}

bool parse_size(std::string_view value, int& width, int& height) {
  const auto split = value.find('x');
  if (split == std::string_view::npos) {
    return false;
  }
  try {
    width = std::stoi(std::string(value.substr(0, split)));
    height = std::stoi(std::string(value.substr(split + 1)));
  } catch (const std::exception&) {
    return false;
  }
  return width > 0 && height > 0;
}

}  // namespace

int main(int argc, char* argv[]) {
  streetnav::osm_route::OsmRouteConfig config;

  if (const char* env_algorithm = std::getenv("STREETNAV_ALGORITHM")) {
    config.algorithm = streetnav::navigation::parse_algorithm(env_algorithm);
    if (!config.algorithm) {
      std::cerr << "[osm_route] Ignoring unknown STREETNAV_ALGORITHM: " << env_algorithm << std::endl;
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }

    const bool takes_value = arg == "-i" || arg == "--input" || arg == "-f" || arg == "--from" ||
                             arg == "-t" || arg == "--to" || arg == "-a" || arg == "--algorithm" ||
                             arg == "-p" || arg == "--png" || arg == "--size";
    if (takes_value && i + 1 >= argc) {
      std::cerr << "[osm_route] Missing value for " << arg << std::endl;
      return 1;
    }

    if (arg == "-i" || arg == "--input") {
      config.input = fs::path(argv[++i]);
    } else if (arg == "-f" || arg == "--from") {
      config.from = argv[++i];
    } else if (arg == "-t" || arg == "--to") {
      config.to = argv[++i];
    } else if (arg == "-a" || arg == "--algorithm") {
      config.algorithm = streetnav::navigation::parse_algorithm(argv[++i]);
      if (!config.algorithm) {
        std::cerr << "[osm_route] Unknown algorithm: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "-p" || arg == "--png") {
      config.png_output = fs::path(argv[++i]);
    } else if (arg == "--size") {
      if (!parse_size(argv[++i], config.png_width, config.png_height)) {
        std::cerr << "[osm_route] Invalid size: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "--include-paths") {
      config.include_paths = true;
    } else if (arg == "-q" || arg == "--quiet") {
      config.quiet = true;
    } else {
      std::cerr << "[osm_route] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  try {
    return streetnav::osm_route::run_osm_route(config);
  } catch (const std::exception& ex) {
    std::cerr << "[osm_route] " << ex.what() << std::endl;
    return 1;
  }
}
