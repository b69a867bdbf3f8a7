#include "demo/demo.hpp"

#include <cstdlib>
#include <exception>
#include <iostream>
#include <string_view>

namespace {

void print_usage() {
  std::cout << "Usage: streetnav_demo [options]\n"
               "\n"
               "Runs Dijkstra and A* over the demonstration town and prints directions.\n"
               "\n"
               "Options:\n"
               "  -f, --from <location>     Start location (default: the built-in demo routes)\n"
               "  -t, --to <location>       Goal location\n"
               "  -a, --algorithm <name>    dijkstra or astar, for the printed directions\n"
               "                            (default: $STREETNAV_ALGORITHM, then dijkstra)\n"
               "      --turns               Print turn-by-turn directions\n"
               "  -v, --verbose             Log a summary line per search\n"
               "  -h, --help                Show this help text\n";
}

}  // namespace

int main(int argc, char* argv[]) {
  streetnav::demo::DemoConfig config;

  if (const char* env_algorithm = std::getenv("STREETNAV_ALGORITHM")) {
    config.algorithm = streetnav::navigation::parse_algorithm(env_algorithm);
    if (!config.algorithm) {
      std::cerr << "[demo] Ignoring unknown STREETNAV_ALGORITHM: " << env_algorithm << std::endl;
    }
  }

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    if (arg == "-f" || arg == "--from") {
      if (i + 1 >= argc) {
        std::cerr << "[demo] Missing value for --from" << std::endl;
        return 1;
      }
      config.from = argv[++i];
    } else if (arg == "-t" || arg == "--to") {
      if (i + 1 >= argc) {
        std::cerr << "[demo] Missing value for --to" << std::endl;
        return 1;
      }
      config.to = argv[++i];
    } else if (arg == "-a" || arg == "--algorithm") {
      if (i + 1 >= argc) {
        std::cerr << "[demo] Missing value for --algorithm" << std::endl;
        return 1;
      }
      config.algorithm = streetnav::navigation::parse_algorithm(argv[++i]);
      if (!config.algorithm) {
        std::cerr << "[demo] Unknown algorithm: " << argv[i] << std::endl;
        return 1;
      }
    } else if (arg == "--turns") {
      config.turn_by_turn = true;
    } else if (arg == "-v" || arg == "--verbose") {
      config.verbose = true;
    } else {
      std::cerr << "[demo] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  try {
    return streetnav::demo::run_demo(config);
  } catch (const std::exception& ex) {
    std::cerr << "[demo] " << ex.what() << std::endl;
    return 1;
  }
}
