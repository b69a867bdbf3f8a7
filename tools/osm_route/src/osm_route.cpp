#include "osm_route/osm_route.hpp"

#include "osm/osm_network_loader.hpp"
#include "pathfinding/search_state.hpp"
#include "rendering/renderer.hpp"

#include <iomanip>
#include <iostream>

namespace streetnav::osm_route {

int run_osm_route(const OsmRouteConfig& config) {
  if (config.input.empty()) {
    std::cerr << "[osm_route] Missing --input argument" << std::endl;
    return 1;
  }
  if (config.from.empty() || config.to.empty()) {
    std::cerr << "[osm_route] Both --from and --to are required" << std::endl;
    return 1;
  }

  osm::OsmLoaderConfig loader_config;
  loader_config.quiet = config.quiet;
  if (config.include_paths) {
    loader_config.excluded_highways.clear();
  }

  auto graph = osm::load_osm_network(config.input, loader_config);
  if (!graph) {
    return 1;
  }

  for (const auto& key : {config.from, config.to}) {
    if (!graph->contains(key)) {
      std::cerr << "[osm_route] Node " << key << " is not on a routable way in " << config.input << std::endl;
      return 1;
    }
  }

  navigation::NavigatorConfig navigator_config;
  navigator_config.verbose = !config.quiet;
  navigator_config.directions.unit = "m";
  navigator_config.directions.precision = 0;
  if (config.algorithm) {
    navigator_config.default_algorithm = *config.algorithm;
  }
  navigation::Navigator navigator(*graph, navigator_config);

  const auto result = navigator.find_path(config.from, config.to);
  if (!result.found()) {
    std::cout << "No route found from " << graph->display_name(config.from) << " to "
              << graph->display_name(config.to) << std::endl;
    return 2;
  }

  std::cout << "Route (" << navigation::algorithm_name(navigator_config.default_algorithm) << "): "
            << result.path->size() << " stops, " << std::fixed << std::setprecision(1) << result.cost << " m"
            << std::endl;
  std::cout << "Path:";
  for (const auto& id : *result.path) {
    std::cout << " " << id;
  }
  std::cout << std::endl;

  std::cout << "\nDirections:" << std::endl;
  const auto directions = navigator.turn_by_turn(result.path);
  for (std::size_t i = 0; i < directions.size(); ++i) {
    std::cout << "  " << (i + 1) << ". " << directions[i] << std::endl;
  }

  if (!config.png_output.empty()) {
    rendering::RouteRenderConfig render_config;
    // street networks from an extract are too dense for a label per node
    render_config.draw_labels = graph->node_count() <= 50;
    rendering::Renderer renderer(render_config);
    if (!renderer.write_png(config.png_output.string(), config.png_width, config.png_height, *graph,
                            result.path)) {
      return 1;
    }
  }

  return 0;
}

}  // namespace streetnav::osm_route
