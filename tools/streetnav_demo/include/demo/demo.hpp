#pragma once

#include <iosfwd>
#include <optional>
#include <string>

#include "core/weighted_graph.hpp"
#include "navigation/navigator.hpp"

namespace streetnav::demo {

struct DemoConfig {
  std::string from;
  std::string to;
  std::optional<navigation::Algorithm> algorithm;  // used for the printed directions
  bool turn_by_turn = false;
  bool verbose = false;
};

int run_demo(const DemoConfig& config);

// Locations and streets; a street with a matching reverse edge is listed once as two-way
void print_network(const core::WeightedGraph& graph, std::ostream& out);

}  // namespace streetnav::demo
