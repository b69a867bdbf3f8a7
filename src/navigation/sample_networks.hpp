#pragma once

#include <string>
#include <utility>
#include <vector>

#include "core/weighted_graph.hpp"

namespace streetnav::navigation::samples {

// Home, School, Store, Park, Library and Hospital joined by eight named two-way streets
core::WeightedGraph build_town();

// Routes the demo walks through on the town network
std::vector<std::pair<std::string, std::string>> town_demo_routes();

// A(0,0) B(1,1) C(1,-1) D(2,0); A-B 1, A-C 2, B-D 3, C-D 1
core::WeightedGraph build_diamond();

// 3x3 unit grid A..I laid out row by row from (0,2) to (2,0)
core::WeightedGraph build_grid();

// Home(0,0) Store(1,1) Park(2,0) with a long direct Home-Park road
core::WeightedGraph build_chain();

} // namespace streetnav::navigation::samples
