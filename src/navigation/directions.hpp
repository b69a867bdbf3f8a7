#pragma once

#include <optional>
#include <string>
#include <vector>

#include "core/types.hpp"

namespace streetnav::core {
    class WeightedGraph;
}

namespace streetnav::navigation {

enum class TurnDirection {
    kRight = 0,
    kLeft,
    kStraight,
    kUTurn
};

// How distances are printed in direction lines
struct DirectionsStyle {
    std::string unit = "units";
    int precision = 1;
};

/*
 * Classify the turn made at `via` when arriving from `from` and leaving towards `to`.
 * Coordinates are y-up; heading changes under ~10 degrees count as straight.
 */
TurnDirection classify_turn(const core::Point2D& from, const core::Point2D& via, const core::Point2D& to);

const char* turn_phrase(TurnDirection direction);

/*
 * One line per step: "Start at", one "Go to ... via ..." per traversed edge, "Arrive at".
 * An absent or empty path gives "No route found"; a one-node path "You are already at ...".
 */
std::vector<std::string> route_description(const core::WeightedGraph& graph,
                                           const std::optional<std::vector<core::NodeKey>>& path,
                                           const DirectionsStyle& style = {});

/*
 * Same edge cases as route_description, but every edge after the first is
 * announced with the turn it takes ("Turn left onto Oak Avenue toward Park").
 */
std::vector<std::string> turn_by_turn(const core::WeightedGraph& graph,
                                      const std::optional<std::vector<core::NodeKey>>& path,
                                      const DirectionsStyle& style = {});

std::string format_distance(double distance, const DirectionsStyle& style = {});

} // namespace streetnav::navigation
