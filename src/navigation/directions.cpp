#include "directions.hpp"
#include "core/weighted_graph.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

namespace streetnav::navigation {

namespace {

constexpr double kStraightThreshold = 0.17; // radians, ~10 degrees
constexpr double kPi = 3.14159265358979323846;

std::string street_label(const core::Edge* edge) {
    if (!edge || edge->name.empty()) {
        return "the street";
    }
    return edge->name;
}

} // namespace

TurnDirection classify_turn(const core::Point2D& from, const core::Point2D& via, const core::Point2D& to) {
    double src_x = via.x - from.x;
    double src_y = via.y - from.y;
    double dst_x = to.x - via.x;
    double dst_y = to.y - via.y;

    // no heading on a zero-length leg
    if ((src_x == 0.0 && src_y == 0.0) || (dst_x == 0.0 && dst_y == 0.0)) {
        return TurnDirection::kStraight;
    }

    //calculate using atan2 to get from -pi to pi
    double init_angle = std::atan2(src_y, src_x);
    double dst_angle = std::atan2(dst_y, dst_x);

    double delta = dst_angle - init_angle;
    if (delta > kPi) {
        delta -= 2.0 * kPi;
    } else if (delta <= -kPi) {
        delta += 2.0 * kPi;
    }

    if (std::abs(delta) < kStraightThreshold) {
        return TurnDirection::kStraight;
    }
    if (std::abs(delta) > kPi - kStraightThreshold) {
        return TurnDirection::kUTurn;
    }
    return delta > 0.0 ? TurnDirection::kLeft : TurnDirection::kRight;
}

const char* turn_phrase(TurnDirection direction) {
    switch (direction) {
        case TurnDirection::kLeft:
            return "Turn left";
        case TurnDirection::kRight:
            return "Turn right";
        case TurnDirection::kUTurn:
            return "Make a U-turn";
        case TurnDirection::kStraight:
        default:
            return "Continue straight";
    }
}

std::string format_distance(double distance, const DirectionsStyle& style) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(style.precision) << distance << " " << style.unit;
    return out.str();
}

std::vector<std::string> route_description(const core::WeightedGraph& graph,
                                           const std::optional<std::vector<core::NodeKey>>& path,
                                           const DirectionsStyle& style) {
    if (!path || path->empty()) {
        return {"No route found"};
    }

    const auto& route = *path;
    if (route.size() == 1) {
        return {"You are already at " + graph.display_name(route.front())};
    }

    std::vector<std::string> directions;
    directions.reserve(route.size() + 1);
    directions.push_back("Start at " + graph.display_name(route.front()));

    for (std::size_t i = 0; i + 1 < route.size(); ++i) {
        const core::Edge* edge = graph.find_edge(route[i], route[i + 1]);
        std::string line = "Go to " + graph.display_name(route[i + 1]);
        if (edge) {
            line += " via " + street_label(edge) + " (" + format_distance(edge->weight, style) + ")";
        }
        directions.push_back(std::move(line));
    }

    directions.push_back("Arrive at " + graph.display_name(route.back()));
    return directions;
}

std::vector<std::string> turn_by_turn(const core::WeightedGraph& graph,
                                      const std::optional<std::vector<core::NodeKey>>& path,
                                      const DirectionsStyle& style) {
    if (!path || path->size() < 2) {
        return route_description(graph, path, style);
    }

    const auto& route = *path;
    std::vector<std::string> directions;
    directions.reserve(route.size());

    for (std::size_t i = 0; i + 1 < route.size(); ++i) {
        const core::Edge* edge = graph.find_edge(route[i], route[i + 1]);
        const std::string target = graph.display_name(route[i + 1]);

        std::string line;
        if (i == 0) {
            line = "Head toward " + target;
            if (edge) {
                line += " on " + street_label(edge);
            }
        } else {
            const core::Node* from = graph.find_node(route[i - 1]);
            const core::Node* via = graph.find_node(route[i]);
            const core::Node* to = graph.find_node(route[i + 1]);

            TurnDirection turn = TurnDirection::kStraight;
            if (from && via && to) {
                turn = classify_turn(from->position, via->position, to->position);
            }

            line = turn_phrase(turn);
            if (edge) {
                line += " onto " + street_label(edge);
            }
            line += " toward " + target;
        }

        if (edge) {
            line += " (" + format_distance(edge->weight, style) + ")";
        }
        directions.push_back(std::move(line));
    }

    directions.push_back("Arrive at " + graph.display_name(route.back()));
    return directions;
}

} // namespace streetnav::navigation
