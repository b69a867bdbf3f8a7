#pragma once

#include <algorithm>
#include <cstddef>
#include <string>
#include <vector>

namespace streetnav::core {

using NodeKey = std::string;

struct Point2D {
    double x = 0.0;
    double y = 0.0;
    Point2D() = default;
    Point2D(double x_val, double y_val) : x(x_val), y(y_val) {}
};

struct Bounds {
    double min_x = 0.0;
    double max_x = 0.0;
    double min_y = 0.0;
    double max_y = 0.0;

    [[nodiscard]] bool is_valid() const {
        return min_x <= max_x && min_y <= max_y;
    }

    [[nodiscard]] Point2D center() const {
        return Point2D((min_x + max_x) * 0.5, (min_y + max_y) * 0.5);
    }

    [[nodiscard]] double width() const { return max_x - min_x; }
    [[nodiscard]] double height() const { return max_y - min_y; }

    [[nodiscard]] bool contains(const Point2D& point) const {
        return point.x >= min_x && point.x <= max_x &&
               point.y >= min_y && point.y <= max_y;
    }

    void expand(const Point2D& point) {
        min_x = std::min(min_x, point.x);
        max_x = std::max(max_x, point.x);
        min_y = std::min(min_y, point.y);
        max_y = std::max(max_y, point.y);
    }
};

// An intersection or named location. Identity is the key alone.
struct Node {
    NodeKey id;
    Point2D position;
    std::string name;

    bool operator==(const Node& other) const { return id == other.id; }
    bool operator!=(const Node& other) const { return id != other.id; }
};

// One direction of a street. Two-way streets are stored as a pair.
struct Edge {
    NodeKey from;
    NodeKey to;
    double weight = 0.0;
    std::string name;
};

struct Neighbor {
    NodeKey id;
    double weight = 0.0;

    bool operator==(const Neighbor& other) const {
        return id == other.id && weight == other.weight;
    }
};

} // namespace streetnav::core
