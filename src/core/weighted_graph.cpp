#include "weighted_graph.hpp"

#include <cmath>
#include <limits>
#include <sstream>

namespace streetnav::core {

namespace {

const std::vector<Edge> kNoEdges;

std::string describe_invalid_weight(const std::string& from, const std::string& to, double weight) {
    std::ostringstream message;
    message << "invalid weight " << weight << " for edge " << from << " -> " << to
            << " (weights must be non-negative numbers)";
    return message.str();
}

} // namespace

InvalidWeightError::InvalidWeightError(const std::string& from, const std::string& to, double weight)
    : std::invalid_argument(describe_invalid_weight(from, to, weight)),
      from_(from), to_(to), weight_(weight) {}

const Node& WeightedGraph::add_node(const NodeKey& id, double x, double y, const std::string& name) {
    auto existing = nodes_.find(id);
    if (existing != nodes_.end()) {
        return existing->second;
    }

    Node node;
    node.id = id;
    node.position = Point2D(x, y);
    node.name = name.empty() ? id : name;

    auto [it, inserted] = nodes_.emplace(id, std::move(node));
    edges_.emplace(id, std::vector<Edge>{});
    insertion_order_.push_back(id);
    return it->second;
}

void WeightedGraph::add_edge(const NodeKey& from, const NodeKey& to, double weight,
                             const std::string& name, bool bidirectional) {
    // reject before touching anything so a bad edge leaves no bare endpoints behind
    if (std::isnan(weight) || weight < 0.0) {
        throw InvalidWeightError(from, to, weight);
    }

    add_node(from);
    add_node(to);

    edges_[from].push_back(Edge{from, to, weight, name});
    ++edge_count_;

    if (bidirectional) {
        edges_[to].push_back(Edge{to, from, weight, name});
        ++edge_count_;
    }
}

std::vector<Neighbor> WeightedGraph::neighbors(const NodeKey& id) const {
    std::vector<Neighbor> result;

    auto it = edges_.find(id);
    if (it == edges_.end()) {
        return result;
    }

    result.reserve(it->second.size());
    for (const auto& edge : it->second) {
        result.push_back(Neighbor{edge.to, edge.weight});
    }
    return result;
}

const std::vector<Edge>& WeightedGraph::outgoing_edges(const NodeKey& id) const {
    auto it = edges_.find(id);
    if (it == edges_.end()) {
        return kNoEdges;
    }
    return it->second;
}

double WeightedGraph::straight_line_distance(const NodeKey& a, const NodeKey& b) const {
    const Node* first = find_node(a);
    const Node* second = find_node(b);
    if (!first || !second) {
        return 0.0;
    }

    double dx = first->position.x - second->position.x;
    double dy = first->position.y - second->position.y;
    return std::sqrt(dx * dx + dy * dy);
}

const Node* WeightedGraph::find_node(const NodeKey& id) const {
    auto it = nodes_.find(id);
    if (it == nodes_.end()) {
        return nullptr;
    }
    return &it->second;
}

std::string WeightedGraph::display_name(const NodeKey& id) const {
    const Node* node = find_node(id);
    return node ? node->name : std::string("unknown");
}

const Edge* WeightedGraph::find_edge(const NodeKey& from, const NodeKey& to) const {
    const Edge* best = nullptr;
    for (const auto& edge : outgoing_edges(from)) {
        if (edge.to != to) {
            continue;
        }
        if (!best || edge.weight < best->weight) {
            best = &edge;
        }
    }
    return best;
}

Bounds WeightedGraph::bounds() const {
    if (insertion_order_.empty()) {
        return Bounds{};
    }

    Bounds box{
        std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest(),
        std::numeric_limits<double>::max(), std::numeric_limits<double>::lowest()
    };
    for (const auto& id : insertion_order_) {
        box.expand(nodes_.at(id).position);
    }
    return box;
}

} // namespace streetnav::core
