#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "graph_errors.hpp"
#include "types.hpp"

namespace streetnav::core {

/**
 * Street network held as a key -> node map plus per-node outgoing edge lists.
 *
 * Nodes and edges are only ever added; nothing is removed or updated in place.
 * The graph is read-only while a search runs, so independent searches may share
 * one instance as long as nobody calls add_node/add_edge concurrently.
 */
class WeightedGraph {
public:
    WeightedGraph() = default;

    /**
     * Add a node, or return the one already stored under this key.
     *
     * The first insertion wins: coordinates and name of an existing node are
     * never overwritten. An empty name defaults to the key.
     */
    const Node& add_node(const NodeKey& id, double x = 0.0, double y = 0.0, const std::string& name = "");

    /**
     * Add a street from `from` to `to` (and back, when bidirectional).
     *
     * Missing endpoints are created as bare nodes at (0, 0) named after their
     * key. Throws InvalidWeightError for a negative or NaN weight, in which
     * case the graph is left untouched.
     */
    void add_edge(const NodeKey& from, const NodeKey& to, double weight,
                  const std::string& name = "", bool bidirectional = true);

    // Outgoing (destination, weight) pairs in insertion order; empty for unknown keys.
    [[nodiscard]] std::vector<Neighbor> neighbors(const NodeKey& id) const;

    [[nodiscard]] const std::vector<Edge>& outgoing_edges(const NodeKey& id) const;

    // Euclidean distance between two node positions, 0 if either key is unknown.
    [[nodiscard]] double straight_line_distance(const NodeKey& a, const NodeKey& b) const;

    [[nodiscard]] bool contains(const NodeKey& id) const { return nodes_.count(id) != 0; }
    [[nodiscard]] const Node* find_node(const NodeKey& id) const;
    [[nodiscard]] std::string display_name(const NodeKey& id) const;

    // Cheapest from -> to edge (first inserted among equal weights), nullptr if none.
    [[nodiscard]] const Edge* find_edge(const NodeKey& from, const NodeKey& to) const;

    [[nodiscard]] std::size_t node_count() const { return nodes_.size(); }
    [[nodiscard]] std::size_t edge_count() const { return edge_count_; }
    [[nodiscard]] bool empty() const { return nodes_.empty(); }

    // Keys in the order they were first added.
    [[nodiscard]] const std::vector<NodeKey>& node_ids() const { return insertion_order_; }

    [[nodiscard]] Bounds bounds() const;

private:
    std::unordered_map<NodeKey, Node> nodes_;
    std::unordered_map<NodeKey, std::vector<Edge>> edges_;
    std::vector<NodeKey> insertion_order_;
    std::size_t edge_count_ = 0;
};

} // namespace streetnav::core
