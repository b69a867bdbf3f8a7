#pragma once

#include <stdexcept>
#include <string>

namespace streetnav::core {

// Raised by WeightedGraph::add_edge for a weight the searches cannot handle.
class InvalidWeightError : public std::invalid_argument {
public:
    InvalidWeightError(const std::string& from, const std::string& to, double weight);

    [[nodiscard]] const std::string& from() const { return from_; }
    [[nodiscard]] const std::string& to() const { return to_; }
    [[nodiscard]] double weight() const { return weight_; }

private:
    std::string from_;
    std::string to_;
    double weight_;
};

} // namespace streetnav::core
