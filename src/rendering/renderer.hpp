#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <cairo.h>

#include "core/types.hpp"

namespace streetnav::core {
    class WeightedGraph;
}

namespace streetnav::rendering {

// Fits graph coordinates (y up) into a viewport (y down)
class CoordinateSystem {
public:
    explicit CoordinateSystem(const core::Bounds& world_bounds, double fill_ratio = 0.8);

    // Scale for fitting the world in the viewport
    double calculate_scale(int viewport_width, int viewport_height, double zoom = 1.0) const;

    core::Point2D world_to_screen(const core::Point2D& world, double scale,
                                  const core::Point2D& offset, int viewport_width, int viewport_height) const;
    core::Point2D screen_to_world(const core::Point2D& screen, double scale,
                                  const core::Point2D& offset, int viewport_width, int viewport_height) const;

private:
    core::Bounds world_bounds_;
    core::Point2D world_center_;
    double fill_ratio_;
};

struct RenderStyle {
    double line_width = 1.0;
    double point_size = 2.0;
    struct Color { double r, g, b, a; } color = {0.0, 0.0, 0.0, 1.0};
    bool filled = false;
    bool stroked = true;
};

// Style presets
namespace styles {
    extern const RenderStyle street_default;
    extern const RenderStyle street_route;
    extern const RenderStyle node_default;
    extern const RenderStyle node_start;
    extern const RenderStyle node_goal;
    extern const RenderStyle label_default;
}

struct RouteRenderConfig {
    double fill_ratio = 0.8;
    bool draw_labels = true;
    std::string label_font = "Sans 10";
    RenderStyle::Color background = {0.95, 0.95, 0.95, 1.0};
};

/**
 * Draws a street network and an optional highlighted route with cairo.
 *
 * A frame is opened with begin_frame() on a caller-owned cairo context and
 * closed with end_frame(); render() does both around a full draw.
 */
class Renderer {
public:
    using LogCallback = std::function<void(const std::string& message, bool is_error)>;

    Renderer();
    explicit Renderer(const RouteRenderConfig& config);
    ~Renderer();

    void set_log_callback(LogCallback callback);
    const RouteRenderConfig& config() const { return config_; }
    // Takes effect from the next frame; the last frame stays pickable
    void set_config(const RouteRenderConfig& config);

    // Rendering context management
    void begin_frame(cairo_t* cr, int width, int height, const core::Bounds& world,
                     double zoom = 1.0, const core::Point2D& offset = {});
    void end_frame();

    // Drawing primitives, in graph coordinates
    void draw_edge(const core::Point2D& from, const core::Point2D& to, const RenderStyle& style);
    void draw_node(const core::Point2D& position, const RenderStyle& style);
    void draw_label(const core::Point2D& position, const std::string& text, const RenderStyle& style);

    void draw_network(const core::WeightedGraph& graph);
    void draw_route(const core::WeightedGraph& graph, const std::vector<core::NodeKey>& route);

    // Background, network, route and labels in one frame
    void render(cairo_t* cr, int width, int height, const core::WeightedGraph& graph,
                const std::optional<std::vector<core::NodeKey>>& route,
                double zoom = 1.0, const core::Point2D& offset = {});

    // Render to an ARGB image and save it; false (with a logged reason) on failure
    bool write_png(const std::string& path, int width, int height, const core::WeightedGraph& graph,
                   const std::optional<std::vector<core::NodeKey>>& route);

    // Closest node within `radius` pixels of a point in the last frame drawn
    std::optional<core::NodeKey> node_at(const core::WeightedGraph& graph, const core::Point2D& screen,
                                         double radius = 10.0) const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
    RouteRenderConfig config_;
    LogCallback log_callback_;

    core::Point2D transform_point(const core::Point2D& world) const;
    void log_message(const std::string& message, bool is_error = false) const;
};

} // namespace streetnav::rendering
