#include "renderer.hpp"

#include "core/weighted_graph.hpp"

#include <pango/pangocairo.h>

#include <algorithm>
#include <cmath>
#include <iostream>
#include <limits>

namespace streetnav::rendering {

namespace {

// Keeps a single node or a straight street from collapsing the fit
constexpr double kMinWorldExtent = 1e-9;

} // namespace

// CoordinateSystem implementation
CoordinateSystem::CoordinateSystem(const core::Bounds& world_bounds, double fill_ratio)
    : world_bounds_(world_bounds), world_center_(world_bounds.center()), fill_ratio_(fill_ratio) {}

double CoordinateSystem::calculate_scale(int viewport_width, int viewport_height, double zoom) const {
    double world_width = world_bounds_.width();
    double world_height = world_bounds_.height();

    if (world_width < kMinWorldExtent && world_height < kMinWorldExtent) {
        return zoom;
    }

    double scale_x = world_width < kMinWorldExtent ? std::numeric_limits<double>::infinity()
                                                   : (viewport_width * fill_ratio_) / world_width;
    double scale_y = world_height < kMinWorldExtent ? std::numeric_limits<double>::infinity()
                                                    : (viewport_height * fill_ratio_) / world_height;

    return std::min(scale_x, scale_y) * zoom;
}

core::Point2D CoordinateSystem::world_to_screen(const core::Point2D& world, double scale,
                                                const core::Point2D& offset, int viewport_width,
                                                int viewport_height) const {
    double x = (world.x - world_center_.x) * scale + offset.x + viewport_width / 2.0;
    double y = (world_center_.y - world.y) * scale + offset.y + viewport_height / 2.0;
    return core::Point2D{x, y};
}

core::Point2D CoordinateSystem::screen_to_world(const core::Point2D& screen, double scale,
                                                const core::Point2D& offset, int viewport_width,
                                                int viewport_height) const {
    double x = world_center_.x + (screen.x - offset.x - viewport_width / 2.0) / scale;
    double y = world_center_.y - (screen.y - offset.y - viewport_height / 2.0) / scale;
    return core::Point2D{x, y};
}

// RenderStyle definitions
namespace styles {
    const RenderStyle street_default{
        .line_width = 2.5,
        .color = {0.6, 0.6, 0.6, 1.0},  // Light gray for streets off the route
        .filled = false,
        .stroked = true
    };

    const RenderStyle street_route{
        .line_width = 6.0,
        .color = {100.0 / 255.0, 149.0 / 255.0, 237.0 / 255.0, 1.0},  // Cornflower blue
        .filled = false,
        .stroked = true
    };

    const RenderStyle node_default{
        .point_size = 4.0,
        .color = {0.3, 0.3, 0.3, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle node_start{
        .point_size = 7.0,
        .color = {0.1, 0.7, 0.2, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle node_goal{
        .point_size = 7.0,
        .color = {0.85, 0.1, 0.1, 1.0},
        .filled = true,
        .stroked = false
    };

    const RenderStyle label_default{
        .color = {0.1, 0.1, 0.1, 1.0},
        .filled = false,
        .stroked = false
    };
}

// Renderer implementation
struct Renderer::Impl {
    cairo_t* cr = nullptr;
    int viewport_width = 0;
    int viewport_height = 0;
    double zoom = 1.0;
    double scale = 1.0;
    core::Point2D offset{0, 0};
    std::optional<CoordinateSystem> coords;
};

Renderer::Renderer() : Renderer(RouteRenderConfig{}) {}

Renderer::Renderer(const RouteRenderConfig& config)
    : impl_(std::make_unique<Impl>()), config_(config), log_callback_(nullptr) {}

Renderer::~Renderer() = default;

void Renderer::set_config(const RouteRenderConfig& config) {
    config_ = config;
}

void Renderer::set_log_callback(LogCallback callback) {
    log_callback_ = std::move(callback);
}

void Renderer::begin_frame(cairo_t* cr, int width, int height, const core::Bounds& world,
                           double zoom, const core::Point2D& offset) {
    impl_->cr = cr;
    impl_->viewport_width = width;
    impl_->viewport_height = height;
    impl_->zoom = zoom;
    impl_->offset = offset;
    impl_->coords.emplace(world, config_.fill_ratio);
    impl_->scale = impl_->coords->calculate_scale(width, height, zoom);
}

void Renderer::end_frame() {
    impl_->cr = nullptr;
}

void Renderer::draw_edge(const core::Point2D& from, const core::Point2D& to, const RenderStyle& style) {
    if (!impl_->cr || !impl_->coords) return;

    cairo_set_line_width(impl_->cr, style.line_width);
    cairo_set_line_cap(impl_->cr, CAIRO_LINE_CAP_ROUND);
    cairo_set_source_rgba(impl_->cr, style.color.r, style.color.g, style.color.b, style.color.a);

    auto from_point = transform_point(from);
    auto to_point = transform_point(to);
    cairo_move_to(impl_->cr, from_point.x, from_point.y);
    cairo_line_to(impl_->cr, to_point.x, to_point.y);

    if (style.stroked) {
        cairo_stroke(impl_->cr);
    } else {
        cairo_new_path(impl_->cr);
    }
}

void Renderer::draw_node(const core::Point2D& position, const RenderStyle& style) {
    if (!impl_->cr || !impl_->coords) return;

    auto transformed = transform_point(position);

    cairo_set_source_rgba(impl_->cr, style.color.r, style.color.g, style.color.b, style.color.a);
    cairo_new_sub_path(impl_->cr);
    cairo_arc(impl_->cr, transformed.x, transformed.y, style.point_size, 0, 2 * M_PI);

    if (style.filled && style.stroked) {
        cairo_fill_preserve(impl_->cr);
        cairo_stroke(impl_->cr);
    } else if (style.filled) {
        cairo_fill(impl_->cr);
    } else if (style.stroked) {
        cairo_stroke(impl_->cr);
    } else {
        cairo_new_path(impl_->cr);
    }
}

void Renderer::draw_label(const core::Point2D& position, const std::string& text, const RenderStyle& style) {
    if (!impl_->cr || !impl_->coords || text.empty()) return;

    auto transformed = transform_point(position);

    cairo_set_source_rgba(impl_->cr, style.color.r, style.color.g, style.color.b, style.color.a);

    PangoLayout* layout = pango_cairo_create_layout(impl_->cr);
    PangoFontDescription* font_desc = pango_font_description_from_string(config_.label_font.c_str());
    pango_layout_set_font_description(layout, font_desc);
    pango_layout_set_text(layout, text.c_str(), -1);

    int text_width = 0;
    int text_height = 0;
    pango_layout_get_pixel_size(layout, &text_width, &text_height);

    // Up and to the right of the point, clear of the node marker
    cairo_save(impl_->cr);
    cairo_move_to(impl_->cr, transformed.x + 8.0, transformed.y - 8.0 - text_height);
    pango_cairo_show_layout(impl_->cr, layout);
    cairo_restore(impl_->cr);

    pango_font_description_free(font_desc);
    g_object_unref(layout);
}

void Renderer::draw_network(const core::WeightedGraph& graph) {
    for (const auto& id : graph.node_ids()) {
        const auto* from = graph.find_node(id);
        for (const auto& edge : graph.outgoing_edges(id)) {
            const auto* to = graph.find_node(edge.to);
            if (from && to) {
                draw_edge(from->position, to->position, styles::street_default);
            }
        }
    }

    for (const auto& id : graph.node_ids()) {
        draw_node(graph.find_node(id)->position, styles::node_default);
    }
}

void Renderer::draw_route(const core::WeightedGraph& graph, const std::vector<core::NodeKey>& route) {
    if (route.empty()) return;

    for (size_t i = 1; i < route.size(); ++i) {
        const auto* from = graph.find_node(route[i - 1]);
        const auto* to = graph.find_node(route[i]);
        if (from && to) {
            draw_edge(from->position, to->position, styles::street_route);
        }
    }

    if (const auto* start = graph.find_node(route.front())) {
        draw_node(start->position, styles::node_start);
    }
    if (const auto* goal = graph.find_node(route.back())) {
        draw_node(goal->position, styles::node_goal);
    }
}

void Renderer::render(cairo_t* cr, int width, int height, const core::WeightedGraph& graph,
                      const std::optional<std::vector<core::NodeKey>>& route,
                      double zoom, const core::Point2D& offset) {
    if (!cr) return;

    const auto& bg = config_.background;
    cairo_set_source_rgba(cr, bg.r, bg.g, bg.b, bg.a);
    cairo_paint(cr);

    if (graph.empty()) return;

    begin_frame(cr, width, height, graph.bounds(), zoom, offset);

    draw_network(graph);
    if (route) {
        draw_route(graph, *route);
    }

    if (config_.draw_labels) {
        for (const auto& id : graph.node_ids()) {
            const auto* node = graph.find_node(id);
            draw_label(node->position, node->name, styles::label_default);
        }
    }

    end_frame();
}

bool Renderer::write_png(const std::string& path, int width, int height, const core::WeightedGraph& graph,
                         const std::optional<std::vector<core::NodeKey>>& route) {
    if (width <= 0 || height <= 0) {
        log_message("Invalid image size " + std::to_string(width) + "x" + std::to_string(height), true);
        return false;
    }

    cairo_surface_t* surface = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width, height);
    if (cairo_surface_status(surface) != CAIRO_STATUS_SUCCESS) {
        log_message(std::string("Failed to create image surface: ") +
                    cairo_status_to_string(cairo_surface_status(surface)), true);
        cairo_surface_destroy(surface);
        return false;
    }

    cairo_t* cr = cairo_create(surface);
    render(cr, width, height, graph, route);
    cairo_destroy(cr);

    cairo_surface_flush(surface);
    cairo_status_t status = cairo_surface_write_to_png(surface, path.c_str());
    cairo_surface_destroy(surface);

    if (status != CAIRO_STATUS_SUCCESS) {
        log_message("Failed to write " + path + ": " + cairo_status_to_string(status), true);
        return false;
    }

    log_message("Wrote " + path);
    return true;
}

std::optional<core::NodeKey> Renderer::node_at(const core::WeightedGraph& graph, const core::Point2D& screen,
                                               double radius) const {
    if (!impl_->coords) return std::nullopt;

    std::optional<core::NodeKey> closest;
    double closest_distance = radius;

    for (const auto& id : graph.node_ids()) {
        auto position = transform_point(graph.find_node(id)->position);
        double distance = std::hypot(position.x - screen.x, position.y - screen.y);
        if (distance <= closest_distance) {
            closest_distance = distance;
            closest = id;
        }
    }

    return closest;
}

core::Point2D Renderer::transform_point(const core::Point2D& world) const {
    if (!impl_->coords) return core::Point2D{0, 0};

    return impl_->coords->world_to_screen(world, impl_->scale, impl_->offset,
                                          impl_->viewport_width, impl_->viewport_height);
}

void Renderer::log_message(const std::string& message, bool is_error) const {
    if (log_callback_) {
        log_callback_(message, is_error);
    } else if (is_error) {
        std::cerr << "[Renderer ERROR] " << message << std::endl;
    } else {
        std::cout << "[Renderer INFO] " << message << std::endl;
    }
}

} // namespace streetnav::rendering
