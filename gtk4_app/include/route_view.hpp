#pragma once

#include <gtk/gtk.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/weighted_graph.hpp"
#include "rendering/renderer.hpp"

// Pannable, zoomable drawing of a street network with the current route on top
class RouteView {
public:
  // Left click picks the start, right click the goal
  using NodePickedCallback = std::function<void(const std::string &node_id, bool is_goal)>;

  RouteView(const streetnav::core::WeightedGraph &graph, NodePickedCallback on_node_picked);
  RouteView(const RouteView &) = delete;
  RouteView &operator=(const RouteView &) = delete;
  RouteView(RouteView &&) = delete;
  RouteView &operator=(RouteView &&) = delete;
  ~RouteView() = default;

  GtkWidget *widget() const;

  void set_route(std::optional<std::vector<std::string>> route);
  void set_show_labels(bool show);
  void reset_view();

private:
  GtkWidget *drawing_area_;
  const streetnav::core::WeightedGraph &graph_;
  NodePickedCallback on_node_picked_;
  std::optional<std::vector<std::string>> route_;
  double offset_x_;
  double offset_y_;
  double zoom_;
  double drag_start_x_;
  double drag_start_y_;

  std::unique_ptr<streetnav::rendering::Renderer> renderer_;

  void draw(cairo_t *cr, int width, int height);
  void begin_drag(double x, double y);
  void update_drag(double x, double y);
  bool handle_scroll(double dx, double dy);
  bool handle_key_press(guint keyval, GdkModifierType state);
  void handle_click(guint button, double x, double y);

  static void draw_cb(GtkDrawingArea *area, cairo_t *cr, int width, int height, gpointer user_data);
  static void drag_begin_cb(GtkGestureDrag *gesture, double start_x, double start_y, gpointer user_data);
  static void drag_update_cb(GtkGestureDrag *gesture, double offset_x, double offset_y, gpointer user_data);
  static gboolean scroll_cb(GtkEventControllerScroll *controller, double dx, double dy, gpointer user_data);
  static gboolean key_press_cb(GtkEventControllerKey *controller, guint keyval, guint keycode, GdkModifierType state, gpointer user_data);
  static void click_released_cb(GtkGestureClick *gesture, int n_press, double x, double y, gpointer user_data);
};
