#include "route_view.hpp"

#include <algorithm>
#include <cmath>
#include <gdk/gdkkeysyms.h>
#include <utility>

namespace {
constexpr double kZoomStep = 1.1;
constexpr double kMinZoom = 0.25;
constexpr double kMaxZoom = 64.0;
constexpr double kPanStep = 32.0;
constexpr double kPickRadius = 12.0;
}

RouteView::RouteView(const streetnav::core::WeightedGraph &graph, NodePickedCallback on_node_picked)
    : drawing_area_(gtk_drawing_area_new())
    , graph_(graph)
    , on_node_picked_(std::move(on_node_picked))
    , offset_x_(0.0)
    , offset_y_(0.0)
    , zoom_(1.0)
    , drag_start_x_(0.0)
    , drag_start_y_(0.0)
    , renderer_(std::make_unique<streetnav::rendering::Renderer>())
{
  gtk_widget_set_hexpand(drawing_area_, TRUE);
  gtk_widget_set_vexpand(drawing_area_, TRUE);
  gtk_widget_set_focusable(drawing_area_, TRUE);

  gtk_drawing_area_set_draw_func(GTK_DRAWING_AREA(drawing_area_), RouteView::draw_cb, this, nullptr);

  GtkGesture *drag = gtk_gesture_drag_new();
  gtk_widget_add_controller(drawing_area_, GTK_EVENT_CONTROLLER(drag));
  g_signal_connect(drag, "drag-begin", G_CALLBACK(RouteView::drag_begin_cb), this);
  g_signal_connect(drag, "drag-update", G_CALLBACK(RouteView::drag_update_cb), this);

  // any button; a press that turns into a drag never reaches "released"
  GtkGesture *click = gtk_gesture_click_new();
  gtk_gesture_single_set_button(GTK_GESTURE_SINGLE(click), 0);
  gtk_widget_add_controller(drawing_area_, GTK_EVENT_CONTROLLER(click));
  g_signal_connect(click, "released", G_CALLBACK(RouteView::click_released_cb), this);

  GtkEventController *scroll = gtk_event_controller_scroll_new(GTK_EVENT_CONTROLLER_SCROLL_BOTH_AXES);
  gtk_widget_add_controller(drawing_area_, scroll);
  g_signal_connect(scroll, "scroll", G_CALLBACK(RouteView::scroll_cb), this);

  GtkEventController *key = gtk_event_controller_key_new();
  gtk_widget_add_controller(drawing_area_, key);
  g_signal_connect(key, "key-pressed", G_CALLBACK(RouteView::key_press_cb), this);
}

GtkWidget *RouteView::widget() const
{
  return drawing_area_;
}

void RouteView::set_route(std::optional<std::vector<std::string>> route)
{
  route_ = std::move(route);
  gtk_widget_queue_draw(drawing_area_);
}

void RouteView::set_show_labels(bool show)
{
  streetnav::rendering::RouteRenderConfig config = renderer_->config();
  config.draw_labels = show;
  renderer_->set_config(config);
  gtk_widget_queue_draw(drawing_area_);
}

void RouteView::reset_view()
{
  offset_x_ = 0.0;
  offset_y_ = 0.0;
  zoom_ = 1.0;
  gtk_widget_queue_draw(drawing_area_);
}

void RouteView::draw(cairo_t *cr, int width, int height)
{
  cairo_save(cr);
  renderer_->render(cr, width, height, graph_, route_, zoom_,
                    streetnav::core::Point2D{offset_x_, offset_y_});
  cairo_restore(cr);
}

void RouteView::begin_drag(double, double)
{
  drag_start_x_ = offset_x_;
  drag_start_y_ = offset_y_;
}

void RouteView::update_drag(double x, double y)
{
  offset_x_ = drag_start_x_ + x;
  offset_y_ = drag_start_y_ + y;
  gtk_widget_queue_draw(drawing_area_);
}

bool RouteView::handle_scroll(double, double dy)
{
  if(std::abs(dy) < 1e-6) {
    return false;
  }

  // keep the view centre fixed while zooming
  const double old_zoom = zoom_;
  if(dy < 0) {
    zoom_ = std::min(zoom_ * kZoomStep, kMaxZoom);
  } else {
    zoom_ = std::max(zoom_ / kZoomStep, kMinZoom);
  }
  offset_x_ *= zoom_ / old_zoom;
  offset_y_ *= zoom_ / old_zoom;

  gtk_widget_queue_draw(drawing_area_);
  return true;
}

bool RouteView::handle_key_press(guint keyval, GdkModifierType state)
{
  bool handled = false;
  double step = kPanStep;
  if((state & GDK_SHIFT_MASK) != 0) {
    step *= 2.0;
  }

  switch(keyval) {
  case GDK_KEY_Up:
  case GDK_KEY_k:
    offset_y_ += step;
    handled = true;
    break;
  case GDK_KEY_Down:
  case GDK_KEY_j:
    offset_y_ -= step;
    handled = true;
    break;
  case GDK_KEY_Left:
  case GDK_KEY_h:
    offset_x_ += step;
    handled = true;
    break;
  case GDK_KEY_Right:
  case GDK_KEY_l:
    offset_x_ -= step;
    handled = true;
    break;
  case GDK_KEY_plus:
  case GDK_KEY_equal:
  case GDK_KEY_KP_Add:
    zoom_ = std::min(zoom_ * kZoomStep, kMaxZoom);
    handled = true;
    break;
  case GDK_KEY_minus:
  case GDK_KEY_KP_Subtract:
    zoom_ = std::max(zoom_ / kZoomStep, kMinZoom);
    handled = true;
    break;
  case GDK_KEY_0:
    offset_x_ = 0.0;
    offset_y_ = 0.0;
    zoom_ = 1.0;
    handled = true;
    break;
  default:
    break;
  }

  if(handled) {
    gtk_widget_queue_draw(drawing_area_);
  }
  return handled;
}

void RouteView::handle_click(guint button, double x, double y)
{
  gtk_widget_grab_focus(drawing_area_);

  if (!on_node_picked_ || (button != GDK_BUTTON_PRIMARY && button != GDK_BUTTON_SECONDARY)) {
    return;
  }

  auto picked = renderer_->node_at(graph_, streetnav::core::Point2D{x, y}, kPickRadius);
  if (picked) {
    on_node_picked_(*picked, button == GDK_BUTTON_SECONDARY);
  }
}

void RouteView::draw_cb(GtkDrawingArea *, cairo_t *cr, int width, int height, gpointer user_data)
{
  auto *self = static_cast<RouteView *>(user_data);
  self->draw(cr, width, height);
}

void RouteView::drag_begin_cb(GtkGestureDrag *, double start_x, double start_y, gpointer user_data)
{
  auto *self = static_cast<RouteView *>(user_data);
  self->begin_drag(start_x, start_y);
}

void RouteView::drag_update_cb(GtkGestureDrag *, double offset_x, double offset_y, gpointer user_data)
{
  auto *self = static_cast<RouteView *>(user_data);
  self->update_drag(offset_x, offset_y);
}

gboolean RouteView::scroll_cb(GtkEventControllerScroll *, double dx, double dy, gpointer user_data)
{
  auto *self = static_cast<RouteView *>(user_data);
  return self->handle_scroll(dx, dy) ? GDK_EVENT_STOP : GDK_EVENT_PROPAGATE;
}

gboolean RouteView::key_press_cb(GtkEventControllerKey *, guint keyval, guint, GdkModifierType state, gpointer user_data)
{
  auto *self = static_cast<RouteView *>(user_data);
  return self->handle_key_press(keyval, state) ? GDK_EVENT_STOP : GDK_EVENT_PROPAGATE;
}

void RouteView::click_released_cb(GtkGestureClick *gesture, int, double x, double y, gpointer user_data)
{
  auto *self = static_cast<RouteView *>(user_data);
  self->handle_click(gtk_gesture_single_get_current_button(GTK_GESTURE_SINGLE(gesture)), x, y);
}
