#include <gtk/gtk.h>

#include <cstdlib>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include "core/weighted_graph.hpp"
#include "navigation/navigator.hpp"
#include "navigation/sample_networks.hpp"
#include "osm/osm_network_loader.hpp"
#include "route_view.hpp"

namespace {

struct ViewerLaunch {
  std::unique_ptr<streetnav::core::WeightedGraph> graph;
  std::string title = "Street Navigator";
  std::optional<streetnav::navigation::Algorithm> algorithm;
  bool metric = false;  // OSM extracts are in metres
};

struct AppState {
  GtkWidget *window = nullptr;
  GtkWidget *start_dropdown = nullptr;
  GtkWidget *goal_dropdown = nullptr;
  GtkWidget *astar_toggle = nullptr;
  GtkWidget *labels_toggle = nullptr;
  GtkWidget *summary_label = nullptr;
  GtkWidget *directions_label = nullptr;
  const ViewerLaunch *launch = nullptr;
  std::unique_ptr<streetnav::navigation::Navigator> navigator;
  std::unique_ptr<RouteView> route_view;
  std::vector<std::string> keys;
  std::vector<std::string> labels;
  std::unordered_map<std::string, guint> key_index;
};

std::optional<std::string> selected_key(AppState *state, GtkWidget *dropdown) {
  const guint index = gtk_drop_down_get_selected(GTK_DROP_DOWN(dropdown));
  if (index == GTK_INVALID_LIST_POSITION || index >= state->keys.size()) {
    return std::nullopt;
  }
  return state->keys[index];
}

void update_route(AppState *state) {
  if (!state || !state->navigator || !state->route_view) {
    return;
  }

  auto start = selected_key(state, state->start_dropdown);
  auto goal = selected_key(state, state->goal_dropdown);
  if (!start || !goal) {
    state->route_view->set_route(std::nullopt);
    gtk_label_set_text(GTK_LABEL(state->summary_label), "Pick a start and a goal");
    gtk_label_set_text(GTK_LABEL(state->directions_label), "");
    return;
  }

  const auto algorithm = gtk_toggle_button_get_active(GTK_TOGGLE_BUTTON(state->astar_toggle))
                             ? streetnav::navigation::Algorithm::kAStar
                             : streetnav::navigation::Algorithm::kDijkstra;
  const auto result = state->navigator->find_path(*start, *goal, algorithm);
  state->route_view->set_route(result.path);

  std::ostringstream summary;
  summary << streetnav::navigation::algorithm_name(algorithm) << ": ";
  if (result.found()) {
    summary << result.path->size() << " stops, cost " << std::fixed
            << std::setprecision(state->launch->metric ? 0 : 1) << result.cost
            << (state->launch->metric ? " m" : " units");
  } else {
    summary << "no route";
  }
  summary << "  (settled " << result.stats.nodes_settled << ", pushed " << result.stats.queue_pushes << ")";
  gtk_label_set_text(GTK_LABEL(state->summary_label), summary.str().c_str());

  std::ostringstream directions;
  const auto lines = state->navigator->turn_by_turn(result.path);
  for (std::size_t i = 0; i < lines.size(); ++i) {
    directions << (i + 1) << ". " << lines[i] << "\n";
  }
  gtk_label_set_text(GTK_LABEL(state->directions_label), directions.str().c_str());
}

void on_selection_changed(GObject *, GParamSpec *, gpointer user_data) {
  update_route(static_cast<AppState *>(user_data));
}

void on_algorithm_toggled(GtkToggleButton *toggle_button, gpointer user_data) {
  gtk_button_set_label(GTK_BUTTON(toggle_button),
                       gtk_toggle_button_get_active(toggle_button) ? "A*" : "Dijkstra");
  update_route(static_cast<AppState *>(user_data));
}

void on_labels_toggled(GtkToggleButton *toggle_button, gpointer user_data) {
  auto *state = static_cast<AppState *>(user_data);
  if (state->route_view) {
    state->route_view->set_show_labels(gtk_toggle_button_get_active(toggle_button));
  }
}

void on_reset_view(GtkButton *, gpointer user_data) {
  auto *state = static_cast<AppState *>(user_data);
  if (state->route_view) {
    state->route_view->reset_view();
  }
}

void on_window_destroy(GtkWidget *, gpointer user_data) {
  auto *state = static_cast<AppState *>(user_data);
  delete state;
}

GtkWidget *make_location_dropdown(AppState *state) {
  std::vector<const char *> strings;
  strings.reserve(state->labels.size() + 1);
  for (const auto &label : state->labels) {
    strings.push_back(label.c_str());
  }
  strings.push_back(nullptr);

  GtkWidget *dropdown = gtk_drop_down_new_from_strings(strings.data());
  g_signal_connect(dropdown, "notify::selected", G_CALLBACK(on_selection_changed), state);
  return dropdown;
}

void on_activate(GtkApplication *app, gpointer user_data) {
  const auto *launch = static_cast<const ViewerLaunch *>(user_data);
  const auto &graph = *launch->graph;

  auto *state = new AppState();
  state->launch = launch;

  streetnav::navigation::NavigatorConfig config;
  if (launch->metric) {
    config.directions.unit = "m";
    config.directions.precision = 0;
  }
  state->navigator = std::make_unique<streetnav::navigation::Navigator>(graph, config);

  for (const auto &id : graph.node_ids()) {
    const std::string name = graph.display_name(id);
    state->key_index.emplace(id, static_cast<guint>(state->keys.size()));
    state->keys.push_back(id);
    state->labels.push_back(name == id ? name : name + " (" + id + ")");
  }

  state->window = gtk_application_window_new(app);
  gtk_window_set_title(GTK_WINDOW(state->window), launch->title.c_str());
  gtk_window_set_default_size(GTK_WINDOW(state->window), 1200, 800);

  GtkWidget *page = gtk_box_new(GTK_ORIENTATION_VERTICAL, 0);

  GtkWidget *toolbar = gtk_box_new(GTK_ORIENTATION_HORIZONTAL, 6);
  gtk_widget_set_margin_top(toolbar, 6);
  gtk_widget_set_margin_bottom(toolbar, 6);
  gtk_widget_set_margin_start(toolbar, 12);
  gtk_widget_set_margin_end(toolbar, 12);

  gtk_box_append(GTK_BOX(toolbar), gtk_label_new("From"));
  state->start_dropdown = make_location_dropdown(state);
  gtk_box_append(GTK_BOX(toolbar), state->start_dropdown);

  gtk_box_append(GTK_BOX(toolbar), gtk_label_new("To"));
  state->goal_dropdown = make_location_dropdown(state);
  gtk_box_append(GTK_BOX(toolbar), state->goal_dropdown);

  const bool use_astar = launch->algorithm == streetnav::navigation::Algorithm::kAStar;
  state->astar_toggle = gtk_toggle_button_new_with_label(use_astar ? "A*" : "Dijkstra");
  gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(state->astar_toggle), use_astar);
  g_signal_connect(state->astar_toggle, "toggled", G_CALLBACK(on_algorithm_toggled), state);
  gtk_box_append(GTK_BOX(toolbar), state->astar_toggle);

  state->labels_toggle = gtk_toggle_button_new_with_label("Labels");
  gtk_toggle_button_set_active(GTK_TOGGLE_BUTTON(state->labels_toggle), graph.node_count() <= 50);
  g_signal_connect(state->labels_toggle, "toggled", G_CALLBACK(on_labels_toggled), state);
  gtk_box_append(GTK_BOX(toolbar), state->labels_toggle);

  GtkWidget *reset_button = gtk_button_new_with_label("Reset View");
  g_signal_connect(reset_button, "clicked", G_CALLBACK(on_reset_view), state);
  gtk_box_append(GTK_BOX(toolbar), reset_button);

  state->summary_label = gtk_label_new("");
  gtk_widget_set_hexpand(state->summary_label, TRUE);
  gtk_label_set_xalign(GTK_LABEL(state->summary_label), 1.0f);
  gtk_box_append(GTK_BOX(toolbar), state->summary_label);

  gtk_box_append(GTK_BOX(page), toolbar);

  GtkWidget *body = gtk_paned_new(GTK_ORIENTATION_HORIZONTAL);
  gtk_widget_set_vexpand(body, TRUE);

  state->route_view = std::make_unique<RouteView>(graph, [state](const std::string &node_id, bool is_goal) {
    auto iter = state->key_index.find(node_id);
    if (iter != state->key_index.end()) {
      gtk_drop_down_set_selected(GTK_DROP_DOWN(is_goal ? state->goal_dropdown : state->start_dropdown),
                                 iter->second);
    }
  });
  state->route_view->set_show_labels(graph.node_count() <= 50);
  gtk_paned_set_start_child(GTK_PANED(body), state->route_view->widget());
  gtk_paned_set_resize_start_child(GTK_PANED(body), TRUE);

  state->directions_label = gtk_label_new("");
  gtk_label_set_xalign(GTK_LABEL(state->directions_label), 0.0f);
  gtk_label_set_yalign(GTK_LABEL(state->directions_label), 0.0f);
  gtk_label_set_wrap(GTK_LABEL(state->directions_label), TRUE);
  gtk_label_set_selectable(GTK_LABEL(state->directions_label), TRUE);
  gtk_widget_set_margin_start(state->directions_label, 12);
  gtk_widget_set_margin_end(state->directions_label, 12);
  gtk_widget_set_margin_top(state->directions_label, 12);

  GtkWidget *directions_scroller = gtk_scrolled_window_new();
  gtk_widget_set_size_request(directions_scroller, 320, -1);
  gtk_scrolled_window_set_child(GTK_SCROLLED_WINDOW(directions_scroller), state->directions_label);
  gtk_paned_set_end_child(GTK_PANED(body), directions_scroller);
  gtk_paned_set_resize_end_child(GTK_PANED(body), FALSE);
  gtk_paned_set_shrink_end_child(GTK_PANED(body), FALSE);

  gtk_box_append(GTK_BOX(page), body);
  gtk_window_set_child(GTK_WINDOW(state->window), page);

  g_signal_connect(state->window, "destroy", G_CALLBACK(on_window_destroy), state);

  // first and last location to start with; each selection recomputes the route
  if (!state->keys.empty()) {
    gtk_drop_down_set_selected(GTK_DROP_DOWN(state->start_dropdown), 0);
    gtk_drop_down_set_selected(GTK_DROP_DOWN(state->goal_dropdown),
                               static_cast<guint>(state->keys.size() - 1));
  }
  update_route(state);

  gtk_window_present(GTK_WINDOW(state->window));
}

void print_usage() {
  std::cout << "Usage: route_viewer [options]\n"
               "\n"
               "Options:\n"
               "  -o, --osm <path>          Load the street network from an OSM extract\n"
               "                            (default: the demonstration town)\n"
               "  -h, --help                Show this help text\n"
               "\n"
               "Left click a location to route from it, right click to route to it.\n";
}

} // namespace

int main(int argc, char *argv[])
{
  ViewerLaunch launch;
  std::filesystem::path osm_path;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    if (arg == "-o" || arg == "--osm") {
      if (i + 1 >= argc) {
        std::cerr << "[route_viewer] Missing value for --osm" << std::endl;
        return 1;
      }
      osm_path = argv[++i];
    } else {
      std::cerr << "[route_viewer] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  if (const char *env_algorithm = std::getenv("STREETNAV_ALGORITHM")) {
    launch.algorithm = streetnav::navigation::parse_algorithm(env_algorithm);
  }

  if (osm_path.empty()) {
    launch.graph = std::make_unique<streetnav::core::WeightedGraph>(streetnav::navigation::samples::build_town());
  } else {
    auto loaded = streetnav::osm::load_osm_network(osm_path);
    if (!loaded) {
      return 1;
    }
    launch.graph = std::make_unique<streetnav::core::WeightedGraph>(std::move(*loaded));
    launch.title = "Street Navigator - " + osm_path.filename().string();
    launch.metric = true;
  }

  GtkApplication *app = gtk_application_new("org.streetnav.viewer", G_APPLICATION_DEFAULT_FLAGS);
  g_signal_connect(app, "activate", G_CALLBACK(on_activate), &launch);

  // our own options are already consumed
  int status = g_application_run(G_APPLICATION(app), 1, argv);
  g_object_unref(app);
  return status;
}
