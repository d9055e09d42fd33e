#include "pch/desktop_drop_pch.hpp"

#include "DemoApp.hpp"

#include "Formatters.hpp"
#include "Logger.hpp"

DemoApp::DemoApp(const ApplicationProperties &props) : App(props) {}

void DemoApp::on_create() {
  left.region = make_scope<DropRegion>(
      get_event_bus(), get_frame_scheduler(), left.geometry,
      make_callbacks(left), RegionOptions{.catch_app_wide_drops = true});
  right.region =
      make_scope<DropRegion>(get_event_bus(), get_frame_scheduler(),
                             right.geometry, make_callbacks(right));
}

void DemoApp::on_update(floating) {
  if (needs_layout)
    layout();
}

void DemoApp::on_resize(u32, u32) { needs_layout = true; }

void DemoApp::on_destroy() {
  info("Panels received {} and {} drop(s)", left.drops, right.drops);
  left.region.reset();
  right.region.reset();
}

auto DemoApp::layout() -> void {
  needs_layout = false;
  const auto size = get_window()->get_size();
  const auto ratio = get_window()->get_hover_pixel_ratio();
  const Position half{size.x * 0.5F, size.y};

  left.geometry.set_layout(Position{0.0F}, half);
  right.geometry.set_layout(Position{half.x, 0.0F}, half);
  left.geometry.set_device_pixel_ratio(ratio);
  right.geometry.set_device_pixel_ratio(ratio);
  debug("Laid out panels at {} and {}", half, Position{half.x, 0.0F});
}

auto DemoApp::make_callbacks(Panel &panel) -> RegionCallbacks {
  return RegionCallbacks{
      .on_entered =
          [&panel](const DropEventDetails &details) {
            info("[{}] entered at {}", panel.name, details.local);
          },
      .on_updated =
          [&panel](const DropEventDetails &details) {
            trace("[{}] hovering at {}", panel.name, details.local);
          },
      .on_exited =
          [&panel](const DropEventDetails &) {
            info("[{}] exited", panel.name);
          },
      .on_done =
          [&panel](const DropDoneDetails &details) {
            ++panel.drops;
            info("[{}] received {} item(s) at {}", panel.name,
                 details.get_items().size(), details.local);
            for (const auto &item : details.get_items()) {
              info("  {}", item);
              if (const auto text = read_as_text(item))
                info("    \"{}\"", *text);
            }
          },
  };
}
