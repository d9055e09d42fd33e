#include "pch/desktop_drop_pch.hpp"

#include "App.hpp"

#include "Logger.hpp"
#include "PlatformConfig.hpp"

#include <exception>

namespace Drop {

auto AppDeleter::operator()(App *app) const noexcept -> void {
  delete app;
  info("Everything is cleaned up. Goodbye!");
}

App::App(const ApplicationProperties &props) : properties(props) {
  window = Window::construct({
      .headless = properties.headless,
  });

  auto [native_end, ui_end] =
      Channel::MethodChannel::create_pair(std::string{Channel::channel_name});

  drop_host = make_scope<Native::NativeDropHost>(native_end, scoped_access,
                                                 &service_queue);
  drag_session = drop_host->create_drag_session({
      .height = window->get_size().y,
  });
  window->attach_drag_session(*drag_session);
  window->set_resize_handler([this](u32 width, u32 height) {
    drag_session->set_surface_height(static_cast<floating>(height));
    on_resize(width, height);
  });

  drop_channel =
      make_scope<Channel::DropChannel>(ui_end, event_bus, frame_scheduler);

  info("DesktopDrop running on '{}'", Platform::get_system_name());
}

App::~App() {
  drop_channel.reset();
  if (window)
    window->set_resize_handler(nullptr);
  drag_session.reset();
  drop_host.reset();
  window.reset();
}

auto App::run() -> void {
  static constexpr auto now = [] {
    return std::chrono::high_resolution_clock::now();
  };

  try {
    on_create();

    if (!properties.launch_paths.empty()) {
      std::vector<FS::Path> paths{properties.launch_paths.begin(),
                                  properties.launch_paths.end()};
      drop_host->handle_open(paths);
    }
    for (const auto &text : properties.service_texts)
      service_queue.accept({.plain_text = text});
    drop_host->handle_did_finish_launching();
    drop_channel->init();

    auto last_time = now();
    const auto total_time = last_time;

    while (!window->should_close()) {
      if (properties.max_frames != 0 && frame_counter >= properties.max_frames)
        break;

      window->update();
      drop_host->poll_services();

      const auto current_time = now();
      const auto delta_time_seconds =
          std::chrono::duration<floating>(current_time - last_time).count();

      on_update(delta_time_seconds);
      frame_scheduler.run_post_frame_callbacks();

      last_time = current_time;
      frame_counter++;

      if (!window->is_headless())
        window->wait_for_events(1.0 / 60.0);
    }

    info("Total time: {} seconds over {} frame(s).",
         std::chrono::duration<floating>(now() - total_time).count(),
         frame_counter);

    on_destroy();
  } catch (const std::exception &exc) {
    error("Main loop exception: {}", exc.what());
    throw;
  }
}

} // namespace Drop
