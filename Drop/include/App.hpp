#pragma once

#include "FrameScheduler.hpp"
#include "PlatformScopedAccess.hpp"
#include "Types.hpp"
#include "Window.hpp"
#include "channel/DropChannel.hpp"
#include "dispatch/DropEventBus.hpp"
#include "native/DragSession.hpp"
#include "native/NativeDropHost.hpp"
#include "native/ServicePayloadQueue.hpp"

#include <string>
#include <vector>

namespace Drop {

class App;
struct AppDeleter {
  auto operator()(App *app) const noexcept -> void;
};

struct ApplicationProperties {
  const bool headless{false};
  // Paths the application was opened with; delivered as an ambient drop.
  std::vector<std::string> launch_paths{};
  // Text handed over through the services menu before launch finished.
  std::vector<std::string> service_texts{};
  // Frames to run before returning, 0 runs until the window closes.
  u64 max_frames{0};
};

/**
 * @brief Wires both ends of the drop core together around one window: the
 * native host and drag session on one side, the channel, bus and frame
 * scheduler on the other. Subclasses create regions in on_create and lay
 * them out in on_update; post-frame callbacks run right after.
 */
class App {
public:
  auto run() -> void;
  virtual ~App();

protected:
  virtual auto on_update(floating ts) -> void = 0;
  virtual auto on_resize(u32 width, u32 height) -> void = 0;
  virtual auto on_create() -> void = 0;
  virtual auto on_destroy() -> void = 0;

  explicit App(const ApplicationProperties &);

  [[nodiscard]] auto get_window() const -> const Scope<Window> & {
    return window;
  }
  [[nodiscard]] auto get_event_bus() -> DropEventBus & { return event_bus; }
  [[nodiscard]] auto get_frame_scheduler() -> FrameScheduler & {
    return frame_scheduler;
  }
  [[nodiscard]] auto get_drop_channel() const
      -> const Scope<Channel::DropChannel> & {
    return drop_channel;
  }
  [[nodiscard]] auto get_drop_host() const
      -> const Scope<Native::NativeDropHost> & {
    return drop_host;
  }
  [[nodiscard]] auto get_service_queue() -> Native::ServicePayloadQueue & {
    return service_queue;
  }
  [[nodiscard]] auto get_frame_counter() const -> u64 { return frame_counter; }

private:
  ApplicationProperties properties;

  // Destroyed in reverse: the UI side goes before the native side.
  Platform::FileSystemScopedAccess scoped_access{};
  Native::ServicePayloadQueue service_queue{};
  Scope<Window> window;
  Scope<Native::NativeDropHost> drop_host;
  Scope<Native::DragSession> drag_session;
  DropEventBus event_bus{};
  FrameScheduler frame_scheduler{};
  Scope<Channel::DropChannel> drop_channel;

  u64 frame_counter{0};
};

auto extern make_application(const ApplicationProperties &)
    -> Scope<App, AppDeleter>;

} // namespace Drop
