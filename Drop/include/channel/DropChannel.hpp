#pragma once

#include "Config.hpp"
#include "FrameScheduler.hpp"
#include "Geometry.hpp"
#include "Types.hpp"
#include "channel/MethodChannel.hpp"
#include "dispatch/DropEventBus.hpp"

#include <optional>

namespace Drop::Channel {

/**
 * @brief UI end of the drop channel. Decodes native messages into drop events
 * and publishes them on the bus, tracking the last hover position so Exit and
 * Done can be placed.
 */
class DropChannel {
public:
  struct Options {
    // The native side reports hovering with 'updated' only (GTK).
    bool hover_without_enter{Config::hover_without_enter};
  };

  DropChannel(Ref<MethodChannel> ui_endpoint, DropEventBus &event_bus,
              FrameScheduler &frame_scheduler);
  DropChannel(Ref<MethodChannel> ui_endpoint, DropEventBus &event_bus,
              FrameScheduler &frame_scheduler, Options channel_options);
  ~DropChannel();

  DropChannel(const DropChannel &) = delete;
  DropChannel &operator=(const DropChannel &) = delete;

  /**
   * Installs the message handler and tells the native side the UI can take
   * drops. The signal is repeated once after the next frame in case the
   * native side was not listening yet. Repeated calls do nothing.
   */
  auto init() -> void;

  /**
   * @throws ProtocolException for unknown methods, UI-bound methods sent to
   * the UI, or arguments of the wrong shape.
   */
  auto handle_method_call(const MethodCall &call) -> MethodResult;

  // Empty bookmark: false, without contacting the native side.
  auto begin_scoped_access(const Bytes &bookmark) -> bool;
  // Empty bookmark: true, without contacting the native side.
  auto end_scoped_access(const Bytes &bookmark) -> bool;

  [[nodiscard]] auto get_last_position() const
      -> const std::optional<Position> & {
    return last_position;
  }
  [[nodiscard]] auto is_initialized() const -> bool { return initialized; }

private:
  auto send_ready() -> void;
  auto publish_done(const Position &position, DropItems &&items) -> void;

  Ref<MethodChannel> endpoint;
  DropEventBus *bus{nullptr};
  FrameScheduler *scheduler{nullptr};
  Options options;
  std::optional<Position> last_position{};
  bool initialized{false};
  Ref<bool> alive{make_ref<bool>(true)};
};

} // namespace Drop::Channel
