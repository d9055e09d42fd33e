#pragma once

#include "Config.hpp"
#include "Geometry.hpp"
#include "channel/MethodChannel.hpp"
#include "native/DragPayload.hpp"

namespace Drop::Native {

class NativeDropHost;

enum class DragOperation : u8 {
  None,
  Copy,
};

/**
 * @brief The in-window drop target of one native surface. Hover calls are
 * forwarded to the UI at once and never block; perform resolves the payload
 * (waiting for promised files) and hands the batch to the host's gate.
 */
class DragSession {
public:
  struct SurfaceInfo {
    floating height{0.0F};
    // Native origin at the bottom left.
    bool flip_y{Config::flip_native_y};
  };

  DragSession(NativeDropHost &drop_host, Channel::MethodChannel &channel,
              SurfaceInfo surface_info);

  auto dragging_entered(const Position &location) -> DragOperation;
  auto dragging_updated(const Position &location) -> DragOperation;
  auto dragging_exited() -> void;

  // Always ends the gesture with one batch; false when it is empty.
  auto perform_drag_operation(DragPayload &payload) -> bool;

  auto set_surface_height(floating height) -> void { surface.height = height; }
  [[nodiscard]] auto get_completed_count() const -> u64 { return completed; }
  [[nodiscard]] auto is_hovering() const -> bool { return hovering; }

private:
  [[nodiscard]] auto to_surface(const Position &location) const -> Position;

  NativeDropHost *host{nullptr};
  Channel::MethodChannel *endpoint{nullptr};
  SurfaceInfo surface;
  bool hovering{false};
  u64 completed{0};
};

} // namespace Drop::Native
