#include "pch/desktop_drop_pch.hpp"

#include "native/DragSession.hpp"

#include "Logger.hpp"
#include "native/NativeDropHost.hpp"

namespace Drop::Native {

DragSession::DragSession(NativeDropHost &drop_host,
                         Channel::MethodChannel &channel,
                         SurfaceInfo surface_info)
    : host(&drop_host), endpoint(&channel), surface(surface_info) {}

auto DragSession::dragging_entered(const Position &location)
    -> DragOperation {
  hovering = true;
  endpoint->invoke_method(Channel::Method::Entered, to_surface(location));
  return DragOperation::Copy;
}

auto DragSession::dragging_updated(const Position &location)
    -> DragOperation {
  hovering = true;
  endpoint->invoke_method(Channel::Method::Updated, to_surface(location));
  return DragOperation::Copy;
}

auto DragSession::dragging_exited() -> void {
  hovering = false;
  endpoint->invoke_method(Channel::Method::Exited);
}

auto DragSession::perform_drag_operation(DragPayload &payload) -> bool {
  hovering = false;
  auto items = host->get_resolver().resolve(payload);
  const bool accepted = !items.empty();
  if (!accepted)
    info("Drop resolved to no items");

  // The UI closes the gesture on Done, so an empty batch is still sent.
  ++completed;
  host->submit(std::move(items));
  return accepted;
}

auto DragSession::to_surface(const Position &location) const -> Position {
  if (!surface.flip_y)
    return location;
  return Position{location.x, static_cast<float>(surface.height) - location.y};
}

} // namespace Drop::Native
