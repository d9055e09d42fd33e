#pragma once

#include "Event.hpp"
#include "Types.hpp"

#include <optional>
#include <vector>

namespace Drop {

class IDropEventListener {
public:
  virtual ~IDropEventListener() = default;
  virtual auto on_drop_event(const DropEvent &event) -> void = 0;
};

/**
 * @brief Fans decoded drop events out to every registered listener, in
 * registration order.
 *
 * An ambient Done (position at the origin) is additionally kept until the
 * next listener registers, so a drop delivered before any region exists is
 * not lost. Only the most recent ambient Done is kept.
 *
 * UI thread only. Listeners may (un)register from inside a callback: a
 * listener removed during a publish is skipped for the rest of it, one added
 * during a publish first sees the next event.
 */
class DropEventBus {
public:
  auto publish(const DropEvent &event) -> void;

  /**
   * Registers a listener. If an ambient Done is pending it is delivered to
   * this listener only, then cleared.
   *
   * @throws StateMisuseException when the listener is already registered.
   */
  auto register_listener(IDropEventListener &listener) -> void;

  // @throws StateMisuseException when the listener is not registered.
  auto unregister_listener(IDropEventListener &listener) -> void;

  [[nodiscard]] auto contains(const IDropEventListener &listener) const
      -> bool;
  [[nodiscard]] auto listener_count() const -> usize {
    return listeners.size();
  }
  [[nodiscard]] auto has_pending_ambient_drop() const -> bool {
    return pending_ambient_drop.has_value();
  }
  [[nodiscard]] auto get_pending_ambient_drop() const
      -> const std::optional<DropDoneEvent> & {
    return pending_ambient_drop;
  }

private:
  static auto deliver(IDropEventListener &listener, const DropEvent &event)
      -> void;

  std::vector<IDropEventListener *> listeners{};
  std::optional<DropDoneEvent> pending_ambient_drop{};
};

} // namespace Drop
