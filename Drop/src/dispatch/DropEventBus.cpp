#include "pch/desktop_drop_pch.hpp"

#include "dispatch/DropEventBus.hpp"

#include "Ensure.hpp"
#include "Logger.hpp"

#include <algorithm>

namespace Drop {

auto DropEventBus::publish(const DropEvent &event) -> void {
  trace("Publishing {} to {} listener(s)", event.to_string(),
        listeners.size());

  const auto snapshot = listeners;
  for (auto *listener : snapshot) {
    if (!contains(*listener))
      continue;
    deliver(*listener, event);
  }

  EventDispatcher dispatcher{event};
  dispatcher.dispatch<DropDoneEvent>([this](const DropDoneEvent &done) {
    if (!done.is_ambient())
      return;
    if (pending_ambient_drop)
      debug("Replacing pending ambient drop of {} item(s)",
            pending_ambient_drop->get_items().size());
    pending_ambient_drop.emplace(done.get_position(), done.share_items());
  });
}

auto DropEventBus::register_listener(IDropEventListener &listener) -> void {
  ensure(!contains(listener), "Drop listener registered twice");
  listeners.push_back(&listener);

  if (!pending_ambient_drop)
    return;

  auto pending = std::move(*pending_ambient_drop);
  pending_ambient_drop.reset();
  debug("Delivering pending ambient drop of {} item(s) to new listener",
        pending.get_items().size());
  deliver(listener, pending);
}

auto DropEventBus::unregister_listener(IDropEventListener &listener) -> void {
  auto found = std::ranges::find(listeners, &listener);
  ensure(found != listeners.end(), "Unregistering an unknown drop listener");
  listeners.erase(found);
}

auto DropEventBus::contains(const IDropEventListener &listener) const -> bool {
  return std::ranges::find(listeners, &listener) != listeners.end();
}

auto DropEventBus::deliver(IDropEventListener &listener,
                           const DropEvent &event) -> void {
  try {
    listener.on_drop_event(event);
  } catch (const std::exception &exc) {
    error("Drop listener failed on {}: {}", event.get_name(), exc.what());
  }
}

} // namespace Drop
