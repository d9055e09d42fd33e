#include "pch/desktop_drop_pch.hpp"

#include "native/ReadinessGate.hpp"

#include "Logger.hpp"

namespace Drop::Native {

auto ReadinessGate::submit(DropItems &&batch) -> void {
  queue.push_back(std::move(batch));
  if (!is_open()) {
    debug("Deferring drop batch (launched={}, ui ready={}), {} queued",
          host_launched, ui_ready, queue.size());
    return;
  }
  flush();
}

auto ReadinessGate::mark_host_launched() -> void {
  if (host_launched)
    return;
  host_launched = true;
  info("Host finished launching");
  flush();
}

auto ReadinessGate::mark_ui_ready() -> void {
  if (ui_ready)
    return;
  ui_ready = true;
  info("UI runtime ready for drops");
  flush();
}

auto ReadinessGate::flush() -> void {
  if (!is_open())
    return;

  // Pop before forwarding: a throwing sink leaves later batches queued.
  while (!queue.empty()) {
    auto batch = std::move(queue.front());
    queue.pop_front();
    trace("Forwarding drop batch of {} item(s)", batch.size());
    sink(std::move(batch));
  }
}

} // namespace Drop::Native
