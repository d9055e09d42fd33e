#pragma once

#include "DropItem.hpp"
#include "Types.hpp"

#include <deque>
#include <functional>

namespace Drop::Native {

/**
 * @brief Holds resolved batches until the host has finished launching and the
 * UI runtime has installed its channel handler. Both signals are idempotent.
 * Batches are forwarded in submission order, one sink call per batch.
 *
 * Host thread only.
 */
class ReadinessGate {
public:
  using Sink = std::function<void(DropItems &&)>;

  explicit ReadinessGate(Sink &&batch_sink) : sink(std::move(batch_sink)) {}

  auto submit(DropItems &&batch) -> void;
  auto mark_host_launched() -> void;
  auto mark_ui_ready() -> void;

  [[nodiscard]] auto is_host_launched() const -> bool { return host_launched; }
  [[nodiscard]] auto is_ui_ready() const -> bool { return ui_ready; }
  [[nodiscard]] auto is_open() const -> bool {
    return host_launched && ui_ready;
  }
  [[nodiscard]] auto queued() const -> usize { return queue.size(); }

private:
  auto flush() -> void;

  Sink sink;
  bool host_launched{false};
  bool ui_ready{false};
  std::deque<DropItems> queue{};
};

} // namespace Drop::Native
