#pragma once

#include "Types.hpp"

#include <functional>
#include <vector>

namespace Drop {

/**
 * @brief Post-layout callback queue owned by the UI thread. The layout
 * collaborator calls run_post_frame_callbacks() after every layout pass.
 * Callbacks are one-shot; a callback that needs another pass re-adds itself
 * and runs on the next pass, never in the current one.
 */
class FrameScheduler {
public:
  using Callback = std::function<void()>;

  auto add_post_frame_callback(Callback &&callback) -> void;

  // Runs the callbacks queued before this call, returns how many ran.
  auto run_post_frame_callbacks() -> usize;

  [[nodiscard]] auto pending() const -> usize { return callbacks.size(); }
  [[nodiscard]] auto get_frame_count() const -> u64 { return frame_count; }

private:
  std::vector<Callback> callbacks{};
  u64 frame_count{0};
};

} // namespace Drop
