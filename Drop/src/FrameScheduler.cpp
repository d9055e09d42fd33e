#include "pch/desktop_drop_pch.hpp"

#include "FrameScheduler.hpp"

#include "Logger.hpp"

namespace Drop {

auto FrameScheduler::add_post_frame_callback(Callback &&callback) -> void {
  callbacks.push_back(std::move(callback));
}

auto FrameScheduler::run_post_frame_callbacks() -> usize {
  ++frame_count;
  auto current = std::exchange(callbacks, {});
  for (auto &callback : current) {
    try {
      callback();
    } catch (const std::exception &exc) {
      error("Post frame callback failed in frame {}: {}", frame_count,
            exc.what());
    }
  }
  return current.size();
}

} // namespace Drop
