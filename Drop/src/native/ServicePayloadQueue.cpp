#include "pch/desktop_drop_pch.hpp"

#include "native/ServicePayloadQueue.hpp"

#include "Logger.hpp"

namespace Drop::Native {

namespace {

auto to_item(const ServicePayload &payload) -> std::optional<MemoryItem> {
  if (payload.plain_text)
    return make_memory_item(*payload.plain_text, "Dock Dropped Text.txt",
                            "text/plain; charset=utf-8");
  if (payload.html)
    return make_memory_item(*payload.html, "Dock Dropped Text.html",
                            "text/html; charset=utf-8");
  if (payload.rtf)
    return make_memory_item(*payload.rtf, "Dock Dropped Text.rtf",
                            "application/rtf");
  if (payload.url)
    return make_memory_item(*payload.url, "Dock Dropped URL.txt",
                            "text/uri-list");
  return std::nullopt;
}

} // namespace

auto ServicePayloadQueue::accept(const ServicePayload &payload) -> bool {
  auto item = to_item(payload);
  if (!item) {
    debug("Ignoring empty service payload");
    return false;
  }

  Observer notify;
  {
    std::scoped_lock lock{mutex};
    debug("Queued service payload '{}'", item->name);
    items.emplace_back(std::move(*item));
    if (std::this_thread::get_id() == observer_thread)
      notify = observer;
  }
  // Other threads leave the item for the observer thread's next poll.
  if (notify)
    notify();
  return true;
}

auto ServicePayloadQueue::drain() -> DropItems {
  std::scoped_lock lock{mutex};
  DropItems drained;
  drained.swap(items);
  return drained;
}

auto ServicePayloadQueue::pending() const -> usize {
  std::scoped_lock lock{mutex};
  return items.size();
}

auto ServicePayloadQueue::set_observer(Observer &&new_observer) -> void {
  std::scoped_lock lock{mutex};
  observer = std::move(new_observer);
  observer_thread = std::this_thread::get_id();
}

auto ServicePayloadQueue::clear_observer() -> void {
  std::scoped_lock lock{mutex};
  observer = nullptr;
  observer_thread = {};
}

} // namespace Drop::Native
