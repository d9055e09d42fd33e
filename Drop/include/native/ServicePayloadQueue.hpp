#pragma once

#include "DropItem.hpp"

#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace Drop::Native {

// Text handed to the application by the OS services menu or a dock drop.
struct ServicePayload {
  std::optional<std::string> plain_text{};
  std::optional<std::string> html{};
  std::optional<Bytes> rtf{};
  std::optional<std::string> url{};
};

/**
 * @brief Collects service payloads that may arrive before any host exists.
 * Each accepted payload becomes one memory-backed item; the first present
 * representation wins (plain text, HTML, RTF, URL).
 *
 * The observer runs only for payloads accepted on the thread that installed
 * it. Payloads accepted anywhere else stay queued until that thread drains.
 */
class ServicePayloadQueue {
public:
  using Observer = std::function<void()>;

  // False when the payload carries nothing usable.
  auto accept(const ServicePayload &payload) -> bool;

  [[nodiscard]] auto drain() -> DropItems;
  [[nodiscard]] auto pending() const -> usize;

  auto set_observer(Observer &&new_observer) -> void;
  auto clear_observer() -> void;

private:
  mutable std::mutex mutex;
  DropItems items{};
  Observer observer{};
  std::thread::id observer_thread{};
};

} // namespace Drop::Native
