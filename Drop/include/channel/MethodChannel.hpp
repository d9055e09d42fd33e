#pragma once

#include "Types.hpp"
#include "channel/MethodCall.hpp"

#include <functional>
#include <string>
#include <utility>

namespace Drop::Channel {

/**
 * @brief One end of a named, in-process message channel between the native
 * host and the UI runtime. invoke_method() runs the peer's handler
 * synchronously and returns its result. Without a peer handler the message is
 * dropped and std::nullopt is returned; exceptions thrown by the handler reach
 * the caller.
 */
class MethodChannel {
public:
  using Handler = std::function<MethodResult(const MethodCall &)>;

  explicit MethodChannel(std::string channel_name)
      : name(std::move(channel_name)) {}

  // Two connected ends: {native side, UI side}.
  static auto create_pair(const std::string &channel_name)
      -> std::pair<Ref<MethodChannel>, Ref<MethodChannel>>;

  auto set_method_call_handler(Handler &&method_handler) -> void;
  auto clear_method_call_handler() -> void;
  [[nodiscard]] auto has_handler() const -> bool {
    return static_cast<bool>(handler);
  }

  auto invoke_method(MethodCall call) -> MethodResult;
  auto invoke_method(Method method, Arguments arguments = {}) -> MethodResult {
    return invoke_method(MethodCall{method, std::move(arguments)});
  }

  [[nodiscard]] auto get_name() const -> const std::string & { return name; }
  [[nodiscard]] auto get_sent_count() const -> u64 { return sent; }

private:
  auto receive(const MethodCall &call) -> MethodResult;

  std::string name;
  Handler handler{};
  Weak<MethodChannel> peer{};
  u64 sent{0};
};

} // namespace Drop::Channel
