#include "pch/desktop_drop_pch.hpp"

#include "channel/MethodChannel.hpp"

#include "Logger.hpp"

namespace Drop::Channel {

auto MethodChannel::create_pair(const std::string &channel_name)
    -> std::pair<Ref<MethodChannel>, Ref<MethodChannel>> {
  auto native_end = make_ref<MethodChannel>(channel_name);
  auto ui_end = make_ref<MethodChannel>(channel_name);
  native_end->peer = ui_end;
  ui_end->peer = native_end;
  return {native_end, ui_end};
}

auto MethodChannel::set_method_call_handler(Handler &&method_handler)
    -> void {
  handler = std::move(method_handler);
}

auto MethodChannel::clear_method_call_handler() -> void { handler = nullptr; }

auto MethodChannel::invoke_method(MethodCall call) -> MethodResult {
  ++sent;
  auto other = peer.lock();
  if (!other) {
    debug("Channel '{}' has no peer, dropping '{}'", name, call.method);
    return std::nullopt;
  }
  return other->receive(call);
}

auto MethodChannel::receive(const MethodCall &call) -> MethodResult {
  if (!handler) {
    debug("Channel '{}' has no handler installed, dropping '{}'", name,
          call.method);
    return std::nullopt;
  }
  trace("Channel '{}' <- {}", name, call.method);
  return handler(call);
}

} // namespace Drop::Channel
