#include "pch/desktop_drop_pch.hpp"

#include "native/NativeDropHost.hpp"

#include "Exception.hpp"
#include "Logger.hpp"
#include "channel/ItemCodec.hpp"

namespace Drop::Native {

NativeDropHost::NativeDropHost(Ref<Channel::MethodChannel> native_endpoint,
                               IScopedAccess &scoped_access,
                               ServicePayloadQueue *service_queue)
    : endpoint(std::move(native_endpoint)), access(&scoped_access),
      services(service_queue), resolver(scoped_access),
      gate([this](DropItems &&batch) { forward(std::move(batch)); }) {
  endpoint->set_method_call_handler(
      [this](const Channel::MethodCall &call) {
        return handle_method_call(call);
      });
}

NativeDropHost::~NativeDropHost() {
  endpoint->clear_method_call_handler();
  if (services)
    services->clear_observer();
}

auto NativeDropHost::handle_did_finish_launching() -> void {
  if (services && !gate.is_host_launched())
    services->set_observer([this] { drain_services(); });
  drain_services();
  if (gate.is_ui_ready())
    release_open_items();
  gate.mark_host_launched();
}

auto NativeDropHost::ready_for_global_drops() -> void {
  drain_services();
  if (gate.is_host_launched())
    release_open_items();
  gate.mark_ui_ready();
}

auto NativeDropHost::poll_services() -> void { drain_services(); }

auto NativeDropHost::handle_open(const std::vector<FS::Path> &paths) -> bool {
  auto batch = resolver.resolve_paths(paths);
  info("Application opened with {} path(s)", batch.size());
  add_open_items(std::move(batch));
  return true;
}

auto NativeDropHost::handle_open_contents(const std::vector<std::string> &texts)
    -> void {
  DropItems batch;
  for (const auto &text : texts)
    batch.emplace_back(make_memory_item(text, "Dock Dropped Text.txt",
                                        "text/plain; charset=utf-8"));
  if (batch.empty())
    return;
  add_open_items(std::move(batch));
}

auto NativeDropHost::create_drag_session(DragSession::SurfaceInfo surface)
    -> Scope<DragSession> {
  return make_scope<DragSession>(*this, *endpoint, surface);
}

auto NativeDropHost::submit(DropItems &&batch) -> void {
  gate.submit(std::move(batch));
}

auto NativeDropHost::forward(DropItems &&batch) -> void {
  const auto result =
      endpoint->invoke_method(Channel::Method::PerformOperationNative,
                              Channel::encode_items(batch));
  if (!result)
    error("UI dropped a batch of {} item(s) after signalling ready",
          batch.size());
}

auto NativeDropHost::drain_services() -> void {
  if (!services)
    return;
  auto items = services->drain();
  if (items.empty())
    return;
  debug("Draining {} service payload(s)", items.size());
  add_open_items(std::move(items));
}

auto NativeDropHost::add_open_items(DropItems &&items) -> void {
  if (gate.is_open()) {
    submit(std::move(items));
    return;
  }

  // Until the gate opens, every open collects into one ambient batch.
  for (auto &item : items) {
    if (!open_paths.insert(item.get_path()).second) {
      trace("Skipping duplicate opened item {}", item.get_path());
      continue;
    }
    open_items.push_back(std::move(item));
  }
}

auto NativeDropHost::release_open_items() -> void {
  if (open_items.empty())
    return;
  debug("Releasing {} item(s) opened before launch", open_items.size());
  open_paths.clear();
  submit(std::exchange(open_items, {}));
}

auto NativeDropHost::handle_method_call(const Channel::MethodCall &call)
    -> Channel::MethodResult {
  using Channel::Method;

  const auto method = Channel::parse_method(call.method);
  if (!method)
    throw ProtocolException{call.method,
                            fmt::format("Unknown method '{}'", call.method)};

  const auto bookmark = [&call]() -> const Bytes & {
    if (const auto *bytes = std::get_if<Bytes>(&call.arguments))
      return *bytes;
    throw ProtocolException{call.method, "Expected bookmark bytes"};
  };

  switch (*method) {
  case Method::ReadyForGlobalDrops:
    ready_for_global_drops();
    return true;
  case Method::StartAccessingSecurityScopedResource:
    return access->start_access(bookmark());
  case Method::StopAccessingSecurityScopedResource:
    return access->stop_access(bookmark());
  default:
    break;
  }

  throw ProtocolException{
      call.method,
      fmt::format("'{}' is not implemented by the native side", call.method)};
}

} // namespace Drop::Native
