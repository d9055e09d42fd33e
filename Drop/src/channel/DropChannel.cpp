#include "pch/desktop_drop_pch.hpp"

#include "channel/DropChannel.hpp"

#include "Exception.hpp"
#include "Logger.hpp"
#include "channel/ItemCodec.hpp"
#include "channel/UriList.hpp"

namespace Drop::Channel {

namespace {

template <class T>
auto expect_arguments(const MethodCall &call) -> const T & {
  if (const auto *value = std::get_if<T>(&call.arguments))
    return *value;
  throw ProtocolException{call.method, fmt::format("Unexpected arguments for "
                                                   "'{}'",
                                                   call.method)};
}

} // namespace

DropChannel::DropChannel(Ref<MethodChannel> ui_endpoint,
                         DropEventBus &event_bus,
                         FrameScheduler &frame_scheduler)
    : DropChannel(std::move(ui_endpoint), event_bus, frame_scheduler,
                  Options{}) {}

DropChannel::DropChannel(Ref<MethodChannel> ui_endpoint,
                         DropEventBus &event_bus,
                         FrameScheduler &frame_scheduler,
                         Options channel_options)
    : endpoint(std::move(ui_endpoint)), bus(&event_bus),
      scheduler(&frame_scheduler), options(channel_options) {}

DropChannel::~DropChannel() {
  *alive = false;
  if (initialized)
    endpoint->clear_method_call_handler();
}

auto DropChannel::init() -> void {
  if (initialized)
    return;
  initialized = true;

  endpoint->set_method_call_handler(
      [this](const MethodCall &call) { return handle_method_call(call); });
  send_ready();

  scheduler->add_post_frame_callback([this, token = Weak<bool>{alive}] {
    if (auto still_alive = token.lock(); still_alive && *still_alive)
      send_ready();
  });
}

auto DropChannel::send_ready() -> void {
  const auto result = endpoint->invoke_method(Method::ReadyForGlobalDrops);
  if (!result)
    debug("Native side not listening for '{}' yet",
          to_wire_name(Method::ReadyForGlobalDrops));
}

auto DropChannel::handle_method_call(const MethodCall &call) -> MethodResult {
  const auto method = parse_method(call.method);
  if (!method)
    throw ProtocolException{call.method,
                            fmt::format("Unknown method '{}'", call.method)};

  switch (*method) {
  case Method::Entered: {
    const auto &position = expect_arguments<Position>(call);
    last_position = position;
    bus->publish(DropEnterEvent{position});
    return true;
  }
  case Method::Updated: {
    const auto &position = expect_arguments<Position>(call);
    const bool opens_gesture =
        options.hover_without_enter && !last_position.has_value();
    last_position = position;
    if (opens_gesture)
      bus->publish(DropEnterEvent{position});
    else
      bus->publish(DropUpdateEvent{position});
    return true;
  }
  case Method::Exited: {
    const auto position = last_position.value_or(origin);
    last_position.reset();
    bus->publish(DropExitEvent{position});
    return true;
  }
  case Method::PerformOperation: {
    const auto &paths = expect_arguments<std::vector<std::string>>(call);
    DropItems items;
    items.reserve(paths.size());
    for (const auto &path : paths)
      items.emplace_back(FileItem{.path = FS::Path{path}});
    publish_done(last_position.value_or(origin), std::move(items));
    return true;
  }
  case Method::PerformOperationNative: {
    const auto &wire = expect_arguments<std::vector<WireItem>>(call);
    publish_done(last_position.value_or(origin), decode_items(wire));
    return true;
  }
  case Method::PerformOperationLinux: {
    const auto &drop = expect_arguments<LinuxDrop>(call);
    DropItems items;
    for (auto &path : parse_file_uri_list(drop.uri_list))
      items.emplace_back(FileItem{.path = std::move(path)});
    publish_done(drop.position, std::move(items));
    return true;
  }
  case Method::ReadyForGlobalDrops:
  case Method::StartAccessingSecurityScopedResource:
  case Method::StopAccessingSecurityScopedResource:
    break;
  }

  throw ProtocolException{
      call.method,
      fmt::format("'{}' is handled by the native side", call.method)};
}

auto DropChannel::publish_done(const Position &position, DropItems &&items)
    -> void {
  last_position.reset();
  bus->publish(DropDoneEvent{position, std::move(items)});
}

auto DropChannel::begin_scoped_access(const Bytes &bookmark) -> bool {
  if (bookmark.empty())
    return false;
  return endpoint
      ->invoke_method(Method::StartAccessingSecurityScopedResource, bookmark)
      .value_or(false);
}

auto DropChannel::end_scoped_access(const Bytes &bookmark) -> bool {
  if (bookmark.empty())
    return true;
  return endpoint
      ->invoke_method(Method::StopAccessingSecurityScopedResource, bookmark)
      .value_or(false);
}

} // namespace Drop::Channel
