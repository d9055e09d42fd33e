#pragma once

#include "DropItem.hpp"
#include "Types.hpp"
#include "channel/MethodChannel.hpp"
#include "native/DragPayload.hpp"
#include "native/DragSession.hpp"
#include "native/PayloadResolver.hpp"
#include "native/ReadinessGate.hpp"
#include "native/ServicePayloadQueue.hpp"

#include <string>
#include <unordered_set>
#include <vector>

namespace Drop::Native {

/**
 * @brief Native end of the drop core. Owns the resolver and the readiness
 * gate, answers the UI's channel requests and turns application-level opens
 * (dock, command line, services) into ambient batches.
 *
 * Host thread only. The scoped access and service queue must outlive the
 * host.
 */
class NativeDropHost {
public:
  NativeDropHost(Ref<Channel::MethodChannel> native_endpoint,
                 IScopedAccess &scoped_access,
                 ServicePayloadQueue *service_queue = nullptr);
  ~NativeDropHost();

  NativeDropHost(const NativeDropHost &) = delete;
  NativeDropHost &operator=(const NativeDropHost &) = delete;

  auto handle_did_finish_launching() -> void;
  auto ready_for_global_drops() -> void;

  // Paths opened through the application, e.g. dropped on its icon. Opens
  // and service payloads arriving before the gate opens are merged into one
  // deduplicated batch; afterwards each call sends its own.
  auto handle_open(const std::vector<FS::Path> &paths) -> bool;
  // Text opened through the application icon.
  auto handle_open_contents(const std::vector<std::string> &texts) -> void;

  // Picks up service payloads accepted on other threads. Call once per frame.
  auto poll_services() -> void;

  [[nodiscard]] auto create_drag_session(DragSession::SurfaceInfo surface)
      -> Scope<DragSession>;

  // Sends a resolved batch through the readiness gate.
  auto submit(DropItems &&batch) -> void;

  /**
   * @throws ProtocolException for unknown methods, methods the native side
   * does not implement, or arguments of the wrong shape.
   */
  auto handle_method_call(const Channel::MethodCall &call)
      -> Channel::MethodResult;

  [[nodiscard]] auto get_resolver() const -> const PayloadResolver & {
    return resolver;
  }
  [[nodiscard]] auto get_gate() const -> const ReadinessGate & {
    return gate;
  }

private:
  auto forward(DropItems &&batch) -> void;
  auto drain_services() -> void;
  auto add_open_items(DropItems &&items) -> void;
  auto release_open_items() -> void;

  Ref<Channel::MethodChannel> endpoint;
  IScopedAccess *access{nullptr};
  ServicePayloadQueue *services{nullptr};
  PayloadResolver resolver;
  ReadinessGate gate;
  DropItems open_items{};
  std::unordered_set<std::string> open_paths{};
};

} // namespace Drop::Native
