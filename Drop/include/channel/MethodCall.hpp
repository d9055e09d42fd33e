#pragma once

#include "Geometry.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Drop::Channel {

inline constexpr std::string_view channel_name = "desktop_drop";

enum class Method : u8 {
  // native -> UI
  Entered,
  Updated,
  Exited,
  PerformOperation,
  PerformOperationNative,
  PerformOperationLinux,
  // UI -> native
  ReadyForGlobalDrops,
  StartAccessingSecurityScopedResource,
  StopAccessingSecurityScopedResource,
};

[[nodiscard]] auto to_wire_name(Method method) -> std::string_view;
[[nodiscard]] auto parse_method(std::string_view name) -> std::optional<Method>;

/**
 * One item of a native Done message. Exactly one of path or data is set: a
 * path for files and directories, data for memory-backed text and links.
 */
struct WireItem {
  std::optional<std::string> path{};
  std::optional<Bytes> data{};
  std::optional<std::string> mime_type{};
  std::optional<std::string> name{};
  std::optional<Bytes> bookmark{};
  bool is_directory{false};
  bool from_promise{false};
};

struct LinuxDrop {
  std::string uri_list;
  Position position{origin};
};

using Arguments =
    std::variant<std::monostate, Position, std::vector<std::string>,
                 std::vector<WireItem>, LinuxDrop, Bytes>;

struct MethodCall {
  std::string method;
  Arguments arguments{};

  MethodCall(Method kind, Arguments args = {})
      : method(to_wire_name(kind)), arguments(std::move(args)) {}
  MethodCall(std::string name, Arguments args = {})
      : method(std::move(name)), arguments(std::move(args)) {}
};

// std::nullopt when the receiving side had no handler installed.
using MethodResult = std::optional<bool>;

} // namespace Drop::Channel
