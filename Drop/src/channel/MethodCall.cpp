#include "pch/desktop_drop_pch.hpp"

#include "channel/MethodCall.hpp"

#include "Exception.hpp"

#include <array>
#include <magic_enum.hpp>
#include <utility>

namespace Drop::Channel {

namespace {

constexpr std::array wire_names{
    std::pair{Method::Entered, std::string_view{"entered"}},
    std::pair{Method::Updated, std::string_view{"updated"}},
    std::pair{Method::Exited, std::string_view{"exited"}},
    std::pair{Method::PerformOperation, std::string_view{"performOperation"}},
    std::pair{Method::PerformOperationNative,
              std::string_view{"performOperation_native"}},
    std::pair{Method::PerformOperationLinux,
              std::string_view{"performOperation_linux"}},
    std::pair{Method::ReadyForGlobalDrops,
              std::string_view{"readyForGlobalDrops"}},
    std::pair{Method::StartAccessingSecurityScopedResource,
              std::string_view{"startAccessingSecurityScopedResource"}},
    std::pair{Method::StopAccessingSecurityScopedResource,
              std::string_view{"stopAccessingSecurityScopedResource"}},
};

static_assert(wire_names.size() == magic_enum::enum_count<Method>());

} // namespace

auto to_wire_name(Method method) -> std::string_view {
  for (const auto &[kind, name] : wire_names) {
    if (kind == method)
      return name;
  }
  throw BaseException{fmt::format("No wire name for method {}",
                                  magic_enum::enum_name(method))};
}

auto parse_method(std::string_view name) -> std::optional<Method> {
  for (const auto &[kind, wire] : wire_names) {
    if (wire == name)
      return kind;
  }
  return std::nullopt;
}

} // namespace Drop::Channel
