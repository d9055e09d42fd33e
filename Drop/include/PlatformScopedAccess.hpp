#pragma once

#include "Types.hpp"
#include "native/DragPayload.hpp"

#include <mutex>
#include <string>
#include <unordered_map>

namespace Drop::Platform {

/**
 * @brief Scoped access for desktops without a sandbox. A bookmark is the
 * UTF-8 path of the resource; starting access checks that it is readable and
 * counts how often it was started. Both calls may be repeated safely.
 */
class FileSystemScopedAccess final : public Native::IScopedAccess {
public:
  [[nodiscard]] auto create_bookmark(const FS::Path &path)
      -> std::optional<Bytes> override;
  [[nodiscard]] auto start_access(const Bytes &bookmark) -> bool override;
  [[nodiscard]] auto stop_access(const Bytes &bookmark) -> bool override;

  [[nodiscard]] auto get_active_count(const FS::Path &path) const -> u32;

private:
  static auto to_path(const Bytes &bookmark) -> FS::Path;
  static auto is_readable(const FS::Path &path) -> bool;

  mutable std::mutex mutex;
  std::unordered_map<std::string, u32> active{};
};

} // namespace Drop::Platform
