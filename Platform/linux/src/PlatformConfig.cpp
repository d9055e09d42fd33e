#include "PlatformConfig.hpp"
#include "PlatformScopedAccess.hpp"

#include <array>
#include <cstdlib>
#include <string>
#include <unistd.h>

namespace Drop::Platform {

auto get_system_name() -> std::string {
  std::array<char, 256> buffer{};
  if (gethostname(buffer.data(), buffer.size()) != 0) {
    return "default"; // Fallback name
  }
  return std::string(buffer.data());
}

auto get_private_storage_root() -> std::optional<std::filesystem::path> {
  if (const auto *data_home = std::getenv("XDG_DATA_HOME");
      data_home && *data_home) {
    return std::filesystem::path{data_home} / "desktop_drop";
  }
  if (const auto *home = std::getenv("HOME"); home && *home) {
    return std::filesystem::path{home} / ".local" / "share" / "desktop_drop";
  }
  return std::nullopt;
}

auto FileSystemScopedAccess::is_readable(const FS::Path &path) -> bool {
  return ::access(path.c_str(), R_OK) == 0;
}

} // namespace Drop::Platform
