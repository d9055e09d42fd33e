#include "pch/desktop_drop_pch.hpp"

#include "PlatformScopedAccess.hpp"

#include "Logger.hpp"

namespace Drop::Platform {

auto FileSystemScopedAccess::to_path(const Bytes &bookmark) -> FS::Path {
  return FS::Path{std::u8string{bookmark.begin(), bookmark.end()}};
}

auto FileSystemScopedAccess::create_bookmark(const FS::Path &path)
    -> std::optional<Bytes> {
  if (!FS::exists(path))
    return std::nullopt;
  const auto encoded = path.u8string();
  return Bytes{encoded.begin(), encoded.end()};
}

auto FileSystemScopedAccess::start_access(const Bytes &bookmark) -> bool {
  if (bookmark.empty())
    return false;

  const auto path = to_path(bookmark);
  if (!is_readable(path)) {
    debug("Scoped access to {} refused", path);
    return false;
  }

  std::scoped_lock lock{mutex};
  ++active[path.string()];
  return true;
}

auto FileSystemScopedAccess::stop_access(const Bytes &bookmark) -> bool {
  if (bookmark.empty())
    return true;

  const auto key = to_path(bookmark).string();
  std::scoped_lock lock{mutex};
  if (auto found = active.find(key); found != active.end()) {
    if (--found->second == 0)
      active.erase(found);
  }
  return true;
}

auto FileSystemScopedAccess::get_active_count(const FS::Path &path) const
    -> u32 {
  std::scoped_lock lock{mutex};
  const auto found = active.find(path.string());
  return found == active.end() ? 0 : found->second;
}

} // namespace Drop::Platform
