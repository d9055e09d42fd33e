#pragma once

#include "Concepts.hpp"
#include "Logger.hpp"

#include <filesystem>
#include <fmt/std.h>
#include <optional>
#include <string>

namespace Drop::FS {

using Path = std::filesystem::path;

auto resolve(StringLike auto path) -> FS::Path {
  return std::filesystem::absolute(path);
}

// DROP_TEMP_DIRECTORY, or the system temp directory.
auto temp_directory() -> Path;

// DROP_CONTAINER_ROOT, or the platform private storage root.
auto private_storage_root() -> std::optional<Path>;

// Component-wise containment, "/tmpfoo" is not inside "/tmp".
auto is_inside(const Path &candidate, const Path &root) -> bool;

// True for paths in the private storage or temp area.
auto is_inside_private_storage(const Path &candidate) -> bool;

// Never throws, unreadable entries classify as files.
auto is_directory(const Path &candidate) noexcept -> bool;

/**
 * @brief Creates a fresh directory `<temp>/Drops/<yyyyMMdd_HHmmss_SSS>Z` for
 * one gesture's promised files. Two gestures within the same millisecond get
 * a numeric suffix, so their files never collide.
 *
 * @throws MaterializationException when the directory cannot be created.
 */
auto unique_drop_destination() -> Path;

inline auto exists(const Path &path) -> bool {
  std::error_code code;
  return std::filesystem::exists(path, code);
}

auto exists(StringLike auto path) -> bool {
  return Drop::FS::exists(FS::Path{path});
}

} // namespace Drop::FS
