#pragma once

#include "Filesystem.hpp"
#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Drop::Native {

/**
 * @brief A file named by the drag source that does not exist yet. The source
 * writes it on request (browsers, mail clients, editors).
 */
class IFilePromise {
public:
  virtual ~IFilePromise() = default;

  /**
   * Writes the promised file below destination and returns its final path.
   * Called on a pool worker; may block on I/O.
   *
   * @throws std::exception on failure; the item is then left out of the drop.
   */
  virtual auto materialize(const FS::Path &destination) -> FS::Path = 0;

  [[nodiscard]] virtual auto describe() const -> std::string {
    return "file promise";
  }
};

/**
 * @brief Everything the OS offered for one drop gesture, already read from the
 * pasteboard / selection. Several representations may be present at once.
 */
struct DragPayload {
  std::vector<FS::Path> file_urls{};
  // NSFilenamesPboardType style plain path strings.
  std::vector<std::string> legacy_paths{};
  std::vector<Scope<IFilePromise>> promises{};
  // Any URLs on the pasteboard; file:// ones are skipped as links.
  std::vector<std::string> links{};
  std::optional<std::string> plain_text{};
  std::optional<std::string> html{};
  std::optional<Bytes> rtf{};

  [[nodiscard]] auto has_files() const -> bool {
    return !file_urls.empty() || !legacy_paths.empty();
  }
};

/**
 * @brief Access tokens for resources outside the application's sandbox.
 * Bookmarks are opaque bytes to the rest of the drop core. create_bookmark is
 * called concurrently from promise workers.
 */
class IScopedAccess {
public:
  virtual ~IScopedAccess() = default;

  [[nodiscard]] virtual auto create_bookmark(const FS::Path &path)
      -> std::optional<Bytes> = 0;
  [[nodiscard]] virtual auto start_access(const Bytes &bookmark) -> bool = 0;
  [[nodiscard]] virtual auto stop_access(const Bytes &bookmark) -> bool = 0;
};

} // namespace Drop::Native
