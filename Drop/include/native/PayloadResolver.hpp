#pragma once

#include "DropItem.hpp"
#include "native/DragPayload.hpp"

#include <mutex>
#include <string>
#include <unordered_set>
#include <vector>

namespace Drop::Native {

/**
 * @brief Turns the raw payload of one drop gesture into a deduplicated item
 * list.
 *
 * Precedence: file URLs and legacy paths win; promises are only read when
 * neither is present; non-file links are always appended; the text fallback
 * (plain, then HTML, then RTF, at most one) is used only when there is no
 * file, promise or link at all.
 */
class PayloadResolver {
public:
  explicit PayloadResolver(IScopedAccess &scoped_access)
      : access(&scoped_access) {}

  // Blocks until every promise of the payload has materialized or failed.
  [[nodiscard]] auto resolve(DragPayload &payload) const -> DropItems;

  // Paths opened through the application, deduplicated like file urls.
  [[nodiscard]] auto resolve_paths(const std::vector<FS::Path> &paths) const
      -> DropItems;

private:
  struct Batch {
    std::mutex lock;
    std::unordered_set<std::string> seen;
    DropItems items;
  };

  // File or directory item with the bookmark rule applied.
  [[nodiscard]] auto make_path_item(const FS::Path &path,
                                    bool from_promise) const -> DropItem;
  auto push(Batch &batch, DropItem item) const -> void;
  auto push_path(Batch &batch, const FS::Path &path, bool from_promise) const
      -> void;
  auto resolve_promises(Batch &batch, DragPayload &payload) const -> void;

  IScopedAccess *access{nullptr};
};

} // namespace Drop::Native
