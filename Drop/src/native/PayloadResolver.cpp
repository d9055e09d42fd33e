#include "pch/desktop_drop_pch.hpp"

#include "native/PayloadResolver.hpp"

#include "Exception.hpp"
#include "Logger.hpp"
#include "ThreadPool.hpp"

namespace Drop::Native {

namespace {

auto is_file_url(std::string_view link) -> bool {
  return link.starts_with("file:");
}

} // namespace

auto PayloadResolver::make_path_item(const FS::Path &path,
                                     bool from_promise) const -> DropItem {
  const auto normal = path.lexically_normal();

  std::optional<Bytes> bookmark{};
  if (!FS::is_inside_private_storage(normal)) {
    bookmark = access->create_bookmark(normal);
    if (!bookmark) {
      debug("No bookmark for {}, access may end with the drop", normal);
    }
  }

  if (FS::is_directory(normal)) {
    return DirectoryItem{
        .path = normal,
        .origin_bookmark = std::move(bookmark),
        .from_promise = from_promise,
    };
  }
  return FileItem{
      .path = normal,
      .origin_bookmark = std::move(bookmark),
      .from_promise = from_promise,
  };
}

auto PayloadResolver::push(Batch &batch, DropItem item) const -> void {
  auto key = item.get_path();
  std::lock_guard guard(batch.lock);
  if (!batch.seen.insert(std::move(key)).second) {
    trace("Skipping duplicate drop item {}", item.get_path());
    return;
  }
  batch.items.push_back(std::move(item));
}

auto PayloadResolver::push_path(Batch &batch, const FS::Path &path,
                                bool from_promise) const -> void {
  // A failing collaborator costs this item only, never the gesture.
  try {
    push(batch, make_path_item(path, from_promise));
  } catch (const std::exception &exc) {
    error("Leaving {} out of the drop: {}", path, exc.what());
  }
}

auto PayloadResolver::resolve_promises(Batch &batch,
                                       DragPayload &payload) const -> void {
  FS::Path destination;
  try {
    destination = FS::unique_drop_destination();
  } catch (const MaterializationException &exc) {
    error("Dropping {} promised file(s): {}", payload.promises.size(),
          exc.what());
    return;
  }

  TaskGroup<void> group;
  for (auto &promise : payload.promises) {
    group.spawn([this, &batch, &destination, promise = promise.get()] {
      FS::Path materialized;
      try {
        materialized = promise->materialize(destination);
      } catch (const std::exception &exc) {
        error("Promise '{}' failed to materialize: {}", promise->describe(),
              exc.what());
        return;
      }
      push_path(batch, materialized, true);
    });
  }
  group.join();
}

auto PayloadResolver::resolve_paths(const std::vector<FS::Path> &paths) const
    -> DropItems {
  Batch batch;
  for (const auto &path : paths)
    push_path(batch, path, false);
  return std::move(batch.items);
}

auto PayloadResolver::resolve(DragPayload &payload) const -> DropItems {
  Batch batch;

  if (payload.has_files()) {
    for (const auto &url : payload.file_urls) {
      push_path(batch, url, false);
    }
    for (const auto &legacy : payload.legacy_paths) {
      push_path(batch, FS::Path{legacy}, false);
    }
  } else if (!payload.promises.empty()) {
    resolve_promises(batch, payload);
  }

  bool has_links = false;
  for (const auto &link : payload.links) {
    if (is_file_url(link))
      continue;
    push(batch, make_memory_item(link, "Dropped URL.txt", "text/uri-list"));
    has_links = true;
  }

  if (payload.has_files() || !payload.promises.empty() || has_links) {
    debug("Resolved {} drop item(s)", batch.items.size());
    return std::move(batch.items);
  }

  if (payload.plain_text) {
    push(batch, make_memory_item(*payload.plain_text, "Dropped Text.txt",
                                 "text/plain; charset=utf-8"));
  } else if (payload.html) {
    push(batch, make_memory_item(*payload.html, "Dropped Text.html",
                                 "text/html; charset=utf-8"));
  } else if (payload.rtf) {
    push(batch, make_memory_item(*payload.rtf, "Dropped Text.rtf",
                                 "application/rtf"));
  }

  debug("Resolved {} drop item(s)", batch.items.size());
  return std::move(batch.items);
}

} // namespace Drop::Native
