#include "pch/desktop_drop_pch.hpp"

#include "DropItem.hpp"

#include "Config.hpp"
#include "channel/UriList.hpp"

#include <atomic>

namespace Drop {

auto DirectoryItem::operator==(const DirectoryItem &other) const -> bool {
  return path == other.path && origin_bookmark == other.origin_bookmark &&
         from_promise == other.from_promise && children == other.children;
}

auto DropItem::get_path() const -> std::string {
  return visit(Overloaded{
      [](const FileItem &file) { return file.path.string(); },
      [](const DirectoryItem &directory) { return directory.path.string(); },
      [](const MemoryItem &memory) { return memory.path; },
  });
}

auto DropItem::get_origin_bookmark() const -> const std::optional<Bytes> & {
  return visit([](const auto &item) -> const std::optional<Bytes> & {
    return item.origin_bookmark;
  });
}

auto DropItem::is_from_promise() const -> bool {
  return visit([](const auto &item) { return item.from_promise; });
}

auto DropItem::get_mime_type() const -> std::optional<std::string> {
  return visit(Overloaded{
      [](const FileItem &) -> std::optional<std::string> {
        return std::nullopt;
      },
      [](const DirectoryItem &) -> std::optional<std::string> {
        return std::nullopt;
      },
      [](const MemoryItem &memory) -> std::optional<std::string> {
        return memory.mime_type;
      },
  });
}

auto DropItem::get_name() const -> std::string {
  return visit(Overloaded{
      [](const FileItem &file) { return file.path.filename().string(); },
      [](const DirectoryItem &directory) {
        return directory.path.filename().string();
      },
      [](const MemoryItem &memory) { return memory.name; },
  });
}

auto DropItem::operator==(const DropItem &other) const -> bool {
  return value == other.value;
}

auto make_memory_item(Bytes data, std::string_view name,
                      std::string_view mime_type, bool from_promise)
    -> MemoryItem {
  static std::atomic<u64> sequence{0};

  const auto now = std::chrono::system_clock::now();
  const auto micros = std::chrono::duration_cast<std::chrono::microseconds>(
                          now.time_since_epoch())
                          .count();
  const std::string item_name{name.empty() ? Config::default_item_name : name};

  MemoryItem item{
      .path = fmt::format("{}drop/{}-{}/{}", Config::memory_scheme, micros,
                          sequence.fetch_add(1), item_name),
      .name = item_name,
      .mime_type = std::string{mime_type.empty() ? Config::default_mime_type
                                                 : mime_type},
      .data = std::move(data),
      .last_modified = now,
      .from_promise = from_promise,
  };
  item.byte_length = item.data.size();
  return item;
}

auto make_memory_item(std::string_view text, std::string_view name,
                      std::string_view mime_type) -> MemoryItem {
  return make_memory_item(Bytes{text.begin(), text.end()}, name, mime_type);
}

auto is_memory_path(std::string_view path) -> bool {
  return path.starts_with(Config::memory_scheme);
}

auto is_memory_backed(const DropItem &item) -> bool {
  return item.is<MemoryItem>() && is_memory_path(item.as<MemoryItem>().path);
}

auto is_text_like(const DropItem &item) -> bool {
  const auto mime = item.get_mime_type().value_or("");
  return mime.starts_with("text/") || mime == "application/rtf";
}

auto read_as_text(const DropItem &item) -> std::optional<std::string> {
  if (!is_memory_backed(item) || !is_text_like(item))
    return std::nullopt;

  const auto &data = item.as<MemoryItem>().data;
  return std::string{data.begin(), data.end()};
}

auto read_as_uris(const DropItem &item) -> std::vector<std::string> {
  if (item.get_mime_type() != "text/uri-list")
    return {};

  return Channel::split_uri_list(read_as_text(item).value_or(""));
}

} // namespace Drop
