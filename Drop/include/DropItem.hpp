#pragma once

#include "Concepts.hpp"
#include "Filesystem.hpp"
#include "Types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace Drop {

class DropItem;

struct FileItem {
  FS::Path path;
  std::optional<Bytes> origin_bookmark{};
  bool from_promise{false};

  auto operator==(const FileItem &) const -> bool = default;
};

struct DirectoryItem {
  FS::Path path;
  std::optional<Bytes> origin_bookmark{};
  bool from_promise{false};
  // Never populated by the drop core.
  std::vector<DropItem> children{};

  auto operator==(const DirectoryItem &) const -> bool;
};

struct MemoryItem {
  // memory://drop/<micros>-<sequence>/<name>
  std::string path;
  std::string name;
  std::string mime_type;
  Bytes data{};
  usize byte_length{0};
  std::chrono::system_clock::time_point last_modified{};
  std::optional<Bytes> origin_bookmark{};
  bool from_promise{false};

  auto operator==(const MemoryItem &) const -> bool = default;
};

/**
 * @brief One dropped thing. A closed sum type: every consumer goes through
 * visit(), which only compiles when all three alternatives are handled.
 */
class DropItem {
public:
  using Variant = std::variant<FileItem, DirectoryItem, MemoryItem>;

  DropItem(FileItem file) : value(std::move(file)) {}
  DropItem(DirectoryItem directory) : value(std::move(directory)) {}
  DropItem(MemoryItem memory) : value(std::move(memory)) {}

  template <class Visitor>
    requires VisitsAll<Visitor, FileItem, DirectoryItem, MemoryItem>
  decltype(auto) visit(Visitor &&visitor) const {
    return std::visit(std::forward<Visitor>(visitor), value);
  }

  [[nodiscard]] auto get_path() const -> std::string;
  [[nodiscard]] auto get_origin_bookmark() const
      -> const std::optional<Bytes> &;
  [[nodiscard]] auto is_from_promise() const -> bool;

  // Only meaningful for memory-backed items, std::nullopt otherwise.
  [[nodiscard]] auto get_mime_type() const -> std::optional<std::string>;
  [[nodiscard]] auto get_name() const -> std::string;

  template <class T> [[nodiscard]] auto is() const -> bool {
    return std::holds_alternative<T>(value);
  }
  template <class T> [[nodiscard]] auto as() const -> const T & {
    return std::get<T>(value);
  }

  auto operator==(const DropItem &) const -> bool;

private:
  Variant value;
};

using DropItems = std::vector<DropItem>;

template <class... Ts> struct Overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> Overloaded(Ts...) -> Overloaded<Ts...>;

/**
 * @brief Builds a memory-backed item with a reserved `memory://` path.
 * Empty name and mime type fall back to "Dropped.data" and
 * "application/octet-stream".
 */
auto make_memory_item(Bytes data, std::string_view name,
                      std::string_view mime_type, bool from_promise = false)
    -> MemoryItem;

auto make_memory_item(std::string_view text, std::string_view name,
                      std::string_view mime_type) -> MemoryItem;

auto is_memory_path(std::string_view path) -> bool;

// Text helpers for memory-backed text and link drops.
auto is_memory_backed(const DropItem &item) -> bool;
auto is_text_like(const DropItem &item) -> bool;

// Invalid UTF-8 is passed through unchanged; no transcoding happens.
auto read_as_text(const DropItem &item) -> std::optional<std::string>;

// Lines of a text/uri-list item, without comments or blank lines.
auto read_as_uris(const DropItem &item) -> std::vector<std::string>;

} // namespace Drop
