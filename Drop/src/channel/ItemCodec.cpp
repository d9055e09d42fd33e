#include "pch/desktop_drop_pch.hpp"

#include "channel/ItemCodec.hpp"

#include "Exception.hpp"

namespace Drop::Channel {

auto encode_item(const DropItem &item) -> WireItem {
  return item.visit(Overloaded{
      [](const FileItem &file) {
        return WireItem{
            .path = file.path.string(),
            .bookmark = file.origin_bookmark,
            .from_promise = file.from_promise,
        };
      },
      [](const DirectoryItem &directory) {
        return WireItem{
            .path = directory.path.string(),
            .bookmark = directory.origin_bookmark,
            .is_directory = true,
            .from_promise = directory.from_promise,
        };
      },
      [](const MemoryItem &memory) {
        return WireItem{
            .data = memory.data,
            .mime_type = memory.mime_type,
            .name = memory.name,
            .bookmark = memory.origin_bookmark,
            .from_promise = memory.from_promise,
        };
      },
  });
}

auto encode_items(const DropItems &items) -> std::vector<WireItem> {
  std::vector<WireItem> wire;
  wire.reserve(items.size());
  for (const auto &item : items)
    wire.push_back(encode_item(item));
  return wire;
}

auto decode_item(const WireItem &wire) -> DropItem {
  if (wire.data) {
    auto memory = make_memory_item(*wire.data, wire.name.value_or(""),
                                   wire.mime_type.value_or(""),
                                   wire.from_promise);
    memory.origin_bookmark = wire.bookmark;
    return memory;
  }

  if (!wire.path || wire.path->empty())
    throw ProtocolException{
        std::string{to_wire_name(Method::PerformOperationNative)},
        "Dropped item carries neither path nor data"};

  if (wire.is_directory)
    return DirectoryItem{.path = FS::Path{*wire.path},
                         .origin_bookmark = wire.bookmark,
                         .from_promise = wire.from_promise};
  return FileItem{.path = FS::Path{*wire.path},
                  .origin_bookmark = wire.bookmark,
                  .from_promise = wire.from_promise};
}

auto decode_items(const std::vector<WireItem> &wire) -> DropItems {
  DropItems items;
  items.reserve(wire.size());
  for (const auto &entry : wire)
    items.push_back(decode_item(entry));
  return items;
}

} // namespace Drop::Channel
