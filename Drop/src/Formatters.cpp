#include "pch/desktop_drop_pch.hpp"

#include "Formatters.hpp"

#include <magic_enum.hpp>

auto fmt::formatter<Drop::DropItem>::format(const Drop::DropItem &item,
                                            format_context &ctx) const
    -> decltype(ctx.out()) {
  using namespace Drop;
  const auto formatted = item.visit(Overloaded{
      [](const FileItem &file) {
        return fmt::format("File({}{})", file.path.string(),
                           file.from_promise ? ", promised" : "");
      },
      [](const DirectoryItem &directory) {
        return fmt::format("Directory({}{})", directory.path.string(),
                           directory.from_promise ? ", promised" : "");
      },
      [](const MemoryItem &memory) {
        return fmt::format("Memory({}, {}, {} bytes)", memory.name,
                           memory.mime_type, memory.byte_length);
      },
  });
  return formatter<const char *>::format(formatted.c_str(), ctx);
}

auto fmt::formatter<Drop::EventType>::format(const Drop::EventType &type,
                                             format_context &ctx) const
    -> decltype(ctx.out()) {
  return formatter<const char *>::format(
      std::string{magic_enum::enum_name(type)}.c_str(), ctx);
}

auto fmt::formatter<Drop::RegionStatus>::format(
    const Drop::RegionStatus &status, format_context &ctx) const
    -> decltype(ctx.out()) {
  return formatter<const char *>::format(
      std::string{magic_enum::enum_name(status)}.c_str(), ctx);
}
