#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace Drop::Platform {

auto get_system_name() -> std::string;

// Application-private storage root (sandbox container, XDG data dir...).
// Items below it need no access bookmark.
auto get_private_storage_root() -> std::optional<std::filesystem::path>;

} // namespace Drop::Platform
