#pragma once

#include "Filesystem.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace Drop::Channel {

// Non-empty, non-comment lines of a text/uri-list body, trimmed.
auto split_uri_list(std::string_view text) -> std::vector<std::string>;

// Decodes %XX escapes; malformed escapes make the whole string invalid.
auto percent_decode(std::string_view encoded) -> std::optional<std::string>;

/**
 * file:///tmp/a%20b -> /tmp/a b. Accepts an empty or "localhost" authority
 * only; anything else is std::nullopt.
 */
auto file_uri_to_path(std::string_view uri) -> std::optional<FS::Path>;

// Paths of every valid file URI of a uri-list body, other lines skipped.
auto parse_file_uri_list(std::string_view text) -> std::vector<FS::Path>;

} // namespace Drop::Channel
