#include "pch/desktop_drop_pch.hpp"

#include "channel/UriList.hpp"

#include "Logger.hpp"

namespace Drop::Channel {

namespace {

auto hex_value(char character) -> std::optional<u8> {
  if (character >= '0' && character <= '9')
    return static_cast<u8>(character - '0');
  if (character >= 'a' && character <= 'f')
    return static_cast<u8>(character - 'a' + 10);
  if (character >= 'A' && character <= 'F')
    return static_cast<u8>(character - 'A' + 10);
  return std::nullopt;
}

auto trim(std::string_view line) -> std::string_view {
  const auto first = line.find_first_not_of(" \t\r");
  if (first == std::string_view::npos)
    return {};
  const auto last = line.find_last_not_of(" \t\r");
  return line.substr(first, last - first + 1);
}

} // namespace

auto split_uri_list(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  while (!text.empty()) {
    const auto end = text.find('\n');
    const auto line = trim(text.substr(0, end));
    text = end == std::string_view::npos ? std::string_view{}
                                         : text.substr(end + 1);

    if (line.empty() || line.starts_with('#'))
      continue;
    lines.emplace_back(line);
  }
  return lines;
}

auto percent_decode(std::string_view encoded) -> std::optional<std::string> {
  std::string decoded;
  decoded.reserve(encoded.size());
  for (usize i = 0; i < encoded.size(); ++i) {
    if (encoded[i] != '%') {
      decoded.push_back(encoded[i]);
      continue;
    }
    if (i + 2 >= encoded.size())
      return std::nullopt;
    const auto high = hex_value(encoded[i + 1]);
    const auto low = hex_value(encoded[i + 2]);
    if (!high || !low)
      return std::nullopt;
    decoded.push_back(static_cast<char>((*high << 4U) | *low));
    i += 2;
  }
  return decoded;
}

auto file_uri_to_path(std::string_view uri) -> std::optional<FS::Path> {
  static constexpr std::string_view scheme = "file://";
  if (!uri.starts_with(scheme))
    return std::nullopt;

  auto rest = uri.substr(scheme.size());
  const auto slash = rest.find('/');
  if (slash == std::string_view::npos)
    return std::nullopt;

  const auto authority = rest.substr(0, slash);
  if (!authority.empty() && authority != "localhost")
    return std::nullopt;

  auto decoded = percent_decode(rest.substr(slash));
  if (!decoded)
    return std::nullopt;
  return FS::Path{*decoded};
}

auto parse_file_uri_list(std::string_view text) -> std::vector<FS::Path> {
  std::vector<FS::Path> paths;
  for (const auto &line : split_uri_list(text)) {
    if (auto path = file_uri_to_path(line)) {
      paths.push_back(std::move(*path));
      continue;
    }
    debug("Skipping uri-list entry '{}'", line);
  }
  return paths;
}

} // namespace Drop::Channel
