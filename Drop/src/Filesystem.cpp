#include "pch/desktop_drop_pch.hpp"

#include "Filesystem.hpp"

#include "Config.hpp"
#include "Environment.hpp"
#include "Exception.hpp"
#include "PlatformConfig.hpp"

#include <atomic>
#include <ctime>
#include <fmt/chrono.h>

namespace Drop::FS {

auto temp_directory() -> Path {
  if (auto configured = Environment::get("DROP_TEMP_DIRECTORY")) {
    return Path{*configured};
  }
  std::error_code code;
  auto path = std::filesystem::temp_directory_path(code);
  if (code) {
    error("temp_directory_path failed: {}", code.message());
    return Path{"/tmp"};
  }
  return path;
}

auto private_storage_root() -> std::optional<Path> {
  if (auto configured = Environment::get("DROP_CONTAINER_ROOT")) {
    return Path{*configured};
  }
  return Platform::get_private_storage_root();
}

auto is_inside(const Path &candidate, const Path &root) -> bool {
  if (root.empty() || candidate.empty())
    return false;

  const auto normal_candidate = candidate.lexically_normal();
  auto normal_root = root.lexically_normal();
  if (!normal_root.has_filename() && normal_root != normal_root.root_path()) {
    // Strip the trailing separator so "/tmp/" compares like "/tmp".
    normal_root = normal_root.parent_path();
  }

  auto candidate_it = normal_candidate.begin();
  for (const auto &part : normal_root) {
    if (candidate_it == normal_candidate.end() || *candidate_it != part)
      return false;
    ++candidate_it;
  }
  return true;
}

auto is_inside_private_storage(const Path &candidate) -> bool {
  if (is_inside(candidate, temp_directory()))
    return true;

  if (const auto root = private_storage_root())
    return is_inside(candidate, *root);

  return false;
}

auto is_directory(const Path &candidate) noexcept -> bool {
  std::error_code code;
  const auto result = std::filesystem::is_directory(candidate, code);
  return !code && result;
}

auto unique_drop_destination() -> Path {
  static std::atomic<u32> collision_counter{0};

  const auto now = std::chrono::system_clock::now();
  const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
                          now.time_since_epoch()) %
                      1000;
  const auto utc = fmt::gmtime(std::chrono::system_clock::to_time_t(now));

  const auto stamp =
      fmt::format("{:%Y%m%d_%H%M%S}_{:03}Z", utc, millis.count());
  const auto base = temp_directory() / Path{Config::promise_directory_name};

  std::error_code code;
  std::filesystem::create_directories(base, code);
  if (code) {
    throw MaterializationException{fmt::format(
        "Could not create drop directory {}: {}", base, code.message())};
  }

  // create_directory reports false when another gesture already owns the name.
  auto destination = base / stamp;
  while (!std::filesystem::create_directory(destination, code)) {
    if (code) {
      throw MaterializationException{
          fmt::format("Could not create drop destination {}: {}", destination,
                      code.message())};
    }
    destination = base / fmt::format("{}-{}", stamp, ++collision_counter);
  }

  debug("Promise destination {}", destination);
  return destination;
}

} // namespace Drop::FS
