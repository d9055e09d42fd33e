#include "pch/desktop_drop_pch.hpp"

#include "Environment.hpp"

#include <cstdlib>

namespace Drop {

auto Environment::get(const std::string &key) -> std::optional<std::string> {
  std::lock_guard lock(access);
  if (const auto found = environment_variables.find(key);
      found != environment_variables.end()) {
    return found->second;
  }

  trace("Key '{}' was not initialized on startup!", key);
  return std::nullopt;
}

void Environment::initialize(std::span<const std::string> keys) {
  for (const auto &key : keys) {
    if (const auto *value = std::getenv(key.c_str())) {
      set_environment_variable(key, value);
      debug("Environment {}={}", key, value);
    } else {
      debug("Key {} was not found.", key);
    }
  }
}

} // namespace Drop
