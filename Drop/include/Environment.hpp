#pragma once

#include "Logger.hpp"

#include <mutex>
#include <optional>
#include <span>
#include <string>
#include <unordered_map>

namespace Drop {

/**
 * Snapshot of the process environment keys DesktopDrop cares about, taken at
 * start-up so later lookups from worker threads never race with setenv.
 */
class Environment {
public:
  static void set_environment_variable(const std::string &key,
                                       const std::string &value) {
    std::lock_guard lock(access);
    environment_variables[key] = value;
  }

  static void clear(const std::string &key) {
    std::lock_guard lock(access);
    environment_variables.erase(key);
  }

  static auto get(const std::string &key) -> std::optional<std::string>;
  static void initialize(std::span<const std::string> keys);

private:
  static inline std::mutex access{};
  static inline std::unordered_map<std::string, std::string>
      environment_variables{};
};

} // namespace Drop
