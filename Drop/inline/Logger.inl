#pragma once

namespace Drop {

#ifndef DROP_RELEASE
template <typename... Args>
void Logger::trace(fmt::format_string<Args...> format,
                   Args &&...args) noexcept {
  if (current_level.load(std::memory_order_relaxed) > LogLevel::Trace)
    return;
  log(fmt::format(format, std::forward<Args>(args)...), LogLevel::Trace);
}

template <typename... Args>
void Logger::debug(fmt::format_string<Args...> format,
                   Args &&...args) noexcept {
  if (current_level.load(std::memory_order_relaxed) > LogLevel::Debug)
    return;
  log(fmt::format(format, std::forward<Args>(args)...), LogLevel::Debug);
}

#else
template <typename... Args>
void Logger::trace(fmt::format_string<Args...>, Args &&...) noexcept {}

template <typename... Args>
void Logger::debug(fmt::format_string<Args...>, Args &&...) noexcept {}

#endif

template <typename... Args>
void Logger::info(fmt::format_string<Args...> format, Args &&...args) noexcept {
  if (current_level.load(std::memory_order_relaxed) > LogLevel::Info)
    return;
  log(fmt::format(format, std::forward<Args>(args)...), LogLevel::Info);
}

template <typename... Args>
void Logger::error(fmt::format_string<Args...> format,
                   Args &&...args) noexcept {
  if (current_level.load(std::memory_order_relaxed) == LogLevel::None)
    return;
  log(fmt::format(format, std::forward<Args>(args)...), LogLevel::Error);
}

} // namespace Drop
