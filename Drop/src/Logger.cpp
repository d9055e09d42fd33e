#include "pch/desktop_drop_pch.hpp"

#include "Logger.hpp"

#include <cctype>
#include <cstdlib>
#include <fmt/chrono.h>
#include <fmt/std.h>
#include <iostream>
#include <string_view>

namespace Drop {

Logger::Logger() : current_level(get_log_level_from_environment()) {
  worker = std::jthread(
      [this](const std::stop_token &stop_token) { process_queue(stop_token); });
}

Logger &Logger::get_instance() {
  static Logger instance;
  return instance;
}

void Logger::stop() { get_instance().stop_all(); }

Logger::~Logger() { stop_all(); }

void Logger::stop_all() {
  if (exit_flag.exchange(true))
    return;

  {
    std::lock_guard lock(queue_mutex);
  }
  cv.notify_one();
  if (worker.joinable())
    worker.join();
}

void Logger::log(std::string &&message, LogLevel level) {
  {
    std::lock_guard lock(queue_mutex);
    log_queue.emplace(std::move(message), level,
                      std::chrono::system_clock::now(),
                      std::this_thread::get_id());
  }
  cv.notify_one();
}

void Logger::process_queue(const std::stop_token &stop_token) {
  while (!stop_token.stop_requested()) {
    std::unique_lock lock(queue_mutex);
    cv.wait(lock, [this] { return !log_queue.empty() || exit_flag; });

    if (exit_flag && log_queue.empty())
      break;

    while (!log_queue.empty()) {
      auto log_message = std::move(log_queue.front());
      log_queue.pop();
      lock.unlock();
      process_single(log_message);
      lock.lock();
    }
  }
}

namespace AnsiColor {
using namespace std::string_view_literals;
static constexpr auto Reset = "\033[0m"sv;
static constexpr auto Red = "\033[31m"sv;    // Error
static constexpr auto Green = "\033[32m"sv;  // Info
static constexpr auto Yellow = "\033[33m"sv; // Debug
static constexpr auto Blue = "\033[34m"sv;   // Trace
} // namespace AnsiColor

void Logger::process_single(const BackgroundLogMessage &message) {
  const auto stamp = std::chrono::floor<std::chrono::milliseconds>(
      message.timestamp.time_since_epoch());
  const auto prefix = fmt::format(
      "{:%H:%M:%S} [{}]",
      std::chrono::system_clock::time_point{stamp}, message.thread);

  switch (message.level) {
    using enum Drop::LogLevel;
  case Trace:
    std::cout << AnsiColor::Blue << prefix << " [TRACE] " << message.message
              << AnsiColor::Reset << '\n';
    break;
  case Debug:
    std::cout << AnsiColor::Yellow << prefix << " [DEBUG] " << message.message
              << AnsiColor::Reset << '\n';
    break;
  case Info:
    std::cout << AnsiColor::Green << prefix << " [INFO] " << message.message
              << AnsiColor::Reset << '\n';
    break;
  case Error:
    std::cerr << AnsiColor::Red << prefix << " [ERROR] " << message.message
              << AnsiColor::Reset << std::endl;
    return;
  case None:
    return;
  }
  std::cout.flush();
}

void Logger::set_level(LogLevel level) { current_level = level; }

LogLevel Logger::get_level() const { return current_level; }

static auto to_lower(std::string_view str) {
  std::string lower_str;
  lower_str.reserve(str.size());
  for (const char ch : str) {
    lower_str += static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return lower_str;
}

static auto is_prefix_of(std::string_view candidate, std::string_view word) {
  return !candidate.empty() && word.starts_with(candidate);
}

LogLevel Logger::get_log_level_from_environment() {
  if (const auto env_value = std::getenv("DROP_LOG_LEVEL");
      env_value != nullptr) {
    const std::string log_level = to_lower(env_value);
    if (is_prefix_of(log_level, "trace"))
      return LogLevel::Trace;
    if (is_prefix_of(log_level, "debug"))
      return LogLevel::Debug;
    if (is_prefix_of(log_level, "info"))
      return LogLevel::Info;
    if (is_prefix_of(log_level, "error"))
      return LogLevel::Error;
    if (is_prefix_of(log_level, "none"))
      return LogLevel::None;
    std::cerr << "Unknown DROP_LOG_LEVEL '" << env_value
              << "', falling back to info\n";
  }
  return LogLevel::Info;
}

} // namespace Drop
