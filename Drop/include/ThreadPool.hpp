#pragma once

#include "BS_thread_pool.hpp"
#include "Config.hpp"
#include "Types.hpp"

#include <future>
#include <vector>

namespace Drop {

/**
 * @brief Bounded worker pool shared by every drag session. The only blocking
 * work in the drop core (promised file materialization) runs here.
 */
class ThreadPool {
public:
  template <typename F, typename R = std::invoke_result_t<std::decay_t<F>>>
  [[nodiscard]] static auto submit(F &&task) -> std::future<R> {
    return pool.submit_task(std::forward<F>(task));
  }

  [[nodiscard]] static auto get_thread_count() -> usize {
    return pool.get_thread_count();
  }

private:
  static constexpr u32 thread_count = Config::thread_count;
  static inline BS::thread_pool pool{thread_count};
};

/**
 * @brief Scoped fork/join group. Tasks are spawned on the shared pool and
 * join() waits for all of them; the destructor joins as well, so no task can
 * outlive the scope that spawned it.
 */
template <class R> class TaskGroup {
public:
  TaskGroup() = default;
  TaskGroup(const TaskGroup &) = delete;
  TaskGroup &operator=(const TaskGroup &) = delete;
  ~TaskGroup() { wait_all(); }

  template <typename F> auto spawn(F &&task) -> void {
    futures.push_back(ThreadPool::submit(std::forward<F>(task)));
  }

  // Results in spawn order. Rethrows the first task exception after every
  // task has finished.
  auto join() -> std::vector<R>
    requires(!std::is_void_v<R>)
  {
    wait_all();
    std::vector<R> results;
    results.reserve(futures.size());
    for (auto &future : futures) {
      results.push_back(future.get());
    }
    futures.clear();
    return results;
  }

  auto join() -> void
    requires(std::is_void_v<R>)
  {
    wait_all();
    for (auto &future : futures) {
      future.get();
    }
    futures.clear();
  }

  [[nodiscard]] auto size() const -> usize { return futures.size(); }

private:
  auto wait_all() -> void {
    for (auto &future : futures) {
      if (future.valid())
        future.wait();
    }
  }

  std::vector<std::future<R>> futures{};
};

} // namespace Drop
