// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <condition_variable>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <queue>
#include <stdexcept>
#include <thread>
#include <type_traits>
#include <utility>
#include <vector>

namespace archive_chunker {

/**
 * @brief Fixed-size pool of threads draining a FIFO task queue
 *
 * Tasks report their results (or exceptions) through the futures returned by
 * submit(). The destructor drains the queue and joins every thread.
 */
class WorkerPool {
public:
  explicit WorkerPool(std::size_t thread_count);
  ~WorkerPool();

  WorkerPool(const WorkerPool &) = delete;
  WorkerPool &operator=(const WorkerPool &) = delete;

  template <class F> auto submit(F &&task) -> std::future<std::invoke_result_t<std::decay_t<F>>>;

  std::size_t size() const { return _threads.size(); }

private:
  void worker_loop();

  std::vector<std::thread> _threads;
  std::queue<std::function<void()>> _tasks;
  std::mutex _mutex;
  std::condition_variable _available;
  bool _stopping = false;
};

template <class F> auto WorkerPool::submit(F &&task) -> std::future<std::invoke_result_t<std::decay_t<F>>> {
  using result_type = std::invoke_result_t<std::decay_t<F>>;

  auto packaged = std::make_shared<std::packaged_task<result_type()>>(std::forward<F>(task));
  std::future<result_type> result = packaged->get_future();
  {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_stopping) {
      throw std::runtime_error("submit on a stopped WorkerPool");
    }
    _tasks.emplace([packaged]() { (*packaged)(); });
  }
  _available.notify_one();
  return result;
}

} // namespace archive_chunker
