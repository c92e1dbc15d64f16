// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "worker_pool.h"

namespace archive_chunker {

WorkerPool::WorkerPool(std::size_t thread_count) {
  if (thread_count == 0) {
    throw std::invalid_argument("WorkerPool requires at least one thread");
  }
  _threads.reserve(thread_count);
  for (std::size_t i = 0; i < thread_count; ++i) {
    _threads.emplace_back([this]() { worker_loop(); });
  }
}

WorkerPool::~WorkerPool() {
  {
    std::lock_guard<std::mutex> lock(_mutex);
    _stopping = true;
  }
  _available.notify_all();
  for (std::thread &thread : _threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }
}

void WorkerPool::worker_loop() {
  while (true) {
    std::function<void()> task;
    {
      std::unique_lock<std::mutex> lock(_mutex);
      _available.wait(lock, [this]() { return _stopping || !_tasks.empty(); });
      if (_tasks.empty()) {
        return;
      }
      task = std::move(_tasks.front());
      _tasks.pop();
    }
    task();
  }
}

} // namespace archive_chunker
