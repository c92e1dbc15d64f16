// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <atomic>
#include <string>

namespace archive_chunker {

/**
 * @brief Cooperative cancellation flag shared between a run and its workers
 *
 * cancel() is a single lock-free atomic store, so it may be called from a
 * signal handler.
 */
class CancellationToken {
public:
  CancellationToken() = default;
  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel() noexcept { _cancelled.store(true, std::memory_order_relaxed); }
  bool cancelled() const noexcept { return _cancelled.load(std::memory_order_relaxed); }

  /// Throws CancelledError mentioning @p where once cancel() has been called.
  void throw_if_cancelled(const std::string &where) const;

private:
  std::atomic<bool> _cancelled{ false };
};

inline bool is_cancelled(const CancellationToken *token) { return token && token->cancelled(); }

} // namespace archive_chunker
