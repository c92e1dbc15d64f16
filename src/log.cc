// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/log.h"
#include "archive_chunker/listing_format.h"

#include <atomic>
#include <iostream>
#include <mutex>

namespace archive_chunker {

namespace {

std::atomic<int> g_log_level{ static_cast<int>(LogLevel::Info) };

std::mutex &log_mutex() {
  static std::mutex mutex;
  return mutex;
}

const char *level_label(LogLevel level) {
  switch (level) {
  case LogLevel::Debug:
    return "debug";
  case LogLevel::Info:
    return "info";
  case LogLevel::Warning:
    return "warning";
  case LogLevel::Error:
    return "error";
  }
  return "?";
}

} // namespace

void set_log_level(LogLevel level) { g_log_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_log_level.load()); }

void log_message(LogLevel level, const std::string &message) {
  if (static_cast<int>(level) < g_log_level.load()) {
    return;
  }
  const std::string stamp = format_current_time();
  std::lock_guard<std::mutex> lock(log_mutex());
  std::cerr << stamp << " [" << level_label(level) << "] " << message << std::endl;
}

} // namespace archive_chunker
