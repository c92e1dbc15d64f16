// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <string>

namespace archive_chunker {

enum class LogLevel {
  Debug,
  Info,
  Warning,
  Error,
};

/// Messages below @p level are dropped. Default: Info.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Writes "<timestamp> [level] message" to std::cerr; safe to call from worker threads.
void log_message(LogLevel level, const std::string &message);

inline void log_debug(const std::string &message) { log_message(LogLevel::Debug, message); }
inline void log_info(const std::string &message) { log_message(LogLevel::Info, message); }
inline void log_warning(const std::string &message) { log_message(LogLevel::Warning, message); }
inline void log_error(const std::string &message) { log_message(LogLevel::Error, message); }

} // namespace archive_chunker
