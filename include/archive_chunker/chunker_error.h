// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

namespace archive_chunker {

enum class ChunkFaultKind {
  MalformedPath,
  SourceFileMissing,
  SourceSizeChanged,
  ArchiveCorrupt,
  ArchiveWrite,
  OutputExists,
  Cancelled,
  Io,
  Config,
  Transfer,
};

const char *chunk_fault_kind_name(ChunkFaultKind kind);

/**
 * @brief Value describing a failure, detached from the exception that carried it
 *
 * Per-chunk reports store ChunkFault values so that one chunk's failure can be
 * recorded while the remaining chunks keep processing.
 */
struct ChunkFault {
  ChunkFaultKind kind = ChunkFaultKind::Io;
  std::string message;
  std::string path; ///< Relative source path or artifact path the fault refers to (may be empty)
  int errno_code = 0;
};

/**
 * @brief Base class of every error raised by archive_chunker
 */
class ChunkerError : public std::runtime_error {
public:
  explicit ChunkerError(ChunkFault fault);

  const ChunkFault &fault() const noexcept { return _fault; }
  ChunkFaultKind kind() const noexcept { return _fault.kind; }

private:
  ChunkFault _fault;
};

/// A catalog path escapes the root, is not normalized, or collides with a directory.
class MalformedPathError : public ChunkerError {
public:
  MalformedPathError(const std::string &path, const std::string &reason);
};

class SourceFileMissingError : public ChunkerError {
public:
  SourceFileMissingError(const std::string &path, int errno_code);
};

class SourceSizeChangedError : public ChunkerError {
public:
  SourceSizeChangedError(const std::string &path, uint64_t expected_size, uint64_t actual_size);

  uint64_t expected_size() const noexcept { return _expected_size; }
  uint64_t actual_size() const noexcept { return _actual_size; }

private:
  uint64_t _expected_size;
  uint64_t _actual_size;
};

/// The verifier could not open or parse a built archive.
class ArchiveCorruptError : public ChunkerError {
public:
  ArchiveCorruptError(const std::string &archive_path, const std::string &detail);
};

class ArchiveWriteError : public ChunkerError {
public:
  ArchiveWriteError(const std::string &archive_path, const std::string &detail);
};

class OutputExistsError : public ChunkerError {
public:
  explicit OutputExistsError(const std::string &path);
};

class CancelledError : public ChunkerError {
public:
  explicit CancelledError(const std::string &message);
};

class IoError : public ChunkerError {
public:
  IoError(const std::string &message, const std::string &path, int errno_code = 0);
};

class ConfigError : public ChunkerError {
public:
  explicit ConfigError(const std::string &message);
};

/// An object store request failed or was refused; path is the object key.
class TransferError : public ChunkerError {
public:
  TransferError(const std::string &message, const std::string &key);
};

std::string format_errno_error(const std::string &prefix, int err);
std::string format_path_errno_error(const std::string &prefix, const std::string &path, int err);

} // namespace archive_chunker
