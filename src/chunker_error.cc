// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunker_error.h"

#include <system_error>
#include <utility>

namespace archive_chunker {

namespace {

ChunkFault make_fault(ChunkFaultKind kind, std::string message, std::string path = {}, int errno_code = 0) {
  ChunkFault fault;
  fault.kind = kind;
  fault.message = std::move(message);
  fault.path = std::move(path);
  fault.errno_code = errno_code;
  return fault;
}

} // namespace

const char *chunk_fault_kind_name(ChunkFaultKind kind) {
  switch (kind) {
  case ChunkFaultKind::MalformedPath:
    return "MalformedPathError";
  case ChunkFaultKind::SourceFileMissing:
    return "SourceFileMissingError";
  case ChunkFaultKind::SourceSizeChanged:
    return "SourceSizeChangedError";
  case ChunkFaultKind::ArchiveCorrupt:
    return "ArchiveCorruptError";
  case ChunkFaultKind::ArchiveWrite:
    return "ArchiveWriteError";
  case ChunkFaultKind::OutputExists:
    return "OutputExistsError";
  case ChunkFaultKind::Cancelled:
    return "Cancelled";
  case ChunkFaultKind::Io:
    return "IoError";
  case ChunkFaultKind::Config:
    return "ConfigError";
  case ChunkFaultKind::Transfer:
    return "TransferError";
  }
  return "UnknownError";
}

ChunkerError::ChunkerError(ChunkFault fault)
    : std::runtime_error(fault.message)
    , _fault(std::move(fault)) {}

MalformedPathError::MalformedPathError(const std::string &path, const std::string &reason)
    : ChunkerError(make_fault(ChunkFaultKind::MalformedPath, "Malformed path '" + path + "': " + reason, path)) {}

SourceFileMissingError::SourceFileMissingError(const std::string &path, int errno_code)
    : ChunkerError(make_fault(ChunkFaultKind::SourceFileMissing, format_path_errno_error("Source file missing", path, errno_code), path, errno_code)) {}

SourceSizeChangedError::SourceSizeChangedError(const std::string &path, uint64_t expected_size, uint64_t actual_size)
    : ChunkerError(make_fault(ChunkFaultKind::SourceSizeChanged,
                              "Source file size changed: " + path + " (catalog " + std::to_string(expected_size) + " bytes, now " + std::to_string(actual_size) + " bytes)",
                              path))
    , _expected_size(expected_size)
    , _actual_size(actual_size) {}

ArchiveCorruptError::ArchiveCorruptError(const std::string &archive_path, const std::string &detail)
    : ChunkerError(make_fault(ChunkFaultKind::ArchiveCorrupt, "Archive " + archive_path + " cannot be read: " + detail, archive_path)) {}

ArchiveWriteError::ArchiveWriteError(const std::string &archive_path, const std::string &detail)
    : ChunkerError(make_fault(ChunkFaultKind::ArchiveWrite, "Failed to write archive " + archive_path + ": " + detail, archive_path)) {}

OutputExistsError::OutputExistsError(const std::string &path)
    : ChunkerError(make_fault(ChunkFaultKind::OutputExists, "Output file already exists (resume is not supported): " + path, path)) {}

CancelledError::CancelledError(const std::string &message)
    : ChunkerError(make_fault(ChunkFaultKind::Cancelled, message)) {}

IoError::IoError(const std::string &message, const std::string &path, int errno_code)
    : ChunkerError(make_fault(ChunkFaultKind::Io, message, path, errno_code)) {}

ConfigError::ConfigError(const std::string &message)
    : ChunkerError(make_fault(ChunkFaultKind::Config, message)) {}

TransferError::TransferError(const std::string &message, const std::string &key)
    : ChunkerError(make_fault(ChunkFaultKind::Transfer, message, key)) {}

std::string format_errno_error(const std::string &prefix, int err) {
  if (err == 0) {
    return prefix;
  }
  return prefix + ": " + std::error_code(err, std::generic_category()).message();
}

std::string format_path_errno_error(const std::string &prefix, const std::string &path, int err) {
  std::string message = prefix;
  if (!path.empty()) {
    message += " (" + path + ")";
  }
  return format_errno_error(message, err);
}

} // namespace archive_chunker
