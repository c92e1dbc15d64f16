// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace archive_chunker {

/**
 * @brief One scanned source file
 *
 * relative_path is slash-separated, rooted at the archive input directory and
 * unique within a catalog.
 */
struct FileRecord {
  std::string relative_path;
  uint64_t size_bytes = 0;
  int64_t last_modified = 0; ///< Seconds since the Unix epoch
};

inline bool operator==(const FileRecord &lhs, const FileRecord &rhs) {
  return lhs.relative_path == rhs.relative_path && lhs.size_bytes == rhs.size_bytes && lhs.last_modified == rhs.last_modified;
}

inline bool operator!=(const FileRecord &lhs, const FileRecord &rhs) { return !(lhs == rhs); }

/// Ordered, read-only collection of every scanned file.
using FileCatalog = std::vector<FileRecord>;

uint64_t catalog_total_size(const FileCatalog &catalog);

} // namespace archive_chunker
