// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/file_record.h"

namespace archive_chunker {

uint64_t catalog_total_size(const FileCatalog &catalog) {
  uint64_t total = 0;
  for (const FileRecord &record : catalog) {
    total += record.size_bytes;
  }
  return total;
}

} // namespace archive_chunker
