// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <archive.h>
#include <archive_entry.h>

#include <cstdio>
#include <memory>
#include <string>

namespace archive_chunker {

struct ArchiveWriteDeleter {
  void operator()(struct archive *ar) const noexcept {
    if (ar) {
      archive_write_free(ar);
    }
  }
};

struct ArchiveReadDeleter {
  void operator()(struct archive *ar) const noexcept {
    if (ar) {
      archive_read_free(ar);
    }
  }
};

struct ArchiveEntryDeleter {
  void operator()(struct archive_entry *entry) const noexcept {
    if (entry) {
      archive_entry_free(entry);
    }
  }
};

struct FileCloser {
  void operator()(FILE *handle) const noexcept {
    if (handle) {
      std::fclose(handle);
    }
  }
};

using archive_write_ptr = std::unique_ptr<struct archive, ArchiveWriteDeleter>;
using archive_read_ptr = std::unique_ptr<struct archive, ArchiveReadDeleter>;
using archive_entry_ptr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;
using file_ptr = std::unique_ptr<FILE, FileCloser>;

inline std::string archive_error_text(struct archive *ar) {
  const char *message = ar ? archive_error_string(ar) : nullptr;
  return message ? std::string(message) : std::string("unknown libarchive error");
}

} // namespace archive_chunker
