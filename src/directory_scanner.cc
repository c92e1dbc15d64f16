// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/directory_scanner.h"
#include "archive_chunker/chunker_error.h"

#include <algorithm>
#include <cerrno>
#include <string>
#include <sys/stat.h>
#include <system_error>
#include <utility>
#include <vector>

namespace archive_chunker {

namespace {

struct PendingDirectory {
  std::filesystem::path absolute;
  std::string relative; ///< Empty for the root
};

std::string join_relative(const std::string &parent, const std::string &name) { return parent.empty() ? name : parent + "/" + name; }

} // namespace

FileCatalog scan_directory(const std::filesystem::path &root, ScanStats *stats, const ScanProgressCallback &progress) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec) || ec) {
    throw IoError(format_path_errno_error("Input is not a readable directory", root.string(), ec.value()), root.string(), ec.value());
  }

  ScanStats local;
  FileCatalog catalog;
  std::vector<PendingDirectory> pending;
  pending.push_back({ root, std::string() });

  while (!pending.empty()) {
    PendingDirectory current = std::move(pending.back());
    pending.pop_back();
    ++local.directories;

    std::filesystem::directory_iterator it(current.absolute, ec);
    std::filesystem::directory_iterator end;
    if (ec) {
      throw IoError(format_path_errno_error("Failed to list directory", current.absolute.string(), ec.value()), current.absolute.string(),
                    ec.value());
    }

    for (; it != end; it.increment(ec)) {
      if (ec) {
        break;
      }
      const std::filesystem::path &entry_path = it->path();
      const std::string name = entry_path.filename().string();
      const std::string relative = join_relative(current.relative, name);

      struct stat st;
      errno = 0;
      if (::lstat(entry_path.c_str(), &st) != 0) {
        const int err = errno;
        throw IoError(format_path_errno_error("Failed to stat", entry_path.string(), err), relative, err);
      }

      if (S_ISDIR(st.st_mode)) {
        pending.push_back({ entry_path, relative });
      } else if (S_ISREG(st.st_mode)) {
        FileRecord record;
        record.relative_path = relative;
        record.size_bytes = static_cast<uint64_t>(st.st_size);
        record.last_modified = static_cast<int64_t>(st.st_mtime);
        local.bytes += record.size_bytes;
        ++local.files;
        catalog.push_back(std::move(record));
      } else {
        ++local.skipped;
      }
    }
    if (ec) {
      throw IoError(format_path_errno_error("Failed to read directory", current.absolute.string(), ec.value()), current.absolute.string(),
                    ec.value());
    }

    if (progress) {
      progress(local);
    }
  }

  std::sort(catalog.begin(), catalog.end(), [](const FileRecord &lhs, const FileRecord &rhs) { return lhs.relative_path < rhs.relative_path; });

  if (stats) {
    *stats = local;
  }
  return catalog;
}

} // namespace archive_chunker
