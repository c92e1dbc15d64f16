// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/file_record.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>

namespace archive_chunker {

struct ScanStats {
  std::size_t files = 0;
  std::size_t directories = 0;
  std::size_t skipped = 0; ///< Symlinks, sockets, devices and other non-regular entries
  uint64_t bytes = 0;
};

using ScanProgressCallback = std::function<void(const ScanStats &)>;

/**
 * @brief Walk @p root and catalog every regular file below it
 *
 * Iterative; symlinks are not followed. The catalog is sorted by relative
 * path. @p progress, when set, is called after each directory.
 *
 * @throws IoError when @p root or one of its directories cannot be read
 */
FileCatalog scan_directory(const std::filesystem::path &root, ScanStats *stats = nullptr, const ScanProgressCallback &progress = {});

} // namespace archive_chunker
