// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/cancellation.h"

#include <cstddef>
#include <filesystem>
#include <string>

namespace archive_chunker {

/// Lower-case hex SHA-256 of an in-memory buffer.
std::string sha256_hex(const void *data, std::size_t size);

/**
 * @brief Lower-case hex SHA-256 of a file, streamed in fixed-size blocks
 * @throws IoError when the file cannot be read, CancelledError when @p cancel fires
 */
std::string sha256_file_hex(const std::filesystem::path &path, const CancellationToken *cancel = nullptr);

} // namespace archive_chunker
