// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/listing_format.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

namespace archive_chunker {

struct UploadSettings {
  std::string endpoint_url; ///< Falls back to ARCHIVER_S3_ENDPOINT_URL when empty
  std::string bucket = "project-archive";
  std::string project;      ///< Key prefix: <project>/ChunkNNNNNNN.zip
  std::string region = "us-east-1";
};

struct RunOptions {
  std::filesystem::path input_dir;
  std::filesystem::path output_dir;
  ChunkerSettings chunker;
  std::size_t workers = 0; ///< 0 resolves to default_worker_count()
  DictionaryFormat dictionary_format = DictionaryFormat::Text;
  std::optional<std::string> entry_prefix; ///< Unset: final component of input_dir
  bool render_web_view = true;
  std::optional<UploadSettings> upload;
};

/// Hardware concurrency, at least 1.
std::size_t default_worker_count();

/// Worker count actually used for @p options.
std::size_t resolved_worker_count(const RunOptions &options);

/// Entry prefix actually used for @p options.
std::string resolved_entry_prefix(const RunOptions &options);

/**
 * @brief Overlay a JSON configuration file on @p base
 *
 * Recognised keys: input_dir, output_dir, target_chunk_size_bytes,
 * target_chunk_size_mb, min_chunk_size_factor, max_chunk_size_factor,
 * workers, dictionary_format, entry_prefix (string or null), web_view,
 * upload {endpoint_url, bucket, project, region}.
 *
 * @throws ConfigError for unreadable files, invalid JSON, unknown keys or wrong types
 */
RunOptions load_run_options_file(const std::filesystem::path &path, RunOptions base = {});

/// @throws ConfigError
void validate_run_options(const RunOptions &options);

/**
 * @brief Checks for re-running the completeness check on an existing output root
 *
 * Only the output directory is read. The input directory is required only
 * when no explicit entry prefix is set, since it is then the prefix source.
 * @throws ConfigError
 */
void validate_recheck_options(const RunOptions &options);

} // namespace archive_chunker
