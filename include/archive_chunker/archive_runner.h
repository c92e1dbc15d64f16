// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/chunk_verifier.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/completeness.h"
#include "archive_chunker/file_record.h"
#include "archive_chunker/run_options.h"

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <vector>

namespace archive_chunker {

enum class RunStatus {
  CompleteSuccess,
  CompleteError,
  Cancelled,
};

const char *run_status_name(RunStatus status);

/// Everything one worker learned about one chunk.
struct ChunkOutcome {
  uint32_t chunk_id = 0;
  bool attempted = false;
  bool built = false;
  bool verified = false;
  ChunkArtifact artifact;
  std::optional<ChunkFault> fault;
  std::optional<VerificationReport> verification;
  std::optional<UploadResult> upload;

  /// Why the chunk cannot be counted as verified (empty when it can).
  std::string failure_text() const;
};

struct RunSummary {
  RunStatus status = RunStatus::CompleteError;
  std::size_t file_count = 0;
  uint64_t total_bytes = 0;
  std::vector<SizeDeviationWarning> warnings;
  std::vector<ChunkOutcome> chunks;
  CompletenessReport completeness;
  std::filesystem::path sentinel_path;
};

/**
 * @brief Drives one archive run from scan to completeness sentinel
 *
 * Scanning, tree building and planning run on the calling thread. Chunks are
 * then built, verified and (optionally) uploaded on a bounded worker pool;
 * a failing chunk is recorded and the others continue. The run waits for
 * every chunk before reconciling the listings with the catalog.
 *
 * @note cancel() may be called from another thread or a signal handler.
 */
class ArchiveRunner {
public:
  explicit ArchiveRunner(RunOptions options, std::shared_ptr<ChunkUploader> uploader = nullptr);

  ArchiveRunner(const ArchiveRunner &) = delete;
  ArchiveRunner &operator=(const ArchiveRunner &) = delete;

  /**
   * @brief Scan the input directory and archive it
   * @throws ConfigError, IoError, MalformedPathError for failures that stop the run before any chunk is built
   */
  RunSummary run();

  /// Archive an already scanned catalog of the input directory.
  RunSummary run_catalog(const FileCatalog &catalog);

  void cancel() noexcept { _cancel.cancel(); }
  CancellationToken &cancellation_token() noexcept { return _cancel; }
  const RunOptions &options() const noexcept { return _options; }

private:
  void prepare_output_root() const;
  RunSummary execute(const FileCatalog &catalog);
  ChunkOutcome process_chunk(const ChunkPlan &plan, const BuildOptions &build_options) const;

  RunOptions _options;
  std::shared_ptr<ChunkUploader> _uploader;
  CancellationToken _cancel;
};

} // namespace archive_chunker
