// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/discrepancy.h"
#include "archive_chunker/file_record.h"
#include "archive_chunker/listing_format.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archive_chunker {

/// Entries one chunk reports holding, plus whether that chunk passed its own verification.
struct ChunkListing {
  uint32_t chunk_id = 0;
  std::vector<ListingEntry> entries;
  bool verified = false;
  std::string failure; ///< Why the chunk is not verified (empty when verified)
};

enum class CompletenessStatus {
  CompleteSuccess,
  CompleteError,
};

struct ChunkFailure {
  uint32_t chunk_id = 0;
  std::string message;
};

struct CompletenessReport {
  CompletenessStatus status = CompletenessStatus::CompleteError;
  std::size_t catalog_files = 0;
  uint64_t catalog_bytes = 0;
  std::size_t listed_files = 0;
  uint64_t listed_bytes = 0;
  std::vector<Discrepancy> discrepancies;
  std::vector<ChunkFailure> failed_chunks;
  std::vector<std::string> notes; ///< Run-level reasons for failure (cancellation, upload errors)

  bool success() const { return status == CompletenessStatus::CompleteSuccess; }

  /// CompleteSuccess.txt or CompleteError.txt
  std::string sentinel_file_name() const;

  std::string to_text() const;
};

/**
 * @brief Reconcile every chunk listing against the full catalog
 *
 * Paths are compared as a set keyed by relative path with size. Any missing,
 * extra, duplicated or resized path, and any chunk that failed verification,
 * makes the outcome CompleteError.
 */
CompletenessReport check_completeness(const std::vector<ChunkListing> &listings, const FileCatalog &catalog);

/// Downgrade @p report to CompleteError with a run-level note.
void add_completeness_note(CompletenessReport &report, const std::string &note);

/**
 * @brief Write the terminal sentinel into @p output_root
 * @throws OutputExistsError when either sentinel already exists
 */
std::filesystem::path write_completeness_sentinel(const std::filesystem::path &output_root, const CompletenessReport &report);

/**
 * @brief Rebuild chunk listings from persisted artifacts
 *
 * A chunk counts as verified when its check file exists and no error file
 * does. A chunk without a listing file is reported as failed.
 */
std::vector<ChunkListing> load_chunk_listings(const std::filesystem::path &chunks_dir, uint32_t chunk_count, const std::string &entry_prefix);

/// Highest N for which ChunkNNNNNNN.zip or its listing exists in @p chunks_dir.
uint32_t find_chunk_count(const std::filesystem::path &chunks_dir);

/**
 * @brief Rerun the completeness check from a finished output root
 *
 * FullListing.txt stands in for the catalog and the per-chunk listings under
 * Chunks/ are read back. Nothing is written.
 *
 * @throws IoError when FullListing.txt cannot be read
 */
CompletenessReport recheck_output_root(const std::filesystem::path &output_root, const std::string &entry_prefix);

} // namespace archive_chunker
