// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/discrepancy.h"
#include "archive_chunker/listing_format.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archive_chunker {

struct VerificationReport {
  uint32_t chunk_id = 0;
  std::filesystem::path archive_path;
  std::size_t planned_files = 0;
  uint64_t planned_bytes = 0;
  std::vector<ListingEntry> archive_entries; ///< Regular-file entries read back from the archive, in archive order
  uint64_t archive_bytes = 0;                ///< Sum of uncompressed sizes read back
  std::vector<Discrepancy> discrepancies;

  bool passed() const { return discrepancies.empty(); }

  /// Text persisted as ChunkNNNNNNNCheck.txt.
  std::string to_text() const;
};

/**
 * @brief Reopen a built archive and compare its entries with the plan
 *
 * Every planned path must be stored exactly once with its recorded size and
 * nothing else may be stored. Directory entries are ignored. Content is not
 * compared byte for byte.
 *
 * @throws ArchiveCorruptError when the archive cannot be opened or parsed
 */
VerificationReport verify_chunk(const ChunkPlan &plan, const std::filesystem::path &archive_path, const std::string &entry_prefix,
                                const CancellationToken *cancel = nullptr);

inline VerificationReport verify_chunk(const ChunkArtifact &artifact, const ChunkPlan &plan, const std::string &entry_prefix,
                                       const CancellationToken *cancel = nullptr) {
  return verify_chunk(plan, artifact.archive_path, entry_prefix, cancel);
}

} // namespace archive_chunker
