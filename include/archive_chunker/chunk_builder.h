// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/listing_format.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archive_chunker {

/// Per-chunk artifact locations inside the chunk directory.
struct ChunkArtifactPaths {
  std::filesystem::path archive; ///< ChunkNNNNNNN.zip
  std::filesystem::path listing; ///< ChunkNNNNNNNListing.txt
  std::filesystem::path hash;    ///< ChunkNNNNNNNHash.txt
  std::filesystem::path check;   ///< ChunkNNNNNNNCheck.txt
  std::filesystem::path error;   ///< ChunkNNNNNNNERROR.txt
};

/// "Chunk" followed by the chunk id padded to seven digits.
std::string chunk_base_name(uint32_t chunk_id);

ChunkArtifactPaths chunk_artifact_paths(const std::filesystem::path &chunks_dir, uint32_t chunk_id);

struct ChunkArtifact {
  uint32_t chunk_id = 0;
  std::filesystem::path archive_path;
  std::filesystem::path listing_path;
  std::filesystem::path hash_path;
  std::string digest;                ///< Hex SHA-256 of the archive bytes
  uint64_t archive_size = 0;         ///< Compressed size on disk
  std::vector<ListingEntry> listing; ///< Entries written, as stat'ed at write time
};

struct BuildOptions {
  std::filesystem::path source_root; ///< Directory the relative paths are resolved against
  std::filesystem::path chunks_dir;  ///< Where the per-chunk artifacts are written
  std::string entry_prefix;          ///< Leading directory of every stored entry name (may be empty)
  std::string title_name;            ///< Name shown in the listing header
  const CancellationToken *cancel = nullptr;
};

/**
 * @brief Materialize one chunk plan
 *
 * Writes the deflate zip archive, the listing of the entries actually
 * written, and the SHA-256 of the archive. On any failure the partially
 * written artifacts of this chunk are removed and the error is rethrown;
 * other chunks are not touched.
 *
 * @throws OutputExistsError if an artifact of this chunk already exists
 * @throws SourceFileMissingError, SourceSizeChangedError for source drift
 * @throws ArchiveWriteError, IoError, CancelledError
 */
ChunkArtifact build_chunk(const ChunkPlan &plan, const BuildOptions &options);

} // namespace archive_chunker
