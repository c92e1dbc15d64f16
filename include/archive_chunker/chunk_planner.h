// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/directory_tree.h"
#include "archive_chunker/file_record.h"

#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace archive_chunker {

constexpr uint64_t kDefaultTargetChunkSize = 1024ull * 1024ull * 1024ull;

struct ChunkerSettings {
  uint64_t target_size_bytes = kDefaultTargetChunkSize;
  double min_chunk_size_factor = 0.5; ///< Lower edge of the deviation tolerance band
  double max_chunk_size_factor = 1.5; ///< Upper edge of the deviation tolerance band

  uint64_t min_target_size_bytes() const;
  uint64_t max_target_size_bytes() const;
};

/// @throws ConfigError when the target is zero or the band does not contain the target
void validate_chunker_settings(const ChunkerSettings &settings);

/// Multi-line human readable summary of the target and band.
std::string describe_chunker_settings(const ChunkerSettings &settings);

struct ChunkPlan {
  uint32_t chunk_id = 0; ///< 1-based, sequential
  std::vector<FileRecord> entries;
  uint64_t total_size = 0;
};

/// relative_path -> chunk_id for every cataloged file.
using ChunkDictionary = std::map<std::string, uint32_t>;

enum class AtomicUnitKind {
  WholeSubtree, ///< A directory subtree small enough to stay in one piece
  LeafGroup,    ///< The files directly inside one directory that had to be expanded
};

/**
 * @brief Indivisible packing unit produced by expanding the tree
 */
struct AtomicUnit {
  AtomicUnitKind kind = AtomicUnitKind::LeafGroup;
  std::string directory; ///< Directory the unit was taken from (empty for the root)
  std::vector<const FileRecord *> files;
  uint64_t size = 0;
};

enum class SizeDeviation {
  BelowMinimum,
  AboveMaximum,
};

struct SizeDeviationWarning {
  uint32_t chunk_id = 0;
  uint64_t total_size = 0;
  SizeDeviation deviation = SizeDeviation::BelowMinimum;
  bool single_oversize_unit = false; ///< The chunk is one atomic unit larger than the target

  std::string describe(const ChunkerSettings &settings) const;
};

struct PlanResult {
  std::vector<ChunkPlan> chunks;
  ChunkDictionary dictionary;
  std::vector<SizeDeviationWarning> warnings;
};

/**
 * @brief Flatten the tree into the ordered sequence of atomic units
 *
 * Depth-first, children in lexicographic order, then the node's own
 * leaf-group. A node whose subtree fits under the upper band edge is emitted
 * whole and not descended into. Units without files are omitted.
 */
std::vector<AtomicUnit> expand_atomic_units(const DirectoryNode &root, const ChunkerSettings &settings);

/**
 * @brief Partition the tree into chunk plans
 *
 * Packs the atomic units in order, closing the current chunk before a unit
 * that would push it past the target. A unit larger than the target still
 * lands in a chunk of its own; files are never split. Chunks outside the
 * tolerance band are reported in PlanResult::warnings, never rejected.
 *
 * @throws ConfigError for invalid settings
 */
PlanResult plan_chunks(const DirectoryNode &root, const ChunkerSettings &settings);

/// Builds the tree from @p catalog and plans it. @throws MalformedPathError
PlanResult plan_chunks(const FileCatalog &catalog, const ChunkerSettings &settings);

} // namespace archive_chunker
