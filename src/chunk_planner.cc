// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/listing_format.h"

#include <sstream>
#include <utility>

namespace archive_chunker {

namespace {

struct TraversalItem {
  const DirectoryNode *node;
  bool leaf_group_only; ///< Children already scheduled; only the node's own files remain
};

// Same order as the expansion: children lexicographically, then own files.
void append_subtree_files(const DirectoryNode &root, std::vector<const FileRecord *> &out) {
  std::vector<TraversalItem> stack;
  stack.push_back({ &root, false });
  while (!stack.empty()) {
    const TraversalItem item = stack.back();
    stack.pop_back();

    if (item.leaf_group_only) {
      for (const auto &file : item.node->direct_files) {
        out.push_back(file.second);
      }
      continue;
    }

    stack.push_back({ item.node, true });
    const auto &children = item.node->child_directories;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back({ it->second.get(), false });
    }
  }
}

AtomicUnit make_leaf_group_unit(const DirectoryNode &node) {
  AtomicUnit unit;
  unit.kind = AtomicUnitKind::LeafGroup;
  unit.directory = node.path;
  for (const auto &file : node.direct_files) {
    unit.files.push_back(file.second);
    unit.size += file.second->size_bytes;
  }
  return unit;
}

AtomicUnit make_subtree_unit(const DirectoryNode &node) {
  AtomicUnit unit;
  unit.kind = AtomicUnitKind::WholeSubtree;
  unit.directory = node.path;
  append_subtree_files(node, unit.files);
  unit.size = node.subtree_size;
  return unit;
}

struct OpenChunk {
  ChunkPlan plan;
  std::size_t unit_count = 0;
};

} // namespace

uint64_t ChunkerSettings::min_target_size_bytes() const {
  return static_cast<uint64_t>(static_cast<double>(target_size_bytes) * min_chunk_size_factor);
}

uint64_t ChunkerSettings::max_target_size_bytes() const {
  return static_cast<uint64_t>(static_cast<double>(target_size_bytes) * max_chunk_size_factor);
}

void validate_chunker_settings(const ChunkerSettings &settings) {
  if (settings.target_size_bytes == 0) {
    throw ConfigError("Target chunk size must be greater than zero");
  }
  if (!(settings.min_chunk_size_factor >= 0.0) || settings.min_chunk_size_factor > 1.0) {
    throw ConfigError("Minimum chunk size factor must be within [0, 1]");
  }
  if (!(settings.max_chunk_size_factor >= 1.0)) {
    throw ConfigError("Maximum chunk size factor must be at least 1");
  }
  if (settings.min_chunk_size_factor >= settings.max_chunk_size_factor) {
    throw ConfigError("Minimum chunk size factor must be below the maximum factor");
  }
}

std::string describe_chunker_settings(const ChunkerSettings &settings) {
  std::ostringstream oss;
  oss << "Target chunk size: " << bytes_to_human(settings.target_size_bytes) << "\n";
  oss << "Target max chunk size: " << bytes_to_human(settings.max_target_size_bytes()) << "\n";
  oss << "Target min chunk size: " << bytes_to_human(settings.min_target_size_bytes()) << "\n";
  oss << "Both limits may be exceeded: individual files are never split across chunks.";
  return oss.str();
}

std::string SizeDeviationWarning::describe(const ChunkerSettings &settings) const {
  std::ostringstream oss;
  oss << "Chunk " << chunk_id << " holds " << bytes_to_human(total_size);
  if (deviation == SizeDeviation::BelowMinimum) {
    oss << ", below the minimum of " << bytes_to_human(settings.min_target_size_bytes());
  } else {
    oss << ", above the maximum of " << bytes_to_human(settings.max_target_size_bytes());
  }
  if (single_oversize_unit) {
    oss << " (single atomic unit larger than the target, cannot be reduced)";
  }
  return oss.str();
}

std::vector<AtomicUnit> expand_atomic_units(const DirectoryNode &root, const ChunkerSettings &settings) {
  const uint64_t whole_limit = settings.max_target_size_bytes();

  std::vector<AtomicUnit> units;
  std::vector<TraversalItem> stack;
  stack.push_back({ &root, false });
  while (!stack.empty()) {
    const TraversalItem item = stack.back();
    stack.pop_back();
    const DirectoryNode &node = *item.node;

    if (item.leaf_group_only) {
      if (!node.direct_files.empty()) {
        units.push_back(make_leaf_group_unit(node));
      }
      continue;
    }

    if (node.subtree_size <= whole_limit) {
      AtomicUnit unit = make_subtree_unit(node);
      if (!unit.files.empty()) {
        units.push_back(std::move(unit));
      }
      continue;
    }

    stack.push_back({ &node, true });
    const auto &children = node.child_directories;
    for (auto it = children.rbegin(); it != children.rend(); ++it) {
      stack.push_back({ it->second.get(), false });
    }
  }
  return units;
}

PlanResult plan_chunks(const DirectoryNode &root, const ChunkerSettings &settings) {
  validate_chunker_settings(settings);

  PlanResult result;
  std::vector<std::size_t> unit_counts;
  OpenChunk current;

  const auto close_current = [&]() {
    if (current.plan.entries.empty()) {
      return;
    }
    current.plan.chunk_id = static_cast<uint32_t>(result.chunks.size() + 1);
    for (const FileRecord &entry : current.plan.entries) {
      result.dictionary.emplace(entry.relative_path, current.plan.chunk_id);
    }
    unit_counts.push_back(current.unit_count);
    result.chunks.push_back(std::move(current.plan));
    current = OpenChunk{};
  };

  for (const AtomicUnit &unit : expand_atomic_units(root, settings)) {
    if (!current.plan.entries.empty() && current.plan.total_size + unit.size > settings.target_size_bytes) {
      close_current();
    }
    for (const FileRecord *file : unit.files) {
      current.plan.entries.push_back(*file);
    }
    current.plan.total_size += unit.size;
    ++current.unit_count;
  }
  close_current();

  const uint64_t min_size = settings.min_target_size_bytes();
  const uint64_t max_size = settings.max_target_size_bytes();
  for (std::size_t i = 0; i < result.chunks.size(); ++i) {
    const ChunkPlan &chunk = result.chunks[i];
    if (chunk.total_size >= min_size && chunk.total_size <= max_size) {
      continue;
    }
    SizeDeviationWarning warning;
    warning.chunk_id = chunk.chunk_id;
    warning.total_size = chunk.total_size;
    warning.deviation = chunk.total_size < min_size ? SizeDeviation::BelowMinimum : SizeDeviation::AboveMaximum;
    warning.single_oversize_unit = unit_counts[i] == 1 && chunk.total_size > settings.target_size_bytes;
    result.warnings.push_back(warning);
  }

  return result;
}

PlanResult plan_chunks(const FileCatalog &catalog, const ChunkerSettings &settings) {
  const std::unique_ptr<DirectoryNode> root = build_directory_tree(catalog);
  return plan_chunks(*root, settings);
}

} // namespace archive_chunker
