// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/file_record.h"

#include <cstdint>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace archive_chunker {

/**
 * @brief One directory of the catalog tree
 *
 * Parents own their children. direct_files points into the FileCatalog the
 * tree was built from, so the catalog must outlive the tree. Both maps are
 * keyed by entry name, which gives the lexicographic order planning relies on.
 */
struct DirectoryNode {
  std::string path; ///< Relative path, empty for the root
  std::string name; ///< Final path component, empty for the root
  std::map<std::string, const FileRecord *> direct_files;
  std::map<std::string, std::unique_ptr<DirectoryNode>> child_directories;
  uint64_t subtree_size = 0; ///< Sum of every file size at or below this node

  DirectoryNode() = default;
  DirectoryNode(std::string node_path, std::string node_name);
  ~DirectoryNode();

  DirectoryNode(const DirectoryNode &) = delete;
  DirectoryNode &operator=(const DirectoryNode &) = delete;

  /// Total size of the leaf-group (files directly inside this directory).
  uint64_t direct_size() const;
};

/**
 * @brief Split a catalog path into its components
 * @throws MalformedPathError for absolute paths, empty, "." or ".." segments,
 *         and control characters that cannot appear in a listing line
 */
std::vector<std::string> split_relative_path(const std::string &path);

/**
 * @brief Organize a flat catalog into a directory tree
 *
 * Inserts every record, then fills subtree_size with one iterative post-order
 * pass. Deep trees do not consume native stack.
 *
 * @throws MalformedPathError when a path is malformed, duplicated, or a file
 *         name collides with a directory name
 */
std::unique_ptr<DirectoryNode> build_directory_tree(const FileCatalog &catalog);

/// Count of directory nodes in the tree, root included.
std::size_t count_directories(const DirectoryNode &root);

} // namespace archive_chunker
