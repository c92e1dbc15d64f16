// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/file_record.h"

#include <nlohmann/json.hpp>

#include <filesystem>
#include <string>

namespace archive_chunker {

/**
 * @brief Browsable map of the catalog
 *
 * {"rootFolderId": "0", "fileMap": {id: node}} where every node carries id,
 * name, isDir, parentId, childrenIds, size and presentInChunks. A folder's
 * presentInChunks is the sorted union of its descendants' chunks. Ids are
 * assigned in a deterministic pre-order walk.
 *
 * @throws MalformedPathError for catalogs build_directory_tree() rejects
 */
nlohmann::json build_file_map(const FileCatalog &catalog, const ChunkDictionary &dictionary, const std::string &root_name);

/// Writes FileMap.json and a self-contained index.html into @p web_dir (created if missing).
void render_web_view(const std::filesystem::path &web_dir, const FileCatalog &catalog, const ChunkDictionary &dictionary,
                     const std::string &root_name);

} // namespace archive_chunker
