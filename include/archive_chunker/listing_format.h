// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/file_record.h"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archive_chunker {

/**
 * @brief Human readable byte count, left-justified to 10 characters
 *
 * "1,020 Bytes", "1.00 KB", "1.40 GB", "1,024.00 TB" (powers of 1024).
 * @throws std::invalid_argument for negative input
 */
std::string bytes_to_human_padded(int64_t n_bytes);

/// bytes_to_human_padded() without the padding.
std::string bytes_to_human(uint64_t n_bytes);

/// Local date of a Unix timestamp as YYYY-MM-DD.
std::string format_last_modified(int64_t last_modified);

/// Current local time as YYYY-MM-DD HH:MM:SS.
std::string format_current_time();

/// Name a relative path is stored under inside a chunk archive.
std::string archive_entry_name(const std::string &entry_prefix, const std::string &relative_path);

/// Inverse of archive_entry_name(); returns false when @p entry_name lies outside the prefix.
bool strip_entry_prefix(const std::string &entry_prefix, const std::string &entry_name, std::string &relative_path);

struct ListingEntry {
  std::string path; ///< Relative path (catalog key)
  uint64_t size_bytes = 0;
  int64_t last_modified = 0;
};

/// "YYYY-MM-DD <size padded> <entry name>  <bytes>"
std::string format_listing_line(const ListingEntry &entry, const std::string &entry_prefix);

/**
 * @brief Parse one line produced by format_listing_line()
 * @return false for header lines and anything else that is not an entry line
 *
 * The parsed path is the stored entry name; last_modified is left at zero
 * because the listing only records the date.
 */
bool parse_listing_line(const std::string &line, ListingEntry &out);

/**
 * @brief Complete listing document: header box followed by one line per entry
 * @param title_name Name shown in the header ("Directory Listing for: ...")
 * @param input_directory Input directory reported in the header
 */
std::string render_listing(const std::string &title_name, const std::string &input_directory, const std::vector<ListingEntry> &entries,
                           const std::string &entry_prefix);

std::vector<ListingEntry> listing_entries_from_catalog(const FileCatalog &catalog);

/**
 * @brief Read a listing file back as (relative path, size) pairs
 * @throws IoError when the file cannot be read
 * @throws MalformedPathError when an entry lies outside @p entry_prefix
 */
std::vector<ListingEntry> read_listing_file(const std::filesystem::path &path, const std::string &entry_prefix);

enum class DictionaryFormat {
  Text,
  Json,
};

/// "text" / "json"; @throws ConfigError for anything else
DictionaryFormat parse_dictionary_format(const std::string &name);
const char *dictionary_format_name(DictionaryFormat format);
std::string dictionary_file_name(DictionaryFormat format);

/// One "Chunk NNNNNNN: <listing line>" per file, chunks separated by blank lines.
std::string render_text_dictionary(const PlanResult &plan, const std::string &entry_prefix);

/// {"files": {path: chunk_id}, "chunks": [{chunk_id, total_size, file_count}]}
std::string render_json_dictionary(const PlanResult &plan);

/// Writes ChunkDictionary.txt or ChunkDictionary.json into @p output_root and returns its path.
std::filesystem::path write_chunk_dictionary(const std::filesystem::path &output_root, const PlanResult &plan, DictionaryFormat format,
                                             const std::string &entry_prefix);

/**
 * @brief Load a persisted dictionary; the format follows the file extension
 * @throws IoError when the file cannot be read or parsed
 */
ChunkDictionary load_chunk_dictionary(const std::filesystem::path &path, const std::string &entry_prefix);

/// @throws IoError
void write_text_file(const std::filesystem::path &path, const std::string &content);

/// @throws IoError
std::string read_text_file(const std::filesystem::path &path);

} // namespace archive_chunker
