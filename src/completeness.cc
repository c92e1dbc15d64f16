// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/completeness.h"
#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunker_error.h"

#include <algorithm>
#include <sstream>
#include <unordered_map>

namespace archive_chunker {

namespace {

constexpr const char *kSuccessSentinel = "CompleteSuccess.txt";
constexpr const char *kErrorSentinel = "CompleteError.txt";
constexpr const char *kFullListingName = "FullListing.txt";

struct ListedFile {
  uint64_t size_bytes;
  uint32_t chunk_id;
  bool matched;
};

} // namespace

std::string CompletenessReport::sentinel_file_name() const { return success() ? kSuccessSentinel : kErrorSentinel; }

std::string CompletenessReport::to_text() const {
  std::ostringstream oss;
  oss << (success() ? "COMPLETE SUCCESS" : "COMPLETE ERROR") << "\n\n";
  oss << "Files in full listing: " << catalog_files << " (" << bytes_to_human(catalog_bytes) << ", " << catalog_bytes << " bytes)\n";
  oss << "Files in chunk listings: " << listed_files << " (" << bytes_to_human(listed_bytes) << ", " << listed_bytes << " bytes)\n\n";

  if (success()) {
    oss << "Every file in the full listing is present in exactly one verified chunk with the correct size.\n";
    return oss.str();
  }

  for (const std::string &note : notes) {
    oss << note << "\n";
  }
  if (!notes.empty()) {
    oss << "\n";
  }
  if (!failed_chunks.empty()) {
    oss << "Chunks that failed: " << failed_chunks.size() << "\n";
    for (const ChunkFailure &failure : failed_chunks) {
      oss << "  chunk " << failure.chunk_id << ": " << failure.message << "\n";
    }
    oss << "\n";
  }
  if (!discrepancies.empty()) {
    oss << "Discrepancies: " << discrepancies.size() << "\n";
    for (const Discrepancy &discrepancy : discrepancies) {
      oss << "  " << discrepancy.describe() << "\n";
    }
  }
  return oss.str();
}

CompletenessReport check_completeness(const std::vector<ChunkListing> &listings, const FileCatalog &catalog) {
  CompletenessReport report;
  report.catalog_files = catalog.size();
  report.catalog_bytes = catalog_total_size(catalog);

  std::unordered_map<std::string, ListedFile> listed;
  for (const ChunkListing &listing : listings) {
    if (!listing.verified) {
      report.failed_chunks.push_back({ listing.chunk_id, listing.failure.empty() ? "verification did not pass" : listing.failure });
    }
    for (const ListingEntry &entry : listing.entries) {
      ++report.listed_files;
      report.listed_bytes += entry.size_bytes;
      if (!listed.emplace(entry.path, ListedFile{ entry.size_bytes, listing.chunk_id, false }).second) {
        Discrepancy duplicate;
        duplicate.kind = DiscrepancyKind::Duplicate;
        duplicate.path = entry.path;
        duplicate.actual_size = entry.size_bytes;
        duplicate.chunk_id = listing.chunk_id;
        report.discrepancies.push_back(std::move(duplicate));
      }
    }
  }

  for (const FileRecord &record : catalog) {
    const auto it = listed.find(record.relative_path);
    if (it == listed.end()) {
      Discrepancy missing;
      missing.kind = DiscrepancyKind::Missing;
      missing.path = record.relative_path;
      missing.expected_size = record.size_bytes;
      report.discrepancies.push_back(std::move(missing));
      continue;
    }
    it->second.matched = true;
    if (it->second.size_bytes != record.size_bytes) {
      Discrepancy mismatch;
      mismatch.kind = DiscrepancyKind::SizeMismatch;
      mismatch.path = record.relative_path;
      mismatch.expected_size = record.size_bytes;
      mismatch.actual_size = it->second.size_bytes;
      mismatch.chunk_id = it->second.chunk_id;
      report.discrepancies.push_back(std::move(mismatch));
    }
  }

  std::vector<Discrepancy> extras;
  for (const auto &item : listed) {
    if (item.second.matched) {
      continue;
    }
    Discrepancy unexpected;
    unexpected.kind = DiscrepancyKind::Unexpected;
    unexpected.path = item.first;
    unexpected.actual_size = item.second.size_bytes;
    unexpected.chunk_id = item.second.chunk_id;
    extras.push_back(std::move(unexpected));
  }
  std::sort(extras.begin(), extras.end(), [](const Discrepancy &lhs, const Discrepancy &rhs) { return lhs.path < rhs.path; });
  report.discrepancies.insert(report.discrepancies.end(), extras.begin(), extras.end());

  report.status = (report.discrepancies.empty() && report.failed_chunks.empty()) ? CompletenessStatus::CompleteSuccess
                                                                                 : CompletenessStatus::CompleteError;
  return report;
}

void add_completeness_note(CompletenessReport &report, const std::string &note) {
  report.notes.push_back(note);
  report.status = CompletenessStatus::CompleteError;
}

std::filesystem::path write_completeness_sentinel(const std::filesystem::path &output_root, const CompletenessReport &report) {
  std::error_code ec;
  for (const char *name : { kSuccessSentinel, kErrorSentinel }) {
    const std::filesystem::path existing = output_root / name;
    if (std::filesystem::exists(existing, ec)) {
      throw OutputExistsError(existing.string());
    }
  }
  const std::filesystem::path path = output_root / report.sentinel_file_name();
  write_text_file(path, report.to_text());
  return path;
}

std::vector<ChunkListing> load_chunk_listings(const std::filesystem::path &chunks_dir, uint32_t chunk_count, const std::string &entry_prefix) {
  std::vector<ChunkListing> listings;
  listings.reserve(chunk_count);
  for (uint32_t chunk_id = 1; chunk_id <= chunk_count; ++chunk_id) {
    const ChunkArtifactPaths paths = chunk_artifact_paths(chunks_dir, chunk_id);
    ChunkListing listing;
    listing.chunk_id = chunk_id;

    std::error_code ec;
    if (!std::filesystem::exists(paths.listing, ec)) {
      listing.failure = "listing file " + paths.listing.filename().string() + " is missing";
      listings.push_back(std::move(listing));
      continue;
    }
    listing.entries = read_listing_file(paths.listing, entry_prefix);

    const bool has_check = std::filesystem::exists(paths.check, ec);
    const bool has_error = std::filesystem::exists(paths.error, ec);
    listing.verified = has_check && !has_error;
    if (has_error) {
      listing.failure = "error file " + paths.error.filename().string() + " present";
    } else if (!has_check) {
      listing.failure = "check file " + paths.check.filename().string() + " is missing";
    }
    listings.push_back(std::move(listing));
  }
  return listings;
}

uint32_t find_chunk_count(const std::filesystem::path &chunks_dir) {
  uint32_t highest = 0;
  std::error_code ec;
  for (std::filesystem::directory_iterator it(chunks_dir, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    if (name.size() < 12 || name.compare(0, 5, "Chunk") != 0) {
      continue;
    }
    const std::string digits = name.substr(5, 7);
    if (!std::all_of(digits.begin(), digits.end(), [](char ch) { return ch >= '0' && ch <= '9'; })) {
      continue;
    }
    const std::string suffix = name.substr(12);
    if (suffix != ".zip" && suffix != "Listing.txt") {
      continue;
    }
    highest = std::max(highest, static_cast<uint32_t>(std::stoul(digits)));
  }
  return highest;
}

CompletenessReport recheck_output_root(const std::filesystem::path &output_root, const std::string &entry_prefix) {
  FileCatalog catalog;
  for (ListingEntry &entry : read_listing_file(output_root / kFullListingName, entry_prefix)) {
    catalog.push_back(FileRecord{ std::move(entry.path), entry.size_bytes, entry.last_modified });
  }
  const std::filesystem::path chunks_dir = output_root / "Chunks";
  const std::vector<ChunkListing> listings = load_chunk_listings(chunks_dir, find_chunk_count(chunks_dir), entry_prefix);
  return check_completeness(listings, catalog);
}

} // namespace archive_chunker
