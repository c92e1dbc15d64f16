// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_verifier.h"
#include "archive_chunker/chunker_error.h"
#include "archive_handles.h"

#include <sstream>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace archive_chunker {

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;

// Used only when the archive does not record the uncompressed size.
uint64_t count_entry_bytes(struct archive *ar, const std::string &archive_path) {
  std::vector<char> buffer(kReadBlockSize);
  uint64_t total = 0;
  while (true) {
    const la_ssize_t bytes_read = archive_read_data(ar, buffer.data(), buffer.size());
    if (bytes_read < 0) {
      throw ArchiveCorruptError(archive_path, archive_error_text(ar));
    }
    if (bytes_read == 0) {
      break;
    }
    total += static_cast<uint64_t>(bytes_read);
  }
  return total;
}

std::vector<ListingEntry> read_archive_entries(const std::filesystem::path &archive_path, const CancellationToken *cancel) {
  const std::string path_text = archive_path.string();

  archive_read_ptr ar(archive_read_new());
  if (!ar) {
    throw ArchiveCorruptError(path_text, "archive_read_new failed");
  }
  archive_read_support_format_zip(ar.get());
  if (archive_read_open_filename(ar.get(), path_text.c_str(), kReadBlockSize) != ARCHIVE_OK) {
    throw ArchiveCorruptError(path_text, archive_error_text(ar.get()));
  }

  std::vector<ListingEntry> entries;
  while (true) {
    if (cancel) {
      cancel->throw_if_cancelled("verifying " + archive_path.filename().string());
    }

    struct archive_entry *entry = nullptr;
    const int status = archive_read_next_header(ar.get(), &entry);
    if (status == ARCHIVE_EOF) {
      break;
    }
    if (status < ARCHIVE_WARN) {
      throw ArchiveCorruptError(path_text, archive_error_text(ar.get()));
    }

    if (archive_entry_filetype(entry) == AE_IFDIR) {
      archive_read_data_skip(ar.get());
      continue;
    }

    const char *name = archive_entry_pathname(entry);
    if (!name) {
      throw ArchiveCorruptError(path_text, "entry without a path name");
    }

    ListingEntry item;
    item.path = name;
    item.last_modified = static_cast<int64_t>(archive_entry_mtime(entry));
    if (archive_entry_size_is_set(entry)) {
      item.size_bytes = static_cast<uint64_t>(archive_entry_size(entry));
      if (archive_read_data_skip(ar.get()) < ARCHIVE_WARN) {
        throw ArchiveCorruptError(path_text, archive_error_text(ar.get()));
      }
    } else {
      item.size_bytes = count_entry_bytes(ar.get(), path_text);
    }
    entries.push_back(std::move(item));
  }
  return entries;
}

} // namespace

std::string VerificationReport::to_text() const {
  std::ostringstream oss;
  oss << "Chunk " << chunk_id << " archive: " << archive_path.filename().string() << "\n\n";
  oss << "Found " << archive_entries.size() << " files in zip file.\n";
  oss << "Found " << planned_files << " files in input chunk.\n\n";
  oss << "Total size of files in zip file: " << bytes_to_human(archive_bytes) << " (" << archive_bytes << " bytes).\n";
  oss << "Total size of files in input chunk: " << bytes_to_human(planned_bytes) << " (" << planned_bytes << " bytes).\n\n";

  if (passed()) {
    oss << "All files in input chunk are present in zip file.\n\n";
    oss << "All files in zip file have the correct size.\n\n";
    oss << "Checks completed successfully.\n";
    return oss.str();
  }

  oss << "Checks FAILED with " << discrepancies.size() << " discrepancies:\n";
  for (const Discrepancy &discrepancy : discrepancies) {
    oss << "  " << discrepancy.describe() << "\n";
  }
  return oss.str();
}

VerificationReport verify_chunk(const ChunkPlan &plan, const std::filesystem::path &archive_path, const std::string &entry_prefix,
                                const CancellationToken *cancel) {
  VerificationReport report;
  report.chunk_id = plan.chunk_id;
  report.archive_path = archive_path;
  report.planned_files = plan.entries.size();
  report.planned_bytes = plan.total_size;
  report.archive_entries = read_archive_entries(archive_path, cancel);

  std::unordered_map<std::string, uint64_t> stored;
  std::vector<const ListingEntry *> outside_plan;
  std::unordered_set<std::string> planned_paths;
  for (const FileRecord &record : plan.entries) {
    planned_paths.insert(record.relative_path);
  }

  for (ListingEntry &entry : report.archive_entries) {
    report.archive_bytes += entry.size_bytes;

    // Entries outside "<prefix>/" would extract somewhere the listings do not say.
    std::string relative;
    if (!strip_entry_prefix(entry_prefix, entry.path, relative)) {
      outside_plan.push_back(&entry);
      continue;
    }
    entry.path = relative;

    if (!stored.emplace(relative, entry.size_bytes).second) {
      Discrepancy duplicate;
      duplicate.kind = DiscrepancyKind::Duplicate;
      duplicate.path = relative;
      duplicate.actual_size = entry.size_bytes;
      duplicate.chunk_id = plan.chunk_id;
      report.discrepancies.push_back(std::move(duplicate));
      continue;
    }
    if (planned_paths.count(relative) == 0) {
      outside_plan.push_back(&entry);
    }
  }

  for (const FileRecord &record : plan.entries) {
    const auto it = stored.find(record.relative_path);
    if (it == stored.end()) {
      Discrepancy missing;
      missing.kind = DiscrepancyKind::Missing;
      missing.path = record.relative_path;
      missing.expected_size = record.size_bytes;
      report.discrepancies.push_back(std::move(missing));
    } else if (it->second != record.size_bytes) {
      Discrepancy mismatch;
      mismatch.kind = DiscrepancyKind::SizeMismatch;
      mismatch.path = record.relative_path;
      mismatch.expected_size = record.size_bytes;
      mismatch.actual_size = it->second;
      mismatch.chunk_id = plan.chunk_id;
      report.discrepancies.push_back(std::move(mismatch));
    }
  }

  for (const ListingEntry *entry : outside_plan) {
    Discrepancy unexpected;
    unexpected.kind = DiscrepancyKind::Unexpected;
    unexpected.path = entry->path;
    unexpected.actual_size = entry->size_bytes;
    unexpected.chunk_id = plan.chunk_id;
    report.discrepancies.push_back(std::move(unexpected));
  }

  return report;
}

} // namespace archive_chunker
