// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunker_error.h"
#include "archive_digest.h"
#include "archive_handles.h"

#include <cerrno>
#include <cstdio>
#include <sys/stat.h>
#include <system_error>
#include <vector>

namespace archive_chunker {

namespace {

constexpr std::size_t kCopyBufferSize = 64 * 1024;

bool is_missing_errno(int err) { return err == ENOENT || err == ENOTDIR; }

// Removes this chunk's outputs unless the build reached the end.
class PartialArtifactGuard {
public:
  explicit PartialArtifactGuard(const ChunkArtifactPaths &paths)
      : _paths(paths) {}

  ~PartialArtifactGuard() {
    if (_committed) {
      return;
    }
    std::error_code ec;
    std::filesystem::remove(_paths.archive, ec);
    std::filesystem::remove(_paths.listing, ec);
    std::filesystem::remove(_paths.hash, ec);
  }

  PartialArtifactGuard(const PartialArtifactGuard &) = delete;
  PartialArtifactGuard &operator=(const PartialArtifactGuard &) = delete;

  void commit() noexcept { _committed = true; }

private:
  const ChunkArtifactPaths &_paths;
  bool _committed = false;
};

void ensure_absent(const std::filesystem::path &path) {
  std::error_code ec;
  if (std::filesystem::exists(path, ec) || ec) {
    throw OutputExistsError(path.string());
  }
}

struct stat stat_source(const std::filesystem::path &source, const FileRecord &record) {
  struct stat st;
  errno = 0;
  if (::stat(source.c_str(), &st) != 0) {
    const int err = errno;
    if (is_missing_errno(err)) {
      throw SourceFileMissingError(record.relative_path, err);
    }
    throw IoError(format_path_errno_error("Failed to stat source file", source.string(), err), record.relative_path, err);
  }
  if (!S_ISREG(st.st_mode)) {
    throw SourceFileMissingError(record.relative_path, 0);
  }
  if (static_cast<uint64_t>(st.st_size) != record.size_bytes) {
    throw SourceSizeChangedError(record.relative_path, record.size_bytes, static_cast<uint64_t>(st.st_size));
  }
  return st;
}

class ZipChunkWriter {
public:
  explicit ZipChunkWriter(const std::filesystem::path &archive_path)
      : _archive_path(archive_path.string())
      , _ar(archive_write_new())
      , _buffer(kCopyBufferSize) {
    if (!_ar) {
      throw ArchiveWriteError(_archive_path, "archive_write_new failed");
    }
    check(archive_write_set_format_zip(_ar.get()), "selecting zip format");
    check(archive_write_zip_set_compression_deflate(_ar.get()), "selecting deflate compression");
    check(archive_write_open_filename(_ar.get(), _archive_path.c_str()), "opening archive");
  }

  ListingEntry add_file(const std::filesystem::path &source, const FileRecord &record, const std::string &entry_name,
                        const CancellationToken *cancel) {
    // Catch drift before anything is written for this entry.
    const struct stat st = stat_source(source, record);

    errno = 0;
    file_ptr handle(std::fopen(source.c_str(), "rb"));
    if (!handle) {
      const int err = errno;
      if (is_missing_errno(err)) {
        throw SourceFileMissingError(record.relative_path, err);
      }
      throw IoError(format_path_errno_error("Failed to open source file", source.string(), err), record.relative_path, err);
    }

    archive_entry_ptr entry(archive_entry_new());
    if (!entry) {
      throw ArchiveWriteError(_archive_path, "archive_entry_new failed");
    }
    archive_entry_set_pathname(entry.get(), entry_name.c_str());
    archive_entry_set_filetype(entry.get(), AE_IFREG);
    archive_entry_set_perm(entry.get(), st.st_mode & 07777);
    archive_entry_set_size(entry.get(), static_cast<la_int64_t>(record.size_bytes));
    archive_entry_set_mtime(entry.get(), st.st_mtime, 0);
    check(archive_write_header(_ar.get(), entry.get()), "writing header for " + entry_name);

    uint64_t copied = 0;
    while (true) {
      if (cancel) {
        cancel->throw_if_cancelled("writing " + entry_name);
      }
      const std::size_t bytes_read = std::fread(_buffer.data(), 1, _buffer.size(), handle.get());
      if (bytes_read > 0) {
        copied += bytes_read;
        if (copied > record.size_bytes) {
          throw SourceSizeChangedError(record.relative_path, record.size_bytes, copied);
        }
        const la_ssize_t written = archive_write_data(_ar.get(), _buffer.data(), bytes_read);
        if (written < 0 || static_cast<std::size_t>(written) != bytes_read) {
          throw ArchiveWriteError(_archive_path, "writing data for " + entry_name + ": " + archive_error_text(_ar.get()));
        }
      }
      if (bytes_read < _buffer.size()) {
        if (std::ferror(handle.get())) {
          const int err = errno;
          throw IoError(format_path_errno_error("Failed to read source file", source.string(), err), record.relative_path, err);
        }
        break;
      }
    }
    if (copied != record.size_bytes) {
      throw SourceSizeChangedError(record.relative_path, record.size_bytes, copied);
    }
    check(archive_write_finish_entry(_ar.get()), "finishing " + entry_name);

    return { record.relative_path, copied, static_cast<int64_t>(st.st_mtime) };
  }

  void close() { check(archive_write_close(_ar.get()), "closing archive"); }

private:
  void check(int status, const std::string &action) {
    if (status < ARCHIVE_WARN) {
      throw ArchiveWriteError(_archive_path, action + ": " + archive_error_text(_ar.get()));
    }
  }

  std::string _archive_path;
  archive_write_ptr _ar;
  std::vector<char> _buffer;
};

} // namespace

std::string chunk_base_name(uint32_t chunk_id) {
  char buffer[24];
  std::snprintf(buffer, sizeof(buffer), "Chunk%07u", static_cast<unsigned>(chunk_id));
  return buffer;
}

ChunkArtifactPaths chunk_artifact_paths(const std::filesystem::path &chunks_dir, uint32_t chunk_id) {
  const std::string base = chunk_base_name(chunk_id);
  ChunkArtifactPaths paths;
  paths.archive = chunks_dir / (base + ".zip");
  paths.listing = chunks_dir / (base + "Listing.txt");
  paths.hash = chunks_dir / (base + "Hash.txt");
  paths.check = chunks_dir / (base + "Check.txt");
  paths.error = chunks_dir / (base + "ERROR.txt");
  return paths;
}

ChunkArtifact build_chunk(const ChunkPlan &plan, const BuildOptions &options) {
  const ChunkArtifactPaths paths = chunk_artifact_paths(options.chunks_dir, plan.chunk_id);
  ensure_absent(paths.archive);
  ensure_absent(paths.listing);
  ensure_absent(paths.hash);
  ensure_absent(paths.check);
  ensure_absent(paths.error);

  std::error_code ec;
  std::filesystem::create_directories(options.chunks_dir, ec);
  if (ec) {
    throw IoError(format_path_errno_error("Failed to create chunk directory", options.chunks_dir.string(), ec.value()), options.chunks_dir.string(),
                  ec.value());
  }

  PartialArtifactGuard guard(paths);

  ChunkArtifact artifact;
  artifact.chunk_id = plan.chunk_id;
  artifact.archive_path = paths.archive;
  artifact.listing_path = paths.listing;
  artifact.hash_path = paths.hash;
  artifact.listing.reserve(plan.entries.size());

  {
    ZipChunkWriter writer(paths.archive);
    for (const FileRecord &record : plan.entries) {
      const std::string entry_name = archive_entry_name(options.entry_prefix, record.relative_path);
      artifact.listing.push_back(writer.add_file(options.source_root / record.relative_path, record, entry_name, options.cancel));
    }
    writer.close();
  }

  write_text_file(paths.listing, render_listing(options.title_name, options.source_root.string(), artifact.listing, options.entry_prefix));

  artifact.digest = sha256_file_hex(paths.archive, options.cancel);
  artifact.archive_size = static_cast<uint64_t>(std::filesystem::file_size(paths.archive, ec));
  if (ec) {
    throw IoError(format_path_errno_error("Failed to size archive", paths.archive.string(), ec.value()), paths.archive.string(), ec.value());
  }
  write_text_file(paths.hash, "SHA256: " + artifact.digest + "  " + paths.archive.filename().string() + "\n");

  guard.commit();
  return artifact;
}

} // namespace archive_chunker
