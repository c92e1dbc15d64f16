// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/run_options.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace archive_chunker {

/**
 * @brief Read side of the object store holding uploaded chunks
 *
 * list_keys() returns every key starting with @p prefix, across all pages.
 * download() writes the object to @p destination, replacing any existing file.
 * Both throw TransferError when the store refuses or the transfer fails.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;
  virtual std::vector<std::string> list_keys(const std::string &prefix) = 0;
  virtual void download(const std::string &key, const std::filesystem::path &destination) = 0;
};

/// One ListObjectsV2 response page.
struct ObjectListingPage {
  std::vector<std::string> keys;
  bool truncated = false;
  std::string next_continuation_token;
};

/// @throws TransferError when the document is an S3 error response
ObjectListingPage parse_list_objects_page(const std::string &xml);

/**
 * @brief SigV4-signed ListObjectsV2 and GetObject against an S3-compatible store
 *
 * Uses the endpoint, bucket and region of @p settings; the endpoint falls back
 * to the credentials' endpoint when empty.
 */
class S3ObjectStore : public ObjectStore {
public:
  S3ObjectStore(S3Credentials credentials, UploadSettings settings);
  ~S3ObjectStore() override;

  S3ObjectStore(const S3ObjectStore &) = delete;
  S3ObjectStore &operator=(const S3ObjectStore &) = delete;

  std::vector<std::string> list_keys(const std::string &prefix) override;
  void download(const std::string &key, const std::filesystem::path &destination) override;

private:
  S3Credentials _credentials;
  UploadSettings _settings;
};

struct ExtractStats {
  std::size_t files = 0;
  uint64_t bytes = 0;
};

/**
 * @brief Unpack a chunk archive below @p output_dir
 *
 * Existing files are overwritten. Entries with absolute names or ".."
 * components are rejected before anything of that entry is written.
 * @throws ArchiveCorruptError, IoError
 */
ExtractStats extract_archive(const std::filesystem::path &archive_path, const std::filesystem::path &output_dir);

/// Keys "<project>/...zip" held by @p store, sorted.
std::vector<std::string> chunk_archive_keys(ObjectStore &store, const std::string &project);

struct RestoreOptions {
  std::string project;
  std::filesystem::path output_dir;
  std::filesystem::path working_dir = "."; ///< Temporary zip downloads land here
  const CancellationToken *cancel = nullptr;
};

struct RestoreSummary {
  std::size_t archives = 0;
  std::size_t files = 0;
  uint64_t bytes = 0;
};

/**
 * @brief Download and extract every chunk archive of a project
 *
 * Creates the working and output directories when missing. Each archive is
 * downloaded into the working directory, extracted, then deleted. Stops at the
 * first failure; archives already extracted stay in place.
 *
 * @throws ConfigError, TransferError, ArchiveCorruptError, IoError, CancelledError
 */
RestoreSummary restore_project(ObjectStore &store, const RestoreOptions &options);

} // namespace archive_chunker
