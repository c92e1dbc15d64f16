// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/run_options.h"

#include <cstdint>
#include <filesystem>
#include <string>

namespace archive_chunker {

/// A verified chunk offered for upload.
struct UploadRequest {
  uint32_t chunk_id = 0;
  std::filesystem::path archive_path;
  std::string digest; ///< Hex SHA-256 of the archive
};

struct UploadResult {
  bool ok = false;
  std::string message;
};

/**
 * @brief Destination for verified chunk archives
 *
 * upload() is called from worker threads, concurrently for different chunks.
 * Implementations report failure through UploadResult; the caller records the
 * outcome and does not retry.
 */
class ChunkUploader {
public:
  virtual ~ChunkUploader() = default;
  virtual UploadResult upload(const UploadRequest &request) = 0;
};

struct S3Credentials {
  std::string access_key;
  std::string secret_key;
  std::string endpoint_url;
};

/**
 * @brief Read ARCHIVER_S3_ACCESS_KEY, ARCHIVER_S3_SECRET_KEY and ARCHIVER_S3_ENDPOINT_URL
 * @param require_endpoint false when the endpoint comes from configuration instead
 * @throws ConfigError naming every missing variable
 */
S3Credentials s3_credentials_from_environment(bool require_endpoint = true);

/// "<project>/ChunkNNNNNNN.zip"
std::string s3_object_key(const std::string &project, uint32_t chunk_id);

/// Path-style bucket URL: "<endpoint>/<bucket>" with the bucket escaped.
std::string s3_bucket_url(const std::string &endpoint_url, const std::string &bucket);

/// Path-style object URL: "<endpoint>/<bucket>/<key>" with each key segment escaped.
std::string s3_object_url(const std::string &endpoint_url, const std::string &bucket, const std::string &key);

/**
 * @brief Put-object upload to an S3-compatible store, SigV4-signed by libcurl
 */
class S3ChunkUploader : public ChunkUploader {
public:
  S3ChunkUploader(S3Credentials credentials, UploadSettings settings);
  ~S3ChunkUploader() override;

  S3ChunkUploader(const S3ChunkUploader &) = delete;
  S3ChunkUploader &operator=(const S3ChunkUploader &) = delete;

  UploadResult upload(const UploadRequest &request) override;

private:
  S3Credentials _credentials;
  UploadSettings _settings;
};

} // namespace archive_chunker
