// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunker_error.h"
#include "curl_handles.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>
#include <vector>

namespace archive_chunker {

namespace {

constexpr std::size_t kMaxResponseExcerpt = 512;

struct UploadFileCloser {
  void operator()(FILE *handle) const noexcept { std::fclose(handle); }
};

std::string read_env(const char *name) {
  const char *value = std::getenv(name);
  return value ? std::string(value) : std::string();
}

size_t collect_response(char *ptr, size_t size, size_t nmemb, void *userdata) {
  auto *body = static_cast<std::string *>(userdata);
  const size_t total = size * nmemb;
  if (body->size() < kMaxResponseExcerpt) {
    body->append(ptr, std::min(total, kMaxResponseExcerpt - body->size()));
  }
  return total;
}

} // namespace

S3Credentials s3_credentials_from_environment(bool require_endpoint) {
  S3Credentials credentials;
  credentials.access_key = read_env("ARCHIVER_S3_ACCESS_KEY");
  credentials.secret_key = read_env("ARCHIVER_S3_SECRET_KEY");
  credentials.endpoint_url = read_env("ARCHIVER_S3_ENDPOINT_URL");

  std::vector<std::string> missing;
  if (credentials.access_key.empty()) {
    missing.push_back("ARCHIVER_S3_ACCESS_KEY");
  }
  if (credentials.secret_key.empty()) {
    missing.push_back("ARCHIVER_S3_SECRET_KEY");
  }
  if (require_endpoint && credentials.endpoint_url.empty()) {
    missing.push_back("ARCHIVER_S3_ENDPOINT_URL");
  }
  if (!missing.empty()) {
    std::string names;
    for (const std::string &name : missing) {
      names += names.empty() ? name : ", " + name;
    }
    throw ConfigError("Missing required environment variables: " + names);
  }
  return credentials;
}

std::string s3_object_key(const std::string &project, uint32_t chunk_id) { return project + "/" + chunk_base_name(chunk_id) + ".zip"; }

std::string s3_bucket_url(const std::string &endpoint_url, const std::string &bucket) {
  curl_easy_ptr curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }
  std::string url = endpoint_url;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  return url + "/" + escape_url_component(curl.get(), bucket);
}

std::string s3_object_url(const std::string &endpoint_url, const std::string &bucket, const std::string &key) {
  curl_easy_ptr curl(curl_easy_init());
  if (!curl) {
    throw std::runtime_error("curl_easy_init failed");
  }

  std::string url = s3_bucket_url(endpoint_url, bucket);

  std::string::size_type start = 0;
  while (start <= key.size()) {
    const std::string::size_type slash = key.find('/', start);
    const std::string segment = key.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
    url += "/" + escape_url_component(curl.get(), segment);
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return url;
}

S3ChunkUploader::S3ChunkUploader(S3Credentials credentials, UploadSettings settings)
    : _credentials(std::move(credentials))
    , _settings(std::move(settings)) {
  if (_settings.endpoint_url.empty()) {
    _settings.endpoint_url = _credentials.endpoint_url;
  }
  if (_settings.endpoint_url.empty()) {
    throw ConfigError("No S3 endpoint configured (set ARCHIVER_S3_ENDPOINT_URL or upload.endpoint_url)");
  }
  // Must run before any worker thread creates an easy handle.
  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

S3ChunkUploader::~S3ChunkUploader() { curl_global_cleanup(); }

UploadResult S3ChunkUploader::upload(const UploadRequest &request) {
  UploadResult result;
  const std::string key = s3_object_key(_settings.project, request.chunk_id);

  errno = 0;
  std::unique_ptr<FILE, UploadFileCloser> archive(std::fopen(request.archive_path.c_str(), "rb"));
  if (!archive) {
    result.message = format_path_errno_error("Failed to open archive for upload", request.archive_path.string(), errno);
    return result;
  }
  std::error_code ec;
  const auto archive_size = std::filesystem::file_size(request.archive_path, ec);
  if (ec) {
    result.message = format_path_errno_error("Failed to size archive for upload", request.archive_path.string(), ec.value());
    return result;
  }

  curl_easy_ptr curl(curl_easy_init());
  if (!curl) {
    result.message = "curl_easy_init failed";
    return result;
  }

  const std::string url = s3_object_url(_settings.endpoint_url, _settings.bucket, key);
  const std::string sigv4 = "aws:amz:" + _settings.region + ":s3";
  const std::string userpwd = _credentials.access_key + ":" + _credentials.secret_key;

  curl_list_ptr headers;
  headers = append_header(std::move(headers), "x-amz-content-sha256: " + request.digest);
  headers = append_header(std::move(headers), "Content-Type: application/zip");

  std::string response;
  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_UPLOAD, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_READDATA, archive.get());
  curl_easy_setopt(curl.get(), CURLOPT_INFILESIZE_LARGE, static_cast<curl_off_t>(archive_size));
  curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USERPWD, userpwd.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_response);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response);
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode code = curl_easy_perform(curl.get());
  if (code != CURLE_OK) {
    result.message = "Upload of " + key + " failed: " + curl_easy_strerror(code);
    return result;
  }

  long http_status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
  if (http_status < 200 || http_status >= 300) {
    result.message = "Upload of " + key + " rejected with HTTP " + std::to_string(http_status);
    if (!response.empty()) {
      result.message += ": " + response;
    }
    return result;
  }

  result.ok = true;
  result.message = "Uploaded " + key + " to bucket " + _settings.bucket;
  return result;
}

} // namespace archive_chunker
