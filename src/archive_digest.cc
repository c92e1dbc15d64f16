// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_digest.h"
#include "archive_chunker/chunker_error.h"
#include "archive_handles.h"

#include <openssl/evp.h>

#include <cerrno>
#include <iomanip>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace archive_chunker {

namespace {

constexpr std::size_t kDigestBlockSize = 1024 * 1024;

struct DigestContextDeleter {
  void operator()(EVP_MD_CTX *ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using digest_context_ptr = std::unique_ptr<EVP_MD_CTX, DigestContextDeleter>;

digest_context_ptr new_sha256_context() {
  digest_context_ptr ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("Failed to allocate SHA-256 context");
  }
  if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialize SHA-256 context");
  }
  return ctx;
}

void update_digest(EVP_MD_CTX *ctx, const void *data, std::size_t size) {
  if (EVP_DigestUpdate(ctx, data, size) != 1) {
    throw std::runtime_error("Failed to update SHA-256 context");
  }
}

std::string finish_digest(EVP_MD_CTX *ctx) {
  unsigned char digest[EVP_MAX_MD_SIZE];
  unsigned int length = 0;
  if (EVP_DigestFinal_ex(ctx, digest, &length) != 1) {
    throw std::runtime_error("Failed to finalize SHA-256 digest");
  }

  std::ostringstream oss;
  oss << std::hex << std::setfill('0');
  for (unsigned int i = 0; i < length; ++i) {
    oss << std::setw(2) << static_cast<int>(digest[i]);
  }
  return oss.str();
}

} // namespace

std::string sha256_hex(const void *data, std::size_t size) {
  digest_context_ptr ctx = new_sha256_context();
  update_digest(ctx.get(), data, size);
  return finish_digest(ctx.get());
}

std::string sha256_file_hex(const std::filesystem::path &path, const CancellationToken *cancel) {
  errno = 0;
  file_ptr handle(std::fopen(path.c_str(), "rb"));
  if (!handle) {
    const int err = errno;
    throw IoError(format_path_errno_error("Failed to open archive for hashing", path.string(), err), path.string(), err);
  }

  digest_context_ptr ctx = new_sha256_context();
  std::vector<unsigned char> buffer(kDigestBlockSize);
  while (true) {
    if (cancel) {
      cancel->throw_if_cancelled("hashing " + path.filename().string());
    }
    const std::size_t bytes_read = std::fread(buffer.data(), 1, buffer.size(), handle.get());
    if (bytes_read > 0) {
      update_digest(ctx.get(), buffer.data(), bytes_read);
    }
    if (bytes_read < buffer.size()) {
      if (std::ferror(handle.get())) {
        const int err = errno;
        throw IoError(format_path_errno_error("Failed to read archive for hashing", path.string(), err), path.string(), err);
      }
      break;
    }
  }
  return finish_digest(ctx.get());
}

} // namespace archive_chunker
