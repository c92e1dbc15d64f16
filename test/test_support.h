// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include "archive_chunker/file_record.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include <unistd.h>

namespace archive_chunker {
namespace test {

constexpr uint64_t kMiB = 1024ull * 1024ull;
constexpr uint64_t kGiB = 1024ull * kMiB;

inline bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << message << std::endl;
    return false;
  }
  return true;
}

// Runs @p body and reports whether it threw @p Exception.
template <class Exception, class Body> bool throws(Body &&body) {
  try {
    body();
  } catch (const Exception &) {
    return true;
  }
  return false;
}

/// Scratch directory removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &name) {
    _path = std::filesystem::temp_directory_path() / ("archive_chunker_" + name + "_" + std::to_string(static_cast<long long>(getpid())));
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
    std::filesystem::create_directories(_path);
  }
  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return _path; }
  std::filesystem::path operator/(const std::string &relative) const { return _path / relative; }

private:
  std::filesystem::path _path;
};

inline void write_file(const std::filesystem::path &path, const std::string &content) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    throw std::runtime_error("Failed to open temp file for writing: " + path.string());
  }
  out << content;
}

/// Deterministic content of @p size bytes, different per @p seed.
inline std::string filler(std::size_t size, char seed) {
  std::string content(size, seed);
  for (std::size_t i = 0; i < size; i += 7) {
    content[i] = static_cast<char>('a' + (i + static_cast<std::size_t>(seed)) % 26);
  }
  return content;
}

inline FileCatalog make_catalog(const std::vector<std::pair<std::string, uint64_t>> &files) {
  FileCatalog catalog;
  int64_t mtime = 1700000000;
  for (const auto &file : files) {
    catalog.push_back(FileRecord{ file.first, file.second, mtime++ });
  }
  return catalog;
}

} // namespace test
} // namespace archive_chunker
