// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/listing_format.h"
#include <filesystem>
#include <iostream>
#include <locale.h>
#include <map>
#include <string>
#include <vector>

using namespace archive_chunker;

namespace {

std::filesystem::path find_dictionary(const std::filesystem::path &output_root) {
  for (DictionaryFormat format : { DictionaryFormat::Text, DictionaryFormat::Json }) {
    const std::filesystem::path candidate = output_root / dictionary_file_name(format);
    std::error_code ec;
    if (std::filesystem::exists(candidate, ec)) {
      return candidate;
    }
  }
  return {};
}

// Count files per chunk
void summarize_chunks(const ChunkDictionary &dictionary) {
  std::map<uint32_t, size_t> file_counts;
  for (const auto &[path, chunk_id] : dictionary) {
    file_counts[chunk_id]++;
  }

  std::cout << "Files per chunk:\n";
  for (const auto &[chunk_id, count] : file_counts) {
    std::cout << "  " << chunk_base_name(chunk_id) << ": " << count << " files\n";
  }
  std::cout << "\nTotal files: " << dictionary.size() << "\n";
}

// Find the chunks holding paths that contain a pattern
void locate(const ChunkDictionary &dictionary, const std::string &pattern) {
  std::vector<std::pair<std::string, uint32_t>> matches;
  for (const auto &[path, chunk_id] : dictionary) {
    if (path.find(pattern) != std::string::npos) {
      matches.emplace_back(path, chunk_id);
    }
  }

  if (matches.empty()) {
    std::cout << "No matches found.\n";
    return;
  }
  std::cout << "Found " << matches.size() << " matches:\n";
  for (const auto &[path, chunk_id] : matches) {
    std::cout << "  " << chunk_base_name(chunk_id) << ".zip  " << path << "\n";
  }
}

} // namespace

int main(int argc, char *argv[]) {
  setlocale(LC_ALL, "");

  if (argc < 3) {
    std::cerr << "Usage: " << argv[0] << " <output_root> <entry_prefix> [pattern]\n";
    std::cerr << "\nExamples:\n";
    std::cerr << "  " << argv[0] << " /archive/out Project\n";
    std::cerr << "  " << argv[0] << " /archive/out Project 'reports/2024'\n";
    std::cerr << "  " << argv[0] << " /archive/out '' '.csv'\n";
    return 1;
  }

  const std::filesystem::path dictionary_path = find_dictionary(argv[1]);
  if (dictionary_path.empty()) {
    std::cerr << "Error: no chunk dictionary in " << argv[1] << "\n";
    return 1;
  }

  try {
    const ChunkDictionary dictionary = load_chunk_dictionary(dictionary_path, argv[2]);
    if (argc >= 4) {
      locate(dictionary, argv[3]);
    } else {
      summarize_chunks(dictionary);
    }
  } catch (const std::exception &e) {
    std::cerr << "Error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
