// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/listing_format.h"
#include "test_support.h"

#include <cstdint>
#include <cstdlib>
#include <ctime>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace archive_chunker;
using namespace archive_chunker::test;

namespace {

bool check_human_sizes() {
  bool ok = true;
  ok = expect(bytes_to_human_padded(0) == "0 Bytes   ", "0 bytes should pad to 10 characters") && ok;
  ok = expect(bytes_to_human_padded(1020) == "1,020 Bytes", "1020 bytes should group thousands") && ok;
  ok = expect(bytes_to_human_padded(1024) == "1.00 KB   ", "1024 bytes should be 1.00 KB") && ok;
  ok = expect(bytes_to_human_padded(static_cast<int64_t>(1.4 * 1024 * 1024)) == "1.40 MB   ", "1.4 MiB should be 1.40 MB") && ok;
  ok = expect(bytes_to_human(3 * kGiB) == "3.00 GB", "3 GiB should be 3.00 GB") && ok;
  ok = expect(bytes_to_human(1024ull * 1024ull * kGiB) == "1,024.00 TB", "1 PiB should stay in TB") && ok;
  ok = expect(throws<std::invalid_argument>([] { bytes_to_human_padded(-1); }), "Negative sizes should be rejected") && ok;
  return ok;
}

bool check_listing_lines() {
  bool ok = true;
  const ListingEntry small{ "docs/readme.txt", 1020, 1700000000 };
  const std::string line = format_listing_line(small, "Proj");
  ok = expect(line == "2023-11-14 1,020 Bytes Proj/docs/readme.txt  1020", "Unexpected listing line: " + line) && ok;

  const ListingEntry padded{ "a  b.bin", 2048, 0 };
  const std::string padded_line = format_listing_line(padded, "");
  ok = expect(padded_line == "1970-01-01 2.00 KB    a  b.bin  2048", "Unexpected padded listing line: " + padded_line) && ok;

  ListingEntry parsed;
  ok = expect(parse_listing_line(line, parsed), "Listing line should parse") && ok;
  ok = expect(parsed.path == "Proj/docs/readme.txt" && parsed.size_bytes == 1020, "Parsed entry should keep name and size") && ok;
  ok = expect(parse_listing_line(padded_line, parsed), "Padded listing line should parse") && ok;
  ok = expect(parsed.path == "a  b.bin" && parsed.size_bytes == 2048, "Double spaces inside names should survive parsing") && ok;

  ok = expect(!parse_listing_line("Printed on: 2023-11-14 10:00:00", parsed), "Header lines are not entries") && ok;
  ok = expect(!parse_listing_line("****", parsed), "Box lines are not entries") && ok;
  ok = expect(!parse_listing_line("", parsed), "Empty lines are not entries") && ok;
  return ok;
}

bool check_listing_file(const TempDir &dir) {
  bool ok = true;
  const FileCatalog catalog = make_catalog({ { "a.txt", 10 }, { "sub/b.txt", 2000 }, { "sub/deeper/c.txt", 3 * kMiB } });
  const std::string document = render_listing("Proj", "/data/Proj", listing_entries_from_catalog(catalog), "Proj");

  ok = expect(document.find("Directory Listing for: Proj") != std::string::npos, "Header should name the listing") && ok;
  ok = expect(document.find("Total Files: 3") != std::string::npos, "Header should count files") && ok;
  ok = expect(document.find("Max File Size: 3.00 MB") != std::string::npos, "Header should report the largest file") && ok;
  ok = expect(document.find("Running with input directory: /data/Proj") != std::string::npos, "Header should name the input directory") && ok;

  const std::filesystem::path path = dir / "FullListing.txt";
  write_text_file(path, document);
  const std::vector<ListingEntry> entries = read_listing_file(path, "Proj");
  ok = expect(entries.size() == catalog.size(), "Every catalog entry should read back") && ok;
  for (std::size_t i = 0; i < entries.size() && i < catalog.size(); ++i) {
    ok = expect(entries[i].path == catalog[i].relative_path, "Read-back path should drop the prefix: " + entries[i].path) && ok;
    ok = expect(entries[i].size_bytes == catalog[i].size_bytes, "Read-back size should match for " + entries[i].path) && ok;
  }

  ok = expect(throws<MalformedPathError>([&] { read_listing_file(path, "Other"); }), "Entries outside the prefix should be rejected") && ok;
  ok = expect(throws<IoError>([&] { read_listing_file(dir / "missing.txt", "Proj"); }), "Missing listing files should raise IoError") && ok;

  const std::filesystem::path huge = dir / "HugeListing.txt";
  write_text_file(huge, "Printed on: 2023-11-14 10:00:00\n\n2023-11-14 1.00 KB    Proj/big.bin  99999999999999999999999\n");
  try {
    read_listing_file(huge, "Proj");
    ok = expect(false, "Sizes beyond 64 bits should be rejected") && ok;
  } catch (const IoError &ex) {
    ok = expect(ex.fault().path == huge.string(), "Size overflow should name the listing file") && ok;
  }
  ListingEntry overflow;
  ok = expect(!parse_listing_line("2023-11-14 1.00 KB    big.bin  18446744073709551616", overflow), "2^64 does not fit a size") && ok;
  ok = expect(parse_listing_line("2023-11-14 1.00 KB    big.bin  18446744073709551615", overflow) && overflow.size_bytes == UINT64_MAX,
              "The largest 64-bit size should still parse") && ok;
  return ok;
}

bool check_dictionaries(const TempDir &dir) {
  bool ok = true;
  ChunkerSettings settings;
  settings.target_size_bytes = 100;
  const FileCatalog catalog = make_catalog({ { "a/1.bin", 60 }, { "a/2.bin", 30 }, { "b/3.bin", 80 }, { "c.bin", 5 } });
  const PlanResult plan = plan_chunks(catalog, settings);

  const std::string text = render_text_dictionary(plan, "Proj");
  ok = expect(text == render_text_dictionary(plan_chunks(catalog, settings), "Proj"), "Text dictionary should be deterministic") && ok;
  ok = expect(text.find("Chunk 0000001: ") == 0, "Text dictionary should start with chunk 1") && ok;
  ok = expect(text.find("\n\n\n\nChunk 0000002: ") != std::string::npos, "Chunks should be separated by blank lines") && ok;

  const std::filesystem::path text_path = write_chunk_dictionary(dir.path(), plan, DictionaryFormat::Text, "Proj");
  const std::filesystem::path json_path = write_chunk_dictionary(dir.path(), plan, DictionaryFormat::Json, "Proj");
  ok = expect(text_path.filename() == "ChunkDictionary.txt", "Text dictionary file name") && ok;
  ok = expect(json_path.filename() == "ChunkDictionary.json", "JSON dictionary file name") && ok;

  const ChunkDictionary from_text = load_chunk_dictionary(text_path, "Proj");
  const ChunkDictionary from_json = load_chunk_dictionary(json_path, "Proj");
  ok = expect(from_text == plan.dictionary, "Text dictionary should load back to the plan dictionary") && ok;
  ok = expect(from_json == plan.dictionary, "JSON dictionary should load back to the plan dictionary") && ok;

  ok = expect(parse_dictionary_format("json") == DictionaryFormat::Json, "json format name") && ok;
  ok = expect(throws<ConfigError>([] { parse_dictionary_format("yaml"); }), "Unknown dictionary formats should be rejected") && ok;

  const std::string entry_line = format_listing_line(ListingEntry{ "a/1.bin", 60, 1700000000 }, "Proj");
  write_text_file(dir / "wide_id.txt", "Chunk 99999999999: " + entry_line + "\n");
  try {
    load_chunk_dictionary(dir / "wide_id.txt", "Proj");
    ok = expect(false, "Chunk ids beyond 32 bits should be rejected") && ok;
  } catch (const IoError &ex) {
    ok = expect(ex.fault().path == (dir / "wide_id.txt").string(), "Chunk id overflow should name the dictionary file") && ok;
  }

  write_text_file(dir / "wide_id.json", "{\"files\": {\"a/1.bin\": 4294967296}, \"chunks\": []}");
  ok = expect(throws<IoError>([&] { load_chunk_dictionary(dir / "wide_id.json", ""); }), "JSON chunk ids beyond 32 bits should be rejected") && ok;

  write_text_file(dir / "broken.json", "{\"files\": [");
  ok = expect(throws<IoError>([&] { load_chunk_dictionary(dir / "broken.json", ""); }), "Corrupt JSON dictionary should raise IoError") && ok;
  return ok;
}

} // namespace

int main() {
  setenv("TZ", "UTC", 1);
  tzset();

  bool ok = true;
  try {
    TempDir dir("listing_format");
    ok = check_human_sizes() && ok;
    ok = check_listing_lines() && ok;
    ok = check_listing_file(dir) && ok;
    ok = check_dictionaries(dir) && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    return 1;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Listing format tests passed" << std::endl;
  return 0;
}
