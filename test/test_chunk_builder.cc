// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunk_planner.h"
#include "archive_chunker/chunk_verifier.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/directory_scanner.h"
#include "archive_chunker/listing_format.h"
#include "archive_digest.h"
#include "test_support.h"

#include <algorithm>
#include <filesystem>
#include <iostream>
#include <string>
#include <vector>

using namespace archive_chunker;
using namespace archive_chunker::test;

namespace {

bool exists(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

ChunkPlan single_chunk_plan(const FileCatalog &catalog) {
  ChunkerSettings settings;
  settings.target_size_bytes = kGiB;
  PlanResult plan = plan_chunks(catalog, settings);
  return plan.chunks.empty() ? ChunkPlan{} : plan.chunks.front();
}

BuildOptions options_for(const TempDir &dir, const std::string &chunks_name) {
  BuildOptions options;
  options.source_root = dir / "Proj";
  options.chunks_dir = dir / chunks_name;
  options.entry_prefix = "Proj";
  options.title_name = "Proj";
  return options;
}

bool check_scanner(const TempDir &dir, FileCatalog &catalog) {
  bool ok = true;
  write_file(dir / "Proj/readme.txt", "hello archive\n");
  write_file(dir / "Proj/data/blob.bin", filler(300000, 'b'));
  write_file(dir / "Proj/data/nested/small.csv", "a,b\n1,2\n");
  write_file(dir / "Proj/empty.txt", "");
  std::filesystem::create_directories(dir / "Proj/empty_dir");
  std::filesystem::create_symlink("readme.txt", dir / "Proj/link.txt");

  ScanStats stats;
  catalog = scan_directory(dir / "Proj", &stats);
  ok = expect(catalog.size() == 4, "Scanner should find four regular files") && ok;
  ok = expect(stats.files == 4 && stats.skipped == 1, "Symlinks should be skipped, not cataloged") && ok;
  ok = expect(stats.directories == 4, "Scanner should visit root, data, data/nested and empty_dir") && ok;
  ok = expect(std::is_sorted(catalog.begin(), catalog.end(), [](const FileRecord &a, const FileRecord &b) { return a.relative_path < b.relative_path; }),
              "Catalog should be sorted by path") && ok;
  ok = expect(!catalog.empty() && catalog.front().relative_path == "data/blob.bin" && catalog.front().size_bytes == 300000,
              "Nested files should use relative paths") && ok;
  ok = expect(throws<IoError>([&] { scan_directory(dir / "does_not_exist"); }), "Scanning a missing directory should fail") && ok;
  return ok;
}

bool check_round_trip(const TempDir &dir, const FileCatalog &catalog) {
  bool ok = true;
  const ChunkPlan plan = single_chunk_plan(catalog);
  const BuildOptions options = options_for(dir, "Chunks");
  const ChunkArtifact artifact = build_chunk(plan, options);
  const ChunkArtifactPaths paths = chunk_artifact_paths(options.chunks_dir, plan.chunk_id);

  ok = expect(paths.archive.filename() == "Chunk0000001.zip", "Archive name should pad the chunk id") && ok;
  ok = expect(paths.listing.filename() == "Chunk0000001Listing.txt" && paths.hash.filename() == "Chunk0000001Hash.txt", "Artifact names") && ok;
  ok = expect(::exists(paths.archive) && ::exists(paths.listing) && ::exists(paths.hash), "Archive, listing and hash should be written") && ok;
  ok = expect(artifact.archive_path == paths.archive, "Artifact should point at the archive") && ok;
  ok = expect(artifact.listing.size() == catalog.size(), "Artifact listing should cover every entry") && ok;

  const std::string digest = sha256_file_hex(paths.archive);
  ok = expect(artifact.digest == digest && digest.size() == 64, "Digest should be the SHA-256 of the archive") && ok;
  ok = expect(read_text_file(paths.hash) == "SHA256: " + digest + "  Chunk0000001.zip\n", "Hash file format") && ok;

  const std::vector<ListingEntry> listed = read_listing_file(paths.listing, "Proj");
  ok = expect(listed.size() == plan.entries.size(), "Listing file should read back every entry") && ok;

  const VerificationReport report = verify_chunk(artifact, plan, "Proj");
  ok = expect(report.passed(), "Freshly built chunk should verify:\n" + report.to_text()) && ok;
  ok = expect(report.archive_entries.size() == catalog.size(), "Verifier should ignore directory entries") && ok;
  ok = expect(report.archive_bytes == plan.total_size && report.planned_bytes == plan.total_size, "Verifier byte totals") && ok;
  ok = expect(report.to_text().find("Checks completed successfully.") != std::string::npos, "Passing report text") && ok;

  // Scenario: the plan names a file that never made it into the archive.
  ChunkPlan with_ghost = plan;
  with_ghost.entries.push_back(FileRecord{ "ghost/missing.txt", 12, 0 });
  with_ghost.total_size += 12;
  const VerificationReport missing = verify_chunk(with_ghost, paths.archive, "Proj");
  ok = expect(missing.discrepancies.size() == 1, "Exactly one discrepancy expected for the missing file") && ok;
  if (missing.discrepancies.size() == 1) {
    ok = expect(missing.discrepancies[0].kind == DiscrepancyKind::Missing && missing.discrepancies[0].path == "ghost/missing.txt",
                "Missing discrepancy should name the absent path") && ok;
  }
  ok = expect(missing.to_text().find("Checks FAILED with 1 discrepancies") != std::string::npos, "Failing report text") && ok;

  ChunkPlan without_one = plan;
  const std::string dropped = without_one.entries.back().relative_path;
  without_one.entries.pop_back();
  const VerificationReport extra = verify_chunk(without_one, paths.archive, "Proj");
  ok = expect(extra.discrepancies.size() == 1 && extra.discrepancies[0].kind == DiscrepancyKind::Unexpected && extra.discrepancies[0].path == dropped,
              "Unplanned archive entry should be Unexpected") && ok;

  ChunkPlan resized = plan;
  resized.entries.front().size_bytes += 1;
  const VerificationReport mismatch = verify_chunk(resized, paths.archive, "Proj");
  ok = expect(mismatch.discrepancies.size() == 1 && mismatch.discrepancies[0].kind == DiscrepancyKind::SizeMismatch,
              "Size difference should be SizeMismatch") && ok;

  const std::string listing_before = read_text_file(paths.listing);
  ok = expect(throws<OutputExistsError>([&] { build_chunk(plan, options); }), "Rebuilding an existing chunk should fail") && ok;
  ok = expect(::exists(paths.archive) && read_text_file(paths.listing) == listing_before, "Existing artifacts should be left untouched") && ok;
  return ok;
}

bool check_source_drift(const TempDir &dir, const FileCatalog &catalog) {
  bool ok = true;
  const BuildOptions options = options_for(dir, "DriftChunks");

  ChunkPlan missing = single_chunk_plan(catalog);
  missing.entries.push_back(FileRecord{ "vanished.txt", 5, 0 });
  missing.total_size += 5;
  try {
    build_chunk(missing, options);
    ok = expect(false, "Expected SourceFileMissingError") && ok;
  } catch (const SourceFileMissingError &ex) {
    ok = expect(ex.fault().path == "vanished.txt", "Missing source fault should name the file") && ok;
  }
  const ChunkArtifactPaths paths = chunk_artifact_paths(options.chunks_dir, missing.chunk_id);
  ok = expect(!::exists(paths.archive) && !::exists(paths.listing) && !::exists(paths.hash), "Failed build should leave no partial artifacts") && ok;

  ChunkPlan resized = single_chunk_plan(catalog);
  for (FileRecord &entry : resized.entries) {
    if (entry.relative_path == "readme.txt") {
      entry.size_bytes += 3;
    }
  }
  try {
    build_chunk(resized, options);
    ok = expect(false, "Expected SourceSizeChangedError") && ok;
  } catch (const SourceSizeChangedError &ex) {
    ok = expect(ex.expected_size() == ex.actual_size() + 3, "Size change fault should carry both sizes") && ok;
  }
  ok = expect(!::exists(paths.archive), "Size change should remove the partial archive") && ok;

  CancellationToken token;
  token.cancel();
  BuildOptions cancelled = options;
  cancelled.cancel = &token;
  ok = expect(throws<CancelledError>([&] { build_chunk(single_chunk_plan(catalog), cancelled); }), "Cancelled build should stop") && ok;
  ok = expect(!::exists(paths.archive) && !::exists(paths.listing), "Cancelled build should leave no partial artifacts") && ok;
  return ok;
}

bool check_unprefixed_entries(const TempDir &dir, const FileCatalog &catalog) {
  bool ok = true;
  FileCatalog readme;
  for (const FileRecord &record : catalog) {
    if (record.relative_path == "readme.txt") {
      readme.push_back(record);
    }
  }
  const ChunkPlan plan = single_chunk_plan(readme);
  BuildOptions bare = options_for(dir, "BareChunks");
  bare.entry_prefix = "";
  const ChunkArtifact artifact = build_chunk(plan, bare);

  // Stored as "readme.txt" while the run expects "Proj/readme.txt".
  const VerificationReport report = verify_chunk(plan, artifact.archive_path, "Proj");
  ok = expect(!report.passed(), "Entries stored without the prefix should fail verification") && ok;
  ok = expect(report.discrepancies.size() == 2, "Expected one Missing and one Unexpected discrepancy:\n" + report.to_text()) && ok;
  const auto has = [&](DiscrepancyKind kind) {
    return std::any_of(report.discrepancies.begin(), report.discrepancies.end(),
                       [&](const Discrepancy &d) { return d.kind == kind && d.path == "readme.txt"; });
  };
  ok = expect(has(DiscrepancyKind::Missing), "Planned file should be Missing under the prefix") && ok;
  ok = expect(has(DiscrepancyKind::Unexpected), "Unprefixed entry should be Unexpected under its stored name") && ok;
  ok = expect(verify_chunk(plan, artifact.archive_path, "").passed(), "The same archive verifies when no prefix is expected") && ok;
  return ok;
}

bool check_corrupt_archive(const TempDir &dir, const FileCatalog &catalog) {
  const std::filesystem::path bogus = dir / "bogus.zip";
  write_file(bogus, "this is not a zip archive at all");
  return expect(throws<ArchiveCorruptError>([&] { verify_chunk(single_chunk_plan(catalog), bogus, "Proj"); }),
                "Unreadable archives should raise ArchiveCorruptError");
}

} // namespace

int main() {
  bool ok = true;
  try {
    TempDir dir("chunk_builder");
    FileCatalog catalog;
    ok = check_scanner(dir, catalog) && ok;
    ok = check_round_trip(dir, catalog) && ok;
    ok = check_source_drift(dir, catalog) && ok;
    ok = check_unprefixed_entries(dir, catalog) && ok;
    ok = check_corrupt_archive(dir, catalog) && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    return 1;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Chunk builder tests passed" << std::endl;
  return 0;
}
