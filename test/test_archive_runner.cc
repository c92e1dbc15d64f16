// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/archive_runner.h"
#include "archive_chunker/chunk_builder.h"
#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/completeness.h"
#include "archive_chunker/directory_scanner.h"
#include "archive_chunker/listing_format.h"
#include "archive_chunker/log.h"
#include "archive_digest.h"
#include "test_support.h"

#include <iostream>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <utility>
#include <vector>

using namespace archive_chunker;
using namespace archive_chunker::test;

namespace {

class RecordingUploader : public ChunkUploader {
public:
  explicit RecordingUploader(std::set<uint32_t> failing = {})
      : _failing(std::move(failing)) {}

  UploadResult upload(const UploadRequest &request) override {
    std::lock_guard<std::mutex> lock(_mutex);
    _requests.push_back(request);
    UploadResult result;
    result.ok = _failing.count(request.chunk_id) == 0;
    result.message = (result.ok ? "uploaded " : "refused ") + request.archive_path.filename().string();
    return result;
  }

  std::vector<UploadRequest> requests() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _requests;
  }

private:
  std::set<uint32_t> _failing;
  mutable std::mutex _mutex;
  std::vector<UploadRequest> _requests;
};

bool exists(const std::filesystem::path &path) {
  std::error_code ec;
  return std::filesystem::exists(path, ec);
}

void populate_source(const std::filesystem::path &root) {
  write_file(root / "README.md", "# Project\n");
  write_file(root / "cad/model_a.step", filler(60000, 'a'));
  write_file(root / "cad/model_b.step", filler(50000, 'b'));
  write_file(root / "cad/old/model_a_v1.step", filler(40000, 'c'));
  write_file(root / "photos/site/001.jpg", filler(90000, 'd'));
  write_file(root / "photos/site/002.jpg", filler(80000, 'e'));
  write_file(root / "reports/final.pdf", filler(30000, 'f'));
  write_file(root / "reports/empty.log", "");
}

RunOptions options_for(const TempDir &dir, const std::string &out_name) {
  RunOptions options;
  options.input_dir = dir / "Site42";
  options.output_dir = dir / out_name;
  options.chunker.target_size_bytes = 100000;
  options.workers = 3;
  return options;
}

bool check_successful_run(const TempDir &dir) {
  bool ok = true;
  const RunOptions options = options_for(dir, "out_success");
  auto uploader = std::make_shared<RecordingUploader>();
  RunOptions with_upload = options;
  with_upload.upload = UploadSettings{};
  with_upload.upload->project = "Site42";
  ArchiveRunner runner(with_upload, uploader);
  const RunSummary summary = runner.run();

  ok = expect(summary.status == RunStatus::CompleteSuccess, "Run should succeed:\n" + summary.completeness.to_text()) && ok;
  ok = expect(summary.file_count == 8 && summary.total_bytes == 350010, "Summary should count the scanned files") && ok;
  ok = expect(summary.chunks.size() >= 3, "Small target should split the tree into several chunks") && ok;
  ok = expect(summary.sentinel_path == options.output_dir / "CompleteSuccess.txt" && ::exists(summary.sentinel_path), "Success sentinel") && ok;
  ok = expect(!::exists(options.output_dir / "CompleteError.txt"), "Only one sentinel per run") && ok;
  ok = expect(::exists(options.output_dir / "FullListing.txt") && ::exists(options.output_dir / "ChunkDictionary.txt"), "Run-level listings") && ok;
  ok = expect(::exists(options.output_dir / "WebView/FileMap.json") && ::exists(options.output_dir / "WebView/index.html"), "Web view") && ok;

  for (const ChunkOutcome &outcome : summary.chunks) {
    const ChunkArtifactPaths paths = chunk_artifact_paths(options.output_dir / "Chunks", outcome.chunk_id);
    ok = expect(outcome.attempted && outcome.built && outcome.verified && !outcome.fault, "Every chunk should build and verify") && ok;
    ok = expect(::exists(paths.archive) && ::exists(paths.listing) && ::exists(paths.hash) && ::exists(paths.check), "Chunk artifacts") && ok;
    ok = expect(!::exists(paths.error), "No error files on success") && ok;
    ok = expect(outcome.upload && outcome.upload->ok, "Every verified chunk should be uploaded") && ok;
  }

  const std::vector<UploadRequest> requests = uploader->requests();
  ok = expect(requests.size() == summary.chunks.size(), "One upload per chunk") && ok;
  for (const UploadRequest &request : requests) {
    ok = expect(request.digest == sha256_file_hex(request.archive_path), "Upload should carry the archive digest") && ok;
  }

  const ChunkDictionary dictionary = load_chunk_dictionary(options.output_dir / "ChunkDictionary.txt", "Site42");
  ok = expect(dictionary.size() == 8, "Dictionary should list every file") && ok;
  ok = expect(dictionary.at("cad/model_a.step") == dictionary.at("cad/model_b.step"), "Leaf-group should stay in one chunk") && ok;

  ok = expect(recheck_output_root(options.output_dir, "Site42").success(), "Rechecking the output should succeed") && ok;

  ArchiveRunner again(options);
  ok = expect(throws<IoError>([&] { again.run(); }), "A non-empty output root should be refused") && ok;
  return ok;
}

bool check_chunk_failures(const TempDir &dir) {
  bool ok = true;
  RunOptions options = options_for(dir, "out_failures");
  options.dictionary_format = DictionaryFormat::Json;
  options.upload = UploadSettings{};
  options.upload->project = "Site42";
  auto uploader = std::make_shared<RecordingUploader>(std::set<uint32_t>{ 1 });

  FileCatalog catalog = scan_directory(options.input_dir);
  catalog.push_back(FileRecord{ "zzz/ghost.bin", 10, 0 });

  ArchiveRunner runner(options, uploader);
  const RunSummary summary = runner.run_catalog(catalog);

  ok = expect(summary.status == RunStatus::CompleteError, "Failed chunk should make the run CompleteError") && ok;
  ok = expect(::exists(options.output_dir / "CompleteError.txt") && ::exists(options.output_dir / "ChunkDictionary.json"), "Error sentinel") && ok;

  std::size_t missing_sources = 0;
  std::size_t verified = 0;
  for (const ChunkOutcome &outcome : summary.chunks) {
    const ChunkArtifactPaths paths = chunk_artifact_paths(options.output_dir / "Chunks", outcome.chunk_id);
    if (outcome.fault && outcome.fault->kind == ChunkFaultKind::SourceFileMissing) {
      ++missing_sources;
      ok = expect(::exists(paths.error) && !::exists(paths.archive), "Failed chunk should leave only its error file") && ok;
      ok = expect(!outcome.upload, "Failed chunks are not uploaded") && ok;
    } else if (outcome.verified) {
      ++verified;
    }
  }
  ok = expect(missing_sources == 1, "Exactly one chunk should miss its source file") && ok;
  ok = expect(verified + 1 == summary.chunks.size(), "Other chunks should still verify") && ok;

  bool ghost_missing = false;
  for (const Discrepancy &discrepancy : summary.completeness.discrepancies) {
    ghost_missing = ghost_missing || (discrepancy.kind == DiscrepancyKind::Missing && discrepancy.path == "zzz/ghost.bin");
  }
  ok = expect(ghost_missing, "Completeness should name the file that was never archived") && ok;

  const std::string report = read_text_file(options.output_dir / "CompleteError.txt");
  ok = expect(report.find("Upload of chunk 1 failed") != std::string::npos, "Upload failures should be reported") && ok;
  return ok;
}

bool check_cancelled_run(const TempDir &dir) {
  bool ok = true;
  const RunOptions options = options_for(dir, "out_cancelled");
  ArchiveRunner runner(options);
  runner.cancel();
  const RunSummary summary = runner.run();

  ok = expect(summary.status == RunStatus::Cancelled, "Cancelled run should report Cancelled") && ok;
  ok = expect(::exists(options.output_dir / "CompleteError.txt"), "Cancelled run should end with CompleteError") && ok;
  ok = expect(!::exists(options.output_dir / "WebView"), "Cancelled run should skip the web view") && ok;
  for (const ChunkOutcome &outcome : summary.chunks) {
    ok = expect(!outcome.attempted && outcome.fault && outcome.fault->kind == ChunkFaultKind::Cancelled, "Unstarted chunks are not attempted") && ok;
    ok = expect(!::exists(chunk_artifact_paths(options.output_dir / "Chunks", outcome.chunk_id).archive), "No archives after cancellation") && ok;
  }
  ok = expect(read_text_file(options.output_dir / "CompleteError.txt").find("cancelled") != std::string::npos, "Report should name the cancellation") &&
       ok;
  return ok;
}

bool check_empty_and_invalid(const TempDir &dir) {
  bool ok = true;
  std::filesystem::create_directories(dir / "Empty");
  RunOptions options;
  options.input_dir = dir / "Empty";
  options.output_dir = dir / "out_empty";
  const RunSummary summary = ArchiveRunner(options).run();
  ok = expect(summary.status == RunStatus::CompleteSuccess && summary.chunks.empty(), "Empty input should archive to zero chunks") && ok;

  RunOptions missing = options;
  missing.input_dir = dir / "NoSuchDir";
  missing.output_dir = dir / "out_missing";
  ok = expect(throws<IoError>([&] { ArchiveRunner(missing).run(); }), "Missing input directory should be fatal") && ok;

  RunOptions invalid = options;
  invalid.chunker.target_size_bytes = 0;
  ok = expect(throws<ConfigError>([&] { ArchiveRunner(invalid).run(); }), "Invalid settings should be rejected before any work") && ok;
  return ok;
}

} // namespace

int main() {
  set_log_level(LogLevel::Error);

  bool ok = true;
  try {
    TempDir dir("archive_runner");
    populate_source(dir / "Site42");
    ok = check_successful_run(dir) && ok;
    ok = check_chunk_failures(dir) && ok;
    ok = check_cancelled_run(dir) && ok;
    ok = check_empty_and_invalid(dir) && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    return 1;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Archive runner tests passed" << std::endl;
  return 0;
}
