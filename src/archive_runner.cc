// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/archive_runner.h"
#include "archive_chunker/directory_scanner.h"
#include "archive_chunker/directory_tree.h"
#include "archive_chunker/listing_format.h"
#include "archive_chunker/log.h"
#include "archive_chunker/web_view.h"
#include "worker_pool.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <future>
#include <sstream>
#include <system_error>
#include <utility>

namespace archive_chunker {

namespace {

constexpr const char *kChunksDirName = "Chunks";
constexpr const char *kWebViewDirName = "WebView";
constexpr const char *kFullListingName = "FullListing.txt";
constexpr auto kScanProgressInterval = std::chrono::seconds(30);

void remove_quietly(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::remove(path, ec);
}

void write_error_file(const ChunkArtifactPaths &paths, const std::string &text) {
  std::error_code ec;
  if (std::filesystem::exists(paths.error, ec)) {
    return;
  }
  try {
    write_text_file(paths.error, text + "\n");
  } catch (const ChunkerError &ex) {
    log_error(ex.what());
  }
}

} // namespace

const char *run_status_name(RunStatus status) {
  switch (status) {
  case RunStatus::CompleteSuccess:
    return "CompleteSuccess";
  case RunStatus::CompleteError:
    return "CompleteError";
  case RunStatus::Cancelled:
    return "Cancelled";
  }
  return "Unknown";
}

std::string ChunkOutcome::failure_text() const {
  if (fault) {
    return std::string(chunk_fault_kind_name(fault->kind)) + ": " + fault->message;
  }
  if (!attempted) {
    return "chunk was not attempted";
  }
  if (verification && !verification->passed()) {
    return "verification found " + std::to_string(verification->discrepancies.size()) + " discrepancies";
  }
  if (!verified) {
    return "chunk was not verified";
  }
  return std::string();
}

ArchiveRunner::ArchiveRunner(RunOptions options, std::shared_ptr<ChunkUploader> uploader)
    : _options(std::move(options))
    , _uploader(std::move(uploader)) {}

RunSummary ArchiveRunner::run() {
  validate_run_options(_options);
  prepare_output_root();

  log_info("Scanning " + _options.input_dir.string());
  auto last_report = std::chrono::steady_clock::now();
  ScanStats stats;
  const FileCatalog catalog = scan_directory(_options.input_dir, &stats, [&last_report](const ScanStats &progress) {
    const auto now = std::chrono::steady_clock::now();
    if (now - last_report >= kScanProgressInterval) {
      last_report = now;
      log_info("Scanned " + std::to_string(progress.files) + " files, " + std::to_string(progress.directories) + " directories, " +
               bytes_to_human(progress.bytes));
    }
  });
  log_info("Scan complete: " + std::to_string(stats.files) + " files in " + std::to_string(stats.directories) + " directories (" +
           bytes_to_human(stats.bytes) + ")");
  if (stats.skipped > 0) {
    log_warning("Skipped " + std::to_string(stats.skipped) + " entries that are not regular files or directories");
  }

  return execute(catalog);
}

RunSummary ArchiveRunner::run_catalog(const FileCatalog &catalog) {
  validate_run_options(_options);
  prepare_output_root();
  return execute(catalog);
}

void ArchiveRunner::prepare_output_root() const {
  std::error_code ec;
  if (!std::filesystem::is_directory(_options.input_dir, ec)) {
    throw IoError("Input directory " + _options.input_dir.string() + " does not exist or is not a directory", _options.input_dir.string());
  }

  if (!std::filesystem::exists(_options.output_dir, ec)) {
    std::filesystem::create_directories(_options.output_dir, ec);
    if (ec) {
      throw IoError(format_path_errno_error("Failed to create output directory", _options.output_dir.string(), ec.value()),
                    _options.output_dir.string(), ec.value());
    }
    return;
  }
  if (!std::filesystem::is_directory(_options.output_dir, ec)) {
    throw IoError("Output directory " + _options.output_dir.string() + " is not a directory", _options.output_dir.string());
  }
  if (!std::filesystem::is_empty(_options.output_dir, ec) || ec) {
    throw IoError("Output directory " + _options.output_dir.string() + " is not empty (resume is not supported)", _options.output_dir.string());
  }
}

RunSummary ArchiveRunner::execute(const FileCatalog &catalog) {
  const std::string entry_prefix = resolved_entry_prefix(_options);
  const std::string title_name = entry_prefix.empty() ? _options.input_dir.filename().string() : entry_prefix;
  const std::filesystem::path chunks_dir = _options.output_dir / kChunksDirName;

  RunSummary summary;
  summary.file_count = catalog.size();
  summary.total_bytes = catalog_total_size(catalog);

  log_info(describe_chunker_settings(_options.chunker));

  PlanResult plan;
  {
    const std::unique_ptr<DirectoryNode> root = build_directory_tree(catalog);
    log_info("Deciding on chunks for " + std::to_string(count_directories(*root)) + " directories");
    plan = plan_chunks(*root, _options.chunker);
  }
  summary.warnings = plan.warnings;
  log_info("Planned " + std::to_string(plan.chunks.size()) + " chunks for " + std::to_string(catalog.size()) + " files (" +
           bytes_to_human(summary.total_bytes) + ")");
  for (const SizeDeviationWarning &warning : plan.warnings) {
    log_warning(warning.describe(_options.chunker));
  }

  write_text_file(_options.output_dir / kFullListingName,
                  render_listing(title_name, _options.input_dir.string(), listing_entries_from_catalog(catalog), entry_prefix));
  const std::filesystem::path dictionary_path = write_chunk_dictionary(_options.output_dir, plan, _options.dictionary_format, entry_prefix);
  log_info("Wrote " + dictionary_path.filename().string());

  std::error_code ec;
  std::filesystem::create_directories(chunks_dir, ec);
  if (ec) {
    throw IoError(format_path_errno_error("Failed to create chunk directory", chunks_dir.string(), ec.value()), chunks_dir.string(), ec.value());
  }

  BuildOptions build_options;
  build_options.source_root = _options.input_dir;
  build_options.chunks_dir = chunks_dir;
  build_options.entry_prefix = entry_prefix;
  build_options.title_name = title_name;
  build_options.cancel = &_cancel;

  if (!plan.chunks.empty()) {
    const std::size_t worker_count = std::min(resolved_worker_count(_options), plan.chunks.size());
    log_info("Saving " + std::to_string(plan.chunks.size()) + " chunks with " + std::to_string(worker_count) + " workers");

    std::atomic<std::size_t> finished{ 0 };
    const std::size_t total = plan.chunks.size();
    std::vector<std::future<ChunkOutcome>> pending;
    pending.reserve(total);
    {
      WorkerPool pool(worker_count);
      for (const ChunkPlan &chunk : plan.chunks) {
        pending.push_back(pool.submit([this, &chunk, &build_options, &finished, total]() {
          ChunkOutcome outcome = process_chunk(chunk, build_options);
          const std::size_t done = ++finished;
          log_info("Chunk " + std::to_string(outcome.chunk_id) + " " + (outcome.verified ? "verified" : "FAILED") + " (" + std::to_string(done) +
                   "/" + std::to_string(total) + ")");
          return outcome;
        }));
      }
      // Barrier: every chunk has either finished or recorded its failure.
      for (std::future<ChunkOutcome> &future : pending) {
        summary.chunks.push_back(future.get());
      }
    }
  }

  std::vector<ChunkListing> listings;
  listings.reserve(summary.chunks.size());
  for (const ChunkOutcome &outcome : summary.chunks) {
    ChunkListing listing;
    listing.chunk_id = outcome.chunk_id;
    listing.entries = outcome.artifact.listing;
    listing.verified = outcome.verified;
    listing.failure = outcome.failure_text();
    listings.push_back(std::move(listing));
  }
  summary.completeness = check_completeness(listings, catalog);

  for (const ChunkOutcome &outcome : summary.chunks) {
    if (outcome.upload && !outcome.upload->ok) {
      add_completeness_note(summary.completeness, "Upload of chunk " + std::to_string(outcome.chunk_id) + " failed: " + outcome.upload->message);
    }
  }
  const bool cancelled = _cancel.cancelled();
  if (cancelled) {
    add_completeness_note(summary.completeness, "Run was cancelled before every chunk finished");
  }

  summary.sentinel_path = write_completeness_sentinel(_options.output_dir, summary.completeness);

  if (_options.render_web_view && !cancelled) {
    try {
      render_web_view(_options.output_dir / kWebViewDirName, catalog, plan.dictionary, title_name);
    } catch (const ChunkerError &ex) {
      log_error(std::string("Web view was not rendered: ") + ex.what());
    }
  }

  if (cancelled) {
    summary.status = RunStatus::Cancelled;
  } else {
    summary.status = summary.completeness.success() ? RunStatus::CompleteSuccess : RunStatus::CompleteError;
  }
  log_info("Run finished: " + std::string(run_status_name(summary.status)) + " (" + summary.sentinel_path.filename().string() + ")");
  return summary;
}

ChunkOutcome ArchiveRunner::process_chunk(const ChunkPlan &plan, const BuildOptions &build_options) const {
  ChunkOutcome outcome;
  outcome.chunk_id = plan.chunk_id;
  if (_cancel.cancelled()) {
    outcome.fault = CancelledError("Chunk " + std::to_string(plan.chunk_id) + " was not started before cancellation").fault();
    return outcome;
  }

  outcome.attempted = true;
  const ChunkArtifactPaths paths = chunk_artifact_paths(build_options.chunks_dir, plan.chunk_id);
  try {
    outcome.artifact = build_chunk(plan, build_options);
    outcome.built = true;

    VerificationReport report = verify_chunk(outcome.artifact, plan, build_options.entry_prefix, &_cancel);
    write_text_file(paths.check, report.to_text());
    outcome.verified = report.passed();
    if (!outcome.verified) {
      write_error_file(paths, report.to_text());
    }
    outcome.verification = std::move(report);

    if (outcome.verified && _uploader) {
      UploadRequest request;
      request.chunk_id = plan.chunk_id;
      request.archive_path = outcome.artifact.archive_path;
      request.digest = outcome.artifact.digest;
      outcome.upload = _uploader->upload(request);
      if (outcome.upload->ok) {
        log_debug(outcome.upload->message);
      } else {
        log_error(outcome.upload->message);
      }
    }
  } catch (const CancelledError &ex) {
    outcome.fault = ex.fault();
    outcome.verified = false;
    // A built chunk that did not finish verification is not independently useful.
    if (outcome.built) {
      remove_quietly(paths.archive);
      remove_quietly(paths.listing);
      remove_quietly(paths.hash);
      remove_quietly(paths.check);
    }
  } catch (const ChunkerError &ex) {
    outcome.fault = ex.fault();
    outcome.verified = false;
    log_error("Chunk " + std::to_string(plan.chunk_id) + ": " + ex.what());
    if (ex.kind() != ChunkFaultKind::OutputExists) {
      write_error_file(paths, std::string(chunk_fault_kind_name(ex.kind())) + ": " + ex.what());
    }
  } catch (const std::exception &ex) {
    ChunkFault fault;
    fault.kind = ChunkFaultKind::Io;
    fault.message = ex.what();
    outcome.fault = std::move(fault);
    outcome.verified = false;
    log_error("Chunk " + std::to_string(plan.chunk_id) + ": " + ex.what());
    write_error_file(paths, ex.what());
  }
  return outcome;
}

} // namespace archive_chunker
