// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/archive_runner.h"
#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/completeness.h"
#include "archive_chunker/log.h"
#include "archive_chunker/run_options.h"

#include <csignal>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

#ifndef ARCHIVE_CHUNKER_VERSION
#define ARCHIVE_CHUNKER_VERSION "0.0.0"
#endif

namespace {

using namespace archive_chunker;

constexpr int kExitSuccess = 0;
constexpr int kExitCompleteError = 1;
constexpr int kExitUsage = 2;
constexpr int kExitFatal = 3;
constexpr int kExitCancelled = 130;

CancellationToken *g_cancel_token = nullptr;

void handle_termination_signal(int) {
  if (g_cancel_token) {
    g_cancel_token->cancel();
  }
}

struct CommandLine {
  std::optional<std::filesystem::path> config_file;
  std::optional<std::filesystem::path> input_dir;
  std::optional<std::filesystem::path> output_dir;
  std::optional<uint64_t> target_chunk_size_mb;
  std::optional<std::size_t> workers;
  std::optional<std::string> dictionary_format;
  std::optional<std::string> entry_prefix;
  bool no_entry_prefix = false;
  std::optional<std::string> upload_bucket;
  std::optional<std::string> upload_project;
  std::optional<std::string> upload_region;
  bool no_web_view = false;
  bool verbose = false;
  bool quiet = false;
  bool recheck = false;
  bool show_version = false;
  bool show_help = false;
};

void print_usage(const char *argv0) {
  std::cerr << "Usage: " << (argv0 ? argv0 : "archive_chunker")
            << " --input-dir DIR --output-dir DIR [--target-chunk-size-mb N]\n"
               "         [--workers N] [--dictionary-format text|json]\n"
               "         [--entry-prefix P | --no-entry-prefix] [--config FILE]\n"
               "         [--upload-bucket B --upload-project P [--upload-region R]]\n"
               "         [--no-web-view] [--verbose | --quiet] [--version] [--help]\n"
            << "       " << (argv0 ? argv0 : "archive_chunker")
            << " --recheck --output-dir DIR (--input-dir DIR | --entry-prefix P | --no-entry-prefix)\n";
}

bool parse_unsigned(std::string_view value, uint64_t &out) {
  if (value.empty()) {
    return false;
  }
  uint64_t result = 0;
  for (char ch : value) {
    if (ch < '0' || ch > '9') {
      return false;
    }
    const uint64_t digit = static_cast<uint64_t>(ch - '0');
    if (result > (UINT64_MAX - digit) / 10) {
      return false;
    }
    result = result * 10 + digit;
  }
  out = result;
  return true;
}

// Returns false (after printing a message) on malformed arguments.
bool parse_command_line(int argc, char **argv, CommandLine &cmd) {
  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    const auto next_value = [&](const char *flag, std::string &value) {
      if (i + 1 >= argc) {
        std::cerr << "Error: " << flag << " requires a value\n";
        return false;
      }
      value = argv[++i];
      return true;
    };

    std::string value;
    if (arg == "--help" || arg == "-h") {
      cmd.show_help = true;
    } else if (arg == "--version") {
      cmd.show_version = true;
    } else if (arg == "--verbose") {
      cmd.verbose = true;
    } else if (arg == "--quiet") {
      cmd.quiet = true;
    } else if (arg == "--no-web-view") {
      cmd.no_web_view = true;
    } else if (arg == "--no-entry-prefix") {
      cmd.no_entry_prefix = true;
    } else if (arg == "--recheck") {
      cmd.recheck = true;
    } else if (arg == "--config") {
      if (!next_value("--config", value)) {
        return false;
      }
      cmd.config_file = value;
    } else if (arg == "--input-dir") {
      if (!next_value("--input-dir", value)) {
        return false;
      }
      cmd.input_dir = value;
    } else if (arg == "--output-dir") {
      if (!next_value("--output-dir", value)) {
        return false;
      }
      cmd.output_dir = value;
    } else if (arg == "--target-chunk-size-mb") {
      uint64_t mb = 0;
      if (!next_value("--target-chunk-size-mb", value)) {
        return false;
      }
      if (!parse_unsigned(value, mb) || mb == 0 || mb > (UINT64_MAX >> 20)) {
        std::cerr << "Error: invalid --target-chunk-size-mb value\n";
        return false;
      }
      cmd.target_chunk_size_mb = mb;
    } else if (arg == "--workers") {
      uint64_t workers = 0;
      if (!next_value("--workers", value)) {
        return false;
      }
      if (!parse_unsigned(value, workers) || workers == 0) {
        std::cerr << "Error: invalid --workers value\n";
        return false;
      }
      cmd.workers = static_cast<std::size_t>(workers);
    } else if (arg == "--dictionary-format") {
      if (!next_value("--dictionary-format", value)) {
        return false;
      }
      cmd.dictionary_format = value;
    } else if (arg == "--entry-prefix") {
      if (!next_value("--entry-prefix", value)) {
        return false;
      }
      cmd.entry_prefix = value;
    } else if (arg == "--upload-bucket") {
      if (!next_value("--upload-bucket", value)) {
        return false;
      }
      cmd.upload_bucket = value;
    } else if (arg == "--upload-project") {
      if (!next_value("--upload-project", value)) {
        return false;
      }
      cmd.upload_project = value;
    } else if (arg == "--upload-region") {
      if (!next_value("--upload-region", value)) {
        return false;
      }
      cmd.upload_region = value;
    } else {
      std::cerr << "Error: unknown arg: " << arg << "\n";
      return false;
    }
  }

  if (cmd.verbose && cmd.quiet) {
    std::cerr << "Error: --verbose and --quiet are mutually exclusive\n";
    return false;
  }
  if (cmd.entry_prefix && cmd.no_entry_prefix) {
    std::cerr << "Error: --entry-prefix and --no-entry-prefix are mutually exclusive\n";
    return false;
  }
  return true;
}

/// Config file first, then command-line flags on top.
RunOptions resolve_run_options(const CommandLine &cmd) {
  RunOptions options;
  if (cmd.config_file) {
    options = load_run_options_file(*cmd.config_file, options);
  }
  if (cmd.input_dir) {
    options.input_dir = *cmd.input_dir;
  }
  if (cmd.output_dir) {
    options.output_dir = *cmd.output_dir;
  }
  if (cmd.target_chunk_size_mb) {
    options.chunker.target_size_bytes = *cmd.target_chunk_size_mb << 20;
  }
  if (cmd.workers) {
    options.workers = *cmd.workers;
  }
  if (cmd.dictionary_format) {
    options.dictionary_format = parse_dictionary_format(*cmd.dictionary_format);
  }
  if (cmd.entry_prefix) {
    options.entry_prefix = *cmd.entry_prefix;
  } else if (cmd.no_entry_prefix) {
    options.entry_prefix = std::string();
  }
  if (cmd.no_web_view) {
    options.render_web_view = false;
  }
  if (cmd.upload_bucket || cmd.upload_project || cmd.upload_region) {
    UploadSettings upload = options.upload.value_or(UploadSettings{});
    if (cmd.upload_bucket) {
      upload.bucket = *cmd.upload_bucket;
    }
    if (cmd.upload_project) {
      upload.project = *cmd.upload_project;
    }
    if (cmd.upload_region) {
      upload.region = *cmd.upload_region;
    }
    options.upload = upload;
  }
  if (cmd.recheck) {
    validate_recheck_options(options);
  } else {
    validate_run_options(options);
  }
  return options;
}

int run_recheck(const RunOptions &options) {
  const CompletenessReport report = recheck_output_root(options.output_dir, resolved_entry_prefix(options));
  std::cout << report.to_text();
  return report.success() ? kExitSuccess : kExitCompleteError;
}

int run_archive(const RunOptions &options) {
  std::shared_ptr<ChunkUploader> uploader;
  if (options.upload) {
    const S3Credentials credentials = s3_credentials_from_environment(options.upload->endpoint_url.empty());
    uploader = std::make_shared<S3ChunkUploader>(credentials, *options.upload);
  }

  ArchiveRunner runner(options, uploader);
  g_cancel_token = &runner.cancellation_token();
  std::signal(SIGINT, handle_termination_signal);
  std::signal(SIGTERM, handle_termination_signal);

  const RunSummary summary = runner.run();

  std::signal(SIGINT, SIG_DFL);
  std::signal(SIGTERM, SIG_DFL);
  g_cancel_token = nullptr;

  switch (summary.status) {
  case RunStatus::CompleteSuccess:
    return kExitSuccess;
  case RunStatus::Cancelled:
    return kExitCancelled;
  case RunStatus::CompleteError:
    break;
  }
  return kExitCompleteError;
}

} // namespace

int main(int argc, char **argv) {
  CommandLine cmd;
  if (!parse_command_line(argc, argv, cmd)) {
    print_usage(argv[0]);
    return kExitUsage;
  }
  if (cmd.show_help) {
    print_usage(argv[0]);
    return kExitSuccess;
  }
  if (cmd.show_version) {
    std::cout << "archive_chunker " << ARCHIVE_CHUNKER_VERSION << "\n";
    return kExitSuccess;
  }

  if (cmd.verbose) {
    set_log_level(LogLevel::Debug);
  } else if (cmd.quiet) {
    set_log_level(LogLevel::Warning);
  }

  RunOptions options;
  try {
    options = resolve_run_options(cmd);
  } catch (const ChunkerError &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    print_usage(argv[0]);
    return kExitUsage;
  }

  try {
    return cmd.recheck ? run_recheck(options) : run_archive(options);
  } catch (const ConfigError &ex) {
    log_error(ex.what());
    return kExitUsage;
  } catch (const CancelledError &ex) {
    log_error(ex.what());
    return kExitCancelled;
  } catch (const ChunkerError &ex) {
    log_error(std::string(chunk_fault_kind_name(ex.kind())) + ": " + ex.what());
    return kExitFatal;
  } catch (const std::exception &ex) {
    log_error(std::string("Fatal: ") + ex.what());
    return kExitFatal;
  }
}
