// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/log.h"
#include "archive_chunker/project_restore.h"

#include <csignal>
#include <iostream>
#include <string>

namespace {

using namespace archive_chunker;

constexpr int kExitSuccess = 0;
constexpr int kExitUsage = 2;
constexpr int kExitFatal = 3;
constexpr int kExitCancelled = 130;

CancellationToken g_cancel_token;

void handle_termination_signal(int) { g_cancel_token.cancel(); }

struct CommandLine {
  RestoreOptions restore;
  UploadSettings store;
  bool verbose = false;
  bool quiet = false;
  bool show_help = false;
};

void print_usage(const char *argv0) {
  std::cerr << "Usage: " << (argv0 ? argv0 : "archive_restore")
            << " --project-name NAME --output-dir DIR [--working-dir DIR]\n"
               "         [--bucket-name B] [--region R] [--endpoint-url URL] [--verbose | --quiet] [--help]\n"
               "\n"
               "Downloads every <NAME>/*.zip object and extracts it into DIR.\n"
               "Environment: ARCHIVER_S3_ACCESS_KEY, ARCHIVER_S3_SECRET_KEY, ARCHIVER_S3_ENDPOINT_URL\n";
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
    } else if (arg == "--verbose") {
      cmd.verbose = true;
    } else if (arg == "--quiet") {
      cmd.quiet = true;
    } else if (arg == "--project-name") {
      if (!next_value("--project-name", value)) {
        return false;
      }
      cmd.restore.project = value;
    } else if (arg == "--output-dir") {
      if (!next_value("--output-dir", value)) {
        return false;
      }
      cmd.restore.output_dir = value;
    } else if (arg == "--working-dir") {
      if (!next_value("--working-dir", value)) {
        return false;
      }
      cmd.restore.working_dir = value;
    } else if (arg == "--bucket-name") {
      if (!next_value("--bucket-name", value)) {
        return false;
      }
      cmd.store.bucket = value;
    } else if (arg == "--region") {
      if (!next_value("--region", value)) {
        return false;
      }
      cmd.store.region = value;
    } else if (arg == "--endpoint-url") {
      if (!next_value("--endpoint-url", value)) {
        return false;
      }
      cmd.store.endpoint_url = value;
    } else {
      std::cerr << "Error: unknown arg: " << arg << "\n";
      return false;
    }
  }

  if (cmd.show_help) {
    return true;
  }
  if (cmd.restore.project.empty() || cmd.restore.output_dir.empty()) {
    std::cerr << "Error: --project-name and --output-dir are required\n";
    return false;
  }
  if (cmd.verbose && cmd.quiet) {
    std::cerr << "Error: --verbose and --quiet are mutually exclusive\n";
    return false;
  }
  return true;
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
  if (cmd.verbose) {
    set_log_level(LogLevel::Debug);
  } else if (cmd.quiet) {
    set_log_level(LogLevel::Warning);
  }

  cmd.store.project = cmd.restore.project;
  cmd.restore.cancel = &g_cancel_token;
  std::signal(SIGINT, handle_termination_signal);
  std::signal(SIGTERM, handle_termination_signal);

  try {
    const S3Credentials credentials = s3_credentials_from_environment(cmd.store.endpoint_url.empty());
    S3ObjectStore store(credentials, cmd.store);
    const RestoreSummary summary = restore_project(store, cmd.restore);
    std::cout << "Extracted " << summary.files << " files from " << summary.archives << " zip files for project '" << cmd.restore.project
              << "'\n";
    return kExitSuccess;
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
