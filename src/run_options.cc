// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/run_options.h"
#include "archive_chunker/chunker_error.h"

#include <nlohmann/json.hpp>

#include <fstream>
#include <set>
#include <thread>

namespace archive_chunker {

namespace {

const std::set<std::string> &known_keys() {
  static const std::set<std::string> keys = { "input_dir",     "output_dir",        "target_chunk_size_bytes", "target_chunk_size_mb",
                                              "min_chunk_size_factor", "max_chunk_size_factor", "workers", "dictionary_format",
                                              "entry_prefix",  "web_view",          "upload" };
  return keys;
}

UploadSettings parse_upload(const nlohmann::json &node, UploadSettings settings) {
  if (!node.is_object()) {
    throw ConfigError("'upload' must be an object");
  }
  for (const auto &item : node.items()) {
    const std::string &key = item.key();
    if (key == "endpoint_url") {
      settings.endpoint_url = item.value().get<std::string>();
    } else if (key == "bucket") {
      settings.bucket = item.value().get<std::string>();
    } else if (key == "project") {
      settings.project = item.value().get<std::string>();
    } else if (key == "region") {
      settings.region = item.value().get<std::string>();
    } else {
      throw ConfigError("Unknown upload configuration key '" + key + "'");
    }
  }
  return settings;
}

void validate_entry_prefix(const RunOptions &options) {
  if (options.entry_prefix) {
    const std::string &prefix = *options.entry_prefix;
    if (prefix.find('/') != std::string::npos || prefix == "." || prefix == "..") {
      throw ConfigError("Entry prefix must be a single path component");
    }
  }
}

} // namespace

std::size_t default_worker_count() {
  const unsigned hint = std::thread::hardware_concurrency();
  return hint == 0 ? 1 : static_cast<std::size_t>(hint);
}

std::size_t resolved_worker_count(const RunOptions &options) { return options.workers == 0 ? default_worker_count() : options.workers; }

std::string resolved_entry_prefix(const RunOptions &options) {
  if (options.entry_prefix) {
    return *options.entry_prefix;
  }
  std::filesystem::path normalized = options.input_dir.lexically_normal();
  if (!normalized.has_filename()) {
    normalized = normalized.parent_path();
  }
  std::string name = normalized.filename().string();
  if (name.empty() || name == "." || name == "..") {
    name = std::filesystem::absolute(options.input_dir).lexically_normal().filename().string();
  }
  return (name == "." || name == "..") ? std::string() : name;
}

RunOptions load_run_options_file(const std::filesystem::path &path, RunOptions base) {
  std::ifstream in(path);
  if (!in) {
    throw ConfigError("Cannot open configuration file " + path.string());
  }

  nlohmann::json document;
  try {
    in >> document;
  } catch (const nlohmann::json::exception &ex) {
    throw ConfigError("Invalid JSON in " + path.string() + ": " + ex.what());
  }
  if (!document.is_object()) {
    throw ConfigError("Configuration file " + path.string() + " must contain a JSON object");
  }

  try {
    for (const auto &item : document.items()) {
      const std::string &key = item.key();
      const nlohmann::json &value = item.value();
      if (known_keys().count(key) == 0) {
        throw ConfigError("Unknown configuration key '" + key + "' in " + path.string());
      }
      if (key == "input_dir") {
        base.input_dir = value.get<std::string>();
      } else if (key == "output_dir") {
        base.output_dir = value.get<std::string>();
      } else if (key == "target_chunk_size_bytes") {
        base.chunker.target_size_bytes = value.get<uint64_t>();
      } else if (key == "target_chunk_size_mb") {
        base.chunker.target_size_bytes = value.get<uint64_t>() * 1024ull * 1024ull;
      } else if (key == "min_chunk_size_factor") {
        base.chunker.min_chunk_size_factor = value.get<double>();
      } else if (key == "max_chunk_size_factor") {
        base.chunker.max_chunk_size_factor = value.get<double>();
      } else if (key == "workers") {
        base.workers = value.get<std::size_t>();
        if (base.workers == 0) {
          throw ConfigError("'workers' must be at least 1 in " + path.string());
        }
      } else if (key == "dictionary_format") {
        base.dictionary_format = parse_dictionary_format(value.get<std::string>());
      } else if (key == "entry_prefix") {
        base.entry_prefix = value.is_null() ? std::optional<std::string>() : std::optional<std::string>(value.get<std::string>());
      } else if (key == "web_view") {
        base.render_web_view = value.get<bool>();
      } else if (key == "upload") {
        base.upload = parse_upload(value, base.upload.value_or(UploadSettings{}));
      }
    }
  } catch (const nlohmann::json::exception &ex) {
    throw ConfigError("Invalid value in " + path.string() + ": " + ex.what());
  }
  return base;
}

void validate_run_options(const RunOptions &options) {
  if (options.input_dir.empty()) {
    throw ConfigError("An input directory is required");
  }
  if (options.output_dir.empty()) {
    throw ConfigError("An output directory is required");
  }
  validate_chunker_settings(options.chunker);
  validate_entry_prefix(options);
  if (options.upload) {
    if (options.upload->bucket.empty()) {
      throw ConfigError("Upload requires a bucket name");
    }
    if (options.upload->project.empty()) {
      throw ConfigError("Upload requires a project name");
    }
  }
}

void validate_recheck_options(const RunOptions &options) {
  if (options.output_dir.empty()) {
    throw ConfigError("An output directory is required");
  }
  if (!options.entry_prefix && options.input_dir.empty()) {
    throw ConfigError("An input directory or an explicit entry prefix is required");
  }
  validate_entry_prefix(options);
}

} // namespace archive_chunker
