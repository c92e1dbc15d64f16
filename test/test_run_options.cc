// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/chunk_uploader.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/run_options.h"
#include "test_support.h"

#include <cstdlib>
#include <iostream>
#include <string>

using namespace archive_chunker;
using namespace archive_chunker::test;

namespace {

bool config_rejected(const TempDir &dir, const std::string &name, const std::string &json) {
  const std::filesystem::path path = dir / name;
  write_file(path, json);
  return throws<ConfigError>([&] { load_run_options_file(path); });
}

bool check_config_file(const TempDir &dir) {
  bool ok = true;
  const std::filesystem::path path = dir / "archive.json";
  write_file(path, R"({
    "input_dir": "/srv/projects/Apollo",
    "output_dir": "/srv/archive/Apollo",
    "target_chunk_size_mb": 2048,
    "workers": 6,
    "dictionary_format": "json",
    "web_view": false,
    "upload": { "bucket": "cold-storage", "project": "Apollo" }
  })");

  const RunOptions options = load_run_options_file(path);
  ok = expect(options.input_dir == "/srv/projects/Apollo" && options.output_dir == "/srv/archive/Apollo", "Directories should load") && ok;
  ok = expect(options.chunker.target_size_bytes == 2048 * kMiB, "Target should convert from MiB") && ok;
  ok = expect(options.workers == 6 && resolved_worker_count(options) == 6, "Worker count should load") && ok;
  ok = expect(options.dictionary_format == DictionaryFormat::Json && !options.render_web_view, "Format and web view flags should load") && ok;
  ok = expect(options.upload && options.upload->bucket == "cold-storage" && options.upload->project == "Apollo", "Upload block should load") && ok;
  ok = expect(options.upload && options.upload->region == "us-east-1", "Upload region should keep its default") && ok;
  ok = expect(resolved_entry_prefix(options) == "Apollo", "Prefix should default to the input directory name") && ok;
  validate_run_options(options);

  RunOptions base;
  base.workers = 2;
  base.entry_prefix = "Keep";
  const std::filesystem::path overlay = dir / "overlay.json";
  write_file(overlay, R"({"target_chunk_size_bytes": 1000, "entry_prefix": null})");
  const RunOptions merged = load_run_options_file(overlay, base);
  ok = expect(merged.workers == 2 && merged.chunker.target_size_bytes == 1000, "Overlay should keep unset fields from the base") && ok;
  ok = expect(!merged.entry_prefix, "Null entry prefix should reset to the default") && ok;

  ok = expect(config_rejected(dir, "unknown.json", R"({"chunk_size": 5})"), "Unknown keys should be rejected") && ok;
  ok = expect(config_rejected(dir, "type.json", R"({"workers": "many"})"), "Wrong value types should be rejected") && ok;
  ok = expect(config_rejected(dir, "zero.json", R"({"workers": 0})"), "Zero workers should be rejected") && ok;
  ok = expect(config_rejected(dir, "format.json", R"({"dictionary_format": "xml"})"), "Unknown dictionary formats should be rejected") && ok;
  ok = expect(config_rejected(dir, "syntax.json", R"({"workers": )"), "Malformed JSON should be rejected") && ok;
  ok = expect(config_rejected(dir, "array.json", R"([1, 2])"), "Non-object documents should be rejected") && ok;
  ok = expect(config_rejected(dir, "upload.json", R"({"upload": {"acl": "public"}})"), "Unknown upload keys should be rejected") && ok;
  ok = expect(throws<ConfigError>([&] { load_run_options_file(dir / "absent.json"); }), "Missing config file should be rejected") && ok;
  return ok;
}

bool check_validation() {
  bool ok = true;
  RunOptions options;
  options.input_dir = "/data/in";
  options.output_dir = "/data/out";
  validate_run_options(options);
  ok = expect(resolved_worker_count(options) == default_worker_count() && default_worker_count() >= 1, "Zero workers resolve to the default") && ok;

  RunOptions trailing = options;
  trailing.input_dir = "/data/in/";
  ok = expect(resolved_entry_prefix(trailing) == "in", "Trailing separator should not hide the directory name") && ok;

  RunOptions no_prefix = options;
  no_prefix.entry_prefix = std::string();
  ok = expect(resolved_entry_prefix(no_prefix).empty(), "Explicit empty prefix should be kept") && ok;

  RunOptions bad = options;
  bad.output_dir.clear();
  ok = expect(throws<ConfigError>([&] { validate_run_options(bad); }), "Missing output directory should be rejected") && ok;
  bad = options;
  bad.entry_prefix = std::string("a/b");
  ok = expect(throws<ConfigError>([&] { validate_run_options(bad); }), "Multi-component prefix should be rejected") && ok;
  bad = options;
  bad.chunker.target_size_bytes = 0;
  ok = expect(throws<ConfigError>([&] { validate_run_options(bad); }), "Zero target should be rejected") && ok;
  bad = options;
  bad.upload = UploadSettings{};
  ok = expect(throws<ConfigError>([&] { validate_run_options(bad); }), "Upload without a project should be rejected") && ok;
  return ok;
}

bool check_recheck_validation() {
  bool ok = true;
  RunOptions options;
  options.output_dir = "/data/out";
  ok = expect(throws<ConfigError>([&] { validate_recheck_options(options); }), "Recheck without input dir or prefix should be rejected") && ok;

  RunOptions named = options;
  named.entry_prefix = std::string("Proj");
  validate_recheck_options(named);
  ok = expect(resolved_entry_prefix(named) == "Proj", "Recheck with an explicit prefix needs no input directory") && ok;

  RunOptions bare = options;
  bare.entry_prefix = std::string();
  validate_recheck_options(bare);
  ok = expect(resolved_entry_prefix(bare).empty(), "Recheck with no prefix needs no input directory") && ok;

  RunOptions from_input = options;
  from_input.input_dir = "/data/Proj";
  validate_recheck_options(from_input);
  ok = expect(resolved_entry_prefix(from_input) == "Proj", "Recheck may still derive the prefix from the input directory") && ok;

  RunOptions no_output = named;
  no_output.output_dir.clear();
  ok = expect(throws<ConfigError>([&] { validate_recheck_options(no_output); }), "Recheck still needs the output directory") && ok;
  RunOptions nested = options;
  nested.entry_prefix = std::string("a/b");
  ok = expect(throws<ConfigError>([&] { validate_recheck_options(nested); }), "Recheck rejects multi-component prefixes") && ok;
  ok = expect(throws<ConfigError>([&] { validate_run_options(named); }), "A full run still requires the input directory") && ok;
  return ok;
}

bool check_upload_helpers() {
  bool ok = true;
  ok = expect(s3_object_key("Apollo", 12) == "Apollo/Chunk0000012.zip", "Object key should follow the chunk name") && ok;
  ok = expect(s3_object_url("http://minio:9000/", "project-archive", "My Project/Chunk0000001.zip") ==
                  "http://minio:9000/project-archive/My%20Project/Chunk0000001.zip",
              "Object URL should escape each key segment") && ok;

  unsetenv("ARCHIVER_S3_ACCESS_KEY");
  unsetenv("ARCHIVER_S3_SECRET_KEY");
  unsetenv("ARCHIVER_S3_ENDPOINT_URL");
  try {
    s3_credentials_from_environment();
    ok = expect(false, "Expected ConfigError for missing credentials") && ok;
  } catch (const ConfigError &ex) {
    const std::string message = ex.what();
    ok = expect(message.find("ARCHIVER_S3_ACCESS_KEY") != std::string::npos && message.find("ARCHIVER_S3_ENDPOINT_URL") != std::string::npos,
                "Error should list every missing variable: " + message) && ok;
  }

  setenv("ARCHIVER_S3_ACCESS_KEY", "AKIDEXAMPLE", 1);
  setenv("ARCHIVER_S3_SECRET_KEY", "secret", 1);
  const S3Credentials credentials = s3_credentials_from_environment(false);
  ok = expect(credentials.access_key == "AKIDEXAMPLE" && credentials.secret_key == "secret", "Credentials should come from the environment") && ok;
  ok = expect(throws<ConfigError>([] { s3_credentials_from_environment(true); }), "Endpoint should be required when asked for") && ok;
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  try {
    TempDir dir("run_options");
    ok = check_config_file(dir) && ok;
    ok = check_validation() && ok;
    ok = check_recheck_validation() && ok;
    ok = check_upload_helpers() && ok;
  } catch (const std::exception &ex) {
    std::cerr << "Unexpected exception: " << ex.what() << std::endl;
    return 1;
  }

  if (!ok) {
    return 1;
  }
  std::cout << "Run options tests passed" << std::endl;
  return 0;
}
