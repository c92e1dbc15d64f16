// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/project_restore.h"
#include "archive_chunker/chunker_error.h"
#include "archive_chunker/log.h"
#include "archive_handles.h"
#include "curl_handles.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <iterator>
#include <system_error>
#include <utility>

namespace archive_chunker {

namespace {

constexpr std::size_t kReadBlockSize = 64 * 1024;
constexpr std::size_t kMaxErrorExcerpt = 512;
// SHA-256 of the empty request body.
constexpr const char *kEmptyPayloadSha256 = "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855";

void append_utf8(std::string &out, unsigned long code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else if (code < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (code >> 18)));
    out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

bool decode_character_reference(const std::string &entity, std::string &out) {
  if (entity.size() < 2 || entity[0] != '#') {
    return false;
  }
  const bool hex = entity[1] == 'x' || entity[1] == 'X';
  const std::string digits = entity.substr(hex ? 2 : 1);
  if (digits.empty() || digits.size() > 6) {
    return false;
  }
  unsigned long code = 0;
  for (char ch : digits) {
    int value = -1;
    if (ch >= '0' && ch <= '9') {
      value = ch - '0';
    } else if (hex && ch >= 'a' && ch <= 'f') {
      value = ch - 'a' + 10;
    } else if (hex && ch >= 'A' && ch <= 'F') {
      value = ch - 'A' + 10;
    }
    if (value < 0) {
      return false;
    }
    code = code * (hex ? 16 : 10) + static_cast<unsigned long>(value);
  }
  if (code == 0 || code > 0x10FFFF) {
    return false;
  }
  append_utf8(out, code);
  return true;
}

std::string xml_unescape(const std::string &text) {
  std::string out;
  out.reserve(text.size());
  std::string::size_type i = 0;
  while (i < text.size()) {
    if (text[i] != '&') {
      out.push_back(text[i++]);
      continue;
    }
    const std::string::size_type semi = text.find(';', i);
    if (semi == std::string::npos) {
      out.append(text, i, std::string::npos);
      break;
    }
    const std::string entity = text.substr(i + 1, semi - i - 1);
    if (entity == "amp") {
      out.push_back('&');
    } else if (entity == "lt") {
      out.push_back('<');
    } else if (entity == "gt") {
      out.push_back('>');
    } else if (entity == "quot") {
      out.push_back('"');
    } else if (entity == "apos") {
      out.push_back('\'');
    } else if (!decode_character_reference(entity, out)) {
      out.append(text, i, semi - i + 1);
    }
    i = semi + 1;
  }
  return out;
}

// Text of every <name>...</name> element, in document order.
std::vector<std::string> element_texts(const std::string &xml, const std::string &name) {
  const std::string open = "<" + name + ">";
  const std::string close = "</" + name + ">";
  std::vector<std::string> texts;
  std::string::size_type pos = 0;
  while ((pos = xml.find(open, pos)) != std::string::npos) {
    const std::string::size_type start = pos + open.size();
    const std::string::size_type end = xml.find(close, start);
    if (end == std::string::npos) {
      break;
    }
    texts.push_back(xml_unescape(xml.substr(start, end - start)));
    pos = end + close.size();
  }
  return texts;
}

std::string first_element_text(const std::string &xml, const std::string &name) {
  const std::vector<std::string> texts = element_texts(xml, name);
  return texts.empty() ? std::string() : texts.front();
}

size_t collect_body(char *ptr, size_t size, size_t nmemb, void *userdata) {
  static_cast<std::string *>(userdata)->append(ptr, size * nmemb);
  return size * nmemb;
}

size_t write_to_file(char *ptr, size_t size, size_t nmemb, void *userdata) {
  return std::fwrite(ptr, size, nmemb, static_cast<FILE *>(userdata)) * size;
}

bool is_safe_entry_name(const std::string &name) {
  if (name.empty() || name.front() == '/') {
    return false;
  }
  std::string::size_type start = 0;
  while (start <= name.size()) {
    const std::string::size_type slash = name.find('/', start);
    const std::string::size_type end = slash == std::string::npos ? name.size() : slash;
    if (name.compare(start, end - start, "..") == 0) {
      return false;
    }
    if (slash == std::string::npos) {
      break;
    }
    start = slash + 1;
  }
  return true;
}

uint64_t copy_entry_data(struct archive *reader, struct archive *writer, const std::string &archive_path, const std::string &target) {
  uint64_t copied = 0;
  while (true) {
    const void *block = nullptr;
    size_t size = 0;
    la_int64_t offset = 0;
    const int status = archive_read_data_block(reader, &block, &size, &offset);
    if (status == ARCHIVE_EOF) {
      return copied;
    }
    if (status < ARCHIVE_WARN) {
      throw ArchiveCorruptError(archive_path, archive_error_text(reader));
    }
    if (archive_write_data_block(writer, block, size, offset) < ARCHIVE_WARN) {
      throw IoError("Failed to write " + target + ": " + archive_error_text(writer), target);
    }
    copied += size;
  }
}

void ensure_directory(const std::filesystem::path &dir) {
  std::error_code ec;
  std::filesystem::create_directories(dir, ec);
  if (ec) {
    throw IoError(format_path_errno_error("Failed to create directory", dir.string(), ec.value()), dir.string(), ec.value());
  }
  if (!std::filesystem::is_directory(dir, ec)) {
    throw ConfigError(dir.string() + " exists but is not a directory");
  }
}

class DownloadedArchive {
public:
  explicit DownloadedArchive(std::filesystem::path path)
      : _path(std::move(path)) {}
  ~DownloadedArchive() {
    std::error_code ec;
    std::filesystem::remove(_path, ec);
    if (ec) {
      log_warning(format_path_errno_error("Failed to delete downloaded archive", _path.string(), ec.value()));
    }
  }

  DownloadedArchive(const DownloadedArchive &) = delete;
  DownloadedArchive &operator=(const DownloadedArchive &) = delete;

  const std::filesystem::path &path() const { return _path; }

private:
  std::filesystem::path _path;
};

} // namespace

ObjectListingPage parse_list_objects_page(const std::string &xml) {
  if (xml.find("<Error>") != std::string::npos) {
    throw TransferError("Object store error " + first_element_text(xml, "Code") + ": " + first_element_text(xml, "Message"), "");
  }
  ObjectListingPage page;
  page.keys = element_texts(xml, "Key");
  page.truncated = first_element_text(xml, "IsTruncated") == "true";
  page.next_continuation_token = first_element_text(xml, "NextContinuationToken");
  return page;
}

S3ObjectStore::S3ObjectStore(S3Credentials credentials, UploadSettings settings)
    : _credentials(std::move(credentials))
    , _settings(std::move(settings)) {
  if (_settings.endpoint_url.empty()) {
    _settings.endpoint_url = _credentials.endpoint_url;
  }
  if (_settings.endpoint_url.empty()) {
    throw ConfigError("No S3 endpoint configured (set ARCHIVER_S3_ENDPOINT_URL)");
  }
  if (curl_global_init(CURL_GLOBAL_ALL) != CURLE_OK) {
    throw std::runtime_error("curl_global_init failed");
  }
}

S3ObjectStore::~S3ObjectStore() { curl_global_cleanup(); }

std::vector<std::string> S3ObjectStore::list_keys(const std::string &prefix) {
  const std::string sigv4 = "aws:amz:" + _settings.region + ":s3";
  const std::string userpwd = _credentials.access_key + ":" + _credentials.secret_key;
  const std::string bucket_url = s3_bucket_url(_settings.endpoint_url, _settings.bucket);

  std::vector<std::string> keys;
  std::string token;
  while (true) {
    curl_easy_ptr curl(curl_easy_init());
    if (!curl) {
      throw TransferError("curl_easy_init failed", prefix);
    }
    // Query parameters in canonical (sorted) order.
    std::string url = bucket_url + "?";
    if (!token.empty()) {
      url += "continuation-token=" + escape_url_component(curl.get(), token) + "&";
    }
    url += "list-type=2&prefix=" + escape_url_component(curl.get(), prefix);

    curl_list_ptr headers;
    headers = append_header(std::move(headers), std::string("x-amz-content-sha256: ") + kEmptyPayloadSha256);

    std::string body;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERPWD, userpwd.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, collect_body);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &body);
    curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

    const CURLcode code = curl_easy_perform(curl.get());
    if (code != CURLE_OK) {
      throw TransferError("Listing bucket " + _settings.bucket + " failed: " + curl_easy_strerror(code), prefix);
    }
    long http_status = 0;
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);
    if (http_status < 200 || http_status >= 300) {
      throw TransferError("Listing bucket " + _settings.bucket + " rejected with HTTP " + std::to_string(http_status) + ": " +
                              body.substr(0, kMaxErrorExcerpt),
                          prefix);
    }

    ObjectListingPage page = parse_list_objects_page(body);
    keys.insert(keys.end(), std::make_move_iterator(page.keys.begin()), std::make_move_iterator(page.keys.end()));
    if (!page.truncated || page.next_continuation_token.empty()) {
      break;
    }
    token = std::move(page.next_continuation_token);
  }
  return keys;
}

void S3ObjectStore::download(const std::string &key, const std::filesystem::path &destination) {
  curl_easy_ptr curl(curl_easy_init());
  if (!curl) {
    throw TransferError("curl_easy_init failed", key);
  }

  errno = 0;
  file_ptr out(std::fopen(destination.c_str(), "wb"));
  if (!out) {
    const int err = errno;
    throw IoError(format_path_errno_error("Failed to create download file", destination.string(), err), destination.string(), err);
  }

  const std::string url = s3_object_url(_settings.endpoint_url, _settings.bucket, key);
  const std::string sigv4 = "aws:amz:" + _settings.region + ":s3";
  const std::string userpwd = _credentials.access_key + ":" + _credentials.secret_key;
  curl_list_ptr headers;
  headers = append_header(std::move(headers), std::string("x-amz-content-sha256: ") + kEmptyPayloadSha256);

  curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
  curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_USERPWD, userpwd.c_str());
  curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.get());
  curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, write_to_file);
  curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, out.get());
  curl_easy_setopt(curl.get(), CURLOPT_NOSIGNAL, 1L);

  const CURLcode code = curl_easy_perform(curl.get());
  long http_status = 0;
  curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &http_status);

  errno = 0;
  const bool closed = std::fclose(out.release()) == 0;
  const int close_err = errno;

  std::string failure;
  if (code != CURLE_OK) {
    failure = "Download of " + key + " failed: " + curl_easy_strerror(code);
  } else if (http_status < 200 || http_status >= 300) {
    failure = "Download of " + key + " rejected with HTTP " + std::to_string(http_status);
  }
  if (!failure.empty()) {
    std::error_code ec;
    std::filesystem::remove(destination, ec);
    throw TransferError(failure, key);
  }
  if (!closed) {
    throw IoError(format_path_errno_error("Failed to finish download file", destination.string(), close_err), destination.string(), close_err);
  }
}

ExtractStats extract_archive(const std::filesystem::path &archive_path, const std::filesystem::path &output_dir) {
  const std::string path_text = archive_path.string();
  const std::filesystem::path root = std::filesystem::absolute(output_dir).lexically_normal();

  archive_read_ptr reader(archive_read_new());
  if (!reader) {
    throw ArchiveCorruptError(path_text, "archive_read_new failed");
  }
  archive_read_support_format_zip(reader.get());
  if (archive_read_open_filename(reader.get(), path_text.c_str(), kReadBlockSize) != ARCHIVE_OK) {
    throw ArchiveCorruptError(path_text, archive_error_text(reader.get()));
  }

  archive_write_ptr writer(archive_write_disk_new());
  if (!writer) {
    throw IoError("archive_write_disk_new failed", root.string());
  }
  archive_write_disk_set_options(writer.get(), ARCHIVE_EXTRACT_TIME | ARCHIVE_EXTRACT_SECURE_NODOTDOT);
  archive_write_disk_set_standard_lookup(writer.get());

  ExtractStats stats;
  while (true) {
    struct archive_entry *entry = nullptr;
    const int status = archive_read_next_header(reader.get(), &entry);
    if (status == ARCHIVE_EOF) {
      break;
    }
    if (status < ARCHIVE_WARN) {
      throw ArchiveCorruptError(path_text, archive_error_text(reader.get()));
    }

    const char *name = archive_entry_pathname(entry);
    if (!name || !is_safe_entry_name(name)) {
      throw ArchiveCorruptError(path_text, std::string("unsafe entry name '") + (name ? name : "") + "'");
    }
    // Chunks hold regular files and directories only.
    const auto filetype = archive_entry_filetype(entry);
    if (filetype != AE_IFREG && filetype != AE_IFDIR) {
      throw ArchiveCorruptError(path_text, std::string("unsupported entry type for '") + name + "'");
    }
    const std::string target = (root / name).string();
    archive_entry_set_pathname(entry, target.c_str());

    if (archive_write_header(writer.get(), entry) < ARCHIVE_WARN) {
      throw IoError("Failed to create " + target + ": " + archive_error_text(writer.get()), target);
    }
    const uint64_t copied = copy_entry_data(reader.get(), writer.get(), path_text, target);
    if (archive_write_finish_entry(writer.get()) < ARCHIVE_WARN) {
      throw IoError("Failed to finish " + target + ": " + archive_error_text(writer.get()), target);
    }
    if (filetype == AE_IFREG) {
      ++stats.files;
      stats.bytes += copied;
    }
  }

  if (archive_write_close(writer.get()) < ARCHIVE_WARN) {
    throw IoError("Failed to finish extraction into " + root.string() + ": " + archive_error_text(writer.get()), root.string());
  }
  return stats;
}

std::vector<std::string> chunk_archive_keys(ObjectStore &store, const std::string &project) {
  const std::string suffix = ".zip";
  std::vector<std::string> keys;
  for (std::string &key : store.list_keys(project + "/")) {
    if (key.size() > suffix.size() && key.compare(key.size() - suffix.size(), suffix.size(), suffix) == 0) {
      keys.push_back(std::move(key));
    }
  }
  std::sort(keys.begin(), keys.end());
  return keys;
}

RestoreSummary restore_project(ObjectStore &store, const RestoreOptions &options) {
  if (options.project.empty()) {
    throw ConfigError("A project name is required");
  }
  if (options.output_dir.empty()) {
    throw ConfigError("An output directory is required");
  }
  ensure_directory(options.working_dir);
  ensure_directory(options.output_dir);

  const std::vector<std::string> keys = chunk_archive_keys(store, options.project);
  RestoreSummary summary;
  if (keys.empty()) {
    log_warning("No zip files found for project '" + options.project + "'");
    return summary;
  }
  log_info("Found " + std::to_string(keys.size()) + " zip files to download");

  for (std::size_t i = 0; i < keys.size(); ++i) {
    const std::string &key = keys[i];
    if (options.cancel) {
      options.cancel->throw_if_cancelled("restoring " + key);
    }
    log_info("Downloading " + key);

    const DownloadedArchive archive(options.working_dir / key.substr(key.rfind('/') + 1));
    store.download(key, archive.path());
    const ExtractStats stats = extract_archive(archive.path(), options.output_dir);

    ++summary.archives;
    summary.files += stats.files;
    summary.bytes += stats.bytes;
    log_info("Downloaded and unzipped " + key + " (" + std::to_string(i + 1) + "/" + std::to_string(keys.size()) + ")");
  }

  log_info("Restored " + std::to_string(summary.files) + " files from " + std::to_string(summary.archives) + " archives for project '" +
           options.project + "'");
  return summary;
}

} // namespace archive_chunker
