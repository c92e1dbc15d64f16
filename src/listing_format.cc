// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/listing_format.h"
#include "archive_chunker/chunker_error.h"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iterator>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace archive_chunker {

namespace {

constexpr std::size_t kHumanFieldWidth = 10;
constexpr std::size_t kHeaderBoxWidth = 100;
constexpr const char *kDictionaryLinePrefix = "Chunk ";

std::string group_thousands(const std::string &digits) {
  std::string grouped;
  const std::size_t count = digits.size();
  for (std::size_t i = 0; i < count; ++i) {
    if (i > 0 && (count - i) % 3 == 0) {
      grouped.push_back(',');
    }
    grouped.push_back(digits[i]);
  }
  return grouped;
}

std::string format_scaled(uint64_t n_bytes, double divisor, const char *unit) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", static_cast<double>(n_bytes) / divisor);
  const std::string fixed(buffer);
  const std::string::size_type dot = fixed.find('.');
  return group_thousands(fixed.substr(0, dot)) + fixed.substr(dot) + " " + unit;
}

std::string centered(const std::string &text, std::size_t width) {
  if (text.size() >= width) {
    return text;
  }
  const std::size_t total = width - text.size();
  const std::size_t left = total / 2;
  return std::string(left, ' ') + text + std::string(total - left, ' ');
}

bool all_digits(const std::string &text) {
  return !text.empty() && std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; });
}

// Digits only; false when the value exceeds max_value.
bool parse_decimal(const std::string &text, uint64_t max_value, uint64_t &out) {
  if (!all_digits(text)) {
    return false;
  }
  uint64_t value = 0;
  for (char ch : text) {
    const uint64_t digit = static_cast<uint64_t>(ch - '0');
    if (value > (max_value - digit) / 10) {
      return false;
    }
    value = value * 10 + digit;
  }
  out = value;
  return true;
}

bool looks_like_date(const std::string &line) {
  if (line.size() < 11) {
    return false;
  }
  for (std::size_t i = 0; i < 10; ++i) {
    const bool dash = (i == 4 || i == 7);
    if (dash ? line[i] != '-' : std::isdigit(static_cast<unsigned char>(line[i])) == 0) {
      return false;
    }
  }
  return line[10] == ' ';
}

std::string chunk_number(uint32_t chunk_id) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%07u", static_cast<unsigned>(chunk_id));
  return buffer;
}

ChunkDictionary load_text_dictionary(const std::string &content, const std::string &entry_prefix, const std::string &source) {
  ChunkDictionary dictionary;
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    if (line.rfind(kDictionaryLinePrefix, 0) != 0) {
      continue;
    }
    const std::string::size_type colon = line.find(": ", 6);
    if (colon == std::string::npos) {
      continue;
    }
    const std::string id_text = line.substr(6, colon - 6);
    uint64_t chunk_id = 0;
    ListingEntry entry;
    if (!parse_decimal(id_text, std::numeric_limits<uint32_t>::max(), chunk_id) || !parse_listing_line(line.substr(colon + 2), entry)) {
      throw IoError("Unrecognised dictionary line in " + source + ": " + line, source);
    }
    std::string relative;
    if (!strip_entry_prefix(entry_prefix, entry.path, relative)) {
      throw IoError("Dictionary entry outside the archive prefix in " + source + ": " + entry.path, source);
    }
    dictionary[relative] = static_cast<uint32_t>(chunk_id);
  }
  return dictionary;
}

ChunkDictionary load_json_dictionary(const std::string &content, const std::string &source) {
  ChunkDictionary dictionary;
  try {
    const nlohmann::json document = nlohmann::json::parse(content);
    for (const auto &item : document.at("files").items()) {
      const nlohmann::json &id = item.value();
      if (!id.is_number_unsigned() || id.get<uint64_t>() > std::numeric_limits<uint32_t>::max()) {
        throw IoError("Chunk id out of range in " + source + " for " + item.key(), source);
      }
      dictionary[item.key()] = static_cast<uint32_t>(id.get<uint64_t>());
    }
  } catch (const nlohmann::json::exception &ex) {
    throw IoError("Invalid JSON dictionary " + source + ": " + ex.what(), source);
  }
  return dictionary;
}

} // namespace

std::string bytes_to_human_padded(int64_t n_bytes) {
  if (n_bytes < 0) {
    throw std::invalid_argument("n_bytes must be >= 0");
  }
  std::string text = bytes_to_human(static_cast<uint64_t>(n_bytes));
  if (text.size() < kHumanFieldWidth) {
    text.append(kHumanFieldWidth - text.size(), ' ');
  }
  return text;
}

std::string bytes_to_human(uint64_t n_bytes) {
  constexpr double kKiB = 1024.0;
  if (n_bytes < 1024ull) {
    return group_thousands(std::to_string(n_bytes)) + " Bytes";
  }
  if (n_bytes < 1024ull * 1024ull) {
    return format_scaled(n_bytes, kKiB, "KB");
  }
  if (n_bytes < 1024ull * 1024ull * 1024ull) {
    return format_scaled(n_bytes, kKiB * kKiB, "MB");
  }
  if (n_bytes < 1024ull * 1024ull * 1024ull * 1024ull) {
    return format_scaled(n_bytes, kKiB * kKiB * kKiB, "GB");
  }
  return format_scaled(n_bytes, kKiB * kKiB * kKiB * kKiB, "TB");
}

std::string format_last_modified(int64_t last_modified) {
  const std::time_t seconds = static_cast<std::time_t>(last_modified);
  std::tm local{};
  if (!localtime_r(&seconds, &local)) {
    return "0000-00-00";
  }
  char buffer[16];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d", &local);
  return buffer;
}

std::string format_current_time() {
  const std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  char buffer[32];
  std::strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &local);
  return buffer;
}

std::string archive_entry_name(const std::string &entry_prefix, const std::string &relative_path) {
  if (entry_prefix.empty()) {
    return relative_path;
  }
  return entry_prefix + "/" + relative_path;
}

bool strip_entry_prefix(const std::string &entry_prefix, const std::string &entry_name, std::string &relative_path) {
  if (entry_prefix.empty()) {
    relative_path = entry_name;
    return true;
  }
  const std::string lead = entry_prefix + "/";
  if (entry_name.size() <= lead.size() || entry_name.compare(0, lead.size(), lead) != 0) {
    return false;
  }
  relative_path = entry_name.substr(lead.size());
  return true;
}

std::string format_listing_line(const ListingEntry &entry, const std::string &entry_prefix) {
  std::string line = format_last_modified(entry.last_modified);
  line += ' ';
  line += bytes_to_human_padded(static_cast<int64_t>(entry.size_bytes));
  line += ' ';
  line += archive_entry_name(entry_prefix, entry.path);
  line += "  ";
  line += std::to_string(entry.size_bytes);
  return line;
}

bool parse_listing_line(const std::string &line, ListingEntry &out) {
  if (!looks_like_date(line)) {
    return false;
  }

  // The size field is "<number> <unit>" padded to at least kHumanFieldWidth.
  const std::size_t field_start = 11;
  const std::string::size_type number_end = line.find(' ', field_start);
  if (number_end == std::string::npos) {
    return false;
  }
  const std::string::size_type unit_end = line.find(' ', number_end + 1);
  if (unit_end == std::string::npos) {
    return false;
  }
  const std::size_t human_length = unit_end - field_start;
  const std::size_t path_start = field_start + std::max(human_length, kHumanFieldWidth) + 1;

  const std::string::size_type separator = line.rfind("  ");
  if (separator == std::string::npos || separator < path_start || path_start > line.size()) {
    return false;
  }
  uint64_t size_bytes = 0;
  if (!parse_decimal(line.substr(separator + 2), std::numeric_limits<uint64_t>::max(), size_bytes)) {
    return false;
  }

  out.path = line.substr(path_start, separator - path_start);
  out.size_bytes = size_bytes;
  out.last_modified = 0;
  return !out.path.empty();
}

std::string render_listing(const std::string &title_name, const std::string &input_directory, const std::vector<ListingEntry> &entries,
                           const std::string &entry_prefix) {
  uint64_t total_size = 0;
  uint64_t max_file_size = 0;
  for (const ListingEntry &entry : entries) {
    total_size += entry.size_bytes;
    max_file_size = std::max(max_file_size, entry.size_bytes);
  }

  const std::size_t inner = kHeaderBoxWidth - 2;
  const std::string border(kHeaderBoxWidth, '*');
  const std::string blank = "*" + std::string(inner, ' ') + "*\n";

  std::ostringstream oss;
  oss << border << "\n" << blank;
  oss << "*" << centered("Directory Listing for: " + title_name, inner) << "*\n";
  oss << "*" << centered("Total Size: " + bytes_to_human_padded(static_cast<int64_t>(total_size)), inner) << "*\n";
  oss << "*" << centered("Max File Size: " + bytes_to_human_padded(static_cast<int64_t>(max_file_size)), inner) << "*\n";
  oss << "*" << centered("Total Files: " + group_thousands(std::to_string(entries.size())), inner) << "*\n";
  oss << blank << border << "\n\n";
  oss << "Printed on: " << format_current_time() << "\n\n";
  oss << "Running with input directory: " << input_directory << "\n\n";

  for (const ListingEntry &entry : entries) {
    oss << format_listing_line(entry, entry_prefix) << "\n";
  }
  return oss.str();
}

std::vector<ListingEntry> listing_entries_from_catalog(const FileCatalog &catalog) {
  std::vector<ListingEntry> entries;
  entries.reserve(catalog.size());
  for (const FileRecord &record : catalog) {
    entries.push_back({ record.relative_path, record.size_bytes, record.last_modified });
  }
  return entries;
}

std::vector<ListingEntry> read_listing_file(const std::filesystem::path &path, const std::string &entry_prefix) {
  const std::string content = read_text_file(path);

  std::vector<ListingEntry> entries;
  std::istringstream stream(content);
  std::string line;
  while (std::getline(stream, line)) {
    ListingEntry entry;
    if (!parse_listing_line(line, entry)) {
      // Header and box lines never start with a date.
      if (looks_like_date(line)) {
        throw IoError("Unrecognised listing line in " + path.string() + ": " + line, path.string());
      }
      continue;
    }
    std::string relative;
    if (!strip_entry_prefix(entry_prefix, entry.path, relative)) {
      throw MalformedPathError(entry.path, "listing entry lies outside the archive prefix '" + entry_prefix + "'");
    }
    entry.path = std::move(relative);
    entries.push_back(std::move(entry));
  }
  return entries;
}

DictionaryFormat parse_dictionary_format(const std::string &name) {
  if (name == "text") {
    return DictionaryFormat::Text;
  }
  if (name == "json") {
    return DictionaryFormat::Json;
  }
  throw ConfigError("Unknown dictionary format '" + name + "' (expected text or json)");
}

const char *dictionary_format_name(DictionaryFormat format) { return format == DictionaryFormat::Json ? "json" : "text"; }

std::string dictionary_file_name(DictionaryFormat format) { return format == DictionaryFormat::Json ? "ChunkDictionary.json" : "ChunkDictionary.txt"; }

std::string render_text_dictionary(const PlanResult &plan, const std::string &entry_prefix) {
  std::ostringstream oss;
  for (const ChunkPlan &chunk : plan.chunks) {
    const std::string line_prefix = kDictionaryLinePrefix + chunk_number(chunk.chunk_id) + ": ";
    for (const FileRecord &record : chunk.entries) {
      oss << line_prefix << format_listing_line({ record.relative_path, record.size_bytes, record.last_modified }, entry_prefix) << "\n";
    }
    oss << "\n\n\n";
  }
  return oss.str();
}

std::string render_json_dictionary(const PlanResult &plan) {
  nlohmann::json files = nlohmann::json::object();
  for (const auto &item : plan.dictionary) {
    files[item.first] = item.second;
  }

  nlohmann::json chunks = nlohmann::json::array();
  for (const ChunkPlan &chunk : plan.chunks) {
    nlohmann::json item;
    item["chunk_id"] = chunk.chunk_id;
    item["total_size"] = chunk.total_size;
    item["file_count"] = chunk.entries.size();
    chunks.push_back(std::move(item));
  }

  nlohmann::json document;
  document["files"] = std::move(files);
  document["chunks"] = std::move(chunks);
  return document.dump(2) + "\n";
}

std::filesystem::path write_chunk_dictionary(const std::filesystem::path &output_root, const PlanResult &plan, DictionaryFormat format,
                                             const std::string &entry_prefix) {
  const std::filesystem::path path = output_root / dictionary_file_name(format);
  write_text_file(path, format == DictionaryFormat::Json ? render_json_dictionary(plan) : render_text_dictionary(plan, entry_prefix));
  return path;
}

ChunkDictionary load_chunk_dictionary(const std::filesystem::path &path, const std::string &entry_prefix) {
  const std::string content = read_text_file(path);
  if (path.extension() == ".json") {
    return load_json_dictionary(content, path.string());
  }
  return load_text_dictionary(content, entry_prefix, path.string());
}

void write_text_file(const std::filesystem::path &path, const std::string &content) {
  errno = 0;
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  if (!out) {
    const int err = errno;
    throw IoError(format_path_errno_error("Failed to create file", path.string(), err), path.string(), err);
  }
  out << content;
  out.flush();
  if (!out) {
    const int err = errno;
    throw IoError(format_path_errno_error("Failed to write file", path.string(), err), path.string(), err);
  }
}

std::string read_text_file(const std::filesystem::path &path) {
  errno = 0;
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    const int err = errno;
    throw IoError(format_path_errno_error("Failed to open file", path.string(), err), path.string(), err);
  }
  std::string content((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  if (in.bad()) {
    throw IoError("Failed to read file (" + path.string() + ")", path.string());
  }
  return content;
}

} // namespace archive_chunker
