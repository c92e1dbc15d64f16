// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <curl/curl.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace archive_chunker {

struct CurlEasyDeleter {
  void operator()(CURL *handle) const noexcept {
    if (handle) {
      curl_easy_cleanup(handle);
    }
  }
};

struct CurlListDeleter {
  void operator()(struct curl_slist *list) const noexcept { curl_slist_free_all(list); }
};

using curl_easy_ptr = std::unique_ptr<CURL, CurlEasyDeleter>;
using curl_list_ptr = std::unique_ptr<struct curl_slist, CurlListDeleter>;

inline curl_list_ptr append_header(curl_list_ptr list, const std::string &header) {
  struct curl_slist *extended = curl_slist_append(list.get(), header.c_str());
  if (!extended) {
    throw std::runtime_error("Failed to allocate HTTP header list");
  }
  list.release();
  return curl_list_ptr(extended);
}

/// Percent-encodes one URL component; returns @p text unchanged if curl cannot allocate.
inline std::string escape_url_component(CURL *curl, const std::string &text) {
  char *escaped = curl_easy_escape(curl, text.c_str(), static_cast<int>(text.size()));
  if (!escaped) {
    return text;
  }
  std::string result(escaped);
  curl_free(escaped);
  return result;
}

} // namespace archive_chunker
