// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/discrepancy.h"

#include <sstream>

namespace archive_chunker {

const char *discrepancy_kind_name(DiscrepancyKind kind) {
  switch (kind) {
  case DiscrepancyKind::Missing:
    return "missing";
  case DiscrepancyKind::Unexpected:
    return "unexpected";
  case DiscrepancyKind::SizeMismatch:
    return "size mismatch";
  case DiscrepancyKind::Duplicate:
    return "duplicate";
  }
  return "unknown";
}

std::string Discrepancy::describe() const {
  std::ostringstream oss;
  oss << discrepancy_kind_name(kind) << ": " << path;
  switch (kind) {
  case DiscrepancyKind::Missing:
    oss << " (expected " << expected_size << " bytes)";
    break;
  case DiscrepancyKind::Unexpected:
    oss << " (" << actual_size << " bytes)";
    break;
  case DiscrepancyKind::SizeMismatch:
    oss << " (expected " << expected_size << " bytes, found " << actual_size << " bytes)";
    break;
  case DiscrepancyKind::Duplicate:
    oss << " (" << actual_size << " bytes, repeated)";
    break;
  }
  if (chunk_id != 0) {
    oss << " in chunk " << chunk_id;
  }
  return oss.str();
}

} // namespace archive_chunker
