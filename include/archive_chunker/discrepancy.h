// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#pragma once

#include <cstdint>
#include <string>

namespace archive_chunker {

enum class DiscrepancyKind {
  Missing,      ///< Expected path absent
  Unexpected,   ///< Path present that nothing expected
  SizeMismatch, ///< Path present with a different size
  Duplicate,    ///< Path present more than once
};

const char *discrepancy_kind_name(DiscrepancyKind kind);

struct Discrepancy {
  DiscrepancyKind kind = DiscrepancyKind::Missing;
  std::string path;
  uint64_t expected_size = 0;
  uint64_t actual_size = 0;
  uint32_t chunk_id = 0; ///< Chunk the path was found in, 0 when not found anywhere

  std::string describe() const;
};

} // namespace archive_chunker
