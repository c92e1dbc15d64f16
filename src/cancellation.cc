// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_chunker Team

#include "archive_chunker/cancellation.h"
#include "archive_chunker/chunker_error.h"

namespace archive_chunker {

void CancellationToken::throw_if_cancelled(const std::string &where) const {
  if (cancelled()) {
    throw CancelledError("Cancelled during " + where);
  }
}

} // namespace archive_chunker
