// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/entry.h"

#include "archive_bridge/archive_error.h"
#include "archive_error_utils.h"
#include "entry_cursor.h"

#include <archive.h>
#include <limits>

namespace archive_bridge {

bool Entry::is_current() const {
  const auto state = _state.lock();
  return state && state->handle && state->generation == _generation;
}

EntryCursorState &Entry::require_current() const {
  const auto state = _state.lock();
  if (!state || !state->handle) {
    throw ResourceError("entry '" + _name + "' belongs to a reader that has been closed");
  }
  if (state->generation != _generation) {
    throw StaleEntryError("entry '" + _name + "' is no longer current: the cursor has moved past it");
  }
  // The reader session keeps the state alive for as long as its handle is set.
  return *state;
}

ssize_t Entry::read(void *buffer, size_t size) {
  EntryCursorState &state = require_current();
  if (state.data_eof || size == 0) {
    return 0;
  }

  ArchiveHandle &handle = *state.handle;
  struct archive *ar = handle.get();
  const la_ssize_t result = archive_read_data(ar, buffer, size);
  if (result < 0) {
    handle.rethrow_pending_stream_error();
    throw make_protocol_error(ar, "archive_read_data", static_cast<int>(result));
  }
  if (result == 0) {
    state.data_eof = true;
  }
  return static_cast<ssize_t>(result);
}

std::vector<uint8_t> Entry::read_all() {
  std::vector<uint8_t> result;
  if (_size_is_set && _size > 0 && _size <= static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
    result.reserve(static_cast<size_t>(_size));
  }

  std::vector<uint8_t> chunk(64 * 1024);
  while (true) {
    const ssize_t bytes_read = read(chunk.data(), chunk.size());
    if (bytes_read == 0) {
      break;
    }
    result.insert(result.end(), chunk.begin(), chunk.begin() + bytes_read);
  }
  return result;
}

std::string Entry::read_all_text() {
  const std::vector<uint8_t> bytes = read_all();
  return std::string(bytes.begin(), bytes.end());
}

void Entry::skip_data() {
  EntryCursorState &state = require_current();
  if (state.data_eof) {
    return;
  }
  ArchiveHandle &handle = *state.handle;
  const int status = archive_read_data_skip(handle.get());
  handle.check(status, "archive_read_data_skip");
  state.data_eof = true;
}

} // namespace archive_bridge
