// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/entry.h"
#include "archive_handle.h"

#include <cstdint>
#include <memory>
#include <optional>

struct archive_entry;

namespace archive_bridge {

/**
 * @brief State shared between a cursor and the entries it produced
 *
 * Entries hold it weakly and compare their generation with the current
 * one before touching the engine.
 */
struct EntryCursorState {
  ArchiveHandle *handle = nullptr; ///< Null once the owning reader is closed
  uint64_t generation = 0;
  bool data_eof = false; ///< archive_read_data() reported end of the current entry
};

/**
 * @brief Forward-only cursor over the headers of a read session
 *
 * advance() maps archive_read_next_header() results:
 *   ARCHIVE_OK / ARCHIVE_WARN -> new Entry (warnings become faults)
 *   ARCHIVE_EOF               -> std::nullopt, no error
 *   anything else             -> captured stream exception or ProtocolError
 *
 * Every advance bumps the shared generation, which invalidates the data
 * window of all previously produced entries.
 */
class EntryCursor {
public:
  explicit EntryCursor(std::shared_ptr<EntryCursorState> state);

  EntryCursor(const EntryCursor &) = delete;
  EntryCursor &operator=(const EntryCursor &) = delete;

  std::optional<Entry> advance();

  bool at_end() const { return _at_end; }
  bool has_advanced() const { return _advanced; }

  /// Invalidate every entry produced so far without moving the engine.
  void invalidate();

  static std::optional<Entry> describe(const std::shared_ptr<EntryCursorState> &state, struct archive_entry *native_entry);

private:
  std::shared_ptr<EntryCursorState> _state;
  bool _at_end;
  bool _advanced;
};

} // namespace archive_bridge
