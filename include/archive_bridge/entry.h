// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/platform_compat.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace archive_bridge {

class EntryCursor;
struct EntryCursorState;

enum class EntryType {
  Directory,
  RegularFile,
  Symlink,
  Other,
};

const char *to_string(EntryType type);

struct EntryTime {
  int64_t seconds = 0;
  int64_t nanoseconds = 0;
};

/**
 * @brief One archive entry produced by the reader's cursor
 *
 * Metadata accessors are plain copies and stay usable forever. The data
 * window is different: it belongs to the engine's current position, so
 * read(), read_all() and skip_data() are only valid while this entry is
 * the cursor's current entry. Once the cursor advances, resets or the
 * reader is closed they raise StaleEntryError (or ResourceError after
 * release) instead of returning another entry's bytes.
 *
 * Copies share the same data window.
 */
class Entry {
public:
  Entry(const Entry &) = default;
  Entry &operator=(const Entry &) = default;
  Entry(Entry &&) noexcept = default;
  Entry &operator=(Entry &&) noexcept = default;
  ~Entry() = default;

  const std::string &name() const { return _name; }
  EntryType type() const { return _type; }
  bool is_directory() const { return _type == EntryType::Directory; }
  bool is_file() const { return _type == EntryType::RegularFile; }
  bool is_symlink() const { return _type == EntryType::Symlink; }

  /// Size in bytes as recorded in the header (0 when unknown).
  uint64_t size() const { return _size; }
  bool size_is_set() const { return _size_is_set; }

  /// Permission bits (no file type bits).
  mode_t permissions() const { return _permissions; }
  EntryTime mtime() const { return _mtime; }
  const std::string &symlink_target() const { return _symlink_target; }

  /// True while the cursor still points at this entry.
  bool is_current() const;

  /**
   * @brief Read the next chunk of entry data
   * @return Bytes read, 0 at end of entry data
   * @throws StaleEntryError if the cursor has moved on
   * @throws ProtocolError if the engine fails to decode the data
   */
  ssize_t read(void *buffer, size_t size);

  std::vector<uint8_t> read_all();
  std::string read_all_text();

  /// Discard the remaining data of this entry.
  void skip_data();

private:
  friend class EntryCursor;

  Entry() = default;

  EntryCursorState &require_current() const;

  std::weak_ptr<EntryCursorState> _state;
  uint64_t _generation = 0;

  std::string _name;
  EntryType _type = EntryType::Other;
  uint64_t _size = 0;
  bool _size_is_set = false;
  mode_t _permissions = 0;
  EntryTime _mtime;
  std::string _symlink_target;
};

} // namespace archive_bridge
