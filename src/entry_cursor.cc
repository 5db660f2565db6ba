// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "entry_cursor.h"

#include "archive_bridge/archive_error.h"
#include "archive_bridge/archive_fault.h"

#include <archive.h>
#include <archive_entry.h>
#include <stdexcept>
#include <utility>

namespace archive_bridge {

namespace {

EntryType entry_type_from_filetype(mode_t filetype) {
  switch (filetype) {
  case AE_IFDIR:
    return EntryType::Directory;
  case AE_IFREG:
    return EntryType::RegularFile;
  case AE_IFLNK:
    return EntryType::Symlink;
  default:
    return EntryType::Other;
  }
}

const char *entry_pathname(struct archive_entry *native_entry) {
  const char *name = archive_entry_pathname_utf8(native_entry);
  return name ? name : archive_entry_pathname(native_entry);
}

const char *entry_symlink(struct archive_entry *native_entry) {
  const char *target = archive_entry_symlink_utf8(native_entry);
  return target ? target : archive_entry_symlink(native_entry);
}

} // namespace

EntryCursor::EntryCursor(std::shared_ptr<EntryCursorState> state)
  : _state(std::move(state))
  , _at_end(false)
  , _advanced(false) {
  if (!_state) {
    throw std::invalid_argument("EntryCursor requires cursor state");
  }
}

void EntryCursor::invalidate() {
  ++_state->generation;
  _state->data_eof = false;
}

std::optional<Entry> EntryCursor::advance() {
  if (_at_end) {
    return std::nullopt;
  }
  if (!_state->handle) {
    throw ResourceError("reader has been closed");
  }

  ArchiveHandle &handle = *_state->handle;
  struct archive *ar = handle.get();
  invalidate();
  _advanced = true;

  while (true) {
    struct archive_entry *native_entry = nullptr;
    const int status = archive_read_next_header(ar, &native_entry);
    if (status == ARCHIVE_EOF) {
      handle.rethrow_pending_stream_error();
      _at_end = true;
      return std::nullopt;
    }
    handle.check(status, "archive_read_next_header");

    if (auto entry = describe(_state, native_entry)) {
      return entry;
    }
    dispatch_registered_fault({ "Skipping entry whose pathname cannot be decoded", status, {} });
  }
}

std::optional<Entry> EntryCursor::describe(const std::shared_ptr<EntryCursorState> &state, struct archive_entry *native_entry) {
  const char *name = native_entry ? entry_pathname(native_entry) : nullptr;
  if (!name) {
    return std::nullopt;
  }

  Entry entry;
  entry._state = state;
  entry._generation = state->generation;
  entry._name = name;
  entry._type = entry_type_from_filetype(archive_entry_filetype(native_entry));
  entry._size_is_set = archive_entry_size_is_set(native_entry) != 0;
  const la_int64_t size = archive_entry_size(native_entry);
  entry._size = size > 0 ? static_cast<uint64_t>(size) : 0;
  entry._permissions = archive_entry_perm(native_entry);
  entry._mtime.seconds = static_cast<int64_t>(archive_entry_mtime(native_entry));
  entry._mtime.nanoseconds = static_cast<int64_t>(archive_entry_mtime_nsec(native_entry));
  if (entry._type == EntryType::Symlink) {
    if (const char *target = entry_symlink(native_entry)) {
      entry._symlink_target = target;
    }
  }
  return entry;
}

} // namespace archive_bridge
