// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_handle.h"

#include "archive_bridge/archive_error.h"
#include "archive_bridge/archive_fault.h"
#include "archive_error_utils.h"

#include <stdexcept>
#include <utility>

namespace archive_bridge {

ArchiveHandle::ArchiveHandle(ArchiveDirection direction, FreeFunction free_fn)
  : _direction(direction)
  , _free_fn(free_fn)
  , _ar(nullptr)
  , _bridge()
  , _opened(false)
  , _engine_closed(false)
  , _released(false) {
  if (!_free_fn) {
    _free_fn = direction == ArchiveDirection::Read ? archive_read_free : archive_write_free;
  }
}

ArchiveHandle::~ArchiveHandle() { release(); }

void ArchiveHandle::acquire() {
  if (_released) {
    throw ResourceError("archive handle has already been released");
  }
  if (_ar) {
    throw std::logic_error("archive handle is already acquired");
  }

  _ar = _direction == ArchiveDirection::Read ? archive_read_new() : archive_write_new();
  if (!_ar) {
    throw ResourceError(_direction == ArchiveDirection::Read ? "Failed to create archive reader" : "Failed to create archive writer");
  }
}

int ArchiveHandle::release() noexcept {
  if (_released) {
    return ARCHIVE_OK;
  }
  _released = true;

  int status = ARCHIVE_OK;
  if (_ar) {
    if (_direction == ArchiveDirection::Write && _opened && !_engine_closed) {
      _engine_closed = true;
      const int close_status = archive_write_close(_ar);
      if (close_status != ARCHIVE_OK) {
        dispatch_registered_fault({ archive_error_text(_ar, "archive_write_close failed during release"), close_status, {} });
      }
    }
    if (_bridge) {
      _bridge->disarm();
    }
    status = _free_fn(_ar);
    _ar = nullptr;
  }
  _bridge.reset();
  return status;
}

struct archive *ArchiveHandle::get() const {
  if (_released) {
    throw ResourceError("archive handle used after release");
  }
  if (!_ar) {
    throw ResourceError("archive handle has not been acquired");
  }
  return _ar;
}

void ArchiveHandle::install_bridge(std::unique_ptr<CallbackBridge> bridge) {
  if (!bridge) {
    throw std::invalid_argument("callback bridge cannot be null");
  }
  if (_bridge) {
    throw std::logic_error("a callback bridge is already installed for this session");
  }
  (void)get();
  _bridge = std::move(bridge);
}

void ArchiveHandle::close_engine() {
  struct archive *ar = get();
  if (_direction != ArchiveDirection::Write || !_opened || _engine_closed) {
    return;
  }
  _engine_closed = true;
  check(archive_write_close(ar), "archive_write_close");
}

void ArchiveHandle::rethrow_pending_stream_error() {
  if (_bridge) {
    _bridge->rethrow_pending();
  }
}

void ArchiveHandle::check(int status, const char *action) {
  rethrow_pending_stream_error();
  if (status == ARCHIVE_OK) {
    return;
  }
  if (status == ARCHIVE_WARN) {
    dispatch_registered_fault({ archive_error_text(_ar, std::string(action) + " reported a warning"), status, {} });
    return;
  }
  throw make_protocol_error(get(), action, status);
}

std::string ArchiveHandle::last_error(const std::string &fallback) const { return archive_error_text(_ar, fallback); }

} // namespace archive_bridge
