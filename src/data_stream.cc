// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/data_stream.h"
#include "archive_bridge/archive_error.h"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <limits>
#include <stdexcept>
#include <utility>

namespace archive_bridge {

// ============================================================================
// IDataStream defaults
// ============================================================================

ssize_t IDataStream::read(void *buffer, size_t size) {
  (void)buffer;
  (void)size;
  throw NotSupportedError("stream is not readable");
}

ssize_t IDataStream::write(const void *buffer, size_t size) {
  (void)buffer;
  (void)size;
  throw NotSupportedError("stream is not writable");
}

void IDataStream::rewind() {
  if (!can_seek() || seek(0, SEEK_SET) != 0) {
    throw NotSupportedError("stream does not support rewind");
  }
}

// ============================================================================
// MemoryStream Implementation
// ============================================================================

MemoryStream::MemoryStream(std::vector<uint8_t> initial)
  : _data(std::move(initial))
  , _position(0) {}

ssize_t MemoryStream::read(void *buffer, size_t size) {
  if (_position >= _data.size() || size == 0) {
    return 0;
  }
  const size_t available = _data.size() - _position;
  const size_t count = std::min({ size, available, static_cast<size_t>(std::numeric_limits<ssize_t>::max()) });
  std::memcpy(buffer, _data.data() + _position, count);
  _position += count;
  return static_cast<ssize_t>(count);
}

ssize_t MemoryStream::write(const void *buffer, size_t size) {
  if (size == 0) {
    return 0;
  }
  const size_t count = std::min(size, static_cast<size_t>(std::numeric_limits<ssize_t>::max()));
  if (_position + count > _data.size()) {
    _data.resize(_position + count);
  }
  std::memcpy(_data.data() + _position, buffer, count);
  _position += count;
  return static_cast<ssize_t>(count);
}

int64_t MemoryStream::seek(int64_t offset, int whence) {
  int64_t base = 0;
  switch (whence) {
  case SEEK_SET:
    base = 0;
    break;
  case SEEK_CUR:
    base = static_cast<int64_t>(_position);
    break;
  case SEEK_END:
    base = static_cast<int64_t>(_data.size());
    break;
  default:
    return -1;
  }
  const int64_t target = base + offset;
  if (target < 0) {
    return -1;
  }
  _position = static_cast<size_t>(target);
  return target;
}

std::vector<uint8_t> MemoryStream::release_data() {
  std::vector<uint8_t> out = std::move(_data);
  _data.clear();
  _position = 0;
  return out;
}

// ============================================================================
// NonSeekableStream Implementation
// ============================================================================

NonSeekableStream::NonSeekableStream(std::shared_ptr<IDataStream> inner)
  : _inner(std::move(inner)) {
  if (!_inner) {
    throw std::invalid_argument("NonSeekableStream requires a valid inner stream");
  }
}

} // namespace archive_bridge
