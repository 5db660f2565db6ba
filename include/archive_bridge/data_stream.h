// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/platform_compat.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace archive_bridge {

/**
 * @brief Abstract byte source/sink plugged into the callback bridges
 *
 * Any transport (file, memory, socket, language binding) can back a
 * session by implementing the subset of operations it supports and
 * advertising them through can_read()/can_write()/can_seek().
 *
 * Implementations report failures by throwing. The bridges catch the
 * exception at the native callback boundary and re-raise it once the
 * engine call returns.
 */
class IDataStream {
public:
  virtual ~IDataStream() = default;

  /**
   * @brief Read up to size bytes
   * @return Bytes read, 0 at end of stream
   */
  virtual ssize_t read(void *buffer, size_t size);

  /**
   * @brief Offer size bytes to the sink
   * @return Bytes accepted; may be fewer than offered
   */
  virtual ssize_t write(const void *buffer, size_t size);

  virtual void flush() {}

  /**
   * @brief Reposition the stream
   * @return New absolute position, or -1 when unsupported
   */
  virtual int64_t seek(int64_t offset, int whence) {
    (void)offset;
    (void)whence;
    return -1;
  }

  virtual int64_t tell() const { return -1; }

  /// Return to the beginning; throws NotSupportedError on non-seekable streams.
  virtual void rewind();

  virtual bool can_read() const { return false; }
  virtual bool can_write() const { return false; }
  virtual bool can_seek() const { return false; }
};

/**
 * @brief Growable in-memory stream supporting read, write and seek
 */
class MemoryStream final : public IDataStream {
public:
  MemoryStream() = default;
  explicit MemoryStream(std::vector<uint8_t> initial);

  ssize_t read(void *buffer, size_t size) override;
  ssize_t write(const void *buffer, size_t size) override;
  int64_t seek(int64_t offset, int whence) override;
  int64_t tell() const override { return static_cast<int64_t>(_position); }
  void rewind() override { _position = 0; }

  bool can_read() const override { return true; }
  bool can_write() const override { return true; }
  bool can_seek() const override { return true; }

  const std::vector<uint8_t> &data() const { return _data; }
  std::vector<uint8_t> release_data();

private:
  std::vector<uint8_t> _data;
  size_t _position = 0;
};

/**
 * @brief Adapter that forwards read/write/flush but hides seeking
 *
 * Models pipes and network transports where rewinding is impossible.
 */
class NonSeekableStream final : public IDataStream {
public:
  explicit NonSeekableStream(std::shared_ptr<IDataStream> inner);

  ssize_t read(void *buffer, size_t size) override { return _inner->read(buffer, size); }
  ssize_t write(const void *buffer, size_t size) override { return _inner->write(buffer, size); }
  void flush() override { _inner->flush(); }

  bool can_read() const override { return _inner->can_read(); }
  bool can_write() const override { return _inner->can_write(); }

private:
  std::shared_ptr<IDataStream> _inner;
};

} // namespace archive_bridge
