// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/data_stream.h"

#include <archive.h>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <memory>
#include <vector>

namespace archive_bridge {

/**
 * @brief Callback state shared with libarchive for one session
 *
 * The object's address is the client_data token libarchive passes back
 * on every callback, so bridges are neither copyable nor movable and are
 * owned by ArchiveHandle for the whole session.
 *
 * Exceptions raised by the stream are never allowed to unwind through
 * libarchive frames: the trampolines capture them, return the failure
 * sentinel, and the owner re-raises them through rethrow_pending() once
 * the native call has returned.
 */
class CallbackBridge {
public:
  enum class State {
    Unopened,
    Open,
    Closed,
  };

  virtual ~CallbackBridge() = default;

  CallbackBridge(const CallbackBridge &) = delete;
  CallbackBridge &operator=(const CallbackBridge &) = delete;
  CallbackBridge(CallbackBridge &&) = delete;
  CallbackBridge &operator=(CallbackBridge &&) = delete;

  /// Register the trampolines on ar and open the session.
  virtual int open(struct archive *ar) = 0;

  State state() const { return _state; }
  void *client_token() { return this; }
  const std::shared_ptr<IDataStream> &stream() const { return _stream; }

  /**
   * @brief Make the bridge inert ahead of native teardown
   *
   * After disarm() every callback returns without touching the stream,
   * and the stream reference is dropped.
   */
  void disarm() noexcept;

  bool has_pending_error() const { return static_cast<bool>(_pending); }

  /// Re-raise and clear the exception captured during the last native call.
  void rethrow_pending();

protected:
  explicit CallbackBridge(std::shared_ptr<IDataStream> stream);

  void capture_current_exception() noexcept;

  static int open_callback(struct archive *ar, void *client_data);

  std::shared_ptr<IDataStream> _stream;
  State _state;
  std::exception_ptr _pending;
};

/**
 * @brief Adapts a readable IDataStream to libarchive's read callbacks
 *
 * Owns the single pinned buffer handed to libarchive. The buffer is
 * allocated once and never resized, so the pointer returned by one read
 * callback stays valid until the next one.
 */
class ReadCallbackBridge final : public CallbackBridge {
public:
  ReadCallbackBridge(std::shared_ptr<IDataStream> stream, size_t block_size);

  int open(struct archive *ar) override;

  const void *buffer_address() const { return _buffer.data(); }
  size_t buffer_size() const { return _buffer.size(); }

  static la_ssize_t read_callback(struct archive *ar, void *client_data, const void **buff);
  static la_int64_t skip_callback(struct archive *ar, void *client_data, la_int64_t request);
  static la_int64_t seek_callback(struct archive *ar, void *client_data, la_int64_t offset, int whence);
  static int close_callback(struct archive *ar, void *client_data);

private:
  std::vector<uint8_t> _buffer;
};

/**
 * @brief Adapts a writable IDataStream to libarchive's write callbacks
 *
 * Relays exactly the count the stream accepted. Retrying partial
 * acceptance is left to the caller of the native write.
 */
class WriteCallbackBridge final : public CallbackBridge {
public:
  explicit WriteCallbackBridge(std::shared_ptr<IDataStream> stream);

  int open(struct archive *ar) override;

  static la_ssize_t write_callback(struct archive *ar, void *client_data, const void *buffer, size_t length);
  static int close_callback(struct archive *ar, void *client_data);
};

} // namespace archive_bridge
