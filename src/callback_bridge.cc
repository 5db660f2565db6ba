// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "callback_bridge.h"

#include <algorithm>
#include <cstdio>
#include <stdexcept>
#include <utility>

namespace archive_bridge {

// ============================================================================
// CallbackBridge Implementation
// ============================================================================

CallbackBridge::CallbackBridge(std::shared_ptr<IDataStream> stream)
  : _stream(std::move(stream))
  , _state(State::Unopened) {
  if (!_stream) {
    throw std::invalid_argument("callback bridge requires a valid data stream");
  }
}

void CallbackBridge::disarm() noexcept {
  _state = State::Closed;
  _stream.reset();
}

void CallbackBridge::rethrow_pending() {
  if (!_pending) {
    return;
  }
  std::exception_ptr pending = std::move(_pending);
  _pending = nullptr;
  std::rethrow_exception(pending);
}

void CallbackBridge::capture_current_exception() noexcept {
  // Keep the first failure; later ones are consequences of it.
  if (!_pending) {
    _pending = std::current_exception();
  }
}

int CallbackBridge::open_callback(struct archive *ar, void *client_data) {
  (void)ar;
  auto *bridge = static_cast<CallbackBridge *>(client_data);
  if (bridge->_state == State::Unopened) {
    bridge->_state = State::Open;
  }
  return ARCHIVE_OK;
}

// ============================================================================
// ReadCallbackBridge Implementation
// ============================================================================

ReadCallbackBridge::ReadCallbackBridge(std::shared_ptr<IDataStream> stream, size_t block_size)
  : CallbackBridge(std::move(stream))
  , _buffer(block_size) {
  if (block_size == 0) {
    throw std::invalid_argument("read block size must be positive");
  }
}

int ReadCallbackBridge::open(struct archive *ar) {
  const int registered[] = {
    archive_read_set_callback_data(ar, client_token()),
    archive_read_set_open_callback(ar, open_callback),
    archive_read_set_read_callback(ar, read_callback),
    archive_read_set_close_callback(ar, close_callback),
    _stream->can_seek() ? archive_read_set_skip_callback(ar, skip_callback) : ARCHIVE_OK,
    _stream->can_seek() ? archive_read_set_seek_callback(ar, seek_callback) : ARCHIVE_OK,
  };
  for (int status : registered) {
    if (status != ARCHIVE_OK) {
      return status;
    }
  }
  return archive_read_open1(ar);
}

la_ssize_t ReadCallbackBridge::read_callback(struct archive *ar, void *client_data, const void **buff) {
  (void)ar;
  auto *bridge = static_cast<ReadCallbackBridge *>(client_data);
  *buff = nullptr;

  if (bridge->_state == State::Closed || !bridge->_stream) {
    return -1;
  }

  ssize_t bytes_read = 0;
  try {
    bytes_read = bridge->_stream->read(bridge->_buffer.data(), bridge->_buffer.size());
  } catch (...) {
    bridge->capture_current_exception();
    return -1;
  }
  if (bytes_read < 0) {
    return -1;
  }

  *buff = bridge->_buffer.data();
  return static_cast<la_ssize_t>(std::min<size_t>(static_cast<size_t>(bytes_read), bridge->_buffer.size()));
}

la_int64_t ReadCallbackBridge::skip_callback(struct archive *ar, void *client_data, la_int64_t request) {
  (void)ar;
  auto *bridge = static_cast<ReadCallbackBridge *>(client_data);
  if (bridge->_state == State::Closed || !bridge->_stream) {
    return 0;
  }

  try {
    la_int64_t current = bridge->_stream->tell();
    if (current < 0) {
      current = bridge->_stream->seek(0, SEEK_CUR);
    }
    if (current < 0) {
      return 0;
    }

    const auto result = bridge->_stream->seek(request, SEEK_CUR);
    if (result >= 0) {
      return result - current;
    }
  } catch (...) {
    bridge->capture_current_exception();
    return 0;
  }
  return 0;
}

la_int64_t ReadCallbackBridge::seek_callback(struct archive *ar, void *client_data, la_int64_t offset, int whence) {
  (void)ar;
  auto *bridge = static_cast<ReadCallbackBridge *>(client_data);
  if (bridge->_state == State::Closed || !bridge->_stream) {
    return ARCHIVE_FATAL;
  }

  try {
    const auto result = bridge->_stream->seek(offset, whence);
    return result >= 0 ? result : ARCHIVE_FATAL;
  } catch (...) {
    bridge->capture_current_exception();
    return ARCHIVE_FATAL;
  }
}

int ReadCallbackBridge::close_callback(struct archive *ar, void *client_data) {
  (void)ar;
  auto *bridge = static_cast<ReadCallbackBridge *>(client_data);
  bridge->_state = State::Closed;
  return ARCHIVE_OK;
}

// ============================================================================
// WriteCallbackBridge Implementation
// ============================================================================

WriteCallbackBridge::WriteCallbackBridge(std::shared_ptr<IDataStream> stream)
  : CallbackBridge(std::move(stream)) {}

int WriteCallbackBridge::open(struct archive *ar) { return archive_write_open(ar, client_token(), open_callback, write_callback, close_callback); }

la_ssize_t WriteCallbackBridge::write_callback(struct archive *ar, void *client_data, const void *buffer, size_t length) {
  (void)ar;
  auto *bridge = static_cast<WriteCallbackBridge *>(client_data);
  if (bridge->_state == State::Closed || !bridge->_stream) {
    return -1;
  }
  if (length == 0) {
    return 0;
  }

  try {
    // buffer is only valid for the duration of this call
    std::vector<uint8_t> transient(static_cast<const uint8_t *>(buffer), static_cast<const uint8_t *>(buffer) + length);
    const ssize_t accepted = bridge->_stream->write(transient.data(), transient.size());
    if (accepted <= 0) {
      return accepted < 0 ? -1 : 0;
    }
    return static_cast<la_ssize_t>(std::min<size_t>(static_cast<size_t>(accepted), length));
  } catch (...) {
    bridge->capture_current_exception();
    return -1;
  }
}

int WriteCallbackBridge::close_callback(struct archive *ar, void *client_data) {
  (void)ar;
  auto *bridge = static_cast<WriteCallbackBridge *>(client_data);
  if (bridge->_state == State::Closed || !bridge->_stream) {
    return ARCHIVE_OK;
  }

  int status = ARCHIVE_OK;
  try {
    bridge->_stream->flush();
  } catch (...) {
    bridge->capture_current_exception();
    status = ARCHIVE_FATAL;
  }
  bridge->_state = State::Closed;
  return status;
}

} // namespace archive_bridge
