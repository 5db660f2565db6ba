// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "callback_bridge.h"

#include <archive.h>
#include <memory>
#include <string>

namespace archive_bridge {

enum class ArchiveDirection {
  Read,
  Write,
};

/**
 * @brief Sole owner of one native libarchive session
 *
 * Guarantees the native free routine runs at most once, and tears the
 * session down in an order that never lets a callback land on freed
 * bridge state:
 *   1. write sessions: archive_write_close() while the bridge is armed
 *   2. bridge disarmed (stream reference dropped)
 *   3. native free routine
 *   4. bridge destroyed
 */
class ArchiveHandle {
public:
  using FreeFunction = int (*)(struct archive *);

  /// free_fn overrides the native free routine (defaults per direction).
  explicit ArchiveHandle(ArchiveDirection direction, FreeFunction free_fn = nullptr);
  ~ArchiveHandle();

  ArchiveHandle(const ArchiveHandle &) = delete;
  ArchiveHandle &operator=(const ArchiveHandle &) = delete;
  ArchiveHandle(ArchiveHandle &&) = delete;
  ArchiveHandle &operator=(ArchiveHandle &&) = delete;

  /// @throws ResourceError if the engine cannot create a session
  void acquire();

  /**
   * @brief Tear the session down; idempotent
   * @return Native free status on the first call, ARCHIVE_OK afterwards
   */
  int release() noexcept;

  bool is_live() const { return _ar != nullptr; }
  bool is_released() const { return _released; }
  ArchiveDirection direction() const { return _direction; }

  /// @throws ResourceError before acquire() or after release()
  struct archive *get() const;

  /// Take ownership of the callback state for the rest of the session.
  void install_bridge(std::unique_ptr<CallbackBridge> bridge);
  CallbackBridge *bridge() const { return _bridge.get(); }

  /// Record that the session was opened, so teardown knows to close it.
  void mark_opened() { _opened = true; }

  /**
   * @brief Flush and close a write session, raising any failure
   *
   * Later release() calls skip the close step.
   */
  void close_engine();

  /// Re-raise an exception a stream raised during the last native call.
  void rethrow_pending_stream_error();

  /**
   * @brief Post-native-call checkpoint
   *
   * Re-raises a captured stream exception first, then raises
   * ProtocolError for any status other than ARCHIVE_OK. ARCHIVE_WARN is
   * reported as a fault instead.
   */
  void check(int status, const char *action);

  std::string last_error(const std::string &fallback) const;

private:
  ArchiveDirection _direction;
  FreeFunction _free_fn;
  struct archive *_ar;
  std::unique_ptr<CallbackBridge> _bridge;
  bool _opened;
  bool _engine_closed;
  bool _released;
};

} // namespace archive_bridge
