// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include <stdexcept>
#include <string>

namespace archive_bridge {

/**
 * @brief Base class of every error raised by archive_bridge
 *
 * Errors raised by caller-supplied streams are not wrapped: they are
 * re-raised with their original type once the native call returns.
 */
class ArchiveError : public std::runtime_error {
public:
  explicit ArchiveError(const std::string &message)
      : std::runtime_error(message) {}
};

/// Native handle could not be created, or was used after release.
class ResourceError : public ArchiveError {
public:
  explicit ResourceError(const std::string &message)
    : ArchiveError(message) {}
};

/// Entry data was requested after the cursor moved past the entry.
class StaleEntryError : public ResourceError {
public:
  explicit StaleEntryError(const std::string &message)
    : ResourceError(message) {}
};

/**
 * @brief The native engine reported a status other than OK/EOF
 *
 * The message is the engine's own diagnostic text when it has one.
 */
class ProtocolError : public ArchiveError {
public:
  ProtocolError(const std::string &message, int status)
    : ArchiveError(message)
    , _status(status) {}

  int status() const noexcept { return _status; }

private:
  int _status;
};

/// Local file I/O failure inside the library (not a caller stream).
class IoError : public ArchiveError {
public:
  IoError(const std::string &message, int errno_value)
    : ArchiveError(message)
    , _errno_value(errno_value) {}

  int errno_value() const noexcept { return _errno_value; }

private:
  int _errno_value;
};

/// Invalid options or thresholds, rejected before any native call.
class ConfigurationError : public ArchiveError {
public:
  explicit ConfigurationError(const std::string &message)
    : ArchiveError(message) {}
};

/// Requested operation is not supported by this source, target or engine.
class NotSupportedError : public ConfigurationError {
public:
  explicit NotSupportedError(const std::string &message)
    : ConfigurationError(message) {}
};

} // namespace archive_bridge
