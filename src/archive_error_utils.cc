// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_error_utils.h"

#include <archive.h>
#include <cstring>

namespace archive_bridge {

std::string format_errno_error(const std::string &prefix, int err) {
  if (err == 0) {
    return prefix;
  }
  return prefix + " (posix errno=" + std::to_string(err) + ": " + std::strerror(err) + ")";
}

std::string format_path_errno_error(const std::string &action, const std::string &path, int err) {
  if (path.empty()) {
    return format_errno_error(action, err);
  }
  return format_errno_error(action + " '" + path + "'", err);
}

std::string prefer_error_detail(const std::string &detail, const std::string &fallback) { return detail.empty() ? fallback : detail; }

std::string archive_error_text(struct archive *ar, const std::string &fallback) {
  if (!ar) {
    return fallback;
  }
  const char *text = archive_error_string(ar);
  return prefer_error_detail(text ? std::string(text) : std::string(), fallback);
}

const char *archive_status_name(int status) {
  switch (status) {
  case ARCHIVE_OK:
    return "ARCHIVE_OK";
  case ARCHIVE_EOF:
    return "ARCHIVE_EOF";
  case ARCHIVE_RETRY:
    return "ARCHIVE_RETRY";
  case ARCHIVE_WARN:
    return "ARCHIVE_WARN";
  case ARCHIVE_FAILED:
    return "ARCHIVE_FAILED";
  case ARCHIVE_FATAL:
    return "ARCHIVE_FATAL";
  default:
    return "ARCHIVE_UNKNOWN";
  }
}

ProtocolError make_protocol_error(struct archive *ar, const std::string &action, int status) {
  const std::string fallback = action + " failed with " + archive_status_name(status);
  return ProtocolError(archive_error_text(ar, fallback), status);
}

IoError make_io_error(const std::string &action, const std::string &path, int err) { return IoError(format_path_errno_error(action, path, err), err); }

} // namespace archive_bridge
