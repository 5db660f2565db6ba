// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/archive_error.h"

#include <string>

struct archive;

namespace archive_bridge {

std::string format_errno_error(const std::string &prefix, int err);
std::string format_path_errno_error(const std::string &action, const std::string &path, int err);
std::string prefer_error_detail(const std::string &detail, const std::string &fallback);

/// Engine's last error text for a handle, or fallback when it has none.
std::string archive_error_text(struct archive *ar, const std::string &fallback);

/// Symbolic name of a libarchive status code ("ARCHIVE_OK", ...).
const char *archive_status_name(int status);

ProtocolError make_protocol_error(struct archive *ar, const std::string &action, int status);
IoError make_io_error(const std::string &action, const std::string &path, int err);

} // namespace archive_bridge
