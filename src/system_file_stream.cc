// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "system_file_stream.h"
#include "archive_error_utils.h"

#include <cerrno>
#include <stdexcept>

namespace archive_bridge {

SystemFileStream::SystemFileStream(const std::filesystem::path &path, Mode mode)
  : _handle(nullptr)
  , _path(path.string())
  , _mode(mode) {
  if (_path.empty()) {
    throw std::invalid_argument("File path cannot be empty");
  }

  errno = 0;
  FILE *handle = std::fopen(_path.c_str(), mode == Mode::Read ? "rb" : "wb");
  if (!handle) {
    const int err = errno;
    throw make_io_error(mode == Mode::Read ? "Failed to open file" : "Failed to create file", _path, err);
  }
  _handle = handle;
}

SystemFileStream::~SystemFileStream() {
  if (_handle) {
    std::fclose(_handle);
    _handle = nullptr;
  }
}

ssize_t SystemFileStream::read(void *buffer, size_t size) {
  if (_mode != Mode::Read) {
    throw NotSupportedError("file stream was opened for writing: " + _path);
  }
  if (size == 0) {
    return 0;
  }
  errno = 0;
  const std::size_t bytes_read = std::fread(buffer, 1, size, _handle);
  if (bytes_read > 0) {
    return static_cast<ssize_t>(bytes_read);
  }

  if (std::feof(_handle)) {
    return 0;
  }

  report_failure("Failed to read file", errno);
}

ssize_t SystemFileStream::write(const void *buffer, size_t size) {
  if (_mode != Mode::Write) {
    throw NotSupportedError("file stream was opened for reading: " + _path);
  }
  if (size == 0) {
    return 0;
  }
  errno = 0;
  const std::size_t written = std::fwrite(buffer, 1, size, _handle);
  if (written == 0 && std::ferror(_handle)) {
    report_failure("Failed to write file", errno);
  }
  return static_cast<ssize_t>(written);
}

void SystemFileStream::flush() {
  if (_mode != Mode::Write) {
    return;
  }
  errno = 0;
  if (std::fflush(_handle) != 0) {
    report_failure("Failed to flush file", errno);
  }
}

int64_t SystemFileStream::seek(int64_t offset, int whence) {
  if (fseeko(_handle, offset, whence) != 0) {
    return -1;
  }
  const auto position = ftello(_handle);
  return position >= 0 ? position : -1;
}

int64_t SystemFileStream::tell() const {
  const auto position = ftello(_handle);
  return position >= 0 ? position : -1;
}

void SystemFileStream::report_failure(const char *action, int err) {
  std::clearerr(_handle);
  throw make_io_error(action, _path, err);
}

} // namespace archive_bridge
