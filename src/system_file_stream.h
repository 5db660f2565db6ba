// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/data_stream.h"

#include <cstdio>
#include <filesystem>
#include <string>

namespace archive_bridge {

/**
 * @brief stdio-backed file stream
 *
 * Read mode opens an existing file; write mode creates or truncates.
 * Failures raise IoError carrying errno.
 */
class SystemFileStream final : public IDataStream {
public:
  enum class Mode {
    Read,
    Write,
  };

  SystemFileStream(const std::filesystem::path &path, Mode mode);
  ~SystemFileStream() override;

  SystemFileStream(const SystemFileStream &) = delete;
  SystemFileStream &operator=(const SystemFileStream &) = delete;

  ssize_t read(void *buffer, size_t size) override;
  ssize_t write(const void *buffer, size_t size) override;
  void flush() override;
  int64_t seek(int64_t offset, int whence) override;
  int64_t tell() const override;

  bool can_read() const override { return _mode == Mode::Read; }
  bool can_write() const override { return _mode == Mode::Write; }
  bool can_seek() const override { return true; }

  const std::string &path() const { return _path; }

private:
  [[noreturn]] void report_failure(const char *action, int err);

  FILE *_handle;
  std::string _path;
  Mode _mode;
};

} // namespace archive_bridge
