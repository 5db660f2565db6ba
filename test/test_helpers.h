// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/data_stream.h"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <string>
#include <system_error>
#include <vector>

namespace archive_bridge::test_helpers {

inline bool expect(bool condition, const std::string &message) {
  if (!condition) {
    std::cerr << "  [FAIL] " << message << std::endl;
    return false;
  }
  return true;
}

/// Run fn and report whether it threw exactly an exception of type E (or derived).
template <typename E, typename Fn> bool expect_throws(Fn &&fn, const std::string &message) {
  try {
    fn();
  } catch (const E &) {
    return true;
  } catch (const std::exception &ex) {
    std::cerr << "  [FAIL] " << message << " (unexpected exception: " << ex.what() << ")" << std::endl;
    return false;
  }
  std::cerr << "  [FAIL] " << message << " (nothing thrown)" << std::endl;
  return false;
}

/// Deterministic pseudo-random payload.
inline std::vector<uint8_t> make_payload(size_t size, uint32_t seed = 1) {
  std::vector<uint8_t> data(size);
  uint32_t state = seed * 2654435761u + 1;
  for (size_t i = 0; i < size; ++i) {
    state = state * 1103515245u + 12345u;
    data[i] = static_cast<uint8_t>(state >> 16);
  }
  return data;
}

/// Directory under the system temp path, removed on destruction.
class TempDir {
public:
  explicit TempDir(const std::string &prefix) {
    static std::atomic<unsigned> counter{ 0 };
    const auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    _path = std::filesystem::temp_directory_path() / (prefix + "_" + std::to_string(stamp) + "_" + std::to_string(counter++));
    std::filesystem::create_directories(_path);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(_path, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return _path; }
  std::filesystem::path operator/(const std::string &name) const { return _path / name; }

private:
  std::filesystem::path _path;
};

inline void write_file(const std::filesystem::path &path, const std::vector<uint8_t> &data) {
  std::filesystem::create_directories(path.parent_path());
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out.write(reinterpret_cast<const char *>(data.data()), static_cast<std::streamsize>(data.size()));
}

inline void write_file(const std::filesystem::path &path, const std::string &text) { write_file(path, std::vector<uint8_t>(text.begin(), text.end())); }

inline std::vector<uint8_t> read_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  return std::vector<uint8_t>(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Writable stream that accepts at most max_accept bytes per write() call.
class TrickleStream final : public IDataStream {
public:
  explicit TrickleStream(size_t max_accept)
    : _max_accept(max_accept) {}

  ssize_t write(const void *buffer, size_t size) override {
    const size_t count = size < _max_accept ? size : _max_accept;
    const auto *bytes = static_cast<const uint8_t *>(buffer);
    _data.insert(_data.end(), bytes, bytes + count);
    ++_write_calls;
    return static_cast<ssize_t>(count);
  }

  void flush() override { ++_flush_calls; }

  bool can_write() const override { return true; }

  const std::vector<uint8_t> &data() const { return _data; }
  size_t write_calls() const { return _write_calls; }
  size_t flush_calls() const { return _flush_calls; }

private:
  size_t _max_accept;
  std::vector<uint8_t> _data;
  size_t _write_calls = 0;
  size_t _flush_calls = 0;
};

} // namespace archive_bridge::test_helpers
