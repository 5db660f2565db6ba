// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/archive_format.h"
#include "archive_bridge/data_stream.h"
#include "archive_bridge/entry.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <limits>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archive_bridge {

/**
 * @brief Size thresholds selecting how file content is staged
 *
 * size < inline_limit                       -> one exactly-sized buffer
 * inline_limit <= size < mapped_threshold   -> pooled chunk buffer
 * size >= mapped_threshold                  -> read-only memory mapping
 */
struct WriteTierOptions {
  uint64_t inline_limit = 2ull * 1024 * 1024;
  uint64_t mapped_threshold = 64ull * 1024 * 1024;
  size_t chunk_size = 1 << 20;
  /// Largest length handed to a single archive_write_data() call.
  size_t max_write_slice = static_cast<size_t>(std::numeric_limits<ssize_t>::max());

  /// @throws ConfigurationError when the thresholds are inconsistent
  void validate() const;
};

struct WriterOptions {
  ArchiveFormat format = ArchiveFormat::Tar;
  CompressionType compression = CompressionType::None;
  int compression_level = 6;                  ///< 0-9
  std::optional<size_t> bytes_per_block;      ///< Engine default when unset
  std::optional<std::string> passphrase;
  EncryptionType encryption = EncryptionType::Default;
  WriteTierOptions tiers;
};

struct DirectoryOptions {
  bool recursive = true;
  bool preserve_structure = true; ///< Store paths relative to the root instead of bare names
  std::function<bool(const std::filesystem::path &)> filter;
};

using PathMapper = std::function<std::string(const std::filesystem::path &)>;
using ProgressCallback = std::function<void(const FileProgress &)>;

/**
 * @brief Creates archives through libarchive
 *
 * The target is a file path, a caller-supplied writable IDataStream, or
 * an internal memory buffer (to_memory()).
 *
 * Failures abort the current entry and propagate; entries written before
 * the failure remain in the output. Callers needing all-or-nothing
 * semantics must discard the output themselves.
 *
 * @note Thread Safety
 * A Writer must not be used from more than one thread at a time.
 */
class Writer {
public:
  static Writer open_file(const std::filesystem::path &path, WriterOptions options = {});
  static Writer open_stream(std::shared_ptr<IDataStream> stream, WriterOptions options = {});
  static Writer to_memory(WriterOptions options = {});

  /// Closes the archive if close() was not called; errors become faults.
  ~Writer();

  Writer(Writer &&) noexcept;
  Writer &operator=(Writer &&) noexcept;

  Writer(const Writer &) = delete;
  Writer &operator=(const Writer &) = delete;

  /**
   * @brief Add a file from disk
   * @param archive_path Name stored in the archive (file name when empty)
   */
  void add_file(const std::filesystem::path &source, const std::string &archive_path = {});

  void add_entry(const std::string &archive_path, const std::vector<uint8_t> &data, std::optional<EntryTime> mtime = std::nullopt, mode_t permissions = 0644);
  void add_entry(const std::string &archive_path, const std::string &text, std::optional<EntryTime> mtime = std::nullopt, mode_t permissions = 0644);

  /// Adds a directory entry; a trailing '/' is appended when missing.
  void add_directory_entry(const std::string &archive_path);

  void add_symlink_entry(const std::string &archive_path, const std::string &target);

  /**
   * @brief Add files in order, stopping at the first failure
   * @param mapper Archive name for each file (file name when empty)
   */
  void add_files(const std::vector<std::filesystem::path> &files, PathMapper mapper = {}, ProgressCallback progress = {});

  /// Add the regular files below root, sorted by path.
  void add_directory(const std::filesystem::path &root, const DirectoryOptions &options = {}, ProgressCallback progress = {});

  /// Flush and release the session. Idempotent.
  void close();

  bool is_open() const;

  /**
   * @brief Archive bytes of a memory writer
   * @throws std::logic_error if the writer is not a memory writer or not closed
   */
  std::vector<uint8_t> take_bytes();

private:
  class Session;

  explicit Writer(std::unique_ptr<Session> session);

  std::unique_ptr<Session> _session;
};

} // namespace archive_bridge
