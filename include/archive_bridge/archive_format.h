// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace archive_bridge {

/// Container formats the writer can produce.
enum class ArchiveFormat {
  Zip,
  SevenZip,
  Tar, ///< POSIX pax (restricted): ustar unless extended headers are needed
  Ustar,
  Pax,
  Cpio, ///< SVR4 newc
  Iso9660,
  Xar,
};

/// Outer compression filters; Deflate is only meaningful for Zip.
enum class CompressionType {
  None,
  Gzip,
  Bzip2,
  Xz,
  Lzma,
  Lz4,
  Zstd,
  Compress,
  Lzip,
  Deflate,
};

enum class EncryptionType {
  Default, ///< Format default (AES-256 for Zip and 7-Zip)
  None,
  Traditional, ///< PKWARE traditional (ZipCrypto)
  AES128,
  AES192,
  AES256,
  ZipCrypto, ///< Alias of Traditional
};

const char *to_string(ArchiveFormat format);
const char *to_string(CompressionType compression);
const char *to_string(EncryptionType encryption);

/**
 * @brief Progress snapshot reported by batch additions
 */
struct FileProgress {
  std::string file_path;    ///< File about to be added, empty on the final report
  uint64_t bytes_processed = 0;
  uint64_t total_bytes = 0;
  size_t file_index = 0;
  size_t total_files = 0;

  double percent_complete() const { return total_bytes > 0 ? static_cast<double>(bytes_processed) * 100.0 / static_cast<double>(total_bytes) : 0.0; }

  bool is_complete() const { return total_files > 0 && file_index >= total_files; }
};

} // namespace archive_bridge
