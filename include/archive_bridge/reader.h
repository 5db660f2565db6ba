// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/data_stream.h"
#include "archive_bridge/entry.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace archive_bridge {

struct ReaderOptions {
  std::vector<std::string> passphrases; ///< Tried in order for encrypted entries
  size_t block_size = 1 << 20;          ///< Read block and pinned buffer size in bytes
};

/**
 * @brief Forward-only reader over an archive's entries
 *
 * The source can be a file path, an ordered list of volume paths, an
 * owned memory buffer, or any readable IDataStream. All filters and
 * formats libarchive supports are enabled.
 *
 * Usage:
 *   auto reader = Reader::open_file("archive.tar.gz");
 *   for (Entry &entry : reader) {
 *       auto bytes = entry.read_all();
 *   }
 *
 * @note Thread Safety
 * A Reader must not be used from more than one thread at a time.
 * Independent readers may run on different threads.
 */
class Reader {
public:
  static Reader open_file(const std::filesystem::path &path, ReaderOptions options = {});
  static Reader open_volumes(std::vector<std::filesystem::path> parts, ReaderOptions options = {});
  static Reader open_memory(std::vector<uint8_t> bytes, ReaderOptions options = {});

  /**
   * @brief Read from a caller-supplied stream
   *
   * The stream is assumed to be positioned at the start of the archive.
   * It must be readable; it only has to be seekable if reset() is used.
   */
  static Reader open_stream(std::shared_ptr<IDataStream> stream, ReaderOptions options = {});

  ~Reader();

  Reader(Reader &&) noexcept;
  Reader &operator=(Reader &&) noexcept;

  // Non-copyable
  Reader(const Reader &) = delete;
  Reader &operator=(const Reader &) = delete;

  /**
   * @brief Input iterator over the remaining entries
   *
   * Incrementing advances the underlying cursor, which invalidates the
   * data window of the entry previously yielded.
   */
  class Iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Entry;
    using difference_type = std::ptrdiff_t;
    using pointer = Entry *;
    using reference = Entry &;

    reference operator*();
    pointer operator->();
    Iterator &operator++();
    bool operator==(const Iterator &other) const;
    bool operator!=(const Iterator &other) const;

  private:
    friend class Reader;
    explicit Iterator(Reader *reader);
    Iterator() = default;

    Reader *_reader = nullptr;
    std::optional<Entry> _current;
  };

  /// Iterator starting at the cursor's next entry (not necessarily the first).
  Iterator begin();
  Iterator end();

  /// Range over the remaining entries: `for (Entry &e : reader.entries())`.
  Reader &entries() { return *this; }

  /**
   * @brief Advance the cursor
   * @return The new current entry, or std::nullopt at end of archive
   */
  std::optional<Entry> next_entry();

  /**
   * @brief Return the archive's first entry
   *
   * Resets the reader first when the cursor has already moved.
   */
  std::optional<Entry> first_entry();

  /**
   * @brief Reopen the source and position before the first entry
   * @throws NotSupportedError for stream sources that cannot seek
   */
  void reset();

  /**
   * @brief Engine's view of encryption in the entries read so far
   * @return >0 encrypted entries seen, 0 none, <0 undetermined
   */
  int has_encrypted_entries() const;

  bool is_open() const;

  /// Release the native session. Idempotent.
  void close();

private:
  class Session;

  explicit Reader(std::unique_ptr<Session> session);

  std::unique_ptr<Session> _session;
};

} // namespace archive_bridge
