// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include "archive_bridge/writer.h"
#include "archive_handle.h"

#include <archive.h>
#include <cstddef>
#include <cstdint>
#include <filesystem>

struct archive_entry;

namespace archive_bridge {

/**
 * @brief Destination of one entry's header and data
 *
 * write_data() follows archive_write_data() conventions: the count
 * accepted (possibly short), 0, or a negative status.
 */
class IEntryDataSink {
public:
  virtual ~IEntryDataSink() = default;

  virtual void write_header(struct archive_entry *entry) = 0;
  virtual la_ssize_t write_data(const void *buffer, size_t length) = 0;
  virtual void finish_entry() = 0;

  /// Raise the error matching a negative write_data() result.
  [[noreturn]] virtual void raise_write_failure(la_ssize_t status) = 0;
};

/// IEntryDataSink over a live write session.
class ArchiveDataSink final : public IEntryDataSink {
public:
  explicit ArchiveDataSink(ArchiveHandle &handle)
    : _handle(handle) {}

  void write_header(struct archive_entry *entry) override;
  la_ssize_t write_data(const void *buffer, size_t length) override;
  void finish_entry() override;
  [[noreturn]] void raise_write_failure(la_ssize_t status) override;

private:
  ArchiveHandle &_handle;
};

enum class WriteStrategy {
  Inline,
  Pooled,
  Mapped,
};

const char *to_string(WriteStrategy strategy);

/**
 * @brief Feeds entry content to a sink using a size-selected strategy
 *
 * Each entry goes through HeaderWritten -> DataLoop -> EntryFinished.
 * Any failure leaves the entry unfinished and propagates.
 */
class TieredFileWriter {
public:
  enum class EntryState {
    Idle,
    HeaderWritten,
    DataLoop,
    EntryFinished,
  };

  /// @throws ConfigurationError when options fail validation
  TieredFileWriter(IEntryDataSink &sink, WriteTierOptions options);

  WriteStrategy select_strategy(uint64_t size) const;

  /**
   * @brief Write a header and the first size bytes of the file at path
   * @return Strategy used for the content
   */
  WriteStrategy write_file(struct archive_entry *entry, const std::filesystem::path &path, uint64_t size);

  /// Write a header followed by an in-memory payload.
  void write_memory(struct archive_entry *entry, const void *data, size_t size);

  EntryState state() const { return _state; }
  uint64_t data_calls() const { return _data_calls; }

private:
  void begin_entry(struct archive_entry *entry);
  void finish_entry();

  void write_inline(const std::filesystem::path &path, uint64_t size);
  void write_pooled(const std::filesystem::path &path, uint64_t size);
  void write_mapped(const std::filesystem::path &path, uint64_t size);

  /// Short-write loop: advances by the accepted count until done.
  void write_fully(const uint8_t *data, size_t length);

  IEntryDataSink &_sink;
  WriteTierOptions _options;
  EntryState _state;
  uint64_t _data_calls;
};

} // namespace archive_bridge
