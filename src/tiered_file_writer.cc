// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "tiered_file_writer.h"

#include "archive_bridge/archive_error.h"
#include "archive_error_utils.h"
#include "buffer_pool.h"
#include "mapped_file.h"
#include "system_file_stream.h"

#include <algorithm>
#include <cerrno>
#include <limits>
#include <vector>

namespace archive_bridge {

namespace {

[[noreturn]] void raise_truncated(const std::filesystem::path &path, uint64_t expected, uint64_t got) {
  throw IoError("File '" + path.string() + "' ended after " + std::to_string(got) + " of " + std::to_string(expected) + " bytes", EIO);
}

} // namespace

void WriteTierOptions::validate() const {
  if (chunk_size == 0) {
    throw ConfigurationError("chunk_size must be positive");
  }
  if (max_write_slice == 0) {
    throw ConfigurationError("max_write_slice must be positive");
  }
  if (inline_limit > mapped_threshold) {
    throw ConfigurationError("inline_limit (" + std::to_string(inline_limit) + ") exceeds mapped_threshold (" + std::to_string(mapped_threshold) + ")");
  }
}

const char *to_string(WriteStrategy strategy) {
  switch (strategy) {
  case WriteStrategy::Inline:
    return "inline";
  case WriteStrategy::Pooled:
    return "pooled";
  case WriteStrategy::Mapped:
    return "mapped";
  }
  return "unknown";
}

// ============================================================================
// ArchiveDataSink Implementation
// ============================================================================

void ArchiveDataSink::write_header(struct archive_entry *entry) { _handle.check(archive_write_header(_handle.get(), entry), "archive_write_header"); }

la_ssize_t ArchiveDataSink::write_data(const void *buffer, size_t length) { return archive_write_data(_handle.get(), buffer, length); }

void ArchiveDataSink::finish_entry() { _handle.check(archive_write_finish_entry(_handle.get()), "archive_write_finish_entry"); }

void ArchiveDataSink::raise_write_failure(la_ssize_t status) {
  _handle.rethrow_pending_stream_error();
  throw make_protocol_error(_handle.get(), "archive_write_data", static_cast<int>(status));
}

// ============================================================================
// TieredFileWriter Implementation
// ============================================================================

TieredFileWriter::TieredFileWriter(IEntryDataSink &sink, WriteTierOptions options)
  : _sink(sink)
  , _options(options)
  , _state(EntryState::Idle)
  , _data_calls(0) {
  _options.validate();
}

WriteStrategy TieredFileWriter::select_strategy(uint64_t size) const {
  if (size < _options.inline_limit) {
    return WriteStrategy::Inline;
  }
  if (size < _options.mapped_threshold) {
    return WriteStrategy::Pooled;
  }
  return WriteStrategy::Mapped;
}

WriteStrategy TieredFileWriter::write_file(struct archive_entry *entry, const std::filesystem::path &path, uint64_t size) {
  const WriteStrategy strategy = select_strategy(size);
  begin_entry(entry);
  if (size > 0) {
    _state = EntryState::DataLoop;
    switch (strategy) {
    case WriteStrategy::Inline:
      write_inline(path, size);
      break;
    case WriteStrategy::Pooled:
      write_pooled(path, size);
      break;
    case WriteStrategy::Mapped:
      write_mapped(path, size);
      break;
    }
  }
  finish_entry();
  return strategy;
}

void TieredFileWriter::write_memory(struct archive_entry *entry, const void *data, size_t size) {
  begin_entry(entry);
  if (size > 0) {
    _state = EntryState::DataLoop;
    write_fully(static_cast<const uint8_t *>(data), size);
  }
  finish_entry();
}

void TieredFileWriter::begin_entry(struct archive_entry *entry) {
  _state = EntryState::Idle;
  _data_calls = 0;
  _sink.write_header(entry);
  _state = EntryState::HeaderWritten;
}

void TieredFileWriter::finish_entry() {
  _sink.finish_entry();
  _state = EntryState::EntryFinished;
}

void TieredFileWriter::write_inline(const std::filesystem::path &path, uint64_t size) {
  if (size > static_cast<uint64_t>(std::numeric_limits<size_t>::max())) {
    throw ConfigurationError("inline_limit exceeds the addressable buffer size");
  }
  const size_t length = static_cast<size_t>(size);
  std::vector<uint8_t> buffer(length);

  SystemFileStream input(path, SystemFileStream::Mode::Read);
  size_t filled = 0;
  while (filled < length) {
    const ssize_t got = input.read(buffer.data() + filled, length - filled);
    if (got <= 0) {
      raise_truncated(path, size, filled);
    }
    filled += static_cast<size_t>(got);
  }
  write_fully(buffer.data(), length);
}

void TieredFileWriter::write_pooled(const std::filesystem::path &path, uint64_t size) {
  BufferPool::Lease chunk = BufferPool::shared().rent(_options.chunk_size);
  const size_t chunk_size = std::min(chunk.size(), _options.chunk_size);

  SystemFileStream input(path, SystemFileStream::Mode::Read);
  uint64_t remaining = size;
  while (remaining > 0) {
    const size_t wanted = static_cast<size_t>(std::min<uint64_t>(remaining, chunk_size));
    const ssize_t got = input.read(chunk.data(), wanted);
    if (got <= 0) {
      raise_truncated(path, size, size - remaining);
    }
    write_fully(chunk.data(), static_cast<size_t>(got));
    remaining -= static_cast<uint64_t>(got);
  }
}

void TieredFileWriter::write_mapped(const std::filesystem::path &path, uint64_t size) {
  MappedFile mapped(path);
  if (static_cast<uint64_t>(mapped.size()) < size) {
    raise_truncated(path, size, mapped.size());
  }
  write_fully(mapped.data(), static_cast<size_t>(size));
}

void TieredFileWriter::write_fully(const uint8_t *data, size_t length) {
  size_t offset = 0;
  while (offset < length) {
    const size_t slice = std::min(length - offset, _options.max_write_slice);
    const la_ssize_t written = _sink.write_data(data + offset, slice);
    ++_data_calls;
    if (written < 0) {
      _sink.raise_write_failure(written);
    }
    if (written == 0) {
      throw ProtocolError("archive_write_data returned 0 bytes written", ARCHIVE_FATAL);
    }
    offset += static_cast<size_t>(written);
  }
}

} // namespace archive_bridge
