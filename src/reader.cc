// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/reader.h"

#include "archive_bridge/archive_error.h"
#include "archive_handle.h"
#include "callback_bridge.h"
#include "entry_cursor.h"

#include <archive.h>
#include <cstdio>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace archive_bridge {

namespace {

struct FileSource {
  std::filesystem::path path;
};

struct VolumeSource {
  std::vector<std::filesystem::path> parts;
};

struct MemorySource {
  std::vector<uint8_t> bytes;
};

struct StreamSource {
  std::shared_ptr<IDataStream> stream;
};

using ReaderSource = std::variant<FileSource, VolumeSource, MemorySource, StreamSource>;

template <class... Ts> struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

} // namespace

// ============================================================================
// Reader::Session
// ============================================================================

class Reader::Session {
public:
  Session(ReaderSource source, ReaderOptions options)
    : _source(std::move(source))
    , _options(std::move(options))
    , _cursor_state(std::make_shared<EntryCursorState>()) {}

  ~Session() { close(); }

  void open();
  void reset();
  void close() noexcept;

  bool is_open() const { return static_cast<bool>(_handle); }

  EntryCursor &cursor() {
    require_open();
    return *_cursor;
  }

  ArchiveHandle &handle() {
    require_open();
    return *_handle;
  }

private:
  void require_open() const {
    if (!_handle) {
      throw ResourceError("reader has been closed");
    }
  }

  void open_source(ArchiveHandle &handle);

  ReaderSource _source;
  ReaderOptions _options;
  std::shared_ptr<EntryCursorState> _cursor_state;
  std::unique_ptr<ArchiveHandle> _handle;
  std::unique_ptr<EntryCursor> _cursor;
};

void Reader::Session::open() {
  auto handle = std::make_unique<ArchiveHandle>(ArchiveDirection::Read);
  handle->acquire();
  struct archive *ar = handle->get();

  handle->check(archive_read_support_filter_all(ar), "archive_read_support_filter_all");
  handle->check(archive_read_support_format_all(ar), "archive_read_support_format_all");
  for (const std::string &passphrase : _options.passphrases) {
    handle->check(archive_read_add_passphrase(ar, passphrase.c_str()), "archive_read_add_passphrase");
  }

  open_source(*handle);
  handle->mark_opened();

  _handle = std::move(handle);
  _cursor_state->handle = _handle.get();
  _cursor = std::make_unique<EntryCursor>(_cursor_state);
}

void Reader::Session::open_source(ArchiveHandle &handle) {
  struct archive *ar = handle.get();
  const size_t block_size = _options.block_size;

  std::visit(overloaded{
                 [&](const FileSource &source) {
                   const std::string path = source.path.string();
                   handle.check(archive_read_open_filename(ar, path.c_str(), block_size), "archive_read_open_filename");
                 },
                 [&](const VolumeSource &source) {
                   std::vector<std::string> paths;
                   paths.reserve(source.parts.size());
                   for (const auto &part : source.parts) {
                     paths.push_back(part.string());
                   }
                   std::vector<const char *> names;
                   names.reserve(paths.size() + 1);
                   for (const std::string &path : paths) {
                     names.push_back(path.c_str());
                   }
                   names.push_back(nullptr);
                   handle.check(archive_read_open_filenames(ar, names.data(), block_size), "archive_read_open_filenames");
                 },
                 [&](const MemorySource &source) {
                   // libarchive wants a non-null pointer even for an empty buffer.
                   static const uint8_t empty = 0;
                   const void *data = source.bytes.empty() ? static_cast<const void *>(&empty) : source.bytes.data();
                   handle.check(archive_read_open_memory(ar, data, source.bytes.size()), "archive_read_open_memory");
                 },
                 [&](const StreamSource &source) {
                   auto bridge = std::make_unique<ReadCallbackBridge>(source.stream, block_size);
                   ReadCallbackBridge *raw = bridge.get();
                   handle.install_bridge(std::move(bridge));
                   handle.check(raw->open(ar), "archive_read_open1");
                 },
             },
             _source);
}

void Reader::Session::reset() {
  require_open();

  std::shared_ptr<IDataStream> stream;
  if (const auto *source = std::get_if<StreamSource>(&_source)) {
    stream = source->stream;
    if (!stream->can_seek()) {
      throw NotSupportedError("Cannot reset a reader whose stream is not seekable");
    }
  }

  close();
  if (stream && stream->seek(0, SEEK_SET) != 0) {
    throw NotSupportedError("Failed to rewind the reader's stream to its start");
  }
  open();
}

void Reader::Session::close() noexcept {
  if (_cursor) {
    _cursor->invalidate();
  }
  _cursor_state->handle = nullptr;
  _cursor.reset();
  if (_handle) {
    _handle->release();
    _handle.reset();
  }
}

// ============================================================================
// Reader Implementation
// ============================================================================

Reader::Reader(std::unique_ptr<Session> session)
  : _session(std::move(session)) {}

Reader::~Reader() = default;

Reader::Reader(Reader &&) noexcept = default;
Reader &Reader::operator=(Reader &&) noexcept = default;

Reader Reader::open_file(const std::filesystem::path &path, ReaderOptions options) {
  if (options.block_size == 0) {
    throw ConfigurationError("block_size must be positive");
  }
  auto session = std::make_unique<Session>(FileSource{ path }, std::move(options));
  session->open();
  return Reader(std::move(session));
}

Reader Reader::open_volumes(std::vector<std::filesystem::path> parts, ReaderOptions options) {
  if (options.block_size == 0) {
    throw ConfigurationError("block_size must be positive");
  }
  if (parts.empty()) {
    throw ConfigurationError("multi-volume source requires at least one part");
  }
  auto session = std::make_unique<Session>(VolumeSource{ std::move(parts) }, std::move(options));
  session->open();
  return Reader(std::move(session));
}

Reader Reader::open_memory(std::vector<uint8_t> bytes, ReaderOptions options) {
  if (options.block_size == 0) {
    throw ConfigurationError("block_size must be positive");
  }
  auto session = std::make_unique<Session>(MemorySource{ std::move(bytes) }, std::move(options));
  session->open();
  return Reader(std::move(session));
}

Reader Reader::open_stream(std::shared_ptr<IDataStream> stream, ReaderOptions options) {
  if (!stream) {
    throw ConfigurationError("stream cannot be null");
  }
  if (!stream->can_read()) {
    throw ConfigurationError("stream must be readable");
  }
  if (options.block_size == 0) {
    throw ConfigurationError("block_size must be positive");
  }
  auto session = std::make_unique<Session>(StreamSource{ std::move(stream) }, std::move(options));
  session->open();
  return Reader(std::move(session));
}

std::optional<Entry> Reader::next_entry() {
  if (!_session) {
    throw ResourceError("reader has been moved from");
  }
  return _session->cursor().advance();
}

std::optional<Entry> Reader::first_entry() {
  if (!_session) {
    throw ResourceError("reader has been moved from");
  }
  if (_session->cursor().has_advanced()) {
    _session->reset();
  }
  return _session->cursor().advance();
}

void Reader::reset() {
  if (!_session) {
    throw ResourceError("reader has been moved from");
  }
  _session->reset();
}

int Reader::has_encrypted_entries() const {
  if (!_session) {
    throw ResourceError("reader has been moved from");
  }
  return archive_read_has_encrypted_entries(_session->handle().get());
}

bool Reader::is_open() const { return _session && _session->is_open(); }

void Reader::close() {
  if (_session) {
    _session->close();
  }
}

Reader::Iterator Reader::begin() { return Iterator(this); }

Reader::Iterator Reader::end() { return Iterator(); }

// ============================================================================
// Reader::Iterator Implementation
// ============================================================================

Reader::Iterator::Iterator(Reader *reader)
  : _reader(reader) {
  _current = _reader->next_entry();
  if (!_current) {
    _reader = nullptr;
  }
}

Entry &Reader::Iterator::operator*() {
  if (!_current) {
    throw std::logic_error("dereferencing an end iterator");
  }
  return *_current;
}

Entry *Reader::Iterator::operator->() { return &operator*(); }

Reader::Iterator &Reader::Iterator::operator++() {
  if (_reader) {
    _current = _reader->next_entry();
    if (!_current) {
      _reader = nullptr;
    }
  }
  return *this;
}

bool Reader::Iterator::operator==(const Iterator &other) const { return _reader == other._reader; }

bool Reader::Iterator::operator!=(const Iterator &other) const { return !(*this == other); }

} // namespace archive_bridge
