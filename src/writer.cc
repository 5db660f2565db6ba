// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/writer.h"

#include "archive_bridge/archive_error.h"
#include "archive_bridge/archive_fault.h"
#include "archive_bridge/platform_compat.h"
#include "archive_error_utils.h"
#include "archive_handle.h"
#include "callback_bridge.h"
#include "tiered_file_writer.h"

#include <archive.h>
#include <archive_entry.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <stdexcept>
#include <sys/stat.h>
#include <system_error>
#include <utility>

namespace archive_bridge {

namespace {

struct ArchiveEntryDeleter {
  void operator()(struct archive_entry *entry) const { archive_entry_free(entry); }
};

using ArchiveEntryPtr = std::unique_ptr<struct archive_entry, ArchiveEntryDeleter>;

ArchiveEntryPtr new_entry(const std::string &archive_path, mode_t filetype, mode_t permissions, const EntryTime &mtime) {
  if (archive_path.empty()) {
    throw std::invalid_argument("archive path cannot be empty");
  }
  ArchiveEntryPtr entry(archive_entry_new());
  if (!entry) {
    throw ResourceError("Failed to allocate archive entry");
  }
  archive_entry_set_pathname(entry.get(), archive_path.c_str());
  archive_entry_set_filetype(entry.get(), filetype);
  archive_entry_set_perm(entry.get(), permissions);
  archive_entry_set_mtime(entry.get(), static_cast<time_t>(mtime.seconds), static_cast<long>(mtime.nanoseconds));
  return entry;
}

EntryTime current_time() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
  const auto nanoseconds = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - seconds);
  return { static_cast<int64_t>(seconds.count()), static_cast<int64_t>(nanoseconds.count()) };
}

/// Module name libarchive registers for a compression filter, or nullptr.
const char *filter_module_name(CompressionType compression) {
  switch (compression) {
  case CompressionType::Gzip:
    return "gzip";
  case CompressionType::Bzip2:
    return "bzip2";
  case CompressionType::Xz:
    return "xz";
  case CompressionType::Lzma:
    return "lzma";
  case CompressionType::Lz4:
    return "lz4";
  case CompressionType::Zstd:
    return "zstd";
  case CompressionType::Lzip:
    return "lzip";
  case CompressionType::None:
  case CompressionType::Compress:
  case CompressionType::Deflate:
    return nullptr;
  }
  return nullptr;
}

const char *zip_encryption_name(EncryptionType encryption) {
  switch (encryption) {
  case EncryptionType::Default:
  case EncryptionType::AES256:
    return "aes256";
  case EncryptionType::AES192:
    return "aes192";
  case EncryptionType::AES128:
    return "aes128";
  case EncryptionType::Traditional:
  case EncryptionType::ZipCrypto:
    return "traditional";
  case EncryptionType::None:
    return "none";
  }
  return "aes256";
}

void validate_options(const WriterOptions &options) {
  if (options.compression_level < 0 || options.compression_level > 9) {
    throw ConfigurationError("Compression level must be between 0 and 9, got " + std::to_string(options.compression_level));
  }
  options.tiers.validate();

  if (options.bytes_per_block && *options.bytes_per_block > static_cast<size_t>(INT_MAX)) {
    throw ConfigurationError("bytes_per_block is too large");
  }
  if (options.compression == CompressionType::Deflate && options.format != ArchiveFormat::Zip) {
    throw NotSupportedError(std::string("Deflate compression is only available for zip archives, not ") + to_string(options.format));
  }

  if (!options.passphrase) {
    if (options.encryption != EncryptionType::Default && options.encryption != EncryptionType::None) {
      throw ConfigurationError(std::string("Encryption ") + to_string(options.encryption) + " requires a passphrase");
    }
    return;
  }
  if (options.passphrase->empty()) {
    throw std::invalid_argument("passphrase cannot be empty");
  }
  switch (options.format) {
  case ArchiveFormat::Zip:
    return;
  case ArchiveFormat::SevenZip:
    if (options.encryption != EncryptionType::Default && options.encryption != EncryptionType::AES256 && options.encryption != EncryptionType::None) {
      throw NotSupportedError(std::string("7-Zip only supports AES-256 encryption, requested ") + to_string(options.encryption));
    }
    return;
  default:
    throw NotSupportedError(std::string("Password encryption is not supported for ") + to_string(options.format) + " archives (supported: zip, 7zip)");
  }
}

void set_format(ArchiveHandle &handle, ArchiveFormat format) {
  struct archive *ar = handle.get();
  int status = ARCHIVE_FATAL;
  switch (format) {
  case ArchiveFormat::Zip:
    status = archive_write_set_format_zip(ar);
    break;
  case ArchiveFormat::SevenZip:
    status = archive_write_set_format_7zip(ar);
    break;
  case ArchiveFormat::Tar:
    status = archive_write_set_format_pax_restricted(ar);
    break;
  case ArchiveFormat::Ustar:
    status = archive_write_set_format_ustar(ar);
    break;
  case ArchiveFormat::Pax:
    status = archive_write_set_format_pax(ar);
    break;
  case ArchiveFormat::Cpio:
    status = archive_write_set_format_cpio_newc(ar);
    break;
  case ArchiveFormat::Iso9660:
    status = archive_write_set_format_iso9660(ar);
    break;
  case ArchiveFormat::Xar:
    status = archive_write_set_format_xar(ar);
    break;
  }
  handle.check(status, "archive_write_set_format");
}

void add_filter(ArchiveHandle &handle, CompressionType compression) {
  struct archive *ar = handle.get();
  int status = ARCHIVE_OK;
  switch (compression) {
  case CompressionType::None:
  case CompressionType::Deflate:
    return;
  case CompressionType::Gzip:
    status = archive_write_add_filter_gzip(ar);
    break;
  case CompressionType::Bzip2:
    status = archive_write_add_filter_bzip2(ar);
    break;
  case CompressionType::Xz:
    status = archive_write_add_filter_xz(ar);
    break;
  case CompressionType::Lzma:
    status = archive_write_add_filter_lzma(ar);
    break;
  case CompressionType::Lz4:
    status = archive_write_add_filter_lz4(ar);
    break;
  case CompressionType::Zstd:
    status = archive_write_add_filter_zstd(ar);
    break;
  case CompressionType::Compress:
    status = archive_write_add_filter_compress(ar);
    break;
  case CompressionType::Lzip:
    status = archive_write_add_filter_lzip(ar);
    break;
  }
  handle.check(status, "archive_write_add_filter");
}

void apply_compression_level(ArchiveHandle &handle, const WriterOptions &options) {
  struct archive *ar = handle.get();

  if (const char *module = filter_module_name(options.compression)) {
    int level = options.compression_level;
    // lz4 and zstd reject level 0.
    if (options.compression == CompressionType::Lz4 || options.compression == CompressionType::Zstd) {
      level = std::max(level, 1);
    }
    const std::string value = std::to_string(level);
    handle.check(archive_write_set_filter_option(ar, module, "compression-level", value.c_str()), "archive_write_set_filter_option(compression-level)");
  }

  if (options.format == ArchiveFormat::Zip) {
    if (options.compression == CompressionType::Deflate) {
      handle.check(archive_write_set_format_option(ar, "zip", "compression", "deflate"), "archive_write_set_format_option(zip:compression)");
    }
    const std::string value = std::to_string(options.compression_level);
    const int status = archive_write_set_format_option(ar, "zip", "compression-level", value.c_str());
    if (status != ARCHIVE_OK) {
      // Older engines lack the option and keep their default level.
      dispatch_registered_fault({ handle.last_error("zip compression-level option was refused"), status, {} });
    }
  }
}

void configure_encryption(ArchiveHandle &handle, const WriterOptions &options) {
  if (!options.passphrase) {
    return;
  }
  struct archive *ar = handle.get();

  if (options.format == ArchiveFormat::SevenZip) {
    if (options.encryption == EncryptionType::None) {
      return;
    }
    handle.check(archive_write_set_passphrase(ar, options.passphrase->c_str()), "archive_write_set_passphrase");
    const int status = archive_write_set_format_option(ar, "7zip", "encryption", "aes256");
    if (status != ARCHIVE_OK) {
      throw NotSupportedError("7-Zip encryption is not available in this libarchive build: " + handle.last_error("encryption option refused"));
    }
    return;
  }

  handle.check(archive_write_set_passphrase(ar, options.passphrase->c_str()), "archive_write_set_passphrase");
  handle.check(archive_write_set_format_option(ar, "zip", "encryption", zip_encryption_name(options.encryption)), "archive_write_set_format_option(zip:encryption)");
}

} // namespace

// ============================================================================
// Writer::Session
// ============================================================================

class Writer::Session {
public:
  explicit Session(WriterOptions options)
    : _options(std::move(options))
    , _closed(false) {}

  ~Session() { release_with_faults(); }

  void open_file(const std::filesystem::path &path);
  void open_stream(std::shared_ptr<IDataStream> stream);
  void open_memory();

  const WriterOptions &options() const { return _options; }

  ArchiveHandle &handle() {
    if (_closed || !_handle) {
      throw ResourceError("writer has been closed");
    }
    return *_handle;
  }

  void close();
  void release_with_faults() noexcept;

  bool is_open() const { return _handle && !_closed; }
  std::vector<uint8_t> take_bytes();

private:
  std::unique_ptr<ArchiveHandle> configured_handle();

  WriterOptions _options;
  std::unique_ptr<ArchiveHandle> _handle;
  std::shared_ptr<MemoryStream> _memory;
  bool _closed;
};

std::unique_ptr<ArchiveHandle> Writer::Session::configured_handle() {
  validate_options(_options);

  auto handle = std::make_unique<ArchiveHandle>(ArchiveDirection::Write);
  handle->acquire();
  set_format(*handle, _options.format);
  add_filter(*handle, _options.compression);
  apply_compression_level(*handle, _options);
  if (_options.bytes_per_block) {
    handle->check(archive_write_set_bytes_per_block(handle->get(), static_cast<int>(*_options.bytes_per_block)), "archive_write_set_bytes_per_block");
  }
  configure_encryption(*handle, _options);
  return handle;
}

void Writer::Session::open_file(const std::filesystem::path &path) {
  if (path.empty()) {
    throw std::invalid_argument("output path cannot be empty");
  }
  auto handle = configured_handle();
  const std::string path_string = path.string();
  handle->check(archive_write_open_filename(handle->get(), path_string.c_str()), "archive_write_open_filename");
  handle->mark_opened();
  _handle = std::move(handle);
}

void Writer::Session::open_stream(std::shared_ptr<IDataStream> stream) {
  if (!stream) {
    throw std::invalid_argument("output stream cannot be null");
  }
  if (!stream->can_write()) {
    throw ConfigurationError("output stream must be writable");
  }
  auto handle = configured_handle();
  auto bridge = std::make_unique<WriteCallbackBridge>(std::move(stream));
  WriteCallbackBridge *raw = bridge.get();
  handle->install_bridge(std::move(bridge));
  handle->check(raw->open(handle->get()), "archive_write_open");
  handle->mark_opened();
  _handle = std::move(handle);
}

void Writer::Session::open_memory() {
  _memory = std::make_shared<MemoryStream>();
  open_stream(_memory);
}

void Writer::Session::close() {
  if (_closed) {
    return;
  }
  _closed = true;
  if (!_handle) {
    return;
  }
  // The engine is released even when the final flush fails.
  std::unique_ptr<ArchiveHandle> handle = std::move(_handle);
  handle->close_engine();
  handle->release();
}

void Writer::Session::release_with_faults() noexcept {
  _closed = true;
  if (_handle) {
    _handle->release();
    _handle.reset();
  }
}

std::vector<uint8_t> Writer::Session::take_bytes() {
  if (!_memory) {
    throw std::logic_error("take_bytes() is only available on memory writers");
  }
  if (!_closed) {
    throw std::logic_error("take_bytes() requires the writer to be closed first");
  }
  return _memory->release_data();
}

// ============================================================================
// Writer Implementation
// ============================================================================

Writer::Writer(std::unique_ptr<Session> session)
  : _session(std::move(session)) {}

Writer::~Writer() = default;

Writer::Writer(Writer &&) noexcept = default;
Writer &Writer::operator=(Writer &&) noexcept = default;

Writer Writer::open_file(const std::filesystem::path &path, WriterOptions options) {
  auto session = std::make_unique<Session>(std::move(options));
  session->open_file(path);
  return Writer(std::move(session));
}

Writer Writer::open_stream(std::shared_ptr<IDataStream> stream, WriterOptions options) {
  auto session = std::make_unique<Session>(std::move(options));
  session->open_stream(std::move(stream));
  return Writer(std::move(session));
}

Writer Writer::to_memory(WriterOptions options) {
  auto session = std::make_unique<Session>(std::move(options));
  session->open_memory();
  return Writer(std::move(session));
}

void Writer::add_file(const std::filesystem::path &source, const std::string &archive_path) {
  if (!_session) {
    throw ResourceError("writer has been moved from");
  }
  ArchiveHandle &handle = _session->handle();

  const std::string source_string = source.string();
  struct stat st;
  if (::stat(source_string.c_str(), &st) != 0) {
    throw make_io_error("Failed to stat file", source_string, errno);
  }
  if (!S_ISREG(st.st_mode)) {
    throw std::invalid_argument("'" + source_string + "' is not a regular file");
  }

  const std::string name = archive_path.empty() ? source.filename().string() : archive_path;
  const EntryTime mtime{ static_cast<int64_t>(st.ARCHIVE_BRIDGE_STAT_MTIM.tv_sec), static_cast<int64_t>(st.ARCHIVE_BRIDGE_STAT_MTIM.tv_nsec) };
  ArchiveEntryPtr entry = new_entry(name, AE_IFREG, st.st_mode & 07777, mtime);
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(st.st_size));

  ArchiveDataSink sink(handle);
  TieredFileWriter writer(sink, _session->options().tiers);
  writer.write_file(entry.get(), source, static_cast<uint64_t>(st.st_size));
}

void Writer::add_entry(const std::string &archive_path, const std::vector<uint8_t> &data, std::optional<EntryTime> mtime, mode_t permissions) {
  if (!_session) {
    throw ResourceError("writer has been moved from");
  }
  ArchiveHandle &handle = _session->handle();

  ArchiveEntryPtr entry = new_entry(archive_path, AE_IFREG, permissions, mtime ? *mtime : current_time());
  archive_entry_set_size(entry.get(), static_cast<la_int64_t>(data.size()));

  ArchiveDataSink sink(handle);
  TieredFileWriter writer(sink, _session->options().tiers);
  writer.write_memory(entry.get(), data.data(), data.size());
}

void Writer::add_entry(const std::string &archive_path, const std::string &text, std::optional<EntryTime> mtime, mode_t permissions) {
  add_entry(archive_path, std::vector<uint8_t>(text.begin(), text.end()), mtime, permissions);
}

void Writer::add_directory_entry(const std::string &archive_path) {
  if (!_session) {
    throw ResourceError("writer has been moved from");
  }
  ArchiveHandle &handle = _session->handle();

  std::string name = archive_path;
  if (!name.empty() && name.back() != '/') {
    name.push_back('/');
  }
  ArchiveEntryPtr entry = new_entry(name, AE_IFDIR, 0755, current_time());
  archive_entry_set_size(entry.get(), 0);

  ArchiveDataSink sink(handle);
  TieredFileWriter writer(sink, _session->options().tiers);
  writer.write_memory(entry.get(), nullptr, 0);
}

void Writer::add_symlink_entry(const std::string &archive_path, const std::string &target) {
  if (!_session) {
    throw ResourceError("writer has been moved from");
  }
  if (target.empty()) {
    throw std::invalid_argument("symlink target cannot be empty");
  }
  ArchiveHandle &handle = _session->handle();

  ArchiveEntryPtr entry = new_entry(archive_path, AE_IFLNK, 0777, current_time());
  archive_entry_set_symlink(entry.get(), target.c_str());
  archive_entry_set_size(entry.get(), 0);

  ArchiveDataSink sink(handle);
  TieredFileWriter writer(sink, _session->options().tiers);
  writer.write_memory(entry.get(), nullptr, 0);
}

void Writer::add_files(const std::vector<std::filesystem::path> &files, PathMapper mapper, ProgressCallback progress) {
  std::vector<uint64_t> sizes;
  sizes.reserve(files.size());
  uint64_t total_bytes = 0;
  for (const auto &file : files) {
    std::error_code ec;
    const uint64_t size = std::filesystem::file_size(file, ec);
    if (ec) {
      throw make_io_error("File not found", file.string(), ec.value());
    }
    sizes.push_back(size);
    total_bytes += size;
  }

  FileProgress report;
  report.total_bytes = total_bytes;
  report.total_files = files.size();

  for (size_t i = 0; i < files.size(); ++i) {
    if (progress) {
      report.file_path = files[i].string();
      report.file_index = i;
      progress(report);
    }
    add_file(files[i], mapper ? mapper(files[i]) : std::string());
    report.bytes_processed += sizes[i];
  }

  if (progress) {
    report.file_path.clear();
    report.file_index = files.size();
    progress(report);
  }
}

void Writer::add_directory(const std::filesystem::path &root, const DirectoryOptions &options, ProgressCallback progress) {
  std::error_code ec;
  if (!std::filesystem::is_directory(root, ec)) {
    throw make_io_error("Directory not found", root.string(), ec ? ec.value() : ENOENT);
  }

  std::vector<std::filesystem::path> files;
  auto collect = [&](const std::filesystem::directory_entry &item) {
    if (item.is_regular_file() && (!options.filter || options.filter(item.path()))) {
      files.push_back(item.path());
    }
  };
  if (options.recursive) {
    for (const auto &item : std::filesystem::recursive_directory_iterator(root)) {
      collect(item);
    }
  } else {
    for (const auto &item : std::filesystem::directory_iterator(root)) {
      collect(item);
    }
  }
  std::sort(files.begin(), files.end());

  PathMapper mapper;
  if (options.preserve_structure) {
    mapper = [&root](const std::filesystem::path &file) { return file.lexically_relative(root).generic_string(); };
  }
  add_files(files, mapper, std::move(progress));
}

void Writer::close() {
  if (_session) {
    _session->close();
  }
}

bool Writer::is_open() const { return _session && _session->is_open(); }

std::vector<uint8_t> Writer::take_bytes() {
  if (!_session) {
    throw std::logic_error("writer has been moved from");
  }
  return _session->take_bytes();
}

} // namespace archive_bridge
