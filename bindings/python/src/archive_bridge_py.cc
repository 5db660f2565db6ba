// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_error.h"
#include "archive_bridge/archive_fault.h"
#include "archive_bridge/archive_format.h"
#include "archive_bridge/data_stream.h"
#include "archive_bridge/entry.h"
#include "archive_bridge/platform_compat.h"
#include "archive_bridge/reader.h"
#include "archive_bridge/writer.h"

#include <cctype>
#include <cstring>
#include <memory>
#include <optional>
#include <pybind11/functional.h>
#include <pybind11/pybind11.h>
#include <pybind11/stl.h>
#include <pybind11/stl/filesystem.h>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;
using namespace archive_bridge;

namespace {

std::string lowercase(std::string value) {
  for (char &ch : value) {
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  }
  return value;
}

ArchiveFormat parse_format(const std::string &name) {
  const std::string key = lowercase(name);
  const ArchiveFormat formats[] = { ArchiveFormat::Zip, ArchiveFormat::SevenZip, ArchiveFormat::Tar, ArchiveFormat::Ustar,
                                    ArchiveFormat::Pax, ArchiveFormat::Cpio,     ArchiveFormat::Iso9660, ArchiveFormat::Xar };
  for (ArchiveFormat format : formats) {
    if (key == to_string(format)) {
      return format;
    }
  }
  throw py::value_error("unknown archive format '" + name + "'");
}

CompressionType parse_compression(const std::string &name) {
  const std::string key = lowercase(name);
  const CompressionType types[] = { CompressionType::None, CompressionType::Gzip,     CompressionType::Bzip2, CompressionType::Xz,      CompressionType::Lzma,
                                    CompressionType::Lz4,  CompressionType::Zstd,     CompressionType::Compress, CompressionType::Lzip, CompressionType::Deflate };
  for (CompressionType type : types) {
    if (key == to_string(type)) {
      return type;
    }
  }
  throw py::value_error("unknown compression '" + name + "'");
}

EncryptionType parse_encryption(const std::string &name) {
  const std::string key = lowercase(name);
  const EncryptionType types[] = { EncryptionType::Default, EncryptionType::None,   EncryptionType::Traditional, EncryptionType::AES128,
                                   EncryptionType::AES192,  EncryptionType::AES256, EncryptionType::ZipCrypto };
  for (EncryptionType type : types) {
    if (key == to_string(type)) {
      return type;
    }
  }
  throw py::value_error("unknown encryption '" + name + "'");
}

py::dict fault_to_python(const ArchiveFault &fault) {
  py::dict result;
  result[py::str("message")] = py::str(fault.message);
  result[py::str("status")] = py::int_(fault.status);
  result[py::str("path")] = py::str(fault.path);
  return result;
}

FaultCallback make_python_fault_callback(const py::object &callable) {
  if (callable.is_none()) {
    return {};
  }
  if (!PyCallable_Check(callable.ptr())) {
    throw py::type_error("fault callback must be callable");
  }
  py::function func = py::reinterpret_borrow<py::function>(callable);
  return [func = std::move(func)](const ArchiveFault &fault) {
    py::gil_scoped_acquire gil;
    try {
      func(fault_to_python(fault));
    } catch (py::error_already_set &error) {
      // Faults arrive from destructors; hand the error to sys.unraisablehook.
      error.discard_as_unraisable("archive_bridge fault callback");
    }
  };
}

/**
 * @brief IDataStream over a Python file-like object
 *
 * Python exceptions leave read()/write() as py::error_already_set; the
 * callback bridge captures them and they resurface in Python once the
 * native call has returned.
 */
class PyObjectStream final : public IDataStream {
public:
  explicit PyObjectStream(py::object io)
    : io_(std::move(io))
    , readable_(py::hasattr(io_, "read"))
    , writable_(py::hasattr(io_, "write"))
    , seekable_(py::hasattr(io_, "seek") && py::hasattr(io_, "tell")) {
    if (seekable_ && py::hasattr(io_, "seekable")) {
      seekable_ = io_.attr("seekable")().cast<bool>();
    }
    if (!readable_ && !writable_) {
      throw py::type_error("stream objects must provide read() or write()");
    }
  }

  ssize_t read(void *buffer, size_t size) override {
    if (!readable_) {
      return IDataStream::read(buffer, size);
    }
    if (size == 0) {
      return 0;
    }
    py::gil_scoped_acquire gil;
    py::object result = io_.attr("read")(py::int_(size));
    if (result.is_none()) {
      return 0;
    }
    py::bytes data(result);
    char *raw = nullptr;
    Py_ssize_t length = 0;
    if (PyBytes_AsStringAndSize(data.ptr(), &raw, &length) != 0) {
      throw py::error_already_set();
    }
    const size_t count = static_cast<size_t>(length) < size ? static_cast<size_t>(length) : size;
    std::memcpy(buffer, raw, count);
    return static_cast<ssize_t>(count);
  }

  ssize_t write(const void *buffer, size_t size) override {
    if (!writable_) {
      return IDataStream::write(buffer, size);
    }
    py::gil_scoped_acquire gil;
    py::object result = io_.attr("write")(py::bytes(static_cast<const char *>(buffer), size));
    if (result.is_none()) {
      return static_cast<ssize_t>(size);
    }
    return result.cast<ssize_t>();
  }

  void flush() override {
    if (!py::hasattr(io_, "flush")) {
      return;
    }
    py::gil_scoped_acquire gil;
    io_.attr("flush")();
  }

  int64_t seek(int64_t offset, int whence) override {
    if (!seekable_) {
      return -1;
    }
    py::gil_scoped_acquire gil;
    return io_.attr("seek")(py::int_(offset), py::int_(whence)).cast<int64_t>();
  }

  int64_t tell() const override {
    if (!seekable_) {
      return -1;
    }
    py::gil_scoped_acquire gil;
    return io_.attr("tell")().cast<int64_t>();
  }

  bool can_read() const override { return readable_; }
  bool can_write() const override { return writable_; }
  bool can_seek() const override { return seekable_; }

private:
  py::object io_;
  bool readable_;
  bool writable_;
  bool seekable_;
};

ReaderOptions make_reader_options(std::optional<std::vector<std::string>> passphrases, size_t block_size) {
  ReaderOptions options;
  if (passphrases) {
    options.passphrases = std::move(*passphrases);
  }
  options.block_size = block_size;
  return options;
}

WriterOptions make_writer_options(const std::string &format, const std::string &compression, int level, std::optional<std::string> passphrase, const std::string &encryption) {
  WriterOptions options;
  options.format = parse_format(format);
  options.compression = parse_compression(compression);
  options.compression_level = level;
  options.passphrase = std::move(passphrase);
  options.encryption = parse_encryption(encryption);
  return options;
}

py::bytes entry_read(Entry &entry, std::optional<ssize_t> size) {
  if (size && *size == 0) {
    return py::bytes();
  }
  if (size && *size > 0) {
    std::vector<uint8_t> buffer(static_cast<size_t>(*size));
    const ssize_t bytes_read = entry.read(buffer.data(), buffer.size());
    return py::bytes(reinterpret_cast<const char *>(buffer.data()), static_cast<size_t>(bytes_read));
  }
  const std::vector<uint8_t> all = entry.read_all();
  return py::bytes(reinterpret_cast<const char *>(all.data()), all.size());
}

py::object optional_entry(std::optional<Entry> entry) {
  if (!entry) {
    return py::none();
  }
  return py::cast(std::move(*entry));
}

} // namespace

PYBIND11_MODULE(archive_bridge, m) {
  m.doc() = "Python bindings for the archive_bridge library";

  py::register_exception<ArchiveError> archive_error(m, "ArchiveError");
  py::register_exception<ResourceError> resource_error(m, "ResourceError", archive_error.ptr());
  py::register_exception<StaleEntryError>(m, "StaleEntryError", resource_error.ptr());
  py::register_exception<ProtocolError>(m, "ProtocolError", archive_error.ptr());
  py::register_exception<IoError>(m, "IoError", archive_error.ptr());
  py::register_exception<ConfigurationError> configuration_error(m, "ConfigurationError", archive_error.ptr());
  py::register_exception<NotSupportedError>(m, "NotSupportedError", configuration_error.ptr());

  m.def("on_fault", [](const py::object &callback) { register_fault_callback(make_python_fault_callback(callback)); }, py::arg("callback") = py::none(),
        "Register or clear the global fault callback (None clears)");

  py::class_<Entry>(m, "Entry")
      .def_property_readonly("name", &Entry::name, "Entry pathname")
      .def_property_readonly("type", [](const Entry &entry) { return std::string(to_string(entry.type())); })
      .def_property_readonly("size", &Entry::size, "Size in bytes as recorded in the header")
      .def_property_readonly("permissions", [](const Entry &entry) { return static_cast<unsigned>(entry.permissions()); })
      .def_property_readonly("mtime", [](const Entry &entry) { return py::make_tuple(entry.mtime().seconds, entry.mtime().nanoseconds); })
      .def_property_readonly("symlink_target", &Entry::symlink_target)
      .def_property_readonly("is_file", &Entry::is_file)
      .def_property_readonly("is_directory", &Entry::is_directory)
      .def_property_readonly("is_symlink", &Entry::is_symlink)
      .def_property_readonly("is_current", &Entry::is_current)
      .def("read", &entry_read, py::arg("size") = py::none(), "Read up to size bytes from the entry (default: read until EOF)")
      .def("skip", &Entry::skip_data)
      .def("__repr__", [](const Entry &entry) { return "<archive_bridge.Entry '" + entry.name() + "' " + to_string(entry.type()) + ">"; });

  py::class_<Reader>(m, "Reader")
      .def_static(
          "open_file",
          [](const std::filesystem::path &path, std::optional<std::vector<std::string>> passphrases, size_t block_size) {
            return Reader::open_file(path, make_reader_options(std::move(passphrases), block_size));
          },
          py::arg("path"), py::arg("passphrases") = py::none(), py::arg("block_size") = size_t(1) << 20)
      .def_static(
          "open_volumes",
          [](std::vector<std::filesystem::path> parts, std::optional<std::vector<std::string>> passphrases, size_t block_size) {
            return Reader::open_volumes(std::move(parts), make_reader_options(std::move(passphrases), block_size));
          },
          py::arg("parts"), py::arg("passphrases") = py::none(), py::arg("block_size") = size_t(1) << 20)
      .def_static(
          "open_memory",
          [](const py::bytes &data, std::optional<std::vector<std::string>> passphrases) {
            const std::string raw = data;
            return Reader::open_memory(std::vector<uint8_t>(raw.begin(), raw.end()), make_reader_options(std::move(passphrases), size_t(1) << 20));
          },
          py::arg("data"), py::arg("passphrases") = py::none())
      .def_static(
          "open_stream",
          [](py::object stream, std::optional<std::vector<std::string>> passphrases, size_t block_size) {
            return Reader::open_stream(std::make_shared<PyObjectStream>(std::move(stream)), make_reader_options(std::move(passphrases), block_size));
          },
          py::arg("stream"), py::arg("passphrases") = py::none(), py::arg("block_size") = size_t(1) << 20)
      .def("__iter__", [](Reader &reader) -> Reader & { return reader; }, py::return_value_policy::reference_internal)
      .def("__next__",
           [](Reader &reader) {
             auto entry = reader.next_entry();
             if (!entry) {
               throw py::stop_iteration();
             }
             return std::move(*entry);
           })
      .def("next_entry", [](Reader &reader) { return optional_entry(reader.next_entry()); })
      .def("first_entry", [](Reader &reader) { return optional_entry(reader.first_entry()); })
      .def("reset", &Reader::reset)
      .def("has_encrypted_entries", &Reader::has_encrypted_entries)
      .def_property_readonly("is_open", &Reader::is_open)
      .def("close", &Reader::close)
      .def("__enter__", [](Reader &reader) -> Reader & { return reader; }, py::return_value_policy::reference_internal)
      .def("__exit__", [](Reader &reader, const py::object &, const py::object &, const py::object &) { reader.close(); });

  py::class_<Writer>(m, "Writer")
      .def_static(
          "open_file",
          [](const std::filesystem::path &path, const std::string &format, const std::string &compression, int level, std::optional<std::string> passphrase,
             const std::string &encryption) { return Writer::open_file(path, make_writer_options(format, compression, level, std::move(passphrase), encryption)); },
          py::arg("path"), py::arg("format") = "tar", py::arg("compression") = "none", py::arg("compression_level") = 6, py::arg("passphrase") = py::none(),
          py::arg("encryption") = "default")
      .def_static(
          "open_stream",
          [](py::object stream, const std::string &format, const std::string &compression, int level, std::optional<std::string> passphrase, const std::string &encryption) {
            return Writer::open_stream(std::make_shared<PyObjectStream>(std::move(stream)), make_writer_options(format, compression, level, std::move(passphrase), encryption));
          },
          py::arg("stream"), py::arg("format") = "tar", py::arg("compression") = "none", py::arg("compression_level") = 6, py::arg("passphrase") = py::none(),
          py::arg("encryption") = "default")
      .def_static(
          "to_memory",
          [](const std::string &format, const std::string &compression, int level, std::optional<std::string> passphrase, const std::string &encryption) {
            return Writer::to_memory(make_writer_options(format, compression, level, std::move(passphrase), encryption));
          },
          py::arg("format") = "tar", py::arg("compression") = "none", py::arg("compression_level") = 6, py::arg("passphrase") = py::none(),
          py::arg("encryption") = "default")
      .def("add_file", &Writer::add_file, py::arg("source"), py::arg("archive_path") = std::string())
      .def(
          "add_entry",
          [](Writer &writer, const std::string &archive_path, const py::bytes &data, unsigned permissions) {
            const std::string raw = data;
            writer.add_entry(archive_path, std::vector<uint8_t>(raw.begin(), raw.end()), std::nullopt, static_cast<mode_t>(permissions));
          },
          py::arg("archive_path"), py::arg("data"), py::arg("permissions") = 0644u)
      .def("add_directory_entry", &Writer::add_directory_entry, py::arg("archive_path"))
      .def("add_symlink_entry", &Writer::add_symlink_entry, py::arg("archive_path"), py::arg("target"))
      .def(
          "add_files",
          [](Writer &writer, const std::vector<std::filesystem::path> &files, const py::object &progress) {
            ProgressCallback callback;
            if (!progress.is_none()) {
              py::function func = py::reinterpret_borrow<py::function>(progress);
              callback = [func](const FileProgress &report) {
                func(report.file_path, report.bytes_processed, report.total_bytes, report.file_index, report.total_files);
              };
            }
            writer.add_files(files, PathMapper{}, callback);
          },
          py::arg("files"), py::arg("progress") = py::none())
      .def(
          "add_directory",
          [](Writer &writer, const std::filesystem::path &root, bool recursive, bool preserve_structure) {
            DirectoryOptions options;
            options.recursive = recursive;
            options.preserve_structure = preserve_structure;
            writer.add_directory(root, options);
          },
          py::arg("root"), py::arg("recursive") = true, py::arg("preserve_structure") = true)
      .def("close", &Writer::close)
      .def_property_readonly("is_open", &Writer::is_open)
      .def("take_bytes",
           [](Writer &writer) {
             const std::vector<uint8_t> bytes = writer.take_bytes();
             return py::bytes(reinterpret_cast<const char *>(bytes.data()), bytes.size());
           })
      .def("__enter__", [](Writer &writer) -> Writer & { return writer; }, py::return_value_policy::reference_internal)
      .def("__exit__", [](Writer &writer, const py::object &exc_type, const py::object &, const py::object &) {
        if (exc_type.is_none()) {
          writer.close();
        }
      });

  m.attr("__version__") = "0.1.0";
}
