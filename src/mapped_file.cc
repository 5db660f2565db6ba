// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "mapped_file.h"

#include "archive_error_utils.h"

#include <cerrno>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace archive_bridge {

MappedFile::MappedFile(const std::filesystem::path &path)
  : _fd(-1)
  , _data(nullptr)
  , _size(0) {
  const std::string path_string = path.string();
  _fd = ::open(path_string.c_str(), O_RDONLY);
  if (_fd < 0) {
    throw make_io_error("Failed to open file for mapping", path_string, errno);
  }

  struct stat st;
  if (::fstat(_fd, &st) < 0) {
    const int err = errno;
    unmap();
    throw make_io_error("Failed to get file size", path_string, err);
  }
  _size = static_cast<size_t>(st.st_size);
  if (_size == 0) {
    // mmap() rejects empty ranges; an empty mapping is represented by null data.
    return;
  }

  void *mapped = ::mmap(nullptr, _size, PROT_READ, MAP_PRIVATE, _fd, 0);
  if (mapped == MAP_FAILED) {
    const int err = errno;
    unmap();
    throw make_io_error("Failed to map file", path_string, err);
  }
  _data = mapped;
#ifdef MADV_SEQUENTIAL
  ::madvise(_data, _size, MADV_SEQUENTIAL);
#endif
}

MappedFile::~MappedFile() { unmap(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
  : _fd(other._fd)
  , _data(other._data)
  , _size(other._size) {
  other._fd = -1;
  other._data = nullptr;
  other._size = 0;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    unmap();
    _fd = other._fd;
    _data = other._data;
    _size = other._size;
    other._fd = -1;
    other._data = nullptr;
    other._size = 0;
  }
  return *this;
}

void MappedFile::unmap() noexcept {
  if (_data) {
    ::munmap(_data, _size);
    _data = nullptr;
  }
  if (_fd >= 0) {
    ::close(_fd);
    _fd = -1;
  }
  _size = 0;
}

} // namespace archive_bridge
