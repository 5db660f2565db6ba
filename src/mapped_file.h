// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace archive_bridge {

/**
 * @brief Read-only memory mapping of a whole file
 *
 * The mapping and its descriptor are released on destruction.
 */
class MappedFile {
public:
  /// @throws IoError when the file cannot be opened, sized or mapped
  explicit MappedFile(const std::filesystem::path &path);
  ~MappedFile();

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  const uint8_t *data() const { return static_cast<const uint8_t *>(_data); }
  size_t size() const { return _size; }

private:
  void unmap() noexcept;

  int _fd;
  void *_data;
  size_t _size;
};

} // namespace archive_bridge
