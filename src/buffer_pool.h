// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <vector>

namespace archive_bridge {

/**
 * @brief Process-wide pool of reusable chunk buffers
 *
 * Buffers are leased through an RAII Lease and returned on its
 * destruction. At most max_retained idle buffers are kept.
 */
class BufferPool {
public:
  class Lease {
  public:
    Lease(Lease &&other) noexcept;
    Lease &operator=(Lease &&other) noexcept;
    ~Lease();

    Lease(const Lease &) = delete;
    Lease &operator=(const Lease &) = delete;

    uint8_t *data() { return _buffer->data(); }
    size_t size() const { return _buffer->size(); }

  private:
    friend class BufferPool;
    Lease(BufferPool *pool, std::unique_ptr<std::vector<uint8_t>> buffer);

    BufferPool *_pool;
    std::unique_ptr<std::vector<uint8_t>> _buffer;
  };

  explicit BufferPool(size_t max_retained = 8);

  BufferPool(const BufferPool &) = delete;
  BufferPool &operator=(const BufferPool &) = delete;

  static BufferPool &shared();

  /// Lease a buffer of at least min_size bytes.
  Lease rent(size_t min_size);

  size_t idle_count() const;

private:
  void give_back(std::unique_ptr<std::vector<uint8_t>> buffer) noexcept;

  mutable std::mutex _mutex;
  std::vector<std::unique_ptr<std::vector<uint8_t>>> _idle;
  size_t _max_retained;
};

} // namespace archive_bridge
