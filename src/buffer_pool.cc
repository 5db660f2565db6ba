// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "buffer_pool.h"

#include <stdexcept>
#include <utility>

namespace archive_bridge {

// ============================================================================
// BufferPool::Lease Implementation
// ============================================================================

BufferPool::Lease::Lease(BufferPool *pool, std::unique_ptr<std::vector<uint8_t>> buffer)
  : _pool(pool)
  , _buffer(std::move(buffer)) {}

BufferPool::Lease::Lease(Lease &&other) noexcept
  : _pool(other._pool)
  , _buffer(std::move(other._buffer)) {
  other._pool = nullptr;
}

BufferPool::Lease &BufferPool::Lease::operator=(Lease &&other) noexcept {
  if (this != &other) {
    if (_pool && _buffer) {
      _pool->give_back(std::move(_buffer));
    }
    _pool = other._pool;
    _buffer = std::move(other._buffer);
    other._pool = nullptr;
  }
  return *this;
}

BufferPool::Lease::~Lease() {
  if (_pool && _buffer) {
    _pool->give_back(std::move(_buffer));
  }
}

// ============================================================================
// BufferPool Implementation
// ============================================================================

BufferPool::BufferPool(size_t max_retained)
  : _max_retained(max_retained) {}

BufferPool &BufferPool::shared() {
  static BufferPool pool;
  return pool;
}

BufferPool::Lease BufferPool::rent(size_t min_size) {
  if (min_size == 0) {
    throw std::invalid_argument("buffer pool lease size must be positive");
  }

  {
    std::lock_guard<std::mutex> lock(_mutex);
    for (auto it = _idle.begin(); it != _idle.end(); ++it) {
      if ((*it)->size() >= min_size) {
        std::unique_ptr<std::vector<uint8_t>> buffer = std::move(*it);
        _idle.erase(it);
        return Lease(this, std::move(buffer));
      }
    }
  }
  return Lease(this, std::make_unique<std::vector<uint8_t>>(min_size));
}

size_t BufferPool::idle_count() const {
  std::lock_guard<std::mutex> lock(_mutex);
  return _idle.size();
}

void BufferPool::give_back(std::unique_ptr<std::vector<uint8_t>> buffer) noexcept {
  std::lock_guard<std::mutex> lock(_mutex);
  if (_idle.size() < _max_retained) {
    _idle.push_back(std::move(buffer));
  }
}

} // namespace archive_bridge
