// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_fault.h"

#include <exception>
#include <iostream>
#include <mutex>
#include <utility>

namespace archive_bridge {

namespace {

std::mutex &fault_mutex() {
  static std::mutex mutex;
  return mutex;
}

FaultCallback &fault_callback_slot() {
  static FaultCallback callback;
  return callback;
}

} // namespace

void register_fault_callback(FaultCallback callback) {
  std::lock_guard<std::mutex> lock(fault_mutex());
  fault_callback_slot() = std::move(callback);
}

void dispatch_registered_fault(const ArchiveFault &fault) noexcept {
  // Dispatch runs inside destructors and release(); an observer failure is
  // reported on stderr and never propagates into the caller.
  try {
    FaultCallback snapshot;
    {
      std::lock_guard<std::mutex> lock(fault_mutex());
      snapshot = fault_callback_slot();
    }
    if (snapshot) {
      snapshot(fault);
    }
  } catch (const std::exception &error) {
    std::cerr << "archive_bridge: fault observer failed while handling '" << fault.message << "': " << error.what() << std::endl;
  } catch (...) {
    std::cerr << "archive_bridge: fault observer failed with a non-standard exception while handling '" << fault.message << "'" << std::endl;
  }
}

} // namespace archive_bridge
