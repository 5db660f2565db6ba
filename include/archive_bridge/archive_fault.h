// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#pragma once

#include <functional>
#include <string>

namespace archive_bridge {

/**
 * @brief Non-fatal condition observed while driving the engine
 *
 * Faults never interrupt the operation that produced them. They cover
 * engine warnings, entries skipped because their name could not be
 * decoded, and close failures that happen inside destructors.
 */
struct ArchiveFault {
  std::string message; ///< Engine text or library description
  int status = 0;      ///< libarchive status code (0 when not applicable)
  std::string path;    ///< Source path or entry name, empty if unknown
};

using FaultCallback = std::function<void(const ArchiveFault &)>;

/**
 * @brief Register a process-wide fault observer
 *
 * Passing an empty callback clears the registration. Registration and
 * dispatch are thread-safe.
 */
void register_fault_callback(FaultCallback callback);

/**
 * @brief Deliver a fault to the registered observer, if any
 *
 * Faults are dispatched from destructors too. An exception thrown by the
 * observer is contained here and written to stderr.
 */
void dispatch_registered_fault(const ArchiveFault &fault) noexcept;

} // namespace archive_bridge
