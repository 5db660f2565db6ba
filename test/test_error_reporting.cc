// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_error.h"
#include "archive_bridge/archive_fault.h"
#include "archive_bridge/archive_format.h"
#include "archive_bridge/entry.h"
#include "archive_error_utils.h"
#include "test_helpers.h"

#include <archive.h>
#include <cerrno>
#include <iostream>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

using namespace archive_bridge;
using archive_bridge::test_helpers::expect;

namespace {

bool test_message_formatting() {
  bool ok = true;
  ok = expect(format_errno_error("plain", 0) == "plain", "errno 0 should leave the prefix untouched") && ok;

  const std::string with_errno = format_errno_error("open failed", ENOENT);
  ok = expect(with_errno.find("posix errno=" + std::to_string(ENOENT)) != std::string::npos, "errno should be embedded in the message") && ok;

  const std::string with_path = format_path_errno_error("Failed to open", "/tmp/x", EACCES);
  ok = expect(with_path.rfind("Failed to open '/tmp/x'", 0) == 0, "path should be quoted after the action") && ok;
  ok = expect(prefer_error_detail("", "fallback") == "fallback", "empty detail should use the fallback") && ok;
  ok = expect(prefer_error_detail("detail", "fallback") == "detail", "detail should win over the fallback") && ok;

  ok = expect(std::string(archive_status_name(ARCHIVE_FATAL)) == "ARCHIVE_FATAL", "status names should be symbolic") && ok;
  ok = expect(std::string(archive_status_name(12345)) == "ARCHIVE_UNKNOWN", "unknown statuses should be labelled") && ok;

  const ProtocolError error = make_protocol_error(nullptr, "archive_write_header", ARCHIVE_FAILED);
  ok = expect(std::string(error.what()) == "archive_write_header failed with ARCHIVE_FAILED", "fallback protocol message") && ok;
  ok = expect(error.status() == ARCHIVE_FAILED, "protocol error should carry its status") && ok;

  const IoError io = make_io_error("Failed to stat file", "/missing", ENOENT);
  ok = expect(io.errno_value() == ENOENT, "io error should carry errno") && ok;
  return ok;
}

static_assert(std::is_base_of<ResourceError, StaleEntryError>::value, "StaleEntryError should be a ResourceError");
static_assert(std::is_base_of<ConfigurationError, NotSupportedError>::value, "NotSupportedError should be a ConfigurationError");
static_assert(std::is_base_of<std::runtime_error, ArchiveError>::value, "ArchiveError should be a runtime_error");

bool test_exception_hierarchy() {
  bool ok = true;
  bool caught_as_resource = false;
  try {
    throw StaleEntryError("stale");
  } catch (const ResourceError &error) {
    caught_as_resource = std::string(error.what()) == "stale";
  }
  ok = expect(caught_as_resource, "StaleEntryError should be catchable as ResourceError") && ok;
  return ok;
}

bool test_fault_registry() {
  bool ok = true;
  std::vector<ArchiveFault> faults;
  register_fault_callback([&faults](const ArchiveFault &fault) { faults.push_back(fault); });

  dispatch_registered_fault({ "first", ARCHIVE_WARN, "a.zip" });
  ok = expect(faults.size() == 1, "registered observer should receive faults") && ok;
  if (!faults.empty()) {
    ok = expect(faults[0].message == "first" && faults[0].path == "a.zip", "fault fields should be delivered intact") && ok;
  }

  register_fault_callback(FaultCallback{});
  dispatch_registered_fault({ "second", ARCHIVE_WARN, {} });
  ok = expect(faults.size() == 1, "cleared registry should not deliver faults") && ok;

  static_assert(noexcept(dispatch_registered_fault(std::declval<const ArchiveFault &>())), "fault dispatch must be noexcept");
  bool observed = false;
  register_fault_callback([&observed](const ArchiveFault &) {
    observed = true;
    throw std::runtime_error("observer failed");
  });
  dispatch_registered_fault({ "third", ARCHIVE_WARN, {} });
  ok = expect(observed, "a throwing observer should still be invoked") && ok;
  register_fault_callback([](const ArchiveFault &) { throw 42; });
  dispatch_registered_fault({ "fourth", ARCHIVE_WARN, {} });
  register_fault_callback(FaultCallback{});
  return ok;
}

bool test_names() {
  bool ok = true;
  ok = expect(std::string(to_string(ArchiveFormat::SevenZip)) == "7zip", "7-Zip format name") && ok;
  ok = expect(std::string(to_string(CompressionType::Zstd)) == "zstd", "zstd compression name") && ok;
  ok = expect(std::string(to_string(EncryptionType::ZipCrypto)) == "zipcrypto", "ZipCrypto encryption name") && ok;
  ok = expect(std::string(to_string(EntryType::Symlink)) == "symlink", "symlink entry type name") && ok;

  FileProgress progress;
  ok = expect(progress.percent_complete() == 0.0, "no bytes means zero percent") && ok;
  progress.total_bytes = 200;
  progress.bytes_processed = 50;
  ok = expect(progress.percent_complete() == 25.0, "percent should follow the byte ratio") && ok;
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok = test_message_formatting() && ok;
  ok = test_exception_hierarchy() && ok;
  ok = test_fault_registry() && ok;
  ok = test_names() && ok;

  if (!ok) {
    return 1;
  }
  std::cout << "[PASS] Error reporting tests passed" << std::endl;
  return 0;
}
