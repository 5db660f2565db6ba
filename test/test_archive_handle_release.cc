// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_error.h"
#include "archive_bridge/archive_fault.h"
#include "archive_handle.h"
#include "callback_bridge.h"
#include "test_helpers.h"

#include <archive.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <vector>

using namespace archive_bridge;
using archive_bridge::test_helpers::expect;
using archive_bridge::test_helpers::expect_throws;

namespace {

int g_read_frees = 0;
int g_write_frees = 0;
// Stream state observed from inside the native free routine.
bool g_bridge_armed_during_free = true;
ArchiveHandle *g_observed_handle = nullptr;

int counting_read_free(struct archive *ar) {
  ++g_read_frees;
  return archive_read_free(ar);
}

int counting_write_free(struct archive *ar) {
  ++g_write_frees;
  if (g_observed_handle && g_observed_handle->bridge()) {
    g_bridge_armed_during_free = g_observed_handle->bridge()->stream() != nullptr;
  }
  return archive_write_free(ar);
}

bool test_release_is_idempotent() {
  bool ok = true;
  g_read_frees = 0;

  {
    ArchiveHandle handle(ArchiveDirection::Read, counting_read_free);
    handle.acquire();
    ok = expect(handle.is_live(), "acquired handle should be live") && ok;
    ok = expect(handle.release() == ARCHIVE_OK, "first release should report the free status") && ok;
    ok = expect(handle.release() == ARCHIVE_OK, "second release should be a no-op") && ok;
    ok = expect(handle.is_released(), "handle should report release") && ok;
    ok = expect_throws<ResourceError>([&] { (void)handle.get(); }, "get() after release should throw ResourceError") && ok;
    ok = expect_throws<ResourceError>([&] { handle.acquire(); }, "acquire() after release should throw ResourceError") && ok;
  }
  ok = expect(g_read_frees == 1, "native free must run exactly once across release() and destruction") && ok;

  g_read_frees = 0;
  {
    ArchiveHandle handle(ArchiveDirection::Read, counting_read_free);
    handle.acquire();
  }
  ok = expect(g_read_frees == 1, "destructor should free an unreleased handle once") && ok;

  g_read_frees = 0;
  {
    ArchiveHandle handle(ArchiveDirection::Read, counting_read_free);
    ok = expect_throws<ResourceError>([&] { (void)handle.get(); }, "get() before acquire should throw ResourceError") && ok;
  }
  ok = expect(g_read_frees == 0, "a handle never acquired must not call the free routine") && ok;
  return ok;
}

bool test_write_teardown_order() {
  bool ok = true;
  g_write_frees = 0;
  g_bridge_armed_during_free = true;

  auto stream = std::make_shared<test_helpers::TrickleStream>(4096);
  {
    ArchiveHandle handle(ArchiveDirection::Write, counting_write_free);
    g_observed_handle = &handle;
    handle.acquire();
    handle.check(archive_write_set_format_pax_restricted(handle.get()), "archive_write_set_format_pax_restricted");

    auto bridge = std::make_unique<WriteCallbackBridge>(stream);
    WriteCallbackBridge *raw = bridge.get();
    handle.install_bridge(std::move(bridge));
    handle.check(raw->open(handle.get()), "archive_write_open");
    handle.mark_opened();
    ok = expect_throws<std::logic_error>([&] { handle.install_bridge(std::make_unique<WriteCallbackBridge>(stream)); }, "a second bridge should be rejected") && ok;

    handle.release();
    ok = expect(handle.bridge() == nullptr, "bridge should be destroyed after release") && ok;
  }
  g_observed_handle = nullptr;

  ok = expect(g_write_frees == 1, "write handle should be freed once") && ok;
  ok = expect(!g_bridge_armed_during_free, "bridge must be disarmed before the native free runs") && ok;
  ok = expect(stream->flush_calls() == 1, "closing the session should flush the stream once") && ok;
  ok = expect(!stream->data().empty(), "closing the session should emit the archive trailer") && ok;
  ok = expect(stream.use_count() == 1, "released session must not keep the stream alive") && ok;
  return ok;
}

bool test_warning_becomes_fault() {
  bool ok = true;
  std::vector<ArchiveFault> faults;
  register_fault_callback([&faults](const ArchiveFault &fault) { faults.push_back(fault); });

  ArchiveHandle handle(ArchiveDirection::Read);
  handle.acquire();
  handle.check(ARCHIVE_WARN, "synthetic_warning");
  ok = expect(faults.size() == 1, "ARCHIVE_WARN should be reported as one fault") && ok;
  if (!faults.empty()) {
    ok = expect(faults.back().status == ARCHIVE_WARN, "fault should carry the warning status") && ok;
  }

  ok = expect_throws<ProtocolError>([&] { handle.check(ARCHIVE_FATAL, "synthetic_failure"); }, "ARCHIVE_FATAL should raise ProtocolError") && ok;
  try {
    handle.check(ARCHIVE_FAILED, "synthetic_failure");
  } catch (const ProtocolError &error) {
    ok = expect(error.status() == ARCHIVE_FAILED, "ProtocolError should carry the engine status") && ok;
  }

  register_fault_callback(FaultCallback{});
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok = test_release_is_idempotent() && ok;
  ok = test_write_teardown_order() && ok;
  ok = test_warning_becomes_fault() && ok;

  if (!ok) {
    return 1;
  }
  std::cout << "[PASS] Archive handle release tests passed" << std::endl;
  return 0;
}
