// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_error.h"
#include "callback_bridge.h"
#include "test_helpers.h"

#include <archive.h>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>

using namespace archive_bridge;
using archive_bridge::test_helpers::expect;

namespace {

class TransportError : public std::runtime_error {
public:
  explicit TransportError(const std::string &message)
      : std::runtime_error(message) {}
};

class FailingStream final : public IDataStream {
public:
  ssize_t read(void *, size_t) override { throw TransportError("read transport failure"); }
  ssize_t write(const void *, size_t) override { throw TransportError("write transport failure"); }
  bool can_read() const override { return true; }
  bool can_write() const override { return true; }
};

bool test_pinned_buffer_is_stable() {
  bool ok = true;
  auto stream = std::make_shared<MemoryStream>(test_helpers::make_payload(10000));
  ReadCallbackBridge bridge(stream, 4096);
  const void *pinned = bridge.buffer_address();

  const void *first = nullptr;
  const void *second = nullptr;
  const la_ssize_t first_len = ReadCallbackBridge::read_callback(nullptr, bridge.client_token(), &first);
  const la_ssize_t second_len = ReadCallbackBridge::read_callback(nullptr, bridge.client_token(), &second);

  ok = expect(first_len == 4096 && second_len == 4096, "read callback should fill the whole block") && ok;
  ok = expect(first == pinned && second == pinned, "read callback must always hand out the pinned buffer") && ok;
  ok = expect(bridge.buffer_size() == 4096, "pinned buffer must never be resized") && ok;

  const void *tail = nullptr;
  ok = expect(ReadCallbackBridge::read_callback(nullptr, bridge.client_token(), &tail) == 10000 - 8192, "last read should return the remainder") && ok;
  ok = expect(ReadCallbackBridge::read_callback(nullptr, bridge.client_token(), &tail) == 0, "read past the end should report EOF") && ok;
  return ok;
}

bool test_read_exception_is_captured() {
  bool ok = true;
  ReadCallbackBridge bridge(std::make_shared<FailingStream>(), 512);

  const void *buffer = nullptr;
  const la_ssize_t result = ReadCallbackBridge::read_callback(nullptr, bridge.client_token(), &buffer);
  ok = expect(result == -1, "read callback should return the failure sentinel") && ok;
  ok = expect(bridge.has_pending_error(), "stream exception should be captured") && ok;

  bool rethrown = false;
  try {
    bridge.rethrow_pending();
  } catch (const TransportError &error) {
    rethrown = std::string(error.what()) == "read transport failure";
  }
  ok = expect(rethrown, "captured exception should be rethrown with its original type") && ok;
  ok = expect(!bridge.has_pending_error(), "rethrow should clear the captured exception") && ok;
  return ok;
}

bool test_write_relays_short_counts() {
  bool ok = true;
  auto stream = std::make_shared<test_helpers::TrickleStream>(1);
  WriteCallbackBridge bridge(stream);

  const char data[] = "abc";
  ok = expect(WriteCallbackBridge::write_callback(nullptr, bridge.client_token(), data, 3) == 1, "write callback should relay exactly the accepted count") && ok;
  ok = expect(stream->data().size() == 1 && stream->data()[0] == 'a', "only the accepted byte should reach the stream") && ok;
  ok = expect(WriteCallbackBridge::write_callback(nullptr, bridge.client_token(), data, 0) == 0, "zero-length writes should not touch the stream") && ok;
  ok = expect(stream->write_calls() == 1, "zero-length writes should not reach the stream") && ok;

  ok = expect(WriteCallbackBridge::close_callback(nullptr, bridge.client_token()) == ARCHIVE_OK, "close callback should succeed") && ok;
  ok = expect(stream->flush_calls() == 1, "close callback should flush the stream") && ok;
  ok = expect(bridge.state() == CallbackBridge::State::Closed, "close callback should close the bridge") && ok;
  ok = expect(WriteCallbackBridge::write_callback(nullptr, bridge.client_token(), data, 3) == -1, "writes after close should fail") && ok;
  return ok;
}

bool test_write_exception_is_captured() {
  bool ok = true;
  WriteCallbackBridge bridge(std::make_shared<FailingStream>());
  const char data[] = "x";
  ok = expect(WriteCallbackBridge::write_callback(nullptr, bridge.client_token(), data, 1) == -1, "throwing write should return -1") && ok;
  ok = expect(bridge.has_pending_error(), "throwing write should be captured") && ok;

  bool rethrown = false;
  try {
    bridge.rethrow_pending();
  } catch (const TransportError &) {
    rethrown = true;
  }
  ok = expect(rethrown, "write exception should keep its type") && ok;
  return ok;
}

bool test_disarmed_bridge_is_inert() {
  bool ok = true;
  auto stream = std::make_shared<MemoryStream>(test_helpers::make_payload(64));
  ReadCallbackBridge bridge(stream, 32);
  bridge.disarm();

  const void *buffer = nullptr;
  ok = expect(ReadCallbackBridge::read_callback(nullptr, bridge.client_token(), &buffer) == -1, "disarmed read should fail") && ok;
  ok = expect(ReadCallbackBridge::close_callback(nullptr, bridge.client_token()) == ARCHIVE_OK, "disarmed close should succeed") && ok;
  ok = expect(stream->tell() == 0, "disarmed bridge must not touch the stream") && ok;
  ok = expect(stream.use_count() == 1, "disarm should drop the stream reference") && ok;
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok = test_pinned_buffer_is_stable() && ok;
  ok = test_read_exception_is_captured() && ok;
  ok = test_write_relays_short_counts() && ok;
  ok = test_write_exception_is_captured() && ok;
  ok = test_disarmed_bridge_is_inert() && ok;

  if (!ok) {
    return 1;
  }
  std::cout << "[PASS] Callback bridge tests passed" << std::endl;
  return 0;
}
