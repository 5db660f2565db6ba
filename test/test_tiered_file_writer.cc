// SPDX-License-Identifier: MIT
// Copyright (c) 2025 archive_bridge Team

#include "archive_bridge/archive_error.h"
#include "buffer_pool.h"
#include "test_helpers.h"
#include "tiered_file_writer.h"

#include <archive.h>
#include <archive_entry.h>
#include <iostream>
#include <string>
#include <vector>

using namespace archive_bridge;
using archive_bridge::test_helpers::expect;
using archive_bridge::test_helpers::expect_throws;

namespace {

/// Sink accepting at most max_accept bytes per call and recording the event order.
class RecordingSink final : public IEntryDataSink {
public:
  explicit RecordingSink(size_t max_accept)
    : _max_accept(max_accept) {}

  void write_header(struct archive_entry *) override { events.push_back("header"); }

  la_ssize_t write_data(const void *buffer, size_t length) override {
    if (fail_with != 0) {
      return fail_with;
    }
    const size_t count = length < _max_accept ? length : _max_accept;
    const auto *bytes = static_cast<const uint8_t *>(buffer);
    data.insert(data.end(), bytes, bytes + count);
    ++data_calls;
    return static_cast<la_ssize_t>(count);
  }

  void finish_entry() override { events.push_back("finish"); }

  void raise_write_failure(la_ssize_t status) override { throw ProtocolError("sink failure", static_cast<int>(status)); }

  std::vector<std::string> events;
  std::vector<uint8_t> data;
  size_t data_calls = 0;
  la_ssize_t fail_with = 0;

private:
  size_t _max_accept;
};

struct EntryHolder {
  EntryHolder()
    : entry(archive_entry_new()) {}
  ~EntryHolder() { archive_entry_free(entry); }
  struct archive_entry *entry;
};

WriteTierOptions small_tiers() {
  WriteTierOptions tiers;
  tiers.inline_limit = 64;
  tiers.mapped_threshold = 4096;
  tiers.chunk_size = 256;
  return tiers;
}

bool test_strategy_selection() {
  bool ok = true;
  RecordingSink sink(1024);
  TieredFileWriter writer(sink, small_tiers());

  ok = expect(writer.select_strategy(0) == WriteStrategy::Inline, "empty file should be inline") && ok;
  ok = expect(writer.select_strategy(63) == WriteStrategy::Inline, "size below inline_limit should be inline") && ok;
  ok = expect(writer.select_strategy(64) == WriteStrategy::Pooled, "size at inline_limit should be pooled") && ok;
  ok = expect(writer.select_strategy(4095) == WriteStrategy::Pooled, "size below mapped_threshold should be pooled") && ok;
  ok = expect(writer.select_strategy(4096) == WriteStrategy::Mapped, "size at mapped_threshold should be mapped") && ok;
  ok = expect(std::string(to_string(WriteStrategy::Mapped)) == "mapped", "strategy names should be readable") && ok;
  return ok;
}

bool test_option_validation() {
  bool ok = true;
  RecordingSink sink(1);

  WriteTierOptions zero_chunk = small_tiers();
  zero_chunk.chunk_size = 0;
  ok = expect_throws<ConfigurationError>([&] { TieredFileWriter writer(sink, zero_chunk); }, "chunk_size 0 should be rejected") && ok;

  WriteTierOptions zero_slice = small_tiers();
  zero_slice.max_write_slice = 0;
  ok = expect_throws<ConfigurationError>([&] { TieredFileWriter writer(sink, zero_slice); }, "max_write_slice 0 should be rejected") && ok;

  WriteTierOptions inverted = small_tiers();
  inverted.inline_limit = inverted.mapped_threshold + 1;
  ok = expect_throws<ConfigurationError>([&] { TieredFileWriter writer(sink, inverted); }, "inline_limit above mapped_threshold should be rejected") && ok;
  ok = expect(sink.events.empty(), "validation must happen before any sink call") && ok;
  return ok;
}

bool test_one_byte_sink_every_tier() {
  bool ok = true;
  test_helpers::TempDir dir("archive_bridge_tiers");

  const struct {
    size_t size;
    WriteStrategy expected;
  } cases[] = {
    { 40, WriteStrategy::Inline },
    { 1000, WriteStrategy::Pooled },
    { 5000, WriteStrategy::Mapped },
  };

  for (const auto &item : cases) {
    const auto payload = test_helpers::make_payload(item.size, static_cast<uint32_t>(item.size));
    const auto path = dir / ("file_" + std::to_string(item.size));
    test_helpers::write_file(path, payload);

    RecordingSink sink(1);
    TieredFileWriter writer(sink, small_tiers());
    EntryHolder holder;
    const WriteStrategy used = writer.write_file(holder.entry, path, item.size);

    const std::string label = std::string(to_string(item.expected)) + " tier";
    ok = expect(used == item.expected, label + ": unexpected strategy") && ok;
    ok = expect(sink.data == payload, label + ": one-byte sink should receive every byte in order") && ok;
    ok = expect(sink.data_calls == item.size, label + ": one write call per byte expected") && ok;
    ok = expect(sink.events.size() == 2 && sink.events.front() == "header" && sink.events.back() == "finish", label + ": header then finish expected") && ok;
    ok = expect(writer.state() == TieredFileWriter::EntryState::EntryFinished, label + ": entry should be finished") && ok;
  }
  return ok;
}

bool test_write_slices_are_bounded() {
  bool ok = true;
  WriteTierOptions tiers = small_tiers();
  tiers.max_write_slice = 100;

  RecordingSink sink(1 << 20);
  TieredFileWriter writer(sink, tiers);
  EntryHolder holder;
  const auto payload = test_helpers::make_payload(1050);
  writer.write_memory(holder.entry, payload.data(), payload.size());

  ok = expect(sink.data == payload, "sliced writes should deliver the whole payload") && ok;
  ok = expect(sink.data_calls == 11, "payload should be split into max_write_slice sized calls") && ok;
  return ok;
}

bool test_empty_file_writes_header_only() {
  bool ok = true;
  test_helpers::TempDir dir("archive_bridge_empty");
  const auto path = dir / "empty.txt";
  test_helpers::write_file(path, std::vector<uint8_t>{});

  RecordingSink sink(1);
  TieredFileWriter writer(sink, small_tiers());
  EntryHolder holder;
  writer.write_file(holder.entry, path, 0);

  ok = expect(sink.data_calls == 0, "empty file should not produce data calls") && ok;
  ok = expect(sink.events.size() == 2, "empty file should still write header and finish") && ok;
  return ok;
}

bool test_zero_and_negative_results() {
  bool ok = true;
  const auto payload = test_helpers::make_payload(16);

  RecordingSink stalled(0);
  TieredFileWriter stalled_writer(stalled, small_tiers());
  EntryHolder first;
  try {
    stalled_writer.write_memory(first.entry, payload.data(), payload.size());
    ok = expect(false, "a sink accepting 0 bytes should raise ProtocolError") && ok;
  } catch (const ProtocolError &error) {
    ok = expect(std::string(error.what()) == "archive_write_data returned 0 bytes written", "zero-progress error message") && ok;
  }
  ok = expect(stalled_writer.state() == TieredFileWriter::EntryState::DataLoop, "failed entry must not be finished") && ok;
  ok = expect(stalled.events.size() == 1, "failed entry should only have written its header") && ok;

  RecordingSink failing(1);
  failing.fail_with = ARCHIVE_FATAL;
  TieredFileWriter failing_writer(failing, small_tiers());
  EntryHolder second;
  try {
    failing_writer.write_memory(second.entry, payload.data(), payload.size());
    ok = expect(false, "negative sink result should raise") && ok;
  } catch (const ProtocolError &error) {
    ok = expect(error.status() == ARCHIVE_FATAL, "negative result should reach raise_write_failure") && ok;
  }
  return ok;
}

bool test_truncated_source_file() {
  bool ok = true;
  test_helpers::TempDir dir("archive_bridge_truncated");
  const auto path = dir / "short.bin";
  test_helpers::write_file(path, test_helpers::make_payload(10));

  RecordingSink sink(1024);
  TieredFileWriter writer(sink, small_tiers());
  EntryHolder holder;
  ok = expect_throws<IoError>([&] { writer.write_file(holder.entry, path, 20); }, "file shorter than its declared size should raise IoError") && ok;
  return ok;
}

bool test_buffer_pool_reuse() {
  bool ok = true;
  BufferPool pool(2);
  uint8_t *first_address = nullptr;
  {
    BufferPool::Lease lease = pool.rent(128);
    first_address = lease.data();
    ok = expect(lease.size() >= 128, "lease should be at least the requested size") && ok;
  }
  ok = expect(pool.idle_count() == 1, "returned lease should be retained") && ok;
  {
    BufferPool::Lease lease = pool.rent(64);
    ok = expect(lease.data() == first_address, "a retained buffer should be reused") && ok;
  }
  {
    BufferPool::Lease a = pool.rent(16);
    BufferPool::Lease b = pool.rent(16);
    BufferPool::Lease c = pool.rent(16);
  }
  ok = expect(pool.idle_count() == 2, "pool should retain at most max_retained buffers") && ok;
  return ok;
}

} // namespace

int main() {
  bool ok = true;
  ok = test_strategy_selection() && ok;
  ok = test_option_validation() && ok;
  ok = test_one_byte_sink_every_tier() && ok;
  ok = test_write_slices_are_bounded() && ok;
  ok = test_empty_file_writes_header_only() && ok;
  ok = test_zero_and_negative_results() && ok;
  ok = test_truncated_source_file() && ok;
  ok = test_buffer_pool_reuse() && ok;

  if (!ok) {
    return 1;
  }
  std::cout << "[PASS] Tiered file writer tests passed" << std::endl;
  return 0;
}
