#include <stdio.h>
#include <stdint.h>

#include <algorithm>
#include <string>
#include <vector>

#include "transfer/chunk_buffer.h"
#include "test_support.h"

using namespace gridlink;
using namespace gridlink::transfer;

static std::vector<uint8_t> chunkBytes(uint32_t index) {
  std::vector<uint8_t> out;
  for (uint32_t i = 0; i <= index % 5; ++i) {
    out.push_back(static_cast<uint8_t>('a' + index));
  }
  return out;
}

static void test_every_permutation_materializes_identically() {
  const uint32_t total = 5;
  std::vector<uint32_t> order;
  for (uint32_t i = 0; i < total; ++i) {
    order.push_back(i);
  }

  std::vector<uint8_t> expected;
  for (uint32_t i = 0; i < total; ++i) {
    const std::vector<uint8_t> b = chunkBytes(i);
    expected.insert(expected.end(), b.begin(), b.end());
  }

  size_t permutations = 0;
  do {
    ChunkBuffer buffer;
    for (size_t i = 0; i < order.size(); ++i) {
      TEST_ASSERT(buffer.acceptChunk(order[i], total, chunkBytes(order[i])));
    }
    TEST_ASSERT(buffer.isComplete());
    std::vector<uint8_t> out;
    TEST_ASSERT(buffer.materialize(out));
    TEST_ASSERT(out == expected);
    permutations++;
  } while (std::next_permutation(order.begin(), order.end()));
  TEST_ASSERT_EQ_UINT(permutations, 120);
  printf("  -> Any delivery order: OK\n");
}

static void test_duplicate_is_idempotent() {
  ChunkBuffer buffer;
  TEST_ASSERT(buffer.acceptChunk(0, 2, test_bytes("AB")));
  TEST_ASSERT(buffer.acceptChunk(1, 2, test_bytes("CD")));
  std::vector<uint8_t> before;
  TEST_ASSERT(buffer.materialize(before));

  TEST_ASSERT(buffer.acceptChunk(1, 2, test_bytes("CD")));
  TEST_ASSERT(buffer.isComplete());
  TEST_ASSERT_EQ_UINT(buffer.receivedCount(), 2);
  TEST_ASSERT_EQ_UINT(buffer.duplicateCount(), 1);
  TEST_ASSERT_EQ_UINT(buffer.receivedBytes(), 4);

  std::vector<uint8_t> after;
  TEST_ASSERT(buffer.materialize(after));
  TEST_ASSERT(before == after);
  printf("  -> Duplicate chunk: OK\n");
}

static void test_missing_middle_chunk() {
  ChunkBuffer buffer;
  TEST_ASSERT(buffer.acceptChunk(2, 3, test_bytes("CD")));
  TEST_ASSERT(buffer.acceptChunk(0, 3, test_bytes("AB")));

  TEST_ASSERT(!buffer.isComplete());
  const std::vector<uint32_t> missing = buffer.missing();
  TEST_ASSERT_EQ_UINT(missing.size(), 1);
  TEST_ASSERT_EQ_UINT(missing[0], 1);

  std::vector<uint8_t> out;
  TEST_ASSERT(!buffer.materialize(out));
  TEST_ASSERT(out.empty());
  TEST_ASSERT(buffer.lastError().code == ErrorCode::INCOMPLETE_TRANSFER);
  TEST_ASSERT(buffer.lastError().detail.find("1") != std::string::npos);
  printf("  -> Missing chunk reported: OK\n");
}

static void test_negative_index_rejected() {
  ChunkBuffer buffer;
  TEST_ASSERT(!buffer.acceptChunk(-1, 3, test_bytes("AB")));
  TEST_ASSERT(buffer.lastError().code == ErrorCode::INVALID_CHUNK);
  TEST_ASSERT_EQ_UINT(buffer.receivedCount(), 0);
  TEST_ASSERT_EQ_UINT(buffer.totalDeclared(), 0);
  TEST_ASSERT(!buffer.hasStarted());
  printf("  -> Negative index: OK\n");
}

static void test_declared_total_is_running_maximum() {
  ChunkBuffer buffer;
  TEST_ASSERT(buffer.acceptChunk(0, 4, test_bytes("AB")));
  TEST_ASSERT(buffer.acceptChunk(1, 2, test_bytes("CD")));
  TEST_ASSERT_EQ_UINT(buffer.totalDeclared(), 4);
  TEST_ASSERT(!buffer.isComplete());

  const std::vector<IndexRange> ranges = buffer.missingRanges();
  TEST_ASSERT_EQ_UINT(ranges.size(), 1);
  TEST_ASSERT_EQ_UINT(ranges[0].first, 2);
  TEST_ASSERT_EQ_UINT(ranges[0].last, 3);
  TEST_ASSERT_EQ_STR(formatRanges(ranges), "2-3");
  printf("  -> Declared total never shrinks: OK\n");
}

static void test_huge_declared_total_reports_gaps() {
  ChunkBuffer buffer;
  TEST_ASSERT(buffer.acceptChunk(0, UINT32_MAX, test_bytes("A")));
  std::vector<IndexRange> ranges = buffer.missingRanges();
  TEST_ASSERT_EQ_UINT(ranges.size(), 1);
  TEST_ASSERT_EQ_UINT(ranges[0].first, 1);
  TEST_ASSERT_EQ_UINT(ranges[0].last, UINT32_MAX - 1);

  TEST_ASSERT(buffer.acceptChunk(5, UINT32_MAX, test_bytes("F")));
  TEST_ASSERT(!buffer.isComplete());

  ranges = buffer.missingRanges();
  TEST_ASSERT_EQ_UINT(ranges.size(), 2);
  TEST_ASSERT_EQ_UINT(ranges[0].first, 1);
  TEST_ASSERT_EQ_UINT(ranges[0].last, 4);
  TEST_ASSERT_EQ_UINT(ranges[1].first, 6);
  TEST_ASSERT_EQ_UINT(ranges[1].last, UINT32_MAX - 1);

  std::vector<uint8_t> out;
  TEST_ASSERT(!buffer.materialize(out));
  TEST_ASSERT_EQ_STR(buffer.lastError().detail, "missing chunks: 1-4, 6-4294967294");
  printf("  -> Huge declared total: OK\n");
}

static void test_empty_transfer_is_not_complete() {
  ChunkBuffer buffer;
  TEST_ASSERT(!buffer.isComplete());
  TEST_ASSERT(buffer.missing().empty());
  std::vector<uint8_t> out;
  TEST_ASSERT(!buffer.materialize(out));
  TEST_ASSERT(buffer.lastError().code == ErrorCode::INCOMPLETE_TRANSFER);
  printf("  -> Nothing declared: OK\n");
}

static void test_finalized_buffer_rejects_input() {
  ChunkBuffer buffer;
  TEST_ASSERT(buffer.acceptChunk(0, 1, test_bytes("AB")));
  buffer.finalize();
  TEST_ASSERT(buffer.isFinalized());
  TEST_ASSERT(!buffer.acceptChunk(1, 2, test_bytes("CD")));
  TEST_ASSERT(!buffer.acceptComplete(10));
  TEST_ASSERT(!buffer.acceptHeader(nlohmann::json::object()));
  TEST_ASSERT_EQ_UINT(buffer.totalDeclared(), 1);

  std::vector<uint8_t> out;
  TEST_ASSERT(buffer.materialize(out));
  TEST_ASSERT(out == test_bytes("AB"));
  printf("  -> Finalized buffer: OK\n");
}

static void test_header_and_completion_metadata() {
  ChunkBuffer buffer;
  nlohmann::json header;
  header["reset_reason"] = "panic";
  header["partition_size"] = 65536;
  TEST_ASSERT(buffer.acceptHeader(header));
  TEST_ASSERT(buffer.hasStarted());
  TEST_ASSERT(buffer.header().has_value());
  TEST_ASSERT(buffer.header().value()["reset_reason"] == "panic");

  TEST_ASSERT(!buffer.completionTotalSize().has_value());
  TEST_ASSERT(buffer.acceptComplete(4096));
  TEST_ASSERT_EQ_UINT(buffer.completionTotalSize().value(), 4096);
  // The asserted size does not gate completeness.
  TEST_ASSERT(!buffer.isComplete());
  printf("  -> Header and completion metadata: OK\n");
}

int main() {
  printf("CHUNK BUFFER TEST SUITE\n");
  test_every_permutation_materializes_identically();
  test_duplicate_is_idempotent();
  test_missing_middle_chunk();
  test_negative_index_rejected();
  test_declared_total_is_running_maximum();
  test_huge_declared_total_reports_gaps();
  test_empty_transfer_is_not_complete();
  test_finalized_buffer_rejects_input();
  test_header_and_completion_metadata();
  printf("ALL TESTS PASSED\n");
  return 0;
}
