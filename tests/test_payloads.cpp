#include <stdio.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "config/gridlink_config.h"
#include "protocol/payloads.h"
#include "test_support.h"

using namespace gridlink;
using namespace gridlink::payloads;

static nlohmann::json parsed(const std::string& text) {
  nlohmann::json out;
  std::string error;
  TEST_ASSERT(parseJson(text, out, error));
  return out;
}

static void test_parse_json_reports_errors() {
  nlohmann::json out;
  std::string error;
  TEST_ASSERT(!parseJson("{\"chunk_index\": ", out, error));
  TEST_ASSERT(!error.empty());
  TEST_ASSERT(!parseJson("", out, error));
  TEST_ASSERT(parseJson("[1, 2]", out, error));
  TEST_ASSERT(out.is_array());
  printf("  -> JSON parse errors: OK\n");
}

static void test_chunk_fields() {
  ChunkPayload chunk;
  TEST_ASSERT(parseChunk(parsed(test_chunk_payload(3, 10, "QUI=")), chunk) == ChunkParseResult::OK);
  TEST_ASSERT_EQ_UINT(chunk.chunk_index, 3);
  TEST_ASSERT_EQ_UINT(chunk.total_chunks, 10);
  TEST_ASSERT_EQ_STR(chunk.data_b64, "QUI=");

  // Missing fields fall back to values the buffer rejects or ignores.
  TEST_ASSERT(parseChunk(parsed("{\"data\": \"QUI=\"}"), chunk) == ChunkParseResult::OK);
  TEST_ASSERT(chunk.chunk_index == -1);
  TEST_ASSERT_EQ_UINT(chunk.total_chunks, 0);
  printf("  -> Chunk fields: OK\n");
}

static void test_chunk_rejections() {
  ChunkPayload chunk;
  TEST_ASSERT(parseChunk(parsed("[]"), chunk) == ChunkParseResult::NOT_AN_OBJECT);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": \"1\", \"data\": \"QUI=\"}"), chunk) ==
              ChunkParseResult::BAD_INDEX);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 1.5, \"data\": \"QUI=\"}"), chunk) ==
              ChunkParseResult::BAD_INDEX);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 1, \"total_chunks\": -2, \"data\": \"QUI=\"}"),
                         chunk) == ChunkParseResult::BAD_TOTAL);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 0, \"total_chunks\": 4294967295, "
                                "\"data\": \"QQ==\"}"),
                         chunk) == ChunkParseResult::BAD_TOTAL);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 0, \"total_chunks\": " +
                                std::to_string(GRIDLINK_MAX_CHUNKS + 1) + ", \"data\": \"QQ==\"}"),
                         chunk) == ChunkParseResult::BAD_TOTAL);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 0, \"total_chunks\": " +
                                std::to_string(GRIDLINK_MAX_CHUNKS) + ", \"data\": \"QQ==\"}"),
                         chunk) == ChunkParseResult::OK);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 1, \"total_chunks\": 2}"), chunk) ==
              ChunkParseResult::MISSING_DATA);
  TEST_ASSERT(parseChunk(parsed("{\"chunk_index\": 1, \"total_chunks\": 2, \"data\": \"\"}"),
                         chunk) == ChunkParseResult::MISSING_DATA);
  TEST_ASSERT_EQ_STR(toString(ChunkParseResult::MISSING_DATA), "data is missing or empty");
  printf("  -> Chunk rejections: OK\n");
}

static void test_total_size() {
  uint64_t size = 0;
  TEST_ASSERT(parseTotalSize(parsed("{\"total_size\": 65536}"), size));
  TEST_ASSERT_EQ_UINT(size, 65536);
  TEST_ASSERT(!parseTotalSize(parsed("{}"), size));
  TEST_ASSERT(!parseTotalSize(parsed("{\"total_size\": -1}"), size));
  TEST_ASSERT(!parseTotalSize(parsed("{\"total_size\": \"big\"}"), size));
  printf("  -> Total size: OK\n");
}

static void test_base64() {
  std::vector<uint8_t> out;
  TEST_ASSERT(decodeBase64("SGVsbG8=", out));
  TEST_ASSERT(out == test_bytes("Hello"));

  TEST_ASSERT(decodeBase64("AAECAw==", out));
  TEST_ASSERT_EQ_UINT(out.size(), 4);
  TEST_ASSERT_EQ_UINT(out[0], 0);
  TEST_ASSERT_EQ_UINT(out[3], 3);

  TEST_ASSERT(decodeBase64("", out));
  TEST_ASSERT(out.empty());

  TEST_ASSERT(!decodeBase64("not*base64", out));
  TEST_ASSERT(out.empty());
  printf("  -> Base64: OK\n");
}

static void test_commands() {
  TEST_ASSERT_EQ_STR(buildOtaCommand("http://10.0.0.2:8000/firmware.bin"),
                     "{\"ota\":\"http://10.0.0.2:8000/firmware.bin\"}");
  TEST_ASSERT_EQ_STR(COMMAND_COREDUMP, "coredump");
  TEST_ASSERT_EQ_STR(COMMAND_RESTART, "restart");
  printf("  -> Commands: OK\n");
}

static void test_header_fields() {
  const nlohmann::json header =
      parsed("{\"reset_reason\": \"panic\", \"partition_size\": 65536, \"firmware_version\": null}");
  TEST_ASSERT_EQ_STR(headerField(header, KEY_RESET_REASON), "panic");
  TEST_ASSERT_EQ_STR(headerField(header, KEY_PARTITION_SIZE), "65536");
  TEST_ASSERT_EQ_STR(headerField(header, KEY_FIRMWARE_VERSION), "unknown");
  TEST_ASSERT_EQ_STR(headerField(nlohmann::json(), KEY_RESET_REASON), "unknown");
  printf("  -> Header fields: OK\n");
}

int main() {
  printf("PAYLOADS TEST SUITE\n");
  test_parse_json_reports_errors();
  test_chunk_fields();
  test_chunk_rejections();
  test_total_size();
  test_base64();
  test_commands();
  test_header_fields();
  printf("ALL TESTS PASSED\n");
  return 0;
}
