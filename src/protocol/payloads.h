/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_PAYLOADS_H
#define GRIDLINK_PAYLOADS_H

#include <stdint.h>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace gridlink {
namespace payloads {

// Bare keyword commands understood by the firmware.
constexpr const char COMMAND_COREDUMP[] = "coredump";
constexpr const char COMMAND_RESTART[] = "restart";

// Key of the structured firmware update command: {"ota": "<url>"}
constexpr const char COMMAND_KEY_OTA[] = "ota";

// Chunk payload: {"chunk_index": int, "total_chunks": int, "data": base64}
constexpr const char KEY_CHUNK_INDEX[] = "chunk_index";
constexpr const char KEY_TOTAL_CHUNKS[] = "total_chunks";
constexpr const char KEY_DATA[] = "data";

// Complete payload carries the device-asserted artifact size.
constexpr const char KEY_TOTAL_SIZE[] = "total_size";

// Header keys reported to the operator (the header itself is free-form).
constexpr const char KEY_RESET_REASON[] = "reset_reason";
constexpr const char KEY_FIRMWARE_VERSION[] = "firmware_version";
constexpr const char KEY_PARTITION_SIZE[] = "partition_size";

struct ChunkPayload {
  int64_t chunk_index;
  uint32_t total_chunks;
  std::string data_b64;

  ChunkPayload() : chunk_index(-1), total_chunks(0), data_b64() {}
};

enum class ChunkParseResult : uint8_t {
  OK = 0,
  NOT_AN_OBJECT = 1,
  BAD_INDEX = 2,
  BAD_TOTAL = 3,
  MISSING_DATA = 4
};

/**
 * @brief Parse text as JSON without throwing.
 *
 * @param text   Raw payload.
 * @param out    Parsed document on success.
 * @param error  Parser message on failure.
 * @return true on success.
 */
bool parseJson(const std::string& text, nlohmann::json& out, std::string& error);

/**
 * @brief Extract the chunk fields from a parsed chunk payload.
 *
 * Missing `chunk_index` reads as -1 and missing `total_chunks` as 0, which
 * keeps the accept/reject decision in the reassembly buffer. Non-integer
 * values are rejected here.
 */
ChunkParseResult parseChunk(const nlohmann::json& body, ChunkPayload& out);

const char* toString(ChunkParseResult result);

// Reads `total_size` from a complete payload; false when absent or invalid.
bool parseTotalSize(const nlohmann::json& body, uint64_t& out);

/**
 * @brief Decode RFC 4648 base64 (mbedTLS).
 *
 * @return false on malformed input; out is left empty.
 */
bool decodeBase64(const std::string& encoded, std::vector<uint8_t>& out);

// {"ota": "<url>"} serialized compactly.
std::string buildOtaCommand(const std::string& firmware_url);

// Reads a header field for display, "unknown" when absent.
std::string headerField(const nlohmann::json& header, const char* key);

}  // namespace payloads
}  // namespace gridlink

#endif  // GRIDLINK_PAYLOADS_H
