#include "payloads.h"

#include <mbedtls/base64.h>

#include "config/gridlink_config.h"

namespace gridlink {
namespace payloads {

bool parseJson(const std::string& text, nlohmann::json& out, std::string& error) {
  try {
    out = nlohmann::json::parse(text);
  } catch (const nlohmann::json::parse_error& e) {
    error = e.what();
    return false;
  }
  return true;
}

ChunkParseResult parseChunk(const nlohmann::json& body, ChunkPayload& out) {
  if (!body.is_object()) {
    return ChunkParseResult::NOT_AN_OBJECT;
  }

  out = ChunkPayload();

  nlohmann::json::const_iterator it = body.find(KEY_CHUNK_INDEX);
  if (it != body.end()) {
    if (!it->is_number_integer()) {
      return ChunkParseResult::BAD_INDEX;
    }
    out.chunk_index = it->get<int64_t>();
  }

  it = body.find(KEY_TOTAL_CHUNKS);
  if (it != body.end()) {
    if (!it->is_number_integer() || it->get<int64_t>() < 0 ||
        it->get<int64_t>() > static_cast<int64_t>(GRIDLINK_MAX_CHUNKS)) {
      return ChunkParseResult::BAD_TOTAL;
    }
    out.total_chunks = static_cast<uint32_t>(it->get<int64_t>());
  }

  it = body.find(KEY_DATA);
  if (it == body.end() || !it->is_string() || it->get_ref<const std::string&>().empty()) {
    return ChunkParseResult::MISSING_DATA;
  }
  out.data_b64 = it->get<std::string>();
  return ChunkParseResult::OK;
}

const char* toString(ChunkParseResult result) {
  switch (result) {
    case ChunkParseResult::OK:            return "ok";
    case ChunkParseResult::NOT_AN_OBJECT: return "payload is not an object";
    case ChunkParseResult::BAD_INDEX:     return "chunk_index is not an integer";
    case ChunkParseResult::BAD_TOTAL:     return "total_chunks is not a valid count";
    case ChunkParseResult::MISSING_DATA:  return "data is missing or empty";
  }
  return "unknown";
}

bool parseTotalSize(const nlohmann::json& body, uint64_t& out) {
  if (!body.is_object()) {
    return false;
  }
  nlohmann::json::const_iterator it = body.find(KEY_TOTAL_SIZE);
  if (it == body.end() || !it->is_number_integer() || it->get<int64_t>() < 0) {
    return false;
  }
  out = static_cast<uint64_t>(it->get<int64_t>());
  return true;
}

bool decodeBase64(const std::string& encoded, std::vector<uint8_t>& out) {
  out.clear();
  const unsigned char* src = reinterpret_cast<const unsigned char*>(encoded.data());
  size_t needed = 0;
  int rc = mbedtls_base64_decode(nullptr, 0, &needed, src, encoded.size());
  if (rc == MBEDTLS_ERR_BASE64_INVALID_CHARACTER) {
    return false;
  }
  if (needed == 0) {
    return rc == 0;
  }

  out.resize(needed);
  size_t written = 0;
  rc = mbedtls_base64_decode(out.data(), out.size(), &written, src, encoded.size());
  if (rc != 0) {
    out.clear();
    return false;
  }
  out.resize(written);
  return true;
}

std::string buildOtaCommand(const std::string& firmware_url) {
  nlohmann::json command;
  command[COMMAND_KEY_OTA] = firmware_url;
  return command.dump();
}

std::string headerField(const nlohmann::json& header, const char* key) {
  if (!header.is_object()) {
    return "unknown";
  }
  nlohmann::json::const_iterator it = header.find(key);
  if (it == header.end() || it->is_null()) {
    return "unknown";
  }
  if (it->is_string()) {
    return it->get<std::string>();
  }
  return it->dump();
}

}  // namespace payloads
}  // namespace gridlink
