#include "message_log.h"

#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "protocol/payloads.h"
#include "storage/artifact_writer.h"

namespace gridlink {
namespace storage {

namespace {

constexpr const char KEY_TOPIC[] = "topic";
constexpr const char KEY_PAYLOAD[] = "payload";
constexpr const char KEY_TIMESTAMP[] = "timestamp";

std::string textOf(const nlohmann::json& value) {
  return value.is_string() ? value.get<std::string>() : value.dump();
}

}  // namespace

bool loadMessageLog(const std::string& path, std::vector<LoggedMessage>& out, Error& error) {
  out.clear();
  std::ifstream in(path.c_str());
  if (!in.is_open()) {
    error = Error(ErrorCode::IO, "cannot open " + path);
    return false;
  }
  std::stringstream buffer;
  buffer << in.rdbuf();

  nlohmann::json document;
  std::string parse_error;
  if (!payloads::parseJson(buffer.str(), document, parse_error)) {
    error = Error(ErrorCode::PAYLOAD_PARSE, path + ": " + parse_error);
    return false;
  }
  if (!document.is_array()) {
    error = Error(ErrorCode::PAYLOAD_PARSE, path + ": expected a JSON array of messages");
    return false;
  }

  size_t skipped = 0;
  for (nlohmann::json::const_iterator it = document.begin(); it != document.end(); ++it) {
    if (!it->is_object()) {
      skipped++;
      continue;
    }
    nlohmann::json::const_iterator topic = it->find(KEY_TOPIC);
    if (topic == it->end() || !topic->is_string()) {
      skipped++;
      continue;
    }

    LoggedMessage message;
    message.topic = topic->get<std::string>();

    nlohmann::json::const_iterator body = it->find(KEY_PAYLOAD);
    if (body == it->end()) {
      body = it->find(payloads::KEY_DATA);
    }
    if (body != it->end()) {
      message.payload = textOf(*body);
    } else {
      message.payload = "{}";
    }

    nlohmann::json::const_iterator ts = it->find(KEY_TIMESTAMP);
    if (ts != it->end() && ts->is_number()) {
      message.timestamp = ts->get<double>();
    }
    out.push_back(message);
  }

  if (skipped > 0) {
    spdlog::warn("Skipped {} malformed entries in {}", skipped, path);
  }
  return true;
}

bool saveMessageLog(const std::string& path, const std::vector<LoggedMessage>& messages,
                    Error& error) {
  nlohmann::json document = nlohmann::json::array();
  for (size_t i = 0; i < messages.size(); ++i) {
    nlohmann::json entry;
    entry[KEY_TOPIC] = messages[i].topic;
    entry[KEY_PAYLOAD] = messages[i].payload;
    entry[KEY_TIMESTAMP] = messages[i].timestamp;
    document.push_back(entry);
  }
  return writeJson(path, document, error);
}

}  // namespace storage
}  // namespace gridlink
