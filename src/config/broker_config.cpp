#include "broker_config.h"

#include <stdlib.h>
#include <errno.h>
#include <fstream>

#include <spdlog/spdlog.h>

#include "config/gridlink_config.h"
#include "util/string_utils.h"

namespace gridlink {
namespace config {

namespace {

std::string unquote(const std::string& value) {
  if (value.size() >= 2) {
    const char first = value[0];
    const char last = value[value.size() - 1];
    if ((first == '"' || first == '\'') && first == last) {
      return value.substr(1, value.size() - 2);
    }
  }
  return value;
}

// Real environment first, then the dotenv values.
bool resolve(const char* name, const EnvMap& file_values, EnvLookup lookup, std::string& out) {
  const char* value = lookup(name);
  if (value != nullptr) {
    out = value;
    return true;
  }
  EnvMap::const_iterator it = file_values.find(name);
  if (it != file_values.end()) {
    out = it->second;
    return true;
  }
  return false;
}

const char* systemEnv(const char* name) {
  return getenv(name);
}

}  // namespace

bool parsePort(const std::string& text, uint16_t& out) {
  const std::string trimmed = util::trimCopy(util::view(text));
  if (trimmed.empty()) {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const long value = strtol(trimmed.c_str(), &end, 10);
  if (errno != 0 || *end != '\0' || value < 1 || value > 65535) {
    return false;
  }
  out = static_cast<uint16_t>(value);
  return true;
}

bool parseDotEnv(const std::string& path, EnvMap& out, Error& error) {
  std::ifstream in(path.c_str());
  if (!in.is_open()) {
    error = Error(ErrorCode::IO, "cannot open " + path);
    return false;
  }

  std::string line;
  size_t line_no = 0;
  while (std::getline(in, line)) {
    line_no++;
    std::string text = util::trimCopy(util::view(line));
    if (text.empty() || text[0] == '#') {
      continue;
    }
    if (text.compare(0, 7, "export ") == 0) {
      text = util::trimCopy(util::view(text).substr(7));
    }
    const size_t eq = text.find('=');
    if (eq == std::string::npos || eq == 0) {
      error = Error(ErrorCode::CONFIG,
                    path + ":" + std::to_string(line_no) + ": expected KEY=VALUE");
      return false;
    }
    const std::string key = util::trimCopy(util::view(text).substr(0, eq));
    const std::string value = unquote(util::trimCopy(util::view(text).substr(eq + 1)));
    out[key] = value;
  }
  return true;
}

BrokerConfig::BrokerConfig()
    : host(GRIDLINK_DEFAULT_BROKER_HOST),
      port(GRIDLINK_DEFAULT_BROKER_PORT),
      username(),
      password(),
      client_id(),
      keepalive_s(GRIDLINK_DEFAULT_KEEPALIVE_S),
      topic_namespace(GRIDLINK_DEFAULT_NAMESPACE),
      log_level("info") {}

bool BrokerConfig::load(const std::string& env_file, bool env_file_required, Error& error,
                        EnvLookup lookup) {
  if (lookup == nullptr) {
    lookup = &systemEnv;
  }

  EnvMap file_values;
  if (!env_file.empty()) {
    Error file_error;
    if (!parseDotEnv(env_file, file_values, file_error)) {
      if (file_error.code != ErrorCode::IO || env_file_required) {
        error = file_error;
        return false;
      }
      spdlog::warn("{} file not found, using default MQTT settings", env_file);
    }
  }

  std::string value;
  if (resolve(ENV_BROKER, file_values, lookup, value) && !value.empty()) {
    host = value;
  }
  if (resolve(ENV_PORT, file_values, lookup, value)) {
    if (!parsePort(value, port)) {
      error = Error(ErrorCode::CONFIG, std::string(ENV_PORT) + " is not a valid port: " + value);
      return false;
    }
  }
  if (resolve(ENV_USERNAME, file_values, lookup, value)) {
    username = value;
  }
  if (resolve(ENV_PASSWORD, file_values, lookup, value)) {
    password = value;
  }
  if (resolve(ENV_NAMESPACE, file_values, lookup, value) && !value.empty()) {
    topic_namespace = value;
  }
  if (resolve(ENV_LOG_LEVEL, file_values, lookup, value) && !value.empty()) {
    log_level = value;
  }
  return true;
}

std::string BrokerConfig::describe() const {
  return host + ":" + std::to_string(port) + (username.empty() ? "" : " as " + username);
}

}  // namespace config
}  // namespace gridlink
