/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_BROKER_CONFIG_H
#define GRIDLINK_BROKER_CONFIG_H

#include <stdint.h>
#include <map>
#include <string>

#include "gridlink_error.h"

namespace gridlink {
namespace config {

// Environment variables read by load().
constexpr const char ENV_BROKER[] = "MQTT_BROKER";
constexpr const char ENV_PORT[] = "MQTT_PORT";
constexpr const char ENV_USERNAME[] = "MQTT_USERNAME";
constexpr const char ENV_PASSWORD[] = "MQTT_PASSWORD";
constexpr const char ENV_NAMESPACE[] = "GRIDLINK_NAMESPACE";
constexpr const char ENV_LOG_LEVEL[] = "GRIDLINK_LOG_LEVEL";

constexpr const char DEFAULT_ENV_FILE[] = ".env";

typedef std::map<std::string, std::string> EnvMap;

// getenv-compatible lookup, replaceable in tests.
typedef const char* (*EnvLookup)(const char* name);

/**
 * @brief Parse a dotenv file.
 *
 * KEY=VALUE per line; blank lines and lines starting with '#' are skipped,
 * an optional leading "export " is accepted and one pair of matching
 * single or double quotes around the value is stripped.
 *
 * @return false with IO when the file cannot be opened, CONFIG on a line
 *         without '='.
 */
bool parseDotEnv(const std::string& path, EnvMap& out, Error& error);

struct BrokerConfig {
  std::string host;
  uint16_t port;
  std::string username;     // empty: anonymous
  std::string password;
  std::string client_id;    // empty: broker assigns one
  uint16_t keepalive_s;
  std::string topic_namespace;
  std::string log_level;

  BrokerConfig();

  /**
   * @brief Resolve the runtime configuration.
   *
   * Values from env_file seed the result, real environment variables win.
   * A missing default ".env" is not an error; a missing file the caller
   * named explicitly is.
   */
  bool load(const std::string& env_file, bool env_file_required, Error& error,
            EnvLookup lookup = nullptr);

  // Broker address for log lines, never includes credentials.
  std::string describe() const;
};

// Parses a TCP port in [1, 65535].
bool parsePort(const std::string& text, uint16_t& out);

}  // namespace config
}  // namespace gridlink

#endif  // GRIDLINK_BROKER_CONFIG_H
