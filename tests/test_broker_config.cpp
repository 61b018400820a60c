#include <stdio.h>
#include <stdint.h>

#include <map>
#include <string>

#include <spdlog/spdlog.h>

#include "config/broker_config.h"
#include "log/logging.h"
#include "test_support.h"

using namespace gridlink;
using namespace gridlink::config;

// Stand-in process environment for BrokerConfig::load().
static std::map<std::string, std::string> g_env;

static const char* fakeEnv(const char* name) {
  std::map<std::string, std::string>::const_iterator it = g_env.find(name);
  return it == g_env.end() ? nullptr : it->second.c_str();
}

static void test_dotenv_parsing() {
  const std::string path = test_temp_path("parse.env");
  test_write_text(path,
                  "# broker settings\n"
                  "\n"
                  "MQTT_BROKER=broker.example.org\n"
                  "export MQTT_PORT = 8883\n"
                  "MQTT_USERNAME=\"grid user\"\n"
                  "MQTT_PASSWORD='s3cr=t'\n"
                  "  GRIDLINK_NAMESPACE=lab  \n");

  EnvMap values;
  Error error;
  TEST_ASSERT(parseDotEnv(path, values, error));
  TEST_ASSERT_EQ_UINT(values.size(), 5);
  TEST_ASSERT_EQ_STR(values["MQTT_BROKER"], "broker.example.org");
  TEST_ASSERT_EQ_STR(values["MQTT_PORT"], "8883");
  TEST_ASSERT_EQ_STR(values["MQTT_USERNAME"], "grid user");
  TEST_ASSERT_EQ_STR(values["MQTT_PASSWORD"], "s3cr=t");
  TEST_ASSERT_EQ_STR(values["GRIDLINK_NAMESPACE"], "lab");
  unlink(path.c_str());
  printf("  -> Dotenv parsing: OK\n");
}

static void test_dotenv_errors() {
  EnvMap values;
  Error error;
  TEST_ASSERT(!parseDotEnv(test_temp_path("missing.env"), values, error));
  TEST_ASSERT(error.code == ErrorCode::IO);

  const std::string path = test_temp_path("bad.env");
  test_write_text(path, "MQTT_BROKER=ok\nthis line has no separator\n");
  TEST_ASSERT(!parseDotEnv(path, values, error));
  TEST_ASSERT(error.code == ErrorCode::CONFIG);
  TEST_ASSERT(error.detail.find(":2:") != std::string::npos);
  unlink(path.c_str());
  printf("  -> Dotenv errors: OK\n");
}

static void test_port_parsing() {
  uint16_t port = 0;
  TEST_ASSERT(parsePort("1883", port));
  TEST_ASSERT_EQ_UINT(port, 1883);
  TEST_ASSERT(parsePort(" 65535 ", port));
  TEST_ASSERT(!parsePort("0", port));
  TEST_ASSERT(!parsePort("65536", port));
  TEST_ASSERT(!parsePort("18a3", port));
  TEST_ASSERT(!parsePort("", port));
  printf("  -> Port parsing: OK\n");
}

static void test_defaults_without_file() {
  g_env.clear();
  BrokerConfig config;
  Error error;
  TEST_ASSERT(config.load(test_temp_path("absent.env"), false, error, &fakeEnv));
  TEST_ASSERT_EQ_STR(config.host, "localhost");
  TEST_ASSERT_EQ_UINT(config.port, 1883);
  TEST_ASSERT(config.username.empty());
  TEST_ASSERT_EQ_STR(config.topic_namespace, "open_grid_monitor");
  TEST_ASSERT_EQ_STR(config.describe(), "localhost:1883");

  BrokerConfig strict;
  TEST_ASSERT(!strict.load(test_temp_path("absent.env"), true, error, &fakeEnv));
  TEST_ASSERT(error.code == ErrorCode::IO);
  printf("  -> Defaults and required file: OK\n");
}

static void test_environment_overrides_file() {
  const std::string path = test_temp_path("override.env");
  test_write_text(path, "MQTT_BROKER=file-host\nMQTT_PORT=1884\nMQTT_USERNAME=file-user\n");

  g_env.clear();
  g_env["MQTT_BROKER"] = "env-host";
  g_env["MQTT_PASSWORD"] = "pw";
  g_env["GRIDLINK_LOG_LEVEL"] = "debug";

  BrokerConfig config;
  Error error;
  TEST_ASSERT(config.load(path, true, error, &fakeEnv));
  TEST_ASSERT_EQ_STR(config.host, "env-host");
  TEST_ASSERT_EQ_UINT(config.port, 1884);
  TEST_ASSERT_EQ_STR(config.username, "file-user");
  TEST_ASSERT_EQ_STR(config.password, "pw");
  TEST_ASSERT_EQ_STR(config.log_level, "debug");
  TEST_ASSERT_EQ_STR(config.describe(), "env-host:1884 as file-user");
  TEST_ASSERT(config.describe().find("pw") == std::string::npos);
  unlink(path.c_str());
  printf("  -> Environment overrides dotenv: OK\n");
}

static void test_invalid_port_is_config_error() {
  g_env.clear();
  g_env["MQTT_PORT"] = "mqtt";
  BrokerConfig config;
  Error error;
  TEST_ASSERT(!config.load("", false, error, &fakeEnv));
  TEST_ASSERT(error.code == ErrorCode::CONFIG);
  TEST_ASSERT(error.detail.find("MQTT_PORT") != std::string::npos);
  printf("  -> Invalid port rejected: OK\n");
}

static void test_logging_levels() {
  TEST_ASSERT(logging::isValidLevel("trace"));
  TEST_ASSERT(logging::isValidLevel("warn"));
  TEST_ASSERT(logging::isValidLevel("off"));
  TEST_ASSERT(!logging::isValidLevel("verbose"));

  TEST_ASSERT(logging::init("debug"));
  TEST_ASSERT(spdlog::get(logging::LOGGER_NAME) != nullptr);
  TEST_ASSERT(spdlog::default_logger()->level() == spdlog::level::debug);

  TEST_ASSERT(!logging::init("loud"));
  TEST_ASSERT(spdlog::default_logger()->level() == spdlog::level::info);
  printf("  -> Logging levels: OK\n");
}

int main() {
  printf("BROKER CONFIG & LOGGING TEST SUITE\n");
  test_dotenv_parsing();
  test_dotenv_errors();
  test_port_parsing();
  test_defaults_without_file();
  test_environment_overrides_file();
  test_invalid_port_is_config_error();
  test_logging_levels();
  printf("ALL TESTS PASSED\n");
  return 0;
}
