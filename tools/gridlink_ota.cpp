/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
/**
 * @file gridlink_ota.cpp
 * @brief Push a firmware image to a device, or just restart it
 *
 * Without --device the tool listens for telemetry to find devices. With
 * --automatic the first device seen is used and nothing is asked; otherwise
 * the operator picks one from a numbered list and confirms the update.
 */
#include <stdio.h>
#include <getopt.h>

#include <iostream>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "config/broker_config.h"
#include "discovery/device_registry.h"
#include "scheduler/session_scheduler.h"
#include "services/ota_updater.h"
#include "transport/mosquitto_transport.h"
#include "tool_common.h"

using namespace gridlink;

namespace {

enum LongOnly {
  OPT_HTTP_PORT = 256,
  OPT_AUTOMATIC,
  OPT_RESTART_ONLY,
  OPT_DISCOVERY_TIMEOUT,
  OPT_HOST_IP,
  OPT_ENV,
  OPT_LOG_LEVEL
};

void usage(const char* argv0) {
  fprintf(stderr,
          "Usage: %s [options]\n"
          "\n"
          "  -f, --firmware FILE        Image to serve (default: search build/)\n"
          "      --http-port P          HTTP port for the image (default %d)\n"
          "  -d, --device ID            Target device (default: discover)\n"
          "      --automatic            Use the first device found, do not ask\n"
          "      --restart-only         Send restart instead of an update\n"
          "      --discovery-timeout S  Discovery window (default %lu)\n"
          "  -t, --timeout S            Update timeout (default %lu)\n"
          "      --host-ip IP           Address the device downloads from\n"
          "      --env FILE             dotenv file with MQTT_* settings (default .env)\n"
          "      --log-level L          trace, debug, info, warn, error, off\n"
          "  -h, --help                 Show this help\n",
          argv0, GRIDLINK_DEFAULT_HTTP_PORT, GRIDLINK_DISCOVERY_WINDOW_MS / 1000,
          GRIDLINK_OTA_TIMEOUT_MS / 1000);
}

// Resolves the target into device: explicit, first found or operator choice.
bool chooseDevice(transport::ITransport& client, const std::string& ns, uint64_t window_ms,
                  bool automatic, std::string& device, Error& error) {
  discovery::DeviceRegistry registry(ns, &scheduler::monotonicMillis);
  if (!device.empty()) {
    const etl::optional<std::string> chosen =
        registry.select(discovery::SelectionPolicy::explicitDevice(device), error);
    return chosen.has_value();
  }

  if (!registry.discover(client, window_ms, automatic, error)) {
    return false;
  }

  etl::optional<std::string> chosen;
  if (automatic) {
    chosen = registry.select(discovery::SelectionPolicy::firstFound(), error);
  } else {
    size_t index = 0;
    if (!tools::promptForDevice(registry.candidates(), std::cin, stdout, index)) {
      error = Error(ErrorCode::ABORTED, "no device selected");
      return false;
    }
    chosen = registry.select(discovery::SelectionPolicy::interactive(index), error);
  }
  if (!chosen.has_value()) {
    return false;
  }
  registry.lock();
  device = chosen.value();
  spdlog::info("Selected device {}", device);
  return true;
}

}  // namespace

int main(int argc, char* argv[]) {
  services::OtaOptions options;
  uint64_t discovery_window_ms = GRIDLINK_DISCOVERY_WINDOW_MS;
  bool automatic = false;
  bool restart_only = false;
  std::string env_file;
  std::string log_level;

  static const struct option LONG_OPTIONS[] = {
    {"firmware", required_argument, nullptr, 'f'},
    {"http-port", required_argument, nullptr, OPT_HTTP_PORT},
    {"device", required_argument, nullptr, 'd'},
    {"automatic", no_argument, nullptr, OPT_AUTOMATIC},
    {"restart-only", no_argument, nullptr, OPT_RESTART_ONLY},
    {"discovery-timeout", required_argument, nullptr, OPT_DISCOVERY_TIMEOUT},
    {"timeout", required_argument, nullptr, 't'},
    {"host-ip", required_argument, nullptr, OPT_HOST_IP},
    {"env", required_argument, nullptr, OPT_ENV},
    {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
  };

  int opt = 0;
  while ((opt = getopt_long(argc, argv, "f:d:t:h", LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
      case 'f':
        options.firmware_path = optarg;
        break;
      case OPT_HTTP_PORT:
        if (!config::parsePort(optarg, options.http_port)) {
          fprintf(stderr, "Invalid --http-port: %s\n", optarg);
          return 1;
        }
        break;
      case 'd':
        options.device = optarg;
        break;
      case OPT_AUTOMATIC:
        automatic = true;
        break;
      case OPT_RESTART_ONLY:
        restart_only = true;
        break;
      case OPT_DISCOVERY_TIMEOUT:
        if (!tools::parseSeconds(optarg, discovery_window_ms)) {
          fprintf(stderr, "Invalid --discovery-timeout: %s\n", optarg);
          return 1;
        }
        break;
      case 't':
        if (!tools::parseSeconds(optarg, options.timeout_ms)) {
          fprintf(stderr, "Invalid --timeout: %s\n", optarg);
          return 1;
        }
        break;
      case OPT_HOST_IP:
        options.host_address = optarg;
        break;
      case OPT_ENV:
        env_file = optarg;
        break;
      case OPT_LOG_LEVEL:
        log_level = optarg;
        break;
      case 'h':
        usage(argv[0]);
        return 0;
      default:
        usage(argv[0]);
        return 1;
    }
  }

  config::BrokerConfig broker;
  if (!tools::setupRuntime(env_file, log_level, broker)) {
    return 1;
  }
  options.topic_namespace = broker.topic_namespace;
  options.cancel_flag = &tools::g_cancel_requested;

  if (!restart_only && options.firmware_path.empty() &&
      !services::findFirmwareImage(options.firmware_path)) {
    spdlog::error("No firmware image found; build it first or pass --firmware");
    return 1;
  }

  tools::installSignalHandlers();
  transport::MosquittoTransport client(broker);
  if (!client.connect()) {
    return tools::exitCodeFor(false, client.lastError());
  }

  Error error;
  if (!chooseDevice(client, broker.topic_namespace, discovery_window_ms, automatic,
                    options.device, error)) {
    client.disconnect();
    if (error.code == ErrorCode::ABORTED && !tools::g_cancel_requested.load()) {
      return tools::exitCodeForOperatorCancel("Device selection");
    }
    return tools::exitCodeFor(false, error);
  }

  services::OtaUpdater updater(client, options, &scheduler::monotonicMillis);
  if (restart_only) {
    const bool ok = updater.restart(error);
    client.disconnect();
    return tools::exitCodeFor(ok, error);
  }

  if (!automatic &&
      !tools::promptForConfirmation("Update " + options.device + " with " +
                                        options.firmware_path + "?",
                                    std::cin, stdout)) {
    client.disconnect();
    return tools::exitCodeForOperatorCancel("Update");
  }

  services::OtaOutcome outcome;
  const bool ok = updater.run(outcome);
  client.disconnect();
  return tools::exitCodeFor(ok, outcome.error);
}
