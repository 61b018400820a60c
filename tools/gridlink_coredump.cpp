/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
/**
 * @file gridlink_coredump.cpp
 * @brief Ask a device for its stored core dump and save it locally
 */
#include <stdio.h>
#include <getopt.h>

#include <string>

#include <spdlog/spdlog.h>

#include "config/broker_config.h"
#include "scheduler/session_scheduler.h"
#include "services/coredump_requester.h"
#include "transport/mosquitto_transport.h"
#include "tool_common.h"

using namespace gridlink;

namespace {

enum LongOnly {
  OPT_ANY_DEVICE = 256,
  OPT_DISCOVERY_TIMEOUT,
  OPT_ENV,
  OPT_LOG_LEVEL
};

void usage(const char* argv0) {
  fprintf(stderr,
          "Usage: %s (--device ID | --any-device) [options]\n"
          "\n"
          "  -d, --device ID            Device to request the core dump from\n"
          "      --any-device           Ask every device publishing telemetry\n"
          "  -t, --timeout S            Seconds to wait for the dump (default %lu)\n"
          "  -o, --output FILE          Output file (default coredump_<device>.bin)\n"
          "      --discovery-timeout S  Discovery window for --any-device (default %lu)\n"
          "      --env FILE             dotenv file with MQTT_* settings (default .env)\n"
          "      --log-level L          trace, debug, info, warn, error, off\n"
          "  -h, --help                 Show this help\n",
          argv0, GRIDLINK_COREDUMP_TIMEOUT_MS / 1000, GRIDLINK_DISCOVERY_WINDOW_MS / 1000);
}

}  // namespace

int main(int argc, char* argv[]) {
  services::CoreDumpRequestOptions options;
  std::string env_file;
  std::string log_level;

  static const struct option LONG_OPTIONS[] = {
    {"device", required_argument, nullptr, 'd'},
    {"any-device", no_argument, nullptr, OPT_ANY_DEVICE},
    {"timeout", required_argument, nullptr, 't'},
    {"output", required_argument, nullptr, 'o'},
    {"discovery-timeout", required_argument, nullptr, OPT_DISCOVERY_TIMEOUT},
    {"env", required_argument, nullptr, OPT_ENV},
    {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
  };

  int opt = 0;
  while ((opt = getopt_long(argc, argv, "d:t:o:h", LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
      case 'd':
        options.device = optarg;
        break;
      case OPT_ANY_DEVICE:
        options.any_device = true;
        break;
      case 't':
        if (!tools::parseSeconds(optarg, options.timeout_ms)) {
          fprintf(stderr, "Invalid --timeout: %s\n", optarg);
          return 1;
        }
        break;
      case 'o':
        options.output_path = optarg;
        break;
      case OPT_DISCOVERY_TIMEOUT:
        if (!tools::parseSeconds(optarg, options.discovery_window_ms)) {
          fprintf(stderr, "Invalid --discovery-timeout: %s\n", optarg);
          return 1;
        }
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

  if (options.device.empty() == !options.any_device) {
    fprintf(stderr, "Exactly one of --device or --any-device is required\n");
    usage(argv[0]);
    return 1;
  }

  config::BrokerConfig broker;
  if (!tools::setupRuntime(env_file, log_level, broker)) {
    return 1;
  }
  options.topic_namespace = broker.topic_namespace;
  options.cancel_flag = &tools::g_cancel_requested;
  tools::installSignalHandlers();

  transport::MosquittoTransport client(broker);
  if (!client.connect()) {
    return tools::exitCodeFor(false, client.lastError());
  }

  services::CoreDumpRequester requester(client, options, &scheduler::monotonicMillis);
  services::CoreDumpOutcome outcome;
  const bool ok = requester.run(outcome);
  client.disconnect();

  if (ok && outcome.saved()) {
    spdlog::info("Core dump from {} written to {} ({} bytes)", outcome.session.target_device,
                 outcome.artifact_path, outcome.artifact_bytes);
  }
  return tools::exitCodeFor(ok, outcome.error);
}
