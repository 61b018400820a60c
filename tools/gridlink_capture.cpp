/**
 * @file gridlink_capture.cpp
 * @brief Rebuild a core dump from the MQTT stream, live or from a recording
 *
 * With --mqtt-log the recorded JSON message log is replayed offline and no
 * broker is contacted. With --live the tool listens on the core dump topics
 * until the transfer completes or the timeout expires.
 */
#include <stdio.h>
#include <getopt.h>

#include <string>

#include <spdlog/spdlog.h>

#include "config/broker_config.h"
#include "log/logging.h"
#include "scheduler/session_scheduler.h"
#include "services/coredump_capture.h"
#include "transport/mosquitto_transport.h"
#include "tool_common.h"

using namespace gridlink;

namespace {

enum LongOnly {
  OPT_MQTT_LOG = 256,
  OPT_LIVE,
  OPT_RECORD,
  OPT_ENV,
  OPT_LOG_LEVEL
};

void usage(const char* argv0) {
  fprintf(stderr,
          "Usage: %s (--mqtt-log FILE | --live) [options]\n"
          "\n"
          "      --mqtt-log FILE   Replay a recorded JSON message log\n"
          "      --live            Listen on the broker\n"
          "  -d, --device ID       Only follow this device (default: first to send)\n"
          "  -t, --timeout S       Listening time for --live (default %lu)\n"
          "  -o, --output FILE     Output file (default coredump_<device>.bin)\n"
          "      --record FILE     Save the messages seen by --live as a message log\n"
          "      --env FILE        dotenv file with MQTT_* settings (default .env)\n"
          "      --log-level L     trace, debug, info, warn, error, off\n"
          "  -h, --help            Show this help\n",
          argv0, GRIDLINK_CAPTURE_TIMEOUT_MS / 1000);
}

}  // namespace

int main(int argc, char* argv[]) {
  services::CaptureOptions options;
  std::string log_path;
  bool live = false;
  std::string env_file;
  std::string log_level;

  static const struct option LONG_OPTIONS[] = {
    {"mqtt-log", required_argument, nullptr, OPT_MQTT_LOG},
    {"live", no_argument, nullptr, OPT_LIVE},
    {"device", required_argument, nullptr, 'd'},
    {"timeout", required_argument, nullptr, 't'},
    {"output", required_argument, nullptr, 'o'},
    {"record", required_argument, nullptr, OPT_RECORD},
    {"env", required_argument, nullptr, OPT_ENV},
    {"log-level", required_argument, nullptr, OPT_LOG_LEVEL},
    {"help", no_argument, nullptr, 'h'},
    {nullptr, 0, nullptr, 0}
  };

  int opt = 0;
  while ((opt = getopt_long(argc, argv, "d:t:o:h", LONG_OPTIONS, nullptr)) != -1) {
    switch (opt) {
      case OPT_MQTT_LOG:
        log_path = optarg;
        break;
      case OPT_LIVE:
        live = true;
        break;
      case 'd':
        options.device = optarg;
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
      case OPT_RECORD:
        options.record_path = optarg;
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

  if (log_path.empty() == !live) {
    fprintf(stderr, "Exactly one of --mqtt-log or --live is required\n");
    usage(argv[0]);
    return 1;
  }

  services::CoreDumpOutcome outcome;
  if (!live) {
    // Offline: no broker settings needed.
    if (!logging::init(log_level.empty() ? "info" : log_level)) {
      return 1;
    }
    services::CoreDumpCapture capture(options, &scheduler::monotonicMillis);
    const bool ok = capture.replay(log_path, outcome);
    return tools::exitCodeFor(ok, outcome.error);
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
  services::CoreDumpCapture capture(options, &scheduler::monotonicMillis);
  const bool ok = capture.captureLive(client, outcome);
  client.disconnect();
  return tools::exitCodeFor(ok, outcome.error);
}
