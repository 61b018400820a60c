#include "ota_updater.h"

#include <limits.h>
#include <stdlib.h>
#include <unistd.h>

#include <chrono>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "http/firmware_server.h"
#include "protocol/payloads.h"
#include "protocol/topics.h"
#include "services/session_binding.h"
#include "text/status_matcher.h"
#include "util/string_utils.h"

namespace gridlink {
namespace services {

const char* const FIRMWARE_SEARCH_PATHS[] = {
  "build/esp32s3_ade7953.bin",
  "../build/esp32s3_ade7953.bin",
  "../../build/esp32s3_ade7953.bin",
  "esp32s3_ade7953.bin",
  nullptr
};

bool findFirmwareImage(std::string& path) {
  for (size_t i = 0; FIRMWARE_SEARCH_PATHS[i] != nullptr; ++i) {
    if (access(FIRMWARE_SEARCH_PATHS[i], R_OK) != 0) {
      continue;
    }
    char resolved[PATH_MAX];
    path = realpath(FIRMWARE_SEARCH_PATHS[i], resolved) != nullptr
               ? std::string(resolved)
               : std::string(FIRMWARE_SEARCH_PATHS[i]);
    return true;
  }
  return false;
}

OtaUpdater::OtaUpdater(transport::ITransport& client, const OtaOptions& options,
                       scheduler::MillisFn clock)
  : _client(client)
  , _options(options)
  , _clock(clock)
{
}

bool OtaUpdater::run(OtaOutcome& outcome) {
  outcome = OtaOutcome();
  if (_options.device.empty()) {
    outcome.error = Error(ErrorCode::CONFIG, "no target device for the firmware update");
    return false;
  }

  http::FirmwareServer server(_options.firmware_path, _options.http_port);
  if (!server.start(outcome.error)) {
    spdlog::error("Firmware cannot be served: {}", outcome.error.detail);
    return false;
  }
  const std::string host =
      _options.host_address.empty() ? http::detectLocalAddress() : _options.host_address;
  outcome.firmware_url = server.url(host);
  outcome.image_bytes = server.imageSize();

  session::SessionConfig config;
  config.topic_namespace = _options.topic_namespace;
  config.target_device = _options.device;
  config.timeout_ms = _options.timeout_ms;
  config.collect_transfer = false;
  config.known_total_size = outcome.image_bytes;
  config.cancel_flag = _options.cancel_flag;

  const text::KeywordStatusMatcher matcher(text::firmwareUpdateRules());
  session::Session session(config, matcher, _clock);
  session.start();

  std::vector<std::string> filters =
      topics::sessionFilters(_options.topic_namespace, _options.device, false);
  filters.push_back(
      topics::deviceTopic(_options.topic_namespace, _options.device, topics::CATEGORY_LOGS));

  SessionBinding binding(_client, session);
  if (!binding.attach(filters, outcome.error)) {
    spdlog::error("Cannot follow device {}: {}", _options.device, outcome.error.detail);
    server.stop();
    return false;
  }

  const std::string topic =
      topics::deviceTopic(_options.topic_namespace, _options.device, topics::CATEGORY_COMMAND);
  if (!_client.publish(topic, payloads::buildOtaCommand(outcome.firmware_url))) {
    outcome.error = _client.lastError();
    spdlog::error("Update command not sent: {}", outcome.error.detail);
    server.stop();
    return false;
  }
  session.markCommandPublished();
  spdlog::info("Update command sent to {}: {}", _options.device, outcome.firmware_url);

  outcome.session = session.waitForVerdict();
  outcome.summary =
      session.progressEstimator().summary(outcome.image_bytes, outcome.session.finished_ms);
  binding.release();
  outcome.downloads = server.downloadsServed();
  server.stop();

  outcome.error = session::toError(outcome.session);
  if (!outcome.error.ok()) {
    spdlog::error("Firmware update of {} failed: {}", _options.device, outcome.error.detail);
    return false;
  }
  logSummary(outcome);
  return true;
}

void OtaUpdater::logSummary(const OtaOutcome& outcome) const {
  spdlog::info("Firmware update of {} completed", _options.device);
  spdlog::info("  Total size:    {} bytes ({:.1f} KB)", outcome.image_bytes,
               outcome.image_bytes / 1024.0);
  spdlog::info("  Total time:    {:.1f} s", outcome.summary.elapsed_s);
  spdlog::info("  Average speed: {}", util::formatSpeed(outcome.summary.average_bps));
}

bool OtaUpdater::restart(Error& error) {
  if (_options.device.empty()) {
    error = Error(ErrorCode::CONFIG, "no target device for restart");
    return false;
  }
  const std::string topic =
      topics::deviceTopic(_options.topic_namespace, _options.device, topics::CATEGORY_COMMAND);
  if (!_client.publish(topic, payloads::COMMAND_RESTART)) {
    error = _client.lastError();
    spdlog::error("Restart command not sent: {}", error.detail);
    return false;
  }
  spdlog::info("Restart command sent to {}", _options.device);
  std::this_thread::sleep_for(std::chrono::milliseconds(_options.restart_linger_ms));
  return true;
}

}  // namespace services
}  // namespace gridlink
