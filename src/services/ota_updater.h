/**
 * @file ota_updater.h
 * @brief Firmware push to one device over MQTT plus HTTP
 *
 * The image is served from a local HTTP server; the device is told where
 * to fetch it with {"ota": "<url>"} on its command topic. The device only
 * reports back through status and error text, which the session turns
 * into a verdict and the progress estimator into download speed.
 */
#ifndef GRIDLINK_OTA_UPDATER_H
#define GRIDLINK_OTA_UPDATER_H

#include <stdint.h>
#include <atomic>
#include <string>

#include "gridlink_error.h"
#include "config/gridlink_config.h"
#include "progress/progress_estimator.h"
#include "scheduler/session_scheduler.h"
#include "session/session.h"
#include "transport/transport.h"

namespace gridlink {
namespace services {

struct OtaOptions {
  std::string topic_namespace;
  std::string device;             // required; discovery happens before
  std::string firmware_path;
  uint16_t http_port;             // 0 picks a free port
  std::string host_address;       // empty: detected LAN address
  uint64_t timeout_ms;
  uint64_t restart_linger_ms;
  const std::atomic<bool>* cancel_flag;

  OtaOptions()
      : topic_namespace(GRIDLINK_DEFAULT_NAMESPACE),
        device(),
        firmware_path(),
        http_port(GRIDLINK_DEFAULT_HTTP_PORT),
        host_address(),
        timeout_ms(GRIDLINK_OTA_TIMEOUT_MS),
        restart_linger_ms(GRIDLINK_RESTART_LINGER_MS),
        cancel_flag(nullptr) {}
};

struct OtaOutcome {
  session::SessionResult session;
  Error error;
  std::string firmware_url;
  uint64_t image_bytes;
  uint32_t downloads;
  progress::ProgressSummary summary;

  OtaOutcome() : session(), error(), firmware_url(), image_bytes(0), downloads(0), summary() {}

  bool ok() const { return error.ok(); }
};

// Candidate image locations, relative to the working directory.
extern const char* const FIRMWARE_SEARCH_PATHS[];

// First existing entry of FIRMWARE_SEARCH_PATHS, made absolute.
bool findFirmwareImage(std::string& path);

class OtaUpdater {
 public:
  OtaUpdater(transport::ITransport& client, const OtaOptions& options,
             scheduler::MillisFn clock);

  /**
   * @brief Serve the image, command the update and wait for the verdict.
   *
   * @return false with outcome.error: IO when the image cannot be served,
   *         TRANSPORT, TIMEOUT, DEVICE_ERROR or ABORTED.
   */
  bool run(OtaOutcome& outcome);

  // Publishes `restart` and lingers restart_linger_ms for delivery.
  bool restart(Error& error);

 private:
  void logSummary(const OtaOutcome& outcome) const;

  transport::ITransport& _client;
  OtaOptions _options;
  scheduler::MillisFn _clock;
};

}  // namespace services
}  // namespace gridlink

#endif  // GRIDLINK_OTA_UPDATER_H
