/**
 * @file coredump_requester.h
 * @brief Request-and-wait core dump retrieval
 *
 * Sends the `coredump` command to one device (or to every device seen on
 * the telemetry topics), follows the first device that answers, waits for
 * a verdict and saves the reassembled dump next to its header metadata.
 *
 * A device with nothing stored answers with a status text instead of data;
 * that is a successful operation with no file written.
 */
#ifndef GRIDLINK_COREDUMP_REQUESTER_H
#define GRIDLINK_COREDUMP_REQUESTER_H

#include <stdint.h>
#include <atomic>
#include <string>
#include <vector>

#include "gridlink_error.h"
#include "config/gridlink_config.h"
#include "scheduler/session_scheduler.h"
#include "session/session.h"
#include "transport/transport.h"

namespace gridlink {
namespace services {

struct CoreDumpRequestOptions {
  std::string topic_namespace;
  std::string device;             // explicit target
  bool any_device;                // discover and ask every device seen
  uint64_t timeout_ms;
  uint64_t discovery_window_ms;
  std::string output_path;        // empty: coredump_<device>.bin
  const std::atomic<bool>* cancel_flag;

  CoreDumpRequestOptions()
      : topic_namespace(GRIDLINK_DEFAULT_NAMESPACE),
        device(),
        any_device(false),
        timeout_ms(GRIDLINK_COREDUMP_TIMEOUT_MS),
        discovery_window_ms(GRIDLINK_DISCOVERY_WINDOW_MS),
        output_path(),
        cancel_flag(nullptr) {}
};

struct CoreDumpOutcome {
  session::SessionResult session;
  Error error;
  std::string artifact_path;      // set when a dump was written
  uint64_t artifact_bytes;

  CoreDumpOutcome() : session(), error(), artifact_path(), artifact_bytes(0) {}

  bool ok() const { return error.ok(); }
  bool saved() const { return !artifact_path.empty(); }
};

/**
 * @brief Materialize a session's dump and save it with its header.
 *
 * @param output_path Target file; empty picks coredump_<device>.bin.
 * @return false with INCOMPLETE_TRANSFER or IO in outcome.error.
 */
bool saveSessionDump(const session::Session& session, const std::string& output_path,
                     CoreDumpOutcome& outcome);

class CoreDumpRequester {
 public:
  CoreDumpRequester(transport::ITransport& client, const CoreDumpRequestOptions& options,
                    scheduler::MillisFn clock);

  /**
   * @brief Run the whole request on a connected transport.
   *
   * @return false with outcome.error set: CONFIG without a target,
   *         NO_DEVICE when discovery found nothing, TRANSPORT, TIMEOUT,
   *         DEVICE_ERROR, ABORTED, INCOMPLETE_TRANSFER or IO.
   */
  bool run(CoreDumpOutcome& outcome);

 private:
  bool resolveTargets(std::vector<std::string>& targets, Error& error);

  transport::ITransport& _client;
  CoreDumpRequestOptions _options;
  scheduler::MillisFn _clock;
};

}  // namespace services
}  // namespace gridlink

#endif  // GRIDLINK_COREDUMP_REQUESTER_H
