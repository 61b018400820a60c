/**
 * @file coredump_capture.h
 * @brief Listen-and-capture core dump retrieval
 *
 * No command is sent. The capture either listens on the core dump topics
 * for a bounded time, or replays a recorded message log offline through
 * the same session, so both paths reassemble identical bytes.
 *
 * Unlike a request, a capture that saw every chunk but no completion
 * signal before its window closed still saves the dump (with a warning):
 * the listener may have joined after the device started sending.
 */
#ifndef GRIDLINK_COREDUMP_CAPTURE_H
#define GRIDLINK_COREDUMP_CAPTURE_H

#include <stdint.h>
#include <atomic>
#include <string>

#include "config/gridlink_config.h"
#include "scheduler/session_scheduler.h"
#include "services/coredump_requester.h"
#include "session/session.h"
#include "transport/transport.h"

namespace gridlink {
namespace services {

struct CaptureOptions {
  std::string topic_namespace;
  std::string device;             // empty: any device
  uint64_t timeout_ms;
  std::string output_path;        // empty: coredump_<device>.bin
  std::string record_path;        // when set, the received messages are saved here
  const std::atomic<bool>* cancel_flag;

  CaptureOptions()
      : topic_namespace(GRIDLINK_DEFAULT_NAMESPACE),
        device(),
        timeout_ms(GRIDLINK_CAPTURE_TIMEOUT_MS),
        output_path(),
        record_path(),
        cancel_flag(nullptr) {}
};

class CoreDumpCapture {
 public:
  CoreDumpCapture(const CaptureOptions& options, scheduler::MillisFn clock);

  // Listens on a connected transport until a verdict or the timeout.
  bool captureLive(transport::ITransport& client, CoreDumpOutcome& outcome);

  /**
   * @brief Rebuild a dump from a recorded message log.
   *
   * Only core dump topics are replayed. The log is processed in file order
   * with no deadline: the verdict is decided once the log is exhausted.
   */
  bool replay(const std::string& log_path, CoreDumpOutcome& outcome);

 private:
  session::SessionConfig sessionConfig() const;
  bool finish(const session::Session& session, CoreDumpOutcome& outcome);
  void record(const session::Session& session, uint64_t started_ms, uint64_t started_unix);

  CaptureOptions _options;
  scheduler::MillisFn _clock;
};

}  // namespace services
}  // namespace gridlink

#endif  // GRIDLINK_COREDUMP_CAPTURE_H
