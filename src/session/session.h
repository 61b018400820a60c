/**
 * @file session.h
 * @brief One GridLink operation: event queue, router, buffer and verdict
 *
 * The transport delivery callback only calls post(). Everything else
 * (classification, reassembly, state machine) runs on the consumer, which
 * is either waitForVerdict() or a test driving pump()/pollDeadline().
 *
 * A session is single-use: start() once, read result() once terminal.
 */
#ifndef GRIDLINK_SESSION_H
#define GRIDLINK_SESSION_H

#include <stdint.h>
#include <atomic>
#include <string>
#include <vector>

#include <etl/optional.h>

#include "gridlink_error.h"
#include "config/gridlink_config.h"
#include "fsm/session_fsm.h"
#include "progress/progress_estimator.h"
#include "router/topic_router.h"
#include "scheduler/session_scheduler.h"
#include "session/event_queue.h"
#include "text/status_matcher.h"
#include "transfer/chunk_buffer.h"

namespace gridlink {
namespace session {

struct SessionConfig {
  std::string topic_namespace;
  std::string target_device;   // empty: adopt the first responding device
  uint64_t timeout_ms;
  uint64_t poll_ms;            // watchdog interval, clamped to 1 s
  bool collect_transfer;       // core dump events feed the buffer
  uint64_t known_total_size;   // artifact size for progress estimates
  const std::atomic<bool>* cancel_flag;  // polled by the watchdog; may be null

  SessionConfig()
      : topic_namespace(GRIDLINK_DEFAULT_NAMESPACE),
        target_device(),
        timeout_ms(GRIDLINK_COREDUMP_TIMEOUT_MS),
        poll_ms(GRIDLINK_DEADLINE_POLL_MS),
        collect_transfer(true),
        known_total_size(0),
        cancel_flag(nullptr) {}
};

struct AuditEntry {
  uint64_t received_ms;
  std::string topic;
  std::string payload;
};

// Caller-visible outcome of one operation.
struct SessionResult {
  fsm::StateId state;
  ErrorCode code;
  std::string device_error;     // raw error text when Failed
  std::string target_device;
  bool nothing_to_transfer;     // vacuous success
  size_t chunks_received;
  uint32_t chunks_declared;
  std::vector<transfer::IndexRange> missing;
  etl::optional<uint64_t> completion_total_size;
  uint64_t elapsed_ms;
  uint64_t finished_ms;         // clock reading at the verdict; 0 while running

  SessionResult()
      : state(fsm::STATE_IDLE), code(ErrorCode::NONE), device_error(), target_device(),
        nothing_to_transfer(false), chunks_received(0), chunks_declared(0), missing(),
        completion_total_size(), elapsed_ms(0), finished_ms(0) {}

  bool succeeded() const { return state == fsm::STATE_SUCCEEDED; }
};

// Error describing a non-successful result; ok() when it succeeded.
Error toError(const SessionResult& result);

class Session : public router::ITopicHandler, public scheduler::TimerHandler {
 public:
  Session(const SessionConfig& config, const text::IStatusMatcher& matcher,
          scheduler::MillisFn clock);

  // Arms the deadline and enters Idle.
  void start();

  // The command has been handed to the transport.
  void markCommandPublished();

  // Thread-safe. Called from the transport delivery thread.
  void post(const std::string& topic, const std::string& payload);

  // Thread-safe. Cancels the operation.
  void abort();

  // Processes every queued event without blocking; returns the count.
  size_t pump();

  // Advances the deadline timer to the current clock reading.
  void pollDeadline();

  /**
   * @brief Block until a terminal state.
   *
   * Runs a watchdog thread that wakes every poll interval and injects a
   * DEADLINE event once the clock passes the deadline, so the verdict does
   * not depend on message arrival. A raised cancel_flag injects ABORT.
   */
  SessionResult waitForVerdict();

  SessionResult result() const;

  fsm::StateId state() const { return _started ? _fsm.stateId() : fsm::STATE_IDLE; }
  bool isTerminal() const { return _terminal.load(); }
  const std::string& target() const { return _target; }
  uint64_t deadline() const { return _deadline_ms; }

  const std::vector<AuditEntry>& auditLog() const { return _audit; }
  const transfer::ChunkBuffer& buffer() const { return _buffer; }
  const progress::ProgressEstimator& progressEstimator() const { return _progress; }
  uint32_t parseErrors() const { return _router.parseErrors(); }

  // ITopicHandler
  void onTelemetry(const router::TopicEvent& event) override;
  void onHeader(const router::TopicEvent& event) override;
  void onChunk(const router::TopicEvent& event) override;
  void onComplete(const router::TopicEvent& event) override;
  void onStatus(const router::TopicEvent& event) override;
  void onError(const router::TopicEvent& event) override;
  void onUnrecognized(const router::TopicEvent& event) override;

  // TimerHandler
  void on_timer(scheduler::TimerId id) override;

 private:
  void process(const QueuedEvent& event);
  // True for the target, or for any device while none is followed yet.
  bool isFromTarget(const std::string& device) const;
  // Follows device when no target is set. Only qualifying events call this.
  void adoptTarget(const std::string& device);
  void checkTerminal();
  void logOutcome() const;

  SessionConfig _config;
  const text::IStatusMatcher& _matcher;
  scheduler::MillisFn _clock;

  EventQueue _queue;
  router::TopicRouter _router;
  transfer::ChunkBuffer _buffer;
  fsm::SessionFsm _fsm;
  progress::ProgressEstimator _progress;
  scheduler::TimerService _timers;
  scheduler::ClockTicker _ticker;

  std::string _target;
  std::string _device_error;
  bool _nothing_to_transfer;
  bool _started;
  uint64_t _started_ms;
  uint64_t _deadline_ms;
  uint64_t _finished_ms;
  std::atomic<bool> _terminal;
  std::vector<AuditEntry> _audit;
};

}  // namespace session
}  // namespace gridlink

#endif  // GRIDLINK_SESSION_H
