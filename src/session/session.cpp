#include "session.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "protocol/payloads.h"
#include "protocol/topics.h"

namespace gridlink {
namespace session {

namespace {

const char* deviceLabel(const std::string& device) {
  return device.empty() ? "<none>" : device.c_str();
}

ErrorCode codeFor(fsm::StateId state) {
  switch (state) {
    case fsm::STATE_SUCCEEDED: return ErrorCode::NONE;
    case fsm::STATE_FAILED:    return ErrorCode::DEVICE_ERROR;
    case fsm::STATE_TIMED_OUT: return ErrorCode::TIMEOUT;
    case fsm::STATE_ABORTED:   return ErrorCode::ABORTED;
    default:                   break;
  }
  return ErrorCode::NONE;
}

}  // namespace

Error toError(const SessionResult& result) {
  const std::string progress = std::to_string(result.chunks_received) + "/" +
                               std::to_string(result.chunks_declared) + " chunks";
  switch (result.state) {
    case fsm::STATE_SUCCEEDED:
      return Error();
    case fsm::STATE_FAILED:
      return Error(ErrorCode::DEVICE_ERROR, "device reported: " + result.device_error);
    case fsm::STATE_ABORTED:
      return Error(ErrorCode::ABORTED, "cancelled after " + progress);
    case fsm::STATE_TIMED_OUT: {
      std::string detail = "no verdict after " + std::to_string(result.elapsed_ms) + " ms";
      if (result.chunks_declared > 0) {
        detail += " (" + progress + ", missing " + transfer::formatRanges(result.missing) + ")";
      }
      return Error(ErrorCode::TIMEOUT, detail);
    }
    default:
      break;
  }
  return Error(ErrorCode::TIMEOUT, std::string("session still ") + fsm::toString(result.state));
}

Session::Session(const SessionConfig& config, const text::IStatusMatcher& matcher,
                 scheduler::MillisFn clock)
    : _config(config),
      _matcher(matcher),
      _clock(clock),
      _queue(),
      _router(config.topic_namespace),
      _buffer(),
      _fsm(),
      _progress(matcher),
      _timers(),
      _ticker(clock),
      _target(config.target_device),
      _device_error(),
      _nothing_to_transfer(false),
      _started(false),
      _started_ms(0),
      _deadline_ms(0),
      _finished_ms(0),
      _terminal(false),
      _audit() {
  _router.setHandler(this);
}

void Session::start() {
  if (_started) {
    return;
  }
  _started = true;
  _started_ms = _clock();
  _deadline_ms = _started_ms + _config.timeout_ms;
  _fsm.begin(&_buffer);
  _ticker.reset();
  _timers.register_timer(this, scheduler::TIMER_SESSION_DEADLINE, _config.timeout_ms, false);
  spdlog::debug("Session started for {} with a {} ms deadline", deviceLabel(_target),
                _config.timeout_ms);
}

void Session::markCommandPublished() {
  if (!_started) {
    return;
  }
  _progress.start(_clock());
  _fsm.commandPublished();
  checkTerminal();
}

void Session::post(const std::string& topic, const std::string& payload) {
  _queue.push(QueuedEvent::message(topic, payload, _clock()));
}

void Session::abort() {
  _queue.push(QueuedEvent::control(QueuedEvent::ABORT, _clock()));
}

size_t Session::pump() {
  size_t processed = 0;
  QueuedEvent event;
  while (_queue.tryPop(event)) {
    process(event);
    processed++;
  }
  return processed;
}

void Session::pollDeadline() {
  if (!_started || _terminal.load()) {
    return;
  }
  _ticker.advance(_timers);
  checkTerminal();
}

SessionResult Session::waitForVerdict() {
  start();

  const uint64_t poll_ms =
      std::min<uint64_t>(std::max<uint64_t>(_config.poll_ms, 1), GRIDLINK_MAX_DEADLINE_POLL_MS);
  std::atomic<bool> stop(false);
  std::thread watchdog([this, &stop, poll_ms]() {
    bool cancel_sent = false;
    while (!stop.load()) {
      std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
      const uint64_t now = _clock();
      if (!cancel_sent && _config.cancel_flag != nullptr && _config.cancel_flag->load()) {
        _queue.push(QueuedEvent::control(QueuedEvent::ABORT, now));
        cancel_sent = true;
      }
      if (now >= _deadline_ms) {
        _queue.push(QueuedEvent::control(QueuedEvent::DEADLINE, now));
      }
    }
  });

  QueuedEvent event;
  while (!_terminal.load()) {
    _queue.waitPop(event);
    process(event);
  }

  stop.store(true);
  watchdog.join();
  return result();
}

SessionResult Session::result() const {
  SessionResult r;
  r.state = _started ? _fsm.stateId() : fsm::STATE_IDLE;
  r.code = codeFor(r.state);
  r.device_error = _device_error;
  r.target_device = _target;
  r.nothing_to_transfer = _nothing_to_transfer;
  r.chunks_received = _buffer.receivedCount();
  r.chunks_declared = _buffer.totalDeclared();
  r.missing = _buffer.missingRanges();
  r.completion_total_size = _buffer.completionTotalSize();
  const uint64_t end = _terminal.load() ? _finished_ms : _clock();
  r.elapsed_ms = end > _started_ms ? end - _started_ms : 0;
  r.finished_ms = _terminal.load() ? _finished_ms : 0;
  return r;
}

void Session::process(const QueuedEvent& event) {
  switch (event.kind) {
    case QueuedEvent::MESSAGE: {
      AuditEntry entry;
      entry.received_ms = event.received_ms;
      entry.topic = event.topic;
      entry.payload = event.payload;
      _audit.push_back(entry);

      if (!_started) {
        spdlog::debug("Session not started, recorded only: {}", event.topic);
        return;
      }
      if (_fsm.isTerminal()) {
        spdlog::trace("Verdict already reached, recorded only: {}", event.topic);
        return;
      }
      _router.dispatch(event.topic, event.payload, event.received_ms);
      checkTerminal();
      break;
    }
    case QueuedEvent::DEADLINE:
      pollDeadline();
      break;
    case QueuedEvent::ABORT:
      if (_started && !_fsm.isTerminal()) {
        spdlog::info("Operation aborted by caller");
        _fsm.abort();
        checkTerminal();
      }
      break;
  }
}

bool Session::isFromTarget(const std::string& device) const {
  if (device.empty()) {
    return false;
  }
  return _target.empty() || device == _target;
}

void Session::adoptTarget(const std::string& device) {
  if (!_target.empty()) {
    return;
  }
  _target = device;
  spdlog::info("Device {} responded first, following it", device);
}

void Session::checkTerminal() {
  if (!_started || _terminal.load() || !_fsm.isTerminal()) {
    return;
  }
  _finished_ms = _clock();
  _buffer.finalize();
  _timers.unregister_timer(scheduler::TIMER_SESSION_DEADLINE);
  _terminal.store(true);
  logOutcome();
}

void Session::logOutcome() const {
  const uint64_t elapsed = _finished_ms > _started_ms ? _finished_ms - _started_ms : 0;
  const fsm::StateId state = _fsm.stateId();
  if (state == fsm::STATE_SUCCEEDED) {
    spdlog::info("Session for {} succeeded after {} ms ({}/{} chunks)", deviceLabel(_target),
                 elapsed, _buffer.receivedCount(), _buffer.totalDeclared());
    return;
  }
  spdlog::error("Session for {} ended {} after {} ms ({}/{} chunks received, missing: {})",
                deviceLabel(_target), fsm::toString(state), elapsed, _buffer.receivedCount(),
                _buffer.totalDeclared(), transfer::formatRanges(_buffer.missingRanges()));
}

// ============================================================================
// ITopicHandler
// ============================================================================
void Session::onTelemetry(const router::TopicEvent& event) {
  // Discovery consumes telemetry; a session only ignores it.
  spdlog::trace("Telemetry from {}", event.device);
}

void Session::onHeader(const router::TopicEvent& event) {
  if (!_config.collect_transfer || !isFromTarget(event.device)) {
    return;
  }
  if (!_buffer.acceptHeader(event.body)) {
    return;
  }
  adoptTarget(event.device);
  spdlog::info("Core dump header from {}: reset reason {}, firmware {}, partition size {}",
               event.device, payloads::headerField(event.body, payloads::KEY_RESET_REASON),
               payloads::headerField(event.body, payloads::KEY_FIRMWARE_VERSION),
               payloads::headerField(event.body, payloads::KEY_PARTITION_SIZE));
  _fsm.transferActivity();
}

void Session::onChunk(const router::TopicEvent& event) {
  if (!_config.collect_transfer || !isFromTarget(event.device)) {
    return;
  }

  payloads::ChunkPayload chunk;
  const payloads::ChunkParseResult parsed = payloads::parseChunk(event.body, chunk);
  if (parsed != payloads::ChunkParseResult::OK) {
    spdlog::warn("Dropping chunk on {}: {}", event.topic, payloads::toString(parsed));
    return;
  }

  std::vector<uint8_t> bytes;
  if (!payloads::decodeBase64(chunk.data_b64, bytes)) {
    spdlog::warn("Dropping chunk {}: data is not valid base64", chunk.chunk_index);
    return;
  }

  if (!_buffer.acceptChunk(chunk.chunk_index, chunk.total_chunks, bytes)) {
    _buffer.clearError();
    return;
  }
  adoptTarget(event.device);
  spdlog::debug("Received chunk {}/{} ({} bytes)", chunk.chunk_index + 1,
                _buffer.totalDeclared(), bytes.size());
  _fsm.transferActivity();
}

void Session::onComplete(const router::TopicEvent& event) {
  if (!_config.collect_transfer || !isFromTarget(event.device)) {
    return;
  }
  adoptTarget(event.device);

  uint64_t total_size = 0;
  if (payloads::parseTotalSize(event.body, total_size)) {
    _buffer.acceptComplete(total_size);
    spdlog::info("Core dump transmission complete, {} bytes declared", total_size);
  } else {
    spdlog::info("Core dump transmission complete (no size declared)");
  }
  if (!_buffer.isComplete()) {
    spdlog::debug("Complete signal ahead of data: {}/{} chunks so far",
                  _buffer.receivedCount(), _buffer.totalDeclared());
  }
  _fsm.completeSignal();
}

void Session::onStatus(const router::TopicEvent& event) {
  if (!isFromTarget(event.device)) {
    return;
  }

  const etl::optional<progress::ProgressSample> sample =
      _progress.observe(event.text, _config.known_total_size, event.received_ms);
  if (sample.has_value()) {
    spdlog::info("{}", progress::ProgressEstimator::describe(sample.value()));
  } else {
    spdlog::info("Status from {}: {}", event.device, event.text);
  }

  if (_matcher.isNothingToTransfer(event.text)) {
    adoptTarget(event.device);
    _nothing_to_transfer = true;
    _fsm.nothingToTransfer();
    return;
  }
  if (_matcher.isSuccess(event.text)) {
    adoptTarget(event.device);
    _fsm.operationSucceeded();
  }
}

void Session::onError(const router::TopicEvent& event) {
  if (!isFromTarget(event.device)) {
    return;
  }
  if (!_matcher.isFailure(event.text)) {
    spdlog::warn("Error from {} (unrelated to this operation): {}", event.device, event.text);
    return;
  }
  adoptTarget(event.device);
  spdlog::error("Device {} reported: {}", event.device, event.text);
  _device_error = event.text;
  _fsm.deviceFailure();
}

void Session::onUnrecognized(const router::TopicEvent& event) {
  if (event.parse_failed) {
    return;
  }
  if (!event.device.empty() && event.device == _target &&
      event.topic.find(std::string("/") + topics::CATEGORY_LOGS) != std::string::npos) {
    spdlog::info("Log from {}: {}", event.device, event.text);
    return;
  }
  spdlog::trace("Ignoring {}", event.topic);
}

// ============================================================================
// TimerHandler
// ============================================================================
void Session::on_timer(scheduler::TimerId id) {
  if (id != scheduler::TIMER_SESSION_DEADLINE || _fsm.isTerminal()) {
    return;
  }
  spdlog::warn("No verdict from {} within {} ms", deviceLabel(_target), _config.timeout_ms);
  _fsm.deadlineExpired();
}

}  // namespace session
}  // namespace gridlink
