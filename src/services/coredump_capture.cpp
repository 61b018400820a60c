#include "coredump_capture.h"

#include <vector>

#include <spdlog/spdlog.h>

#include "protocol/topics.h"
#include "services/session_binding.h"
#include "storage/message_log.h"
#include "text/status_matcher.h"

namespace gridlink {
namespace services {

namespace {

std::string coreDumpSegment() {
  return std::string("/") + topics::CATEGORY_COREDUMP;
}

}  // namespace

CoreDumpCapture::CoreDumpCapture(const CaptureOptions& options, scheduler::MillisFn clock)
  : _options(options)
  , _clock(clock)
{
}

session::SessionConfig CoreDumpCapture::sessionConfig() const {
  session::SessionConfig config;
  config.topic_namespace = _options.topic_namespace;
  config.target_device = _options.device;
  config.timeout_ms = _options.timeout_ms;
  config.collect_transfer = true;
  config.cancel_flag = _options.cancel_flag;
  return config;
}

bool CoreDumpCapture::captureLive(transport::ITransport& client, CoreDumpOutcome& outcome) {
  outcome = CoreDumpOutcome();

  const text::KeywordStatusMatcher matcher(text::coreDumpRules());
  session::Session session(sessionConfig(), matcher, _clock);
  const uint64_t started_ms = _clock();
  const uint64_t started_unix = scheduler::unixSeconds();
  session.start();

  SessionBinding binding(client, session);
  if (!binding.attach(topics::sessionFilters(_options.topic_namespace, _options.device, true),
                      outcome.error)) {
    spdlog::error("Cannot listen for core dumps: {}", outcome.error.detail);
    return false;
  }
  spdlog::info("Listening for core dump messages on {} for {} s",
               topics::coreDumpFilter(_options.topic_namespace, _options.device),
               _options.timeout_ms / 1000);

  outcome.session = session.waitForVerdict();
  binding.release();

  record(session, started_ms, started_unix);
  return finish(session, outcome);
}

bool CoreDumpCapture::replay(const std::string& log_path, CoreDumpOutcome& outcome) {
  outcome = CoreDumpOutcome();

  std::vector<storage::LoggedMessage> messages;
  if (!storage::loadMessageLog(log_path, messages, outcome.error)) {
    spdlog::error("Cannot replay {}: {}", log_path, outcome.error.detail);
    return false;
  }

  const text::KeywordStatusMatcher matcher(text::coreDumpRules());
  session::Session session(sessionConfig(), matcher, _clock);
  session.start();

  const std::string segment = coreDumpSegment();
  size_t replayed = 0;
  for (size_t i = 0; i < messages.size(); ++i) {
    if (messages[i].topic.find(segment) == std::string::npos) {
      continue;
    }
    session.post(messages[i].topic, messages[i].payload);
    replayed++;
  }
  session.pump();
  spdlog::info("Replayed {} of {} logged messages from {}", replayed, messages.size(), log_path);

  outcome.session = session.result();
  return finish(session, outcome);
}

bool CoreDumpCapture::finish(const session::Session& session, CoreDumpOutcome& outcome) {
  const session::SessionResult& result = outcome.session;
  if (result.succeeded()) {
    if (result.nothing_to_transfer) {
      spdlog::info("Device {} has no core dump stored", result.target_device);
      return true;
    }
    return saveSessionDump(session, _options.output_path, outcome);
  }

  // Every chunk present but no completion signal seen.
  const bool unfinished = !session.isTerminal() || result.state == fsm::STATE_TIMED_OUT;
  if (unfinished && session.buffer().isComplete()) {
    spdlog::warn("No completion signal from {}, saving the {} chunks received",
                 result.target_device.empty() ? "the device" : result.target_device.c_str(),
                 result.chunks_received);
    outcome.error = Error();
    return saveSessionDump(session, _options.output_path, outcome);
  }

  if (session.isTerminal()) {
    outcome.error = session::toError(result);
  } else if (!session.buffer().hasStarted()) {
    outcome.error = Error(ErrorCode::INCOMPLETE_TRANSFER, "no core dump messages found");
  } else {
    outcome.error = Error(ErrorCode::INCOMPLETE_TRANSFER,
                          std::to_string(result.chunks_received) + "/" +
                              std::to_string(result.chunks_declared) + " chunks, missing " +
                              transfer::formatRanges(result.missing));
  }
  spdlog::error("Core dump capture failed: {}", outcome.error.detail);
  return false;
}

void CoreDumpCapture::record(const session::Session& session, uint64_t started_ms,
                             uint64_t started_unix) {
  if (_options.record_path.empty()) {
    return;
  }
  const std::vector<session::AuditEntry>& audit = session.auditLog();
  std::vector<storage::LoggedMessage> messages;
  messages.reserve(audit.size());
  for (size_t i = 0; i < audit.size(); ++i) {
    storage::LoggedMessage message;
    message.topic = audit[i].topic;
    message.payload = audit[i].payload;
    const uint64_t offset_ms =
        audit[i].received_ms > started_ms ? audit[i].received_ms - started_ms : 0;
    message.timestamp = static_cast<double>(started_unix) + offset_ms / 1000.0;
    messages.push_back(message);
  }

  Error error;
  if (!storage::saveMessageLog(_options.record_path, messages, error)) {
    spdlog::warn("Message log not saved: {}", error.detail);
    return;
  }
  spdlog::info("Recorded {} messages to {}", messages.size(), _options.record_path);
}

}  // namespace services
}  // namespace gridlink
