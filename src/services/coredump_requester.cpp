#include "coredump_requester.h"

#include <vector>

#include <spdlog/spdlog.h>

#include "discovery/device_registry.h"
#include "protocol/payloads.h"
#include "protocol/topics.h"
#include "services/session_binding.h"
#include "storage/artifact_writer.h"
#include "text/status_matcher.h"

namespace gridlink {
namespace services {

bool saveSessionDump(const session::Session& session, const std::string& output_path,
                     CoreDumpOutcome& outcome) {
  std::vector<uint8_t> bytes;
  if (!session.buffer().materialize(bytes)) {
    outcome.error = session.buffer().lastError();
    spdlog::error("Core dump cannot be reassembled: {}", outcome.error.detail);
    return false;
  }

  const std::string path =
      output_path.empty()
          ? storage::defaultArtifactName(outcome.session.target_device, scheduler::unixSeconds())
          : output_path;
  if (!storage::saveArtifact(path, bytes, session.buffer().header(), outcome.error)) {
    return false;
  }
  outcome.artifact_path = path;
  outcome.artifact_bytes = bytes.size();
  return true;
}

CoreDumpRequester::CoreDumpRequester(transport::ITransport& client,
                                     const CoreDumpRequestOptions& options,
                                     scheduler::MillisFn clock)
  : _client(client)
  , _options(options)
  , _clock(clock)
{
}

bool CoreDumpRequester::resolveTargets(std::vector<std::string>& targets, Error& error) {
  if (!_options.device.empty()) {
    targets.push_back(_options.device);
    return true;
  }
  if (!_options.any_device) {
    error = Error(ErrorCode::CONFIG, "either a device id or any-device mode is required");
    return false;
  }

  discovery::DeviceRegistry registry(_options.topic_namespace, _clock);
  if (!registry.discover(_client, _options.discovery_window_ms, false, error)) {
    return false;
  }
  targets = registry.devices();
  return true;
}

bool CoreDumpRequester::run(CoreDumpOutcome& outcome) {
  outcome = CoreDumpOutcome();

  std::vector<std::string> targets;
  if (!resolveTargets(targets, outcome.error)) {
    spdlog::error("Core dump request not sent: {}", outcome.error.detail);
    return false;
  }

  session::SessionConfig config;
  config.topic_namespace = _options.topic_namespace;
  config.target_device = _options.device;
  config.timeout_ms = _options.timeout_ms;
  config.collect_transfer = true;
  config.cancel_flag = _options.cancel_flag;

  const text::KeywordStatusMatcher matcher(text::coreDumpRules());
  session::Session session(config, matcher, _clock);
  session.start();

  SessionBinding binding(_client, session);
  if (!binding.attach(topics::sessionFilters(_options.topic_namespace, _options.device, true),
                      outcome.error)) {
    spdlog::error("Cannot listen for the core dump: {}", outcome.error.detail);
    return false;
  }

  for (size_t i = 0; i < targets.size(); ++i) {
    const std::string topic =
        topics::deviceTopic(_options.topic_namespace, targets[i], topics::CATEGORY_COMMAND);
    spdlog::info("Requesting core dump from {} (timeout {} s)", targets[i],
                 _options.timeout_ms / 1000);
    if (!_client.publish(topic, payloads::COMMAND_COREDUMP)) {
      outcome.error = _client.lastError();
      spdlog::error("Core dump command not sent: {}", outcome.error.detail);
      return false;
    }
  }
  session.markCommandPublished();

  outcome.session = session.waitForVerdict();
  binding.release();

  outcome.error = session::toError(outcome.session);
  if (!outcome.error.ok()) {
    return false;
  }
  if (outcome.session.nothing_to_transfer) {
    spdlog::info("Device {} has no core dump stored", outcome.session.target_device);
    return true;
  }
  return saveSessionDump(session, _options.output_path, outcome);
}

}  // namespace services
}  // namespace gridlink
