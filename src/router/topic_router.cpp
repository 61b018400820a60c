#include "topic_router.h"

#include <vector>

#include <spdlog/spdlog.h>

#include "protocol/payloads.h"
#include "protocol/topics.h"
#include "util/string_utils.h"

namespace gridlink {
namespace router {

const char* toString(MessageId kind) {
  switch (kind) {
    case MSG_TELEMETRY:    return "telemetry";
    case MSG_HEADER:       return "header";
    case MSG_CHUNK:        return "chunk";
    case MSG_COMPLETE:     return "complete";
    case MSG_STATUS:       return "status";
    case MSG_ERROR:        return "error";
    case MSG_UNRECOGNIZED: return "unrecognized";
    default:               break;
  }
  return "unknown";
}

TopicRouter::TopicRouter(const std::string& ns)
  : message_router(ROUTER_ID)
  , _namespace(ns)
  , _handler(nullptr)
  , _parse_errors(0)
{
}

TopicEvent TopicRouter::classify(const std::string& topic, const std::string& payload,
                                 uint64_t received_ms) {
  TopicEvent event;
  event.topic = topic;
  event.text = payload;
  event.received_ms = received_ms;

  const std::vector<std::string> segments = util::split(util::view(topic), '/');
  if (segments.size() < topics::MIN_SEGMENTS) {
    return event;
  }
  if (segments[topics::NAMESPACE_SEGMENT] != _namespace) {
    return event;
  }
  event.device = segments[topics::DEVICE_SEGMENT];
  if (event.device.empty()) {
    return event;
  }

  const std::string& category = segments[topics::CATEGORY_SEGMENT];

  if (category == topics::CATEGORY_MEASUREMENT) {
    event.kind = MSG_TELEMETRY;
    return event;
  }
  if (category == topics::CATEGORY_STATUS) {
    event.kind = MSG_STATUS;
    return event;
  }
  if (category == topics::CATEGORY_ERROR) {
    event.kind = MSG_ERROR;
    return event;
  }
  if (category != topics::CATEGORY_COREDUMP) {
    // command echoes, device logs, system info: not session events
    return event;
  }

  MessageId kind = MSG_UNRECOGNIZED;
  const etl::string_view t = util::view(topic);
  if (util::contains(t, topics::COREDUMP_HEADER_MARKER)) {
    kind = MSG_HEADER;
  } else if (util::contains(t, topics::COREDUMP_CHUNK_MARKER)) {
    kind = MSG_CHUNK;
  } else if (util::contains(t, topics::COREDUMP_COMPLETE_MARKER)) {
    kind = MSG_COMPLETE;
  }
  if (kind == MSG_UNRECOGNIZED) {
    return event;
  }

  std::string error;
  if (!payloads::parseJson(payload, event.body, error)) {
    _parse_errors++;
    event.parse_failed = true;
    spdlog::warn("Failed to parse JSON from topic {}: {}", topic, error);
    return event;
  }
  event.kind = kind;
  return event;
}

void TopicRouter::route(const TopicEvent& event) {
  switch (event.kind) {
    case MSG_TELEMETRY: receive(MsgTelemetry(event));    break;
    case MSG_HEADER:    receive(MsgHeader(event));       break;
    case MSG_CHUNK:     receive(MsgChunk(event));        break;
    case MSG_COMPLETE:  receive(MsgComplete(event));     break;
    case MSG_STATUS:    receive(MsgStatus(event));       break;
    case MSG_ERROR:     receive(MsgError(event));        break;
    default:            receive(MsgUnrecognized(event)); break;
  }
}

TopicEvent TopicRouter::dispatch(const std::string& topic, const std::string& payload,
                                 uint64_t received_ms) {
  TopicEvent event = classify(topic, payload, received_ms);
  route(event);
  return event;
}

}  // namespace router
}  // namespace gridlink
