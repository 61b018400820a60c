/**
 * @file topic_router.h
 * @brief ETL-based Topic Router for the GridLink host tools
 *
 * Classifies a raw (topic, payload) pair delivered by the messaging
 * transport into one event kind and dispatches it through ETL's
 * message_router to an ITopicHandler.
 *
 * Topic layout: <namespace>/<device-id>/<category>[/<subtype>...]
 *
 * Event Kinds (Message IDs):
 *   - MSG_TELEMETRY (0):    category "measurement"
 *   - MSG_HEADER (1):       category "coredump", topic contains "/header"
 *   - MSG_CHUNK (2):        category "coredump", topic contains "/chunk/"
 *   - MSG_COMPLETE (3):     category "coredump", topic contains "/complete"
 *   - MSG_STATUS (4):       category "status", payload is free text
 *   - MSG_ERROR (5):        category "error", payload is free text
 *   - MSG_UNRECOGNIZED (6): anything else, including payloads that do not
 *                           parse as JSON where JSON is expected
 *
 * Matching is by category segment equality plus substring presence, not by
 * a full topic grammar: firmware revisions disagree on segment depth.
 */
#ifndef GRIDLINK_TOPIC_ROUTER_H
#define GRIDLINK_TOPIC_ROUTER_H

#include <stdint.h>
#include <string>

#include <nlohmann/json.hpp>

#include "etl/message.h"
#include "etl/message_router.h"

namespace gridlink {
namespace router {

// ============================================================================
// Message IDs - One per event kind
// ============================================================================
enum MessageId : etl::message_id_t {
  MSG_TELEMETRY = 0,
  MSG_HEADER = 1,
  MSG_CHUNK = 2,
  MSG_COMPLETE = 3,
  MSG_STATUS = 4,
  MSG_ERROR = 5,
  MSG_UNRECOGNIZED = 6,
  NUMBER_OF_MESSAGES = 7
};

const char* toString(MessageId kind);

// ============================================================================
// Classified event
// ============================================================================
struct TopicEvent {
  MessageId kind;
  std::string device;      // empty when the topic carries no device segment
  std::string topic;
  std::string text;        // raw payload (status/error text, or JSON source)
  nlohmann::json body;     // parsed payload for header/chunk/complete
  uint64_t received_ms;
  bool parse_failed;       // JSON expected but payload did not parse

  TopicEvent()
      : kind(MSG_UNRECOGNIZED), device(), topic(), text(), body(),
        received_ms(0), parse_failed(false) {}

  bool isCoreDump() const {
    return kind == MSG_HEADER || kind == MSG_CHUNK || kind == MSG_COMPLETE;
  }
};

// ============================================================================
// Kind-specific Messages
// ============================================================================
// Pointer to avoid copying JSON documents during routing
struct MsgTelemetry : public etl::message<MSG_TELEMETRY> {
  const TopicEvent* event;
  explicit MsgTelemetry(const TopicEvent& e) : event(&e) {}
};

struct MsgHeader : public etl::message<MSG_HEADER> {
  const TopicEvent* event;
  explicit MsgHeader(const TopicEvent& e) : event(&e) {}
};

struct MsgChunk : public etl::message<MSG_CHUNK> {
  const TopicEvent* event;
  explicit MsgChunk(const TopicEvent& e) : event(&e) {}
};

struct MsgComplete : public etl::message<MSG_COMPLETE> {
  const TopicEvent* event;
  explicit MsgComplete(const TopicEvent& e) : event(&e) {}
};

struct MsgStatus : public etl::message<MSG_STATUS> {
  const TopicEvent* event;
  explicit MsgStatus(const TopicEvent& e) : event(&e) {}
};

struct MsgError : public etl::message<MSG_ERROR> {
  const TopicEvent* event;
  explicit MsgError(const TopicEvent& e) : event(&e) {}
};

struct MsgUnrecognized : public etl::message<MSG_UNRECOGNIZED> {
  const TopicEvent* event;
  explicit MsgUnrecognized(const TopicEvent& e) : event(&e) {}
};

// ============================================================================
// Handler Interface - Sessions and the discovery registry implement this
// ============================================================================
class ITopicHandler {
public:
  virtual ~ITopicHandler() {}
  virtual void onTelemetry(const TopicEvent& event) = 0;
  virtual void onHeader(const TopicEvent& event) = 0;
  virtual void onChunk(const TopicEvent& event) = 0;
  virtual void onComplete(const TopicEvent& event) = 0;
  virtual void onStatus(const TopicEvent& event) = 0;
  virtual void onError(const TopicEvent& event) = 0;
  virtual void onUnrecognized(const TopicEvent& event) { (void)event; }
};

// ============================================================================
// Topic Router - ETL message_router for event dispatch
// ============================================================================
class TopicRouter : public etl::message_router<TopicRouter,
                                                MsgTelemetry,
                                                MsgHeader,
                                                MsgChunk,
                                                MsgComplete,
                                                MsgStatus,
                                                MsgError,
                                                MsgUnrecognized>
{
public:
  explicit TopicRouter(const std::string& ns);

  void setHandler(ITopicHandler* handler) {
    _handler = handler;
  }

  const std::string& topicNamespace() const { return _namespace; }

  /**
   * @brief Classify a raw message. Never throws.
   *
   * A JSON parse failure on a core dump topic yields MSG_UNRECOGNIZED with
   * parse_failed set; the failure is logged and counted.
   */
  TopicEvent classify(const std::string& topic, const std::string& payload,
                      uint64_t received_ms);

  // Route a classified event to the appropriate handler
  void route(const TopicEvent& event);

  // classify() followed by route(); returns the classified event
  TopicEvent dispatch(const std::string& topic, const std::string& payload,
                      uint64_t received_ms);

  uint32_t parseErrors() const { return _parse_errors; }

  // ETL message handlers - dispatch to ITopicHandler
  void on_receive(const MsgTelemetry& msg)    { if (_handler) _handler->onTelemetry(*msg.event); }
  void on_receive(const MsgHeader& msg)       { if (_handler) _handler->onHeader(*msg.event); }
  void on_receive(const MsgChunk& msg)        { if (_handler) _handler->onChunk(*msg.event); }
  void on_receive(const MsgComplete& msg)     { if (_handler) _handler->onComplete(*msg.event); }
  void on_receive(const MsgStatus& msg)       { if (_handler) _handler->onStatus(*msg.event); }
  void on_receive(const MsgError& msg)        { if (_handler) _handler->onError(*msg.event); }
  void on_receive(const MsgUnrecognized& msg) { if (_handler) _handler->onUnrecognized(*msg.event); }

  void on_receive_unknown(const etl::imessage&) {
    // Should not happen - all kinds are handled
  }

private:
  static constexpr etl::message_router_id_t ROUTER_ID = 1;
  std::string _namespace;
  ITopicHandler* _handler;
  uint32_t _parse_errors;
};

}  // namespace router
}  // namespace gridlink

#endif  // GRIDLINK_TOPIC_ROUTER_H
