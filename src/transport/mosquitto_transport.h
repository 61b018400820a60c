/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_MOSQUITTO_TRANSPORT_H
#define GRIDLINK_MOSQUITTO_TRANSPORT_H

#include <condition_variable>
#include <mutex>
#include <set>
#include <string>

#include "config/broker_config.h"
#include "transport/transport.h"

struct mosquitto;
struct mosquitto_message;

namespace gridlink {
namespace transport {

/**
 * ITransport over libmosquitto.
 *
 * The network loop runs on libmosquitto's own thread (loop_start), which is
 * also the delivery thread for the message handler. Subscriptions are
 * remembered and restored after a reconnect.
 */
class MosquittoTransport : public ITransport {
 public:
  explicit MosquittoTransport(const config::BrokerConfig& config);
  ~MosquittoTransport();

  bool connect() override;
  void disconnect() override;
  bool isConnected() const override;

  bool subscribe(const std::string& filter) override;
  bool unsubscribe(const std::string& filter) override;
  bool publish(const std::string& topic, const std::string& payload) override;

  void setMessageHandler(const MessageHandler& handler) override;

  const Error& lastError() const override { return _last_error; }

 private:
  MosquittoTransport(const MosquittoTransport&);
  MosquittoTransport& operator=(const MosquittoTransport&);

  static void onConnect(struct mosquitto* mosq, void* obj, int rc);
  static void onDisconnect(struct mosquitto* mosq, void* obj, int rc);
  static void onMessage(struct mosquitto* mosq, void* obj, const struct mosquitto_message* msg);

  bool fail(const std::string& what, int rc);

  static const int QOS = 1;

  config::BrokerConfig _config;
  struct mosquitto* _mosq;

  mutable std::mutex _state_mutex;
  std::condition_variable _state_changed;
  bool _connected;
  int _connack;          // -1 until the broker answers
  bool _loop_running;
  std::set<std::string> _filters;

  std::mutex _handler_mutex;
  MessageHandler _handler;

  Error _last_error;
};

}  // namespace transport
}  // namespace gridlink

#endif  // GRIDLINK_MOSQUITTO_TRANSPORT_H
