#include "mosquitto_transport.h"

#include <chrono>

#include <mosquitto.h>
#include <spdlog/spdlog.h>

#include "config/gridlink_config.h"

namespace gridlink {
namespace transport {

namespace {

// mosquitto_lib_init/cleanup are process-wide; count live clients.
std::mutex g_lib_mutex;
int g_lib_users = 0;

void libAcquire() {
  std::lock_guard<std::mutex> lock(g_lib_mutex);
  if (g_lib_users++ == 0) {
    mosquitto_lib_init();
  }
}

void libRelease() {
  std::lock_guard<std::mutex> lock(g_lib_mutex);
  if (--g_lib_users == 0) {
    mosquitto_lib_cleanup();
  }
}

}  // namespace

MosquittoTransport::MosquittoTransport(const config::BrokerConfig& config)
  : _config(config)
  , _mosq(nullptr)
  , _state_mutex()
  , _state_changed()
  , _connected(false)
  , _connack(-1)
  , _loop_running(false)
  , _filters()
  , _handler_mutex()
  , _handler()
  , _last_error()
{
  libAcquire();
}

MosquittoTransport::~MosquittoTransport() {
  disconnect();
  if (_mosq != nullptr) {
    mosquitto_destroy(_mosq);
    _mosq = nullptr;
  }
  libRelease();
}

bool MosquittoTransport::fail(const std::string& what, int rc) {
  _last_error = Error(ErrorCode::TRANSPORT, what + ": " + mosquitto_strerror(rc));
  spdlog::error("MQTT {}", _last_error.detail);
  return false;
}

bool MosquittoTransport::connect() {
  if (_mosq == nullptr) {
    const char* id = _config.client_id.empty() ? nullptr : _config.client_id.c_str();
    _mosq = mosquitto_new(id, true, this);
    if (_mosq == nullptr) {
      _last_error = Error(ErrorCode::TRANSPORT, "mosquitto_new failed");
      return false;
    }
    mosquitto_connect_callback_set(_mosq, &MosquittoTransport::onConnect);
    mosquitto_disconnect_callback_set(_mosq, &MosquittoTransport::onDisconnect);
    mosquitto_message_callback_set(_mosq, &MosquittoTransport::onMessage);
    const int delay_rc = mosquitto_reconnect_delay_set(_mosq, 1, 10, true);
    if (delay_rc != MOSQ_ERR_SUCCESS) {
      spdlog::debug("MQTT reconnect delay: {}", mosquitto_strerror(delay_rc));
    }
  }

  if (!_config.username.empty()) {
    const int rc = mosquitto_username_pw_set(
        _mosq, _config.username.c_str(),
        _config.password.empty() ? nullptr : _config.password.c_str());
    if (rc != MOSQ_ERR_SUCCESS) {
      return fail("credentials", rc);
    }
  }

  {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _connack = -1;
  }

  spdlog::info("Connecting to MQTT broker {}", _config.describe());
  int rc = mosquitto_connect_async(_mosq, _config.host.c_str(), _config.port, _config.keepalive_s);
  if (rc != MOSQ_ERR_SUCCESS) {
    return fail("connect to " + _config.describe(), rc);
  }
  rc = mosquitto_loop_start(_mosq);
  if (rc != MOSQ_ERR_SUCCESS) {
    return fail("loop start", rc);
  }

  std::unique_lock<std::mutex> lock(_state_mutex);
  _loop_running = true;
  const bool answered = _state_changed.wait_for(
      lock, std::chrono::milliseconds(GRIDLINK_CONNECT_TIMEOUT_MS),
      [this]() { return _connack >= 0; });
  if (!answered) {
    _last_error = Error(ErrorCode::TRANSPORT,
                        "no answer from broker " + _config.describe() + " within " +
                            std::to_string(GRIDLINK_CONNECT_TIMEOUT_MS) + " ms");
    lock.unlock();
    disconnect();
    return false;
  }
  if (_connack != 0) {
    _last_error = Error(ErrorCode::TRANSPORT,
                        std::string("broker refused connection: ") +
                            mosquitto_connack_string(_connack));
    lock.unlock();
    disconnect();
    return false;
  }
  spdlog::info("Connected to MQTT broker");
  return true;
}

void MosquittoTransport::disconnect() {
  if (_mosq == nullptr) {
    return;
  }
  bool stop_loop = false;
  {
    std::lock_guard<std::mutex> lock(_state_mutex);
    stop_loop = _loop_running;
    _loop_running = false;
    _connected = false;
    _filters.clear();
  }
  if (!stop_loop) {
    return;
  }
  const int rc = mosquitto_disconnect(_mosq);
  if (rc != MOSQ_ERR_SUCCESS && rc != MOSQ_ERR_NO_CONN) {
    spdlog::debug("MQTT disconnect: {}", mosquitto_strerror(rc));
  }
  const int loop_rc = mosquitto_loop_stop(_mosq, false);
  if (loop_rc != MOSQ_ERR_SUCCESS) {
    spdlog::debug("MQTT loop stop: {}", mosquitto_strerror(loop_rc));
  }
}

bool MosquittoTransport::isConnected() const {
  std::lock_guard<std::mutex> lock(_state_mutex);
  return _connected;
}

bool MosquittoTransport::subscribe(const std::string& filter) {
  if (_mosq == nullptr) {
    _last_error = Error(ErrorCode::TRANSPORT, "not connected");
    return false;
  }
  const int rc = mosquitto_subscribe(_mosq, nullptr, filter.c_str(), QOS);
  if (rc != MOSQ_ERR_SUCCESS) {
    return fail("subscribe " + filter, rc);
  }
  std::lock_guard<std::mutex> lock(_state_mutex);
  _filters.insert(filter);
  spdlog::debug("Subscribed to {}", filter);
  return true;
}

bool MosquittoTransport::unsubscribe(const std::string& filter) {
  if (_mosq == nullptr) {
    _last_error = Error(ErrorCode::TRANSPORT, "not connected");
    return false;
  }
  {
    std::lock_guard<std::mutex> lock(_state_mutex);
    _filters.erase(filter);
  }
  const int rc = mosquitto_unsubscribe(_mosq, nullptr, filter.c_str());
  if (rc != MOSQ_ERR_SUCCESS) {
    return fail("unsubscribe " + filter, rc);
  }
  return true;
}

bool MosquittoTransport::publish(const std::string& topic, const std::string& payload) {
  if (_mosq == nullptr) {
    _last_error = Error(ErrorCode::TRANSPORT, "not connected");
    return false;
  }
  const int rc = mosquitto_publish(_mosq, nullptr, topic.c_str(), static_cast<int>(payload.size()),
                                   payload.data(), QOS, false);
  if (rc != MOSQ_ERR_SUCCESS) {
    return fail("publish " + topic, rc);
  }
  spdlog::debug("Published to {}: {}", topic, payload);
  return true;
}

void MosquittoTransport::setMessageHandler(const MessageHandler& handler) {
  std::lock_guard<std::mutex> lock(_handler_mutex);
  _handler = handler;
}

void MosquittoTransport::onConnect(struct mosquitto* mosq, void* obj, int rc) {
  MosquittoTransport* self = static_cast<MosquittoTransport*>(obj);
  std::set<std::string> filters;
  {
    std::lock_guard<std::mutex> lock(self->_state_mutex);
    self->_connack = rc;
    self->_connected = (rc == 0);
    filters = self->_filters;
  }
  self->_state_changed.notify_all();

  if (rc != 0) {
    return;
  }
  // Clean session: the broker forgot our subscriptions.
  for (std::set<std::string>::const_iterator it = filters.begin(); it != filters.end(); ++it) {
    const int sub_rc = mosquitto_subscribe(mosq, nullptr, it->c_str(), QOS);
    if (sub_rc != MOSQ_ERR_SUCCESS) {
      spdlog::warn("Re-subscribe to {} failed: {}", *it, mosquitto_strerror(sub_rc));
    }
  }
}

void MosquittoTransport::onDisconnect(struct mosquitto*, void* obj, int rc) {
  MosquittoTransport* self = static_cast<MosquittoTransport*>(obj);
  {
    std::lock_guard<std::mutex> lock(self->_state_mutex);
    self->_connected = false;
  }
  if (rc != 0) {
    spdlog::warn("Lost connection to MQTT broker ({}), reconnecting", mosquitto_strerror(rc));
  }
}

void MosquittoTransport::onMessage(struct mosquitto*, void* obj,
                                   const struct mosquitto_message* msg) {
  MosquittoTransport* self = static_cast<MosquittoTransport*>(obj);
  if (msg == nullptr || msg->topic == nullptr) {
    return;
  }
  const std::string topic(msg->topic);
  const std::string payload =
      msg->payloadlen > 0
          ? std::string(static_cast<const char*>(msg->payload), static_cast<size_t>(msg->payloadlen))
          : std::string();

  std::lock_guard<std::mutex> lock(self->_handler_mutex);
  if (self->_handler.is_valid()) {
    self->_handler(topic, payload);
  }
}

}  // namespace transport
}  // namespace gridlink
