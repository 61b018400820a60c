#include "device_registry.h"

#include <algorithm>
#include <chrono>
#include <thread>

#include <spdlog/spdlog.h>

#include "config/gridlink_config.h"
#include "protocol/topics.h"

namespace gridlink {
namespace discovery {

namespace {

std::vector<std::string> sortedCopy(const std::vector<std::string>& ids) {
  std::vector<std::string> out(ids);
  std::sort(out.begin(), out.end());
  return out;
}

}  // namespace

SelectionPolicy SelectionPolicy::firstFound() {
  SelectionPolicy p;
  p.kind = FIRST_FOUND;
  p.candidate_index = 0;
  return p;
}

SelectionPolicy SelectionPolicy::explicitDevice(const std::string& id) {
  SelectionPolicy p;
  p.kind = EXPLICIT;
  p.device_id = id;
  p.candidate_index = 0;
  return p;
}

SelectionPolicy SelectionPolicy::interactive(size_t index) {
  SelectionPolicy p;
  p.kind = INTERACTIVE;
  p.candidate_index = index;
  return p;
}

DeviceRegistry::DeviceRegistry(const std::string& ns, scheduler::MillisFn clock)
    : _mutex(),
      _router(ns),
      _timers(),
      _ticker(clock),
      _devices(),
      _selected(),
      _locked(false),
      _window_open(false),
      _window_expired(false),
      _early_stop(false),
      _window_started_ms(0),
      _added(false) {
  _router.setHandler(this);
}

void DeviceRegistry::beginWindow(uint64_t window_ms, bool early_stop) {
  std::lock_guard<std::mutex> guard(_mutex);
  if (!_locked) {
    _devices.clear();
  }
  _early_stop = early_stop;
  _window_open = true;
  _window_expired = false;
  _ticker.reset();
  _window_started_ms = _ticker.now();
  _timers.register_timer(this, scheduler::TIMER_DISCOVERY_WINDOW, window_ms, false);
}

bool DeviceRegistry::isOpenLocked() const {
  if (!_window_open || _window_expired) {
    return false;
  }
  return !(_early_stop && !_devices.empty());
}

bool DeviceRegistry::observe(const std::string& topic, const std::string& payload) {
  std::lock_guard<std::mutex> guard(_mutex);
  _ticker.advance(_timers);
  if (!isOpenLocked()) {
    return false;
  }
  _added = false;
  _router.dispatch(topic, payload, _ticker.now());
  return _added;
}

bool DeviceRegistry::windowClosed() {
  std::lock_guard<std::mutex> guard(_mutex);
  _ticker.advance(_timers);
  return !isOpenLocked();
}

void DeviceRegistry::onMessage(const std::string& topic, const std::string& payload) {
  observe(topic, payload);
}

bool DeviceRegistry::discover(transport::ITransport& client, uint64_t window_ms,
                              bool early_stop, Error& error) {
  const std::string filter =
      topics::anyDeviceTopic(_router.topicNamespace(), topics::CATEGORY_MEASUREMENT);

  beginWindow(window_ms, early_stop);
  client.setMessageHandler(
      transport::MessageHandler::create<DeviceRegistry, &DeviceRegistry::onMessage>(*this));
  if (!client.subscribe(filter)) {
    client.setMessageHandler(transport::MessageHandler());
    error = Error(ErrorCode::TRANSPORT,
                  "subscribe to " + filter + " failed: " + client.lastError().detail);
    return false;
  }

  spdlog::info("Discovering devices for up to {:.1f} s...", static_cast<double>(window_ms) / 1000.0);
  while (!windowClosed()) {
    std::this_thread::sleep_for(std::chrono::milliseconds(GRIDLINK_DISCOVERY_POLL_MS));
  }

  if (!client.unsubscribe(filter)) {
    spdlog::warn("Unsubscribe from {} failed: {}", filter, client.lastError().detail);
  }
  client.setMessageHandler(transport::MessageHandler());

  const std::vector<std::string> found = devices();
  if (found.empty()) {
    error = Error(ErrorCode::NO_DEVICE, "no devices published telemetry on " + filter);
    return false;
  }
  spdlog::info("Found {} device(s)", found.size());
  return true;
}

std::vector<std::string> DeviceRegistry::devices() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return _devices;
}

std::vector<std::string> DeviceRegistry::candidates() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return sortedCopy(_devices);
}

etl::optional<std::string> DeviceRegistry::select(const SelectionPolicy& policy, Error& error) {
  std::lock_guard<std::mutex> guard(_mutex);
  if (_locked) {
    error = Error(ErrorCode::CONFIG, "device selection is locked");
    return etl::optional<std::string>();
  }

  switch (policy.kind) {
    case SelectionPolicy::FIRST_FOUND:
      if (_devices.empty()) {
        error = Error(ErrorCode::NO_DEVICE, "no devices discovered");
        return etl::optional<std::string>();
      }
      _selected = _devices.front();
      break;
    case SelectionPolicy::EXPLICIT:
      if (policy.device_id.empty()) {
        error = Error(ErrorCode::CONFIG, "no device id given");
        return etl::optional<std::string>();
      }
      _selected = policy.device_id;
      break;
    case SelectionPolicy::INTERACTIVE: {
      const std::vector<std::string> sorted = sortedCopy(_devices);
      if (policy.candidate_index >= sorted.size()) {
        error = Error(ErrorCode::CONFIG, "selection " + std::to_string(policy.candidate_index + 1) +
                                             " is out of range");
        return etl::optional<std::string>();
      }
      _selected = sorted[policy.candidate_index];
      break;
    }
  }
  return _selected;
}

void DeviceRegistry::lock() {
  std::lock_guard<std::mutex> guard(_mutex);
  _locked = true;
}

bool DeviceRegistry::isLocked() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return _locked;
}

etl::optional<std::string> DeviceRegistry::selected() const {
  std::lock_guard<std::mutex> guard(_mutex);
  return _selected;
}

// Called from _router.dispatch() with _mutex held.
void DeviceRegistry::onTelemetry(const router::TopicEvent& event) {
  if (std::find(_devices.begin(), _devices.end(), event.device) != _devices.end()) {
    return;
  }
  _devices.push_back(event.device);
  _added = true;
  const uint64_t after = event.received_ms - _window_started_ms;
  spdlog::info("Discovered device {} after {:.1f} s", event.device,
               static_cast<double>(after) / 1000.0);
}

// Called from _ticker.advance() with _mutex held.
void DeviceRegistry::on_timer(scheduler::TimerId id) {
  if (id == scheduler::TIMER_DISCOVERY_WINDOW) {
    _window_expired = true;
  }
}

}  // namespace discovery
}  // namespace gridlink
