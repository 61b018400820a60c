/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_DEVICE_REGISTRY_H
#define GRIDLINK_DEVICE_REGISTRY_H

#include <stddef.h>
#include <stdint.h>
#include <mutex>
#include <string>
#include <vector>

#include <etl/optional.h>

#include "gridlink_error.h"
#include "router/topic_router.h"
#include "scheduler/session_scheduler.h"
#include "transport/transport.h"

namespace gridlink {
namespace discovery {

struct SelectionPolicy {
  enum Kind : uint8_t {
    FIRST_FOUND = 0,  // earliest sighting in the window
    EXPLICIT = 1,     // caller-supplied id, discovery not needed
    INTERACTIVE = 2   // operator picked an entry of candidates()
  };

  Kind kind;
  std::string device_id;     // EXPLICIT
  size_t candidate_index;    // INTERACTIVE, index into candidates()

  static SelectionPolicy firstFound();
  static SelectionPolicy explicitDevice(const std::string& id);
  static SelectionPolicy interactive(size_t index);
};

/**
 * Passive device discovery from telemetry sightings.
 *
 * Devices are collected only while a window is open. With early stop the
 * window closes at the first sighting. Selection is immutable after lock().
 *
 * observe() may be called from the transport delivery thread; everything
 * is guarded by one mutex.
 */
class DeviceRegistry : public router::ITopicHandler, public scheduler::TimerHandler {
 public:
  DeviceRegistry(const std::string& ns, scheduler::MillisFn clock);

  void beginWindow(uint64_t window_ms, bool early_stop);

  // Record one raw message. Returns true if it added a new device.
  bool observe(const std::string& topic, const std::string& payload);

  // Advances the window timer; true once the window is over.
  bool windowClosed();

  /**
   * @brief Blocking discovery over a transport.
   *
   * Subscribes to <ns>/+/measurement, waits for the window, unsubscribes.
   * @return false with NO_DEVICE when nothing was seen, TRANSPORT when the
   *         subscription fails.
   */
  bool discover(transport::ITransport& client, uint64_t window_ms, bool early_stop,
                Error& error);

  // Arrival order.
  std::vector<std::string> devices() const;

  // Sorted, for display to an operator.
  std::vector<std::string> candidates() const;

  etl::optional<std::string> select(const SelectionPolicy& policy, Error& error);

  void lock();
  bool isLocked() const;
  etl::optional<std::string> selected() const;

  // ITopicHandler: only telemetry is a sighting.
  void onTelemetry(const router::TopicEvent& event) override;
  void onHeader(const router::TopicEvent&) override {}
  void onChunk(const router::TopicEvent&) override {}
  void onComplete(const router::TopicEvent&) override {}
  void onStatus(const router::TopicEvent&) override {}
  void onError(const router::TopicEvent&) override {}

  // TimerHandler
  void on_timer(scheduler::TimerId id) override;

 private:
  void onMessage(const std::string& topic, const std::string& payload);
  bool isOpenLocked() const;

  mutable std::mutex _mutex;
  router::TopicRouter _router;
  scheduler::TimerService _timers;
  scheduler::ClockTicker _ticker;

  std::vector<std::string> _devices;
  etl::optional<std::string> _selected;
  bool _locked;
  bool _window_open;
  bool _window_expired;
  bool _early_stop;
  uint64_t _window_started_ms;
  bool _added;
};

}  // namespace discovery
}  // namespace gridlink

#endif  // GRIDLINK_DEVICE_REGISTRY_H
