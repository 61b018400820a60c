/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_EVENT_QUEUE_H
#define GRIDLINK_EVENT_QUEUE_H

#include <stddef.h>
#include <stdint.h>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace gridlink {
namespace session {

struct QueuedEvent {
  enum Kind : uint8_t {
    MESSAGE = 0,   // raw (topic, payload) from the transport
    DEADLINE = 1,  // watchdog saw the deadline pass
    ABORT = 2      // caller cancellation
  };

  Kind kind;
  std::string topic;
  std::string payload;
  uint64_t received_ms;

  QueuedEvent() : kind(MESSAGE), topic(), payload(), received_ms(0) {}

  static QueuedEvent message(const std::string& topic, const std::string& payload,
                             uint64_t now_ms) {
    QueuedEvent e;
    e.kind = MESSAGE;
    e.topic = topic;
    e.payload = payload;
    e.received_ms = now_ms;
    return e;
  }

  static QueuedEvent control(Kind kind, uint64_t now_ms) {
    QueuedEvent e;
    e.kind = kind;
    e.received_ms = now_ms;
    return e;
  }
};

/**
 * Multi-producer, single-consumer FIFO.
 *
 * Producers are the transport delivery thread, the deadline watchdog and
 * whoever calls abort(); only the session's consumer pops.
 */
class EventQueue {
 public:
  EventQueue() : _mutex(), _ready(), _events() {}

  void push(const QueuedEvent& event) {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _events.push_back(event);
    }
    _ready.notify_one();
  }

  bool tryPop(QueuedEvent& out) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (_events.empty()) {
      return false;
    }
    out = _events.front();
    _events.pop_front();
    return true;
  }

  // Blocks until an event is available.
  void waitPop(QueuedEvent& out) {
    std::unique_lock<std::mutex> lock(_mutex);
    _ready.wait(lock, [this]() { return !_events.empty(); });
    out = _events.front();
    _events.pop_front();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _events.size();
  }

 private:
  mutable std::mutex _mutex;
  std::condition_variable _ready;
  std::deque<QueuedEvent> _events;
};

}  // namespace session
}  // namespace gridlink

#endif  // GRIDLINK_EVENT_QUEUE_H
