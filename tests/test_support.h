#pragma once

#include <stddef.h>
#include <stdint.h>
#include <stdio.h>
#include <stdlib.h>
#include <string.h>
#include <unistd.h>

#include <atomic>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <vector>

#include "gridlink_error.h"
#include "protocol/topics.h"
#include "transport/transport.h"

#define TEST_ASSERT(cond)                                                      \
  do {                                                                         \
    if (!(cond)) {                                                             \
      fprintf(stderr, "[FATAL] Assertion failed at %s:%d: %s\n", __FILE__,   \
              __LINE__, #cond);                                                \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define TEST_ASSERT_EQ_UINT(actual, expected)                                  \
  do {                                                                         \
    const unsigned long _a = (unsigned long)(actual);                          \
    const unsigned long _e = (unsigned long)(expected);                        \
    if (_a != _e) {                                                            \
      fprintf(stderr,                                                          \
              "[FATAL] Assertion failed at %s:%d: %s == %s (got %lu, exp %lu)\n", \
              __FILE__, __LINE__, #actual, #expected, _a, _e);                 \
      abort();                                                                 \
    }                                                                          \
  } while (0)

#define TEST_ASSERT_EQ_STR(actual, expected)                                   \
  do {                                                                         \
    const std::string _a = (actual);                                           \
    const std::string _e = (expected);                                         \
    if (_a != _e) {                                                            \
      fprintf(stderr,                                                          \
              "[FATAL] Assertion failed at %s:%d: %s == %s (got \"%s\", exp \"%s\")\n", \
              __FILE__, __LINE__, #actual, #expected, _a.c_str(), _e.c_str()); \
      abort();                                                                 \
    }                                                                          \
  } while (0)

// ============================================================================
// Manual clock
// ============================================================================
// Sessions and registries take a plain function pointer; tests drive this one.
static std::atomic<uint64_t> g_test_millis(0);

static inline uint64_t test_millis() { return g_test_millis.load(); }
static inline void test_set_millis(uint64_t ms) { g_test_millis.store(ms); }
static inline void test_advance_millis(uint64_t ms) { g_test_millis.fetch_add(ms); }

// ============================================================================
// Helpers
// ============================================================================
static inline std::vector<uint8_t> test_bytes(const char* text) {
  return std::vector<uint8_t>(text, text + strlen(text));
}

// Unique path under the temp directory; the file is not created.
static inline std::string test_temp_path(const char* name) {
  const char* dir = getenv("TMPDIR");
  std::string path = (dir != nullptr && dir[0] != '\0') ? dir : "/tmp";
  path += "/gridlink_test_" + std::to_string(getpid()) + "_" + name;
  return path;
}

static inline std::string test_read_text(const std::string& path) {
  std::string out;
  FILE* f = fopen(path.c_str(), "rb");
  if (f == nullptr) {
    return out;
  }
  char buf[512];
  size_t n = 0;
  while ((n = fread(buf, 1, sizeof(buf), f)) > 0) {
    out.append(buf, n);
  }
  fclose(f);
  return out;
}

static inline void test_write_text(const std::string& path, const std::string& text) {
  FILE* f = fopen(path.c_str(), "wb");
  TEST_ASSERT(f != nullptr);
  TEST_ASSERT(fwrite(text.data(), 1, text.size(), f) == text.size());
  fclose(f);
}

// ============================================================================
// Fake transport
// ============================================================================
// In-memory broker stand-in. Messages delivered through deliver() reach the
// installed handler only when an active subscription matches the topic.
// Hooks run synchronously on the caller's thread, which lets a test script
// a device that answers a command immediately.
class FakeTransport : public gridlink::transport::ITransport {
 public:
  struct Published {
    std::string topic;
    std::string payload;
  };

  typedef std::function<void(FakeTransport&, const std::string&, const std::string&)> PublishHook;
  typedef std::function<void(FakeTransport&, const std::string&)> SubscribeHook;

  FakeTransport()
      : connected(false), fail_subscribe(false), fail_publish(false), published(),
        subscribed(), unsubscribed(), on_publish(), on_subscribe(), _mutex(), _active(),
        _handler(), _error() {}

  bool connect() override {
    connected = true;
    return true;
  }
  void disconnect() override { connected = false; }
  bool isConnected() const override { return connected; }

  bool subscribe(const std::string& filter) override {
    if (fail_subscribe) {
      _error = gridlink::Error(gridlink::ErrorCode::TRANSPORT, "subscribe refused");
      return false;
    }
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _active.insert(filter);
    }
    subscribed.push_back(filter);
    if (on_subscribe) {
      on_subscribe(*this, filter);
    }
    return true;
  }

  bool unsubscribe(const std::string& filter) override {
    {
      std::lock_guard<std::mutex> lock(_mutex);
      _active.erase(filter);
    }
    unsubscribed.push_back(filter);
    return true;
  }

  bool publish(const std::string& topic, const std::string& payload) override {
    if (fail_publish) {
      _error = gridlink::Error(gridlink::ErrorCode::TRANSPORT, "publish refused");
      return false;
    }
    Published p;
    p.topic = topic;
    p.payload = payload;
    published.push_back(p);
    if (on_publish) {
      on_publish(*this, topic, payload);
    }
    return true;
  }

  void setMessageHandler(const gridlink::transport::MessageHandler& handler) override {
    std::lock_guard<std::mutex> lock(_mutex);
    _handler = handler;
  }

  const gridlink::Error& lastError() const override { return _error; }

  // Returns true when a subscription matched and a handler received it.
  bool deliver(const std::string& topic, const std::string& payload) {
    std::lock_guard<std::mutex> lock(_mutex);
    if (!_handler.is_valid()) {
      return false;
    }
    for (std::set<std::string>::const_iterator it = _active.begin(); it != _active.end(); ++it) {
      if (gridlink::topics::matchesFilter(*it, topic)) {
        _handler(topic, payload);
        return true;
      }
    }
    return false;
  }

  size_t activeSubscriptions() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _active.size();
  }

  bool hasHandler() const {
    std::lock_guard<std::mutex> lock(_mutex);
    return _handler.is_valid();
  }

  bool connected;
  bool fail_subscribe;
  bool fail_publish;
  std::vector<Published> published;
  std::vector<std::string> subscribed;
  std::vector<std::string> unsubscribed;
  PublishHook on_publish;
  SubscribeHook on_subscribe;

 private:
  mutable std::mutex _mutex;
  std::set<std::string> _active;
  gridlink::transport::MessageHandler _handler;
  gridlink::Error _error;
};

// ============================================================================
// Core dump message builders
// ============================================================================
static inline std::string test_chunk_payload(int index, int total, const std::string& b64) {
  return "{\"chunk_index\": " + std::to_string(index) + ", \"total_chunks\": " +
         std::to_string(total) + ", \"data\": \"" + b64 + "\"}";
}

static inline std::string test_topic(const std::string& device, const std::string& rest) {
  return std::string("open_grid_monitor/") + device + "/" + rest;
}
