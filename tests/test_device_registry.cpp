#include <stdio.h>
#include <stdint.h>

#include <string>
#include <vector>

#include "discovery/device_registry.h"
#include "scheduler/session_scheduler.h"
#include "test_support.h"

using namespace gridlink;
using namespace gridlink::discovery;

static const char* TELEMETRY = "{\"frequency\": 50.01, \"voltage\": 229.8}";

static void test_early_stop_keeps_first_sighting() {
  test_set_millis(0);
  DeviceRegistry registry("open_grid_monitor", &test_millis);
  registry.beginWindow(1000, true);

  test_set_millis(100);
  TEST_ASSERT(registry.observe(test_topic("dev1", "measurement"), TELEMETRY));
  TEST_ASSERT(registry.windowClosed());

  test_set_millis(400);
  TEST_ASSERT(!registry.observe(test_topic("dev2", "measurement"), TELEMETRY));

  const std::vector<std::string> found = registry.devices();
  TEST_ASSERT_EQ_UINT(found.size(), 1);
  TEST_ASSERT_EQ_STR(found[0], "dev1");
  printf("  -> Early stop after the first device: OK\n");
}

static void test_full_window_collects_all() {
  test_set_millis(0);
  DeviceRegistry registry("open_grid_monitor", &test_millis);
  registry.beginWindow(1000, false);

  test_set_millis(100);
  TEST_ASSERT(registry.observe(test_topic("dev1", "measurement"), TELEMETRY));
  test_set_millis(200);
  TEST_ASSERT(!registry.observe(test_topic("dev1", "measurement"), TELEMETRY));
  test_set_millis(400);
  TEST_ASSERT(registry.observe(test_topic("dev2", "measurement"), TELEMETRY));

  // Only telemetry counts as a sighting.
  TEST_ASSERT(!registry.observe(test_topic("dev3", "status"), "online"));
  TEST_ASSERT(!registry.observe(test_topic("dev3", "coredump/chunk/0"), test_chunk_payload(0, 1, "QUI=")));
  TEST_ASSERT(!registry.windowClosed());

  test_set_millis(1000);
  TEST_ASSERT(registry.windowClosed());
  TEST_ASSERT(!registry.observe(test_topic("dev4", "measurement"), TELEMETRY));

  const std::vector<std::string> found = registry.devices();
  TEST_ASSERT_EQ_UINT(found.size(), 2);
  TEST_ASSERT_EQ_STR(found[0], "dev1");
  TEST_ASSERT_EQ_STR(found[1], "dev2");
  printf("  -> Full window, duplicates and non-telemetry: OK\n");
}

static void test_no_window_no_devices() {
  test_set_millis(0);
  DeviceRegistry registry("open_grid_monitor", &test_millis);
  TEST_ASSERT(!registry.observe(test_topic("dev1", "measurement"), TELEMETRY));
  TEST_ASSERT(registry.devices().empty());

  Error error;
  TEST_ASSERT(!registry.select(SelectionPolicy::firstFound(), error).has_value());
  TEST_ASSERT(error.code == ErrorCode::NO_DEVICE);
  printf("  -> Closed registry ignores messages: OK\n");
}

static void test_selection_policies() {
  test_set_millis(0);
  DeviceRegistry registry("open_grid_monitor", &test_millis);
  registry.beginWindow(5000, false);
  registry.observe(test_topic("ccddeeff0011", "measurement"), TELEMETRY);
  registry.observe(test_topic("aabbccddeeff", "measurement"), TELEMETRY);

  const std::vector<std::string> menu = registry.candidates();
  TEST_ASSERT_EQ_STR(menu[0], "aabbccddeeff");
  TEST_ASSERT_EQ_STR(menu[1], "ccddeeff0011");

  Error error;
  etl::optional<std::string> chosen = registry.select(SelectionPolicy::firstFound(), error);
  TEST_ASSERT(chosen.has_value());
  TEST_ASSERT_EQ_STR(chosen.value(), "ccddeeff0011");

  chosen = registry.select(SelectionPolicy::interactive(0), error);
  TEST_ASSERT_EQ_STR(chosen.value(), "aabbccddeeff");

  chosen = registry.select(SelectionPolicy::interactive(2), error);
  TEST_ASSERT(!chosen.has_value());
  TEST_ASSERT(error.code == ErrorCode::CONFIG);

  error = Error();
  chosen = registry.select(SelectionPolicy::explicitDevice("not-seen-yet"), error);
  TEST_ASSERT_EQ_STR(chosen.value(), "not-seen-yet");
  TEST_ASSERT(!registry.select(SelectionPolicy::explicitDevice(""), error).has_value());
  printf("  -> Selection policies: OK\n");
}

static void test_lock_freezes_selection() {
  test_set_millis(0);
  DeviceRegistry registry("open_grid_monitor", &test_millis);
  registry.beginWindow(5000, false);
  registry.observe(test_topic("dev1", "measurement"), TELEMETRY);

  Error error;
  TEST_ASSERT(registry.select(SelectionPolicy::firstFound(), error).has_value());
  registry.lock();
  TEST_ASSERT(registry.isLocked());

  TEST_ASSERT(!registry.select(SelectionPolicy::explicitDevice("dev9"), error).has_value());
  TEST_ASSERT(error.code == ErrorCode::CONFIG);
  TEST_ASSERT_EQ_STR(registry.selected().value(), "dev1");

  // A new window keeps the locked set.
  registry.beginWindow(5000, false);
  TEST_ASSERT_EQ_UINT(registry.devices().size(), 1);
  printf("  -> Lock freezes selection: OK\n");
}

static void test_discover_over_transport() {
  FakeTransport client;
  client.on_subscribe = [](FakeTransport& t, const std::string& filter) {
    TEST_ASSERT_EQ_STR(filter, "open_grid_monitor/+/measurement");
    TEST_ASSERT(t.deliver(test_topic("dev-b", "measurement"), TELEMETRY));
    TEST_ASSERT(t.deliver(test_topic("dev-a", "measurement"), TELEMETRY));
  };

  DeviceRegistry registry("open_grid_monitor", &scheduler::monotonicMillis);
  Error error;
  TEST_ASSERT(registry.discover(client, 150, false, error));
  TEST_ASSERT(error.ok());

  const std::vector<std::string> found = registry.devices();
  TEST_ASSERT_EQ_UINT(found.size(), 2);
  TEST_ASSERT_EQ_STR(found[0], "dev-b");
  TEST_ASSERT_EQ_STR(registry.candidates()[0], "dev-a");

  TEST_ASSERT_EQ_UINT(client.unsubscribed.size(), 1);
  TEST_ASSERT_EQ_UINT(client.activeSubscriptions(), 0);
  TEST_ASSERT(!client.hasHandler());
  printf("  -> Discovery over a transport: OK\n");
}

static void test_discover_failures() {
  {
    FakeTransport client;
    DeviceRegistry registry("open_grid_monitor", &scheduler::monotonicMillis);
    Error error;
    TEST_ASSERT(!registry.discover(client, 50, false, error));
    TEST_ASSERT(error.code == ErrorCode::NO_DEVICE);
  }
  {
    FakeTransport client;
    client.fail_subscribe = true;
    DeviceRegistry registry("open_grid_monitor", &scheduler::monotonicMillis);
    Error error;
    TEST_ASSERT(!registry.discover(client, 50, false, error));
    TEST_ASSERT(error.code == ErrorCode::TRANSPORT);
    TEST_ASSERT(!client.hasHandler());
  }
  printf("  -> Discovery failures: OK\n");
}

int main() {
  printf("DEVICE REGISTRY TEST SUITE\n");
  test_early_stop_keeps_first_sighting();
  test_full_window_collects_all();
  test_no_window_no_devices();
  test_selection_policies();
  test_lock_freezes_selection();
  test_discover_over_transport();
  test_discover_failures();
  printf("ALL TESTS PASSED\n");
  return 0;
}
