#include <stdio.h>
#include <stdint.h>
#include <math.h>

#include <string>

#include "progress/progress_estimator.h"
#include "text/status_matcher.h"
#include "util/string_utils.h"
#include "test_support.h"

using namespace gridlink;

static void test_core_dump_rules() {
  const text::KeywordStatusMatcher m(text::coreDumpRules());
  TEST_ASSERT(m.isNothingToTransfer("No core dump data available"));
  TEST_ASSERT(m.isNothingToTransfer("no core dump data available on flash"));
  TEST_ASSERT(!m.isNothingToTransfer("Core dump found"));
  TEST_ASSERT(m.isOperationStarted("Core dump found, Starting Transmission"));
  TEST_ASSERT(m.isFailure("Failed to read core dump partition"));
  TEST_ASSERT(m.isFailure("Unknown command: coredump"));
  TEST_ASSERT(!m.isFailure("WiFi reconnect"));
  TEST_ASSERT(!m.isSuccess("anything at all"));
  TEST_ASSERT(!m.isProgress("OTA Progress: 10%"));
  printf("  -> Core dump rules: OK\n");
}

static void test_firmware_update_rules() {
  const text::KeywordStatusMatcher m(text::firmwareUpdateRules());
  TEST_ASSERT(m.isSuccess("OTA update completed successfully, rebooting"));
  TEST_ASSERT(m.isSuccess("Device will restart now"));
  TEST_ASSERT(!m.isSuccess("OTA Progress: 100% (restart pending)"));
  TEST_ASSERT(m.isOperationStarted("Starting OTA from http://x/firmware.bin"));
  TEST_ASSERT(m.isFailure("OTA failed: connection reset"));
  TEST_ASSERT(m.isFailure("Invalid JSON command"));
  TEST_ASSERT(!m.isFailure("Sensor read timeout"));
  TEST_ASSERT(!m.isNothingToTransfer("No core dump data available"));
  printf("  -> Firmware update rules: OK\n");
}

static void test_percent_extraction() {
  const text::KeywordStatusMatcher m(text::firmwareUpdateRules());
  TEST_ASSERT(m.extractPercent("OTA Progress: 45% (450000/1000000)").value() == 45.0);
  TEST_ASSERT(m.extractPercent("OTA Progress:  7.5 %").value() == 7.5);
  TEST_ASSERT(!m.extractPercent("OTA Progress: abc%").has_value());
  TEST_ASSERT(!m.extractPercent("OTA Progress: 45").has_value());
  TEST_ASSERT(!m.extractPercent("OTA Progress: 150%").has_value());
  TEST_ASSERT(!m.extractPercent("Progress: 45%").has_value());
  // The marker is case-sensitive.
  TEST_ASSERT(!m.isProgress("ota progress: 45%"));
  printf("  -> Percent extraction: OK\n");
}

static void test_progress_estimate_example() {
  const text::KeywordStatusMatcher m(text::firmwareUpdateRules());
  progress::ProgressEstimator estimator(m);
  estimator.start(0);

  const etl::optional<progress::ProgressSample> sample =
      estimator.observe("OTA Progress: 45% (x/y)", 1000000, 10000);
  TEST_ASSERT(sample.has_value());
  TEST_ASSERT_EQ_UINT(sample.value().estimated_bytes, 450000);
  TEST_ASSERT(fabs(sample.value().throughput_bps - 45000.0) < 1e-6);
  TEST_ASSERT_EQ_UINT(estimator.samples().size(), 1);
  TEST_ASSERT_EQ_STR(progress::ProgressEstimator::describe(sample.value()),
                     "Progress: 45.0% - Speed: 43.9 KB/s");
  printf("  -> 45%% of 1 MB in 10 s: OK\n");
}

static void test_progress_restart_and_failures() {
  const text::KeywordStatusMatcher m(text::firmwareUpdateRules());
  progress::ProgressEstimator estimator(m);
  estimator.start(0);
  TEST_ASSERT(estimator.observe("OTA Progress: 20%", 1000, 1000).has_value());

  // Unparseable progress is dropped without touching history.
  TEST_ASSERT(!estimator.observe("OTA Progress: ??%", 1000, 1500).has_value());
  TEST_ASSERT_EQ_UINT(estimator.samples().size(), 1);

  // Unrelated text is ignored.
  TEST_ASSERT(!estimator.observe("WiFi connected", 1000, 1600).has_value());

  TEST_ASSERT(!estimator.observe("Starting OTA", 1000, 5000).has_value());
  TEST_ASSERT(estimator.samples().empty());
  TEST_ASSERT_EQ_UINT(estimator.startedAt(), 5000);

  const etl::optional<progress::ProgressSample> s = estimator.observe("OTA Progress: 50%", 1000, 7000);
  TEST_ASSERT(s.has_value());
  TEST_ASSERT(fabs(s.value().throughput_bps - 250.0) < 1e-6);
  printf("  -> Restart resets history: OK\n");
}

static void test_progress_without_start_and_summary() {
  const text::KeywordStatusMatcher m(text::firmwareUpdateRules());
  progress::ProgressEstimator estimator(m);
  TEST_ASSERT(!estimator.isStarted());

  const etl::optional<progress::ProgressSample> first = estimator.observe("OTA Progress: 10%", 2048, 3000);
  TEST_ASSERT(first.has_value());
  TEST_ASSERT(estimator.isStarted());
  TEST_ASSERT(first.value().throughput_bps == 0.0);

  progress::ProgressSummary summary = estimator.summary(2048, 5000);
  TEST_ASSERT(fabs(summary.elapsed_s - 2.0) < 1e-9);
  TEST_ASSERT_EQ_UINT(summary.bytes, 204);

  progress::ProgressEstimator idle(m);
  idle.start(0);
  summary = idle.summary(4096, 2000);
  TEST_ASSERT_EQ_UINT(summary.bytes, 4096);
  TEST_ASSERT(fabs(summary.average_bps - 2048.0) < 1e-9);
  printf("  -> Summary falls back to image size: OK\n");
}

static void test_speed_units() {
  TEST_ASSERT_EQ_STR(util::formatSpeed(0.0), "0.0 KB/s");
  TEST_ASSERT_EQ_STR(util::formatSpeed(2048.0), "2.0 KB/s");
  TEST_ASSERT_EQ_STR(util::formatSpeed(3.0 * 1024 * 1024), "3.0 MB/s");
  printf("  -> Speed units: OK\n");
}

int main() {
  printf("STATUS MATCHER & PROGRESS TEST SUITE\n");
  test_core_dump_rules();
  test_firmware_update_rules();
  test_percent_extraction();
  test_progress_estimate_example();
  test_progress_restart_and_failures();
  test_progress_without_start_and_summary();
  test_speed_units();
  printf("ALL TESTS PASSED\n");
  return 0;
}
