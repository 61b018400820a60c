#include <stdio.h>
#include <stdint.h>

#include <sstream>
#include <string>
#include <vector>

#include "tool_common.h"
#include "test_support.h"

using namespace gridlink;

static FILE* quietOutput() {
  FILE* out = fopen("/dev/null", "w");
  TEST_ASSERT(out != nullptr);
  return out;
}

static std::vector<std::string> threeDevices() {
  std::vector<std::string> devices;
  devices.push_back("dev1");
  devices.push_back("dev2");
  devices.push_back("dev3");
  return devices;
}

static void test_device_menu() {
  FILE* out = quietOutput();
  size_t index = 99;

  std::istringstream answers("abc\n0\n4\n 2 \n");
  TEST_ASSERT(tools::promptForDevice(threeDevices(), answers, out, index));
  TEST_ASSERT_EQ_UINT(index, 1);

  std::istringstream first("1\n");
  TEST_ASSERT(tools::promptForDevice(threeDevices(), first, out, index));
  TEST_ASSERT_EQ_UINT(index, 0);

  fclose(out);
  printf("  -> Device menu: OK\n");
}

static void test_device_menu_quit() {
  FILE* out = quietOutput();
  size_t index = 7;

  std::istringstream quit("9\nq\n1\n");
  TEST_ASSERT(!tools::promptForDevice(threeDevices(), quit, out, index));
  TEST_ASSERT_EQ_UINT(index, 7);

  std::istringstream closed("");
  TEST_ASSERT(!tools::promptForDevice(threeDevices(), closed, out, index));

  fclose(out);
  printf("  -> Device menu quit and end of input: OK\n");
}

static void test_confirmation() {
  FILE* out = quietOutput();

  std::istringstream enter("\n");
  TEST_ASSERT(tools::promptForConfirmation("Update dev1?", enter, out));

  std::istringstream closed("");
  TEST_ASSERT(!tools::promptForConfirmation("Update dev1?", closed, out));

  tools::g_cancel_requested.store(true);
  std::istringstream interrupted("\n");
  TEST_ASSERT(!tools::promptForConfirmation("Update dev1?", interrupted, out));
  tools::g_cancel_requested.store(false);

  fclose(out);
  printf("  -> Confirmation prompt: OK\n");
}

static void test_exit_codes() {
  TEST_ASSERT_EQ_UINT(tools::exitCodeForOperatorCancel("Update"), 0);
  TEST_ASSERT_EQ_UINT(tools::exitCodeFor(true, Error()), 0);
  TEST_ASSERT_EQ_UINT(tools::exitCodeFor(false, Error(ErrorCode::TIMEOUT, "no verdict")), 1);
  TEST_ASSERT_EQ_UINT(tools::exitCodeFor(false, Error(ErrorCode::ABORTED, "signal")), 1);
  printf("  -> Exit codes: OK\n");
}

static void test_parse_seconds() {
  uint64_t ms = 0;
  TEST_ASSERT(tools::parseSeconds("30", ms));
  TEST_ASSERT_EQ_UINT(ms, 30000);
  TEST_ASSERT(tools::parseSeconds("0.5", ms));
  TEST_ASSERT_EQ_UINT(ms, 500);
  TEST_ASSERT(!tools::parseSeconds("0", ms));
  TEST_ASSERT(!tools::parseSeconds("-3", ms));
  TEST_ASSERT(!tools::parseSeconds("10s", ms));
  TEST_ASSERT(!tools::parseSeconds("", ms));
  printf("  -> Seconds arguments: OK\n");
}

int main() {
  printf("TOOLS TEST SUITE\n");
  test_device_menu();
  test_device_menu_quit();
  test_confirmation();
  test_exit_codes();
  test_parse_seconds();
  printf("ALL TESTS PASSED\n");
  return 0;
}
