#include "tool_common.h"

#include <stdlib.h>
#include <errno.h>
#include <signal.h>
#include <string.h>

#include <spdlog/spdlog.h>

#include "log/logging.h"
#include "util/string_utils.h"

namespace gridlink {
namespace tools {

std::atomic<bool> g_cancel_requested(false);

namespace {

void onSignal(int) {
  g_cancel_requested.store(true);
}

}  // namespace

void installSignalHandlers() {
  struct sigaction action;
  memset(&action, 0, sizeof(action));
  action.sa_handler = onSignal;
  sigemptyset(&action.sa_mask);
  const int signals[] = {SIGINT, SIGTERM};
  for (size_t i = 0; i < sizeof(signals) / sizeof(signals[0]); ++i) {
    if (sigaction(signals[i], &action, nullptr) != 0) {
      spdlog::warn("Cannot install handler for signal {}: {}", signals[i], strerror(errno));
    }
  }
}

bool parseSeconds(const char* text, uint64_t& out_ms) {
  if (text == nullptr || text[0] == '\0') {
    return false;
  }
  char* end = nullptr;
  errno = 0;
  const double seconds = strtod(text, &end);
  if (errno != 0 || *end != '\0' || !(seconds > 0.0) || seconds > 86400.0) {
    return false;
  }
  out_ms = static_cast<uint64_t>(seconds * 1000.0 + 0.5);
  return true;
}

bool setupRuntime(const std::string& env_file, const std::string& cli_level,
                  config::BrokerConfig& out) {
  // Console logging first so configuration problems are visible.
  if (!logging::init(cli_level.empty() ? "info" : cli_level)) {
    return false;
  }

  Error error;
  const bool explicit_file = !env_file.empty();
  if (!out.load(explicit_file ? env_file : config::DEFAULT_ENV_FILE, explicit_file, error)) {
    spdlog::error("Configuration error: {}", error.detail);
    return false;
  }
  if (cli_level.empty() && !logging::init(out.log_level)) {
    return false;
  }
  spdlog::debug("MQTT broker {}, namespace {}", out.describe(), out.topic_namespace);
  return true;
}

int exitCodeFor(bool ok, const Error& error) {
  if (ok) {
    return 0;
  }
  if (!error.ok()) {
    spdlog::error("{}: {}", toString(error.code), error.detail);
  }
  return 1;
}

int exitCodeForOperatorCancel(const char* what) {
  spdlog::info("{} cancelled", what);
  return 0;
}

bool promptForDevice(const std::vector<std::string>& candidates, std::istream& in, FILE* out,
                     size_t& index) {
  fprintf(out, "\nDevices found:\n");
  for (size_t i = 0; i < candidates.size(); ++i) {
    fprintf(out, "  %zu. %s\n", i + 1, candidates[i].c_str());
  }

  std::string line;
  while (true) {
    fprintf(out, "Select a device (1-%zu, q to quit): ", candidates.size());
    fflush(out);
    if (!std::getline(in, line)) {
      return false;
    }
    const std::string answer = util::trimCopy(util::view(line));
    if (answer == "q" || answer == "Q") {
      return false;
    }
    char* end = nullptr;
    const long choice = strtol(answer.c_str(), &end, 10);
    if (!answer.empty() && *end == '\0' && choice >= 1 &&
        static_cast<size_t>(choice) <= candidates.size()) {
      index = static_cast<size_t>(choice - 1);
      return true;
    }
    fprintf(out, "Invalid selection\n");
  }
}

bool promptForConfirmation(const std::string& question, std::istream& in, FILE* out) {
  fprintf(out, "\n%s Press Enter to continue, Ctrl+C to cancel ", question.c_str());
  fflush(out);
  std::string line;
  return static_cast<bool>(std::getline(in, line)) && !g_cancel_requested.load();
}

}  // namespace tools
}  // namespace gridlink
