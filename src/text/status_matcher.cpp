#include "status_matcher.h"

#include <stdlib.h>

#include "util/string_utils.h"

namespace gridlink {
namespace text {

namespace {

bool anyPhrase(const std::vector<std::string>& phrases, const std::string& text) {
  for (size_t i = 0; i < phrases.size(); ++i) {
    if (util::containsIgnoreCase(util::view(text), util::view(phrases[i]))) {
      return true;
    }
  }
  return false;
}

}  // namespace

StatusRules coreDumpRules() {
  StatusRules rules;
  rules.nothing_phrases.push_back("No core dump data available");
  rules.started_phrases.push_back("starting transmission");
  rules.failure_keywords.push_back("core dump");
  rules.failure_keywords.push_back("Unknown command");
  return rules;
}

StatusRules firmwareUpdateRules() {
  StatusRules rules;
  rules.success_phrases.push_back("OTA update completed successfully");
  rules.success_phrases.push_back("OTA completed");
  rules.success_phrases.push_back("OTA finished");
  rules.success_phrases.push_back("restart");
  rules.started_phrases.push_back("Starting OTA");
  rules.started_phrases.push_back("OTA started");
  rules.failure_keywords.push_back("OTA");
  rules.failure_keywords.push_back("Invalid JSON command");
  rules.failure_keywords.push_back("Unknown command");
  rules.progress_marker = "OTA Progress:";
  return rules;
}

bool KeywordStatusMatcher::isNothingToTransfer(const std::string& status) const {
  return anyPhrase(_rules.nothing_phrases, status);
}

bool KeywordStatusMatcher::isSuccess(const std::string& status) const {
  // Progress lines never count as an outcome.
  if (isProgress(status)) {
    return false;
  }
  return anyPhrase(_rules.success_phrases, status);
}

bool KeywordStatusMatcher::isOperationStarted(const std::string& status) const {
  return anyPhrase(_rules.started_phrases, status);
}

bool KeywordStatusMatcher::isFailure(const std::string& error) const {
  return anyPhrase(_rules.failure_keywords, error);
}

bool KeywordStatusMatcher::isProgress(const std::string& status) const {
  return !_rules.progress_marker.empty() &&
         status.find(_rules.progress_marker) != std::string::npos;
}

etl::optional<double> KeywordStatusMatcher::extractPercent(const std::string& status) const {
  if (!isProgress(status)) {
    return etl::optional<double>();
  }
  const size_t start = status.find(_rules.progress_marker) + _rules.progress_marker.size();
  const size_t percent = status.find('%', start);
  if (percent == std::string::npos) {
    return etl::optional<double>();
  }

  const std::string number = util::trimCopy(util::view(status).substr(start, percent - start));
  if (number.empty()) {
    return etl::optional<double>();
  }
  char* end = nullptr;
  const double value = strtod(number.c_str(), &end);
  if (end == number.c_str() || *end != '\0') {
    return etl::optional<double>();
  }
  if (value < 0.0 || value > 100.0) {
    return etl::optional<double>();
  }
  return etl::optional<double>(value);
}

}  // namespace text
}  // namespace gridlink
