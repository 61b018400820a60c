#include "progress_estimator.h"

#include <stdio.h>

#include <spdlog/spdlog.h>

#include "util/string_utils.h"

namespace gridlink {
namespace progress {

ProgressEstimator::ProgressEstimator(const text::IStatusMatcher& matcher)
    : _matcher(matcher), _started(false), _started_at_ms(0), _samples() {}

void ProgressEstimator::start(uint64_t now_ms) {
  _started = true;
  _started_at_ms = now_ms;
  _samples.clear();
}

etl::optional<ProgressSample> ProgressEstimator::observe(const std::string& status,
                                                         uint64_t known_total_size,
                                                         uint64_t now_ms) {
  if (_matcher.isOperationStarted(status)) {
    spdlog::debug("Operation (re)started, resetting progress history");
    start(now_ms);
    return etl::optional<ProgressSample>();
  }
  if (!_matcher.isProgress(status)) {
    return etl::optional<ProgressSample>();
  }

  const etl::optional<double> percent = _matcher.extractPercent(status);
  if (!percent.has_value()) {
    spdlog::warn("Error parsing progress from status: {}", status);
    return etl::optional<ProgressSample>();
  }
  if (!_started) {
    start(now_ms);
  }

  ProgressSample sample;
  sample.timestamp_ms = now_ms;
  sample.percent = percent.value();
  sample.estimated_bytes =
      static_cast<uint64_t>(sample.percent / 100.0 * static_cast<double>(known_total_size));
  const double elapsed_s =
      now_ms > _started_at_ms ? static_cast<double>(now_ms - _started_at_ms) / 1000.0 : 0.0;
  sample.throughput_bps =
      elapsed_s > 0.0 ? static_cast<double>(sample.estimated_bytes) / elapsed_s : 0.0;

  _samples.push_back(sample);
  return etl::optional<ProgressSample>(sample);
}

ProgressSummary ProgressEstimator::summary(uint64_t known_total_size, uint64_t now_ms) const {
  ProgressSummary out;
  out.elapsed_s =
      (_started && now_ms > _started_at_ms) ? static_cast<double>(now_ms - _started_at_ms) / 1000.0
                                            : 0.0;
  out.bytes = _samples.empty() ? known_total_size : _samples.back().estimated_bytes;
  out.average_bps = out.elapsed_s > 0.0 ? static_cast<double>(out.bytes) / out.elapsed_s : 0.0;
  return out;
}

std::string ProgressEstimator::describe(const ProgressSample& sample) {
  char buf[48];
  snprintf(buf, sizeof(buf), "Progress: %.1f%% - Speed: ", sample.percent);
  return std::string(buf) + util::formatSpeed(sample.throughput_bps);
}

}  // namespace progress
}  // namespace gridlink
