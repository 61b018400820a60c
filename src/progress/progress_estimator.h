/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_PROGRESS_ESTIMATOR_H
#define GRIDLINK_PROGRESS_ESTIMATOR_H

#include <stdint.h>
#include <string>
#include <vector>

#include <etl/optional.h>

#include "text/status_matcher.h"

namespace gridlink {
namespace progress {

struct ProgressSample {
  uint64_t timestamp_ms;
  double percent;
  uint64_t estimated_bytes;
  double throughput_bps;
};

struct ProgressSummary {
  double elapsed_s;
  uint64_t bytes;
  double average_bps;
};

/**
 * Estimates transfer progress of a firmware push from the device's status
 * text. Reporting only: nothing here influences the session verdict.
 *
 * Samples are append-only per attempt. A status that announces a new
 * attempt ("Starting OTA") drops the history and restarts the clock.
 */
class ProgressEstimator {
 public:
  explicit ProgressEstimator(const text::IStatusMatcher& matcher);

  // Starts timing; called when the command is published.
  void start(uint64_t now_ms);

  /**
   * @brief Feed one status text.
   *
   * @param status           Raw status payload.
   * @param known_total_size Size of the artifact being pushed, in bytes.
   * @param now_ms           Clock reading at receipt.
   * @return The appended sample, or empty when the text carries no usable
   *         percentage (parse failures are logged and dropped).
   */
  etl::optional<ProgressSample> observe(const std::string& status, uint64_t known_total_size,
                                        uint64_t now_ms);

  bool isStarted() const { return _started; }
  uint64_t startedAt() const { return _started_at_ms; }
  const std::vector<ProgressSample>& samples() const { return _samples; }

  // Totals at completion. Uses the last estimate, or known_total_size when
  // no progress was reported.
  ProgressSummary summary(uint64_t known_total_size, uint64_t now_ms) const;

  // "Progress: 45.0% - Speed: 43.9 KB/s"
  static std::string describe(const ProgressSample& sample);

 private:
  const text::IStatusMatcher& _matcher;
  bool _started;
  uint64_t _started_at_ms;
  std::vector<ProgressSample> _samples;
};

}  // namespace progress
}  // namespace gridlink

#endif  // GRIDLINK_PROGRESS_ESTIMATOR_H
