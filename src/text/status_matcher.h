/*
 * This file is part of GridLink host tools.
 * (C) 2025 Ignacio Santolin
 */
#ifndef GRIDLINK_STATUS_MATCHER_H
#define GRIDLINK_STATUS_MATCHER_H

#include <string>
#include <vector>

#include <etl/optional.h>

namespace gridlink {
namespace text {

/**
 * Free-text rules applied to device status and error messages.
 *
 * The firmware reports progress and outcome only as human readable text,
 * so all phrase matching lives behind this interface. The session state
 * machine only sees the booleans.
 */
class IStatusMatcher {
public:
  virtual ~IStatusMatcher() {}

  // Status text meaning "nothing to transfer" (vacuous success).
  virtual bool isNothingToTransfer(const std::string& status) const = 0;

  // Status text meaning the requested operation succeeded.
  virtual bool isSuccess(const std::string& status) const = 0;

  // Status text announcing a (re)started operation attempt.
  virtual bool isOperationStarted(const std::string& status) const = 0;

  // Error text that fails the requested capability.
  virtual bool isFailure(const std::string& error) const = 0;

  // Percentage complete carried by a progress status, if any.
  virtual etl::optional<double> extractPercent(const std::string& status) const = 0;

  // True if the text carries the progress marker at all.
  virtual bool isProgress(const std::string& status) const = 0;
};

struct StatusRules {
  // Phrases match as case-insensitive substrings.
  std::vector<std::string> nothing_phrases;
  std::vector<std::string> success_phrases;
  std::vector<std::string> started_phrases;
  std::vector<std::string> failure_keywords;
  std::string progress_marker;  // case-sensitive, e.g. "OTA Progress:"
};

// Rules for the `coredump` capability.
StatusRules coreDumpRules();

// Rules for the firmware push (`ota`) capability.
StatusRules firmwareUpdateRules();

class KeywordStatusMatcher : public IStatusMatcher {
public:
  explicit KeywordStatusMatcher(const StatusRules& rules) : _rules(rules) {}

  bool isNothingToTransfer(const std::string& status) const override;
  bool isSuccess(const std::string& status) const override;
  bool isOperationStarted(const std::string& status) const override;
  bool isFailure(const std::string& error) const override;
  etl::optional<double> extractPercent(const std::string& status) const override;
  bool isProgress(const std::string& status) const override;

  const StatusRules& rules() const { return _rules; }

private:
  StatusRules _rules;
};

}  // namespace text
}  // namespace gridlink

#endif  // GRIDLINK_STATUS_MATCHER_H
