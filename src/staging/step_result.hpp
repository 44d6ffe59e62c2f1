#pragma once

#include <string>
#include <utility>

namespace sitebuild::staging {

// Outcome of one staging step.
// - kOk: step finished.
// - kRecorded: failure is already in the ledger and logged; siblings continue.
// - kFatal: failure is already in the ledger and logged; the caller must stop
//   its enclosing step.
enum class StepStatus {
  kOk,
  kRecorded,
  kFatal,
};

struct StepResult {
  StepStatus status = StepStatus::kOk;
  std::string error;

  static StepResult Ok() {
    return {};
  }

  static StepResult Recorded(std::string message) {
    return {StepStatus::kRecorded, std::move(message)};
  }

  static StepResult Fatal(std::string message) {
    return {StepStatus::kFatal, std::move(message)};
  }

  bool ok() const {
    return status == StepStatus::kOk;
  }

  bool fatal() const {
    return status == StepStatus::kFatal;
  }
};

} // namespace sitebuild::staging
