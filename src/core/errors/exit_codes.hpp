#pragma once

namespace sitebuild::core::errors {

// Process-exit contract for scripts and CI steps:
// - 0 build produced output with no recorded errors
// - 1 build failed, recorded errors, or processed nothing
// - 2 usage/argument failure
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace sitebuild::core::errors
