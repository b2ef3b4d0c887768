#pragma once

namespace researchguard::core::errors {

// Stable process-exit contract for `researchguard` automation.
//
// 0/1/2 keep their conventional meanings. The remaining values separate the
// designed pipeline outcomes (blocked, timed out) from real failures so
// wrappers can branch without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfigInvalid = 10,
  kBlocked = 20,
  kTimedOut = 30,
  kGenerationFailed = 40,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace researchguard::core::errors
