#pragma once

namespace kbake::core::errors {

// Process-exit contract for pipeline steps.
//
// The pipeline host only distinguishes success from failure; the usage value
// lets wrappers tell a misconfigured step apart from a failed render without
// scraping stderr.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace kbake::core::errors
