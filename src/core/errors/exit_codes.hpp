#pragma once

namespace scenkit::core::errors {

// Stable process-exit contract for the CLI host.
//
// 0/1/2 keep their conventional meanings. The remaining values mirror the run
// error taxonomy so wrappers can branch without scraping stderr text.
enum class ExitCode : int {
  kSuccess = 0,
  kFailure = 1,
  kUsage = 2,
  kConfiguration = 10,
  kAuthentication = 20,
  kEnvironment = 30,
  kPortAllocation = 40,
  kTimeout = 50,
  kProcess = 60,
};

constexpr int ToInt(ExitCode code) {
  return static_cast<int>(code);
}

} // namespace scenkit::core::errors
