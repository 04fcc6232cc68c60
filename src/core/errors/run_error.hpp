#pragma once

#include "core/errors/exit_codes.hpp"

#include <string>
#include <string_view>

namespace scenkit::core::errors {

// Failure classes for one scenario run. Every class is terminal for the run
// it occurs in; the user re-invokes to retry.
enum class RunErrorCode {
  // Bad or missing run template, unresolved scenario path.
  kConfiguration,
  // Elevation validation failed or the password prompt was cancelled.
  kAuthentication,
  // Feature unsupported on this platform, or a required dependency is missing.
  kEnvironment,
  kPortAllocation,
  kTimeout,
  // Spawn failure or an unusable child process.
  kProcess,
};

// Grep-friendly code, e.g. "CONFIGURATION_ERROR".
std::string_view ToStableErrorCode(RunErrorCode code);

ExitCode ToExitCode(RunErrorCode code);

struct RunError {
  RunErrorCode code = RunErrorCode::kProcess;
  std::string message;
};

// Fills `error` and returns false so call sites can `return Fail(...)`.
bool Fail(RunError& error, RunErrorCode code, std::string message);

// Single-line contract text: "<STABLE_CODE>: <message>".
std::string FormatRunError(const RunError& error);

} // namespace scenkit::core::errors
