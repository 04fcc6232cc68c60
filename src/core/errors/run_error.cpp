#include "core/errors/run_error.hpp"

#include <utility>

namespace scenkit::core::errors {

std::string_view ToStableErrorCode(const RunErrorCode code) {
  switch (code) {
  case RunErrorCode::kConfiguration:
    return "CONFIGURATION_ERROR";
  case RunErrorCode::kAuthentication:
    return "AUTHENTICATION_ERROR";
  case RunErrorCode::kEnvironment:
    return "ENVIRONMENT_ERROR";
  case RunErrorCode::kPortAllocation:
    return "PORT_ALLOCATION_ERROR";
  case RunErrorCode::kTimeout:
    return "TIMEOUT_ERROR";
  case RunErrorCode::kProcess:
    return "PROCESS_ERROR";
  }
  return "PROCESS_ERROR";
}

ExitCode ToExitCode(const RunErrorCode code) {
  switch (code) {
  case RunErrorCode::kConfiguration:
    return ExitCode::kConfiguration;
  case RunErrorCode::kAuthentication:
    return ExitCode::kAuthentication;
  case RunErrorCode::kEnvironment:
    return ExitCode::kEnvironment;
  case RunErrorCode::kPortAllocation:
    return ExitCode::kPortAllocation;
  case RunErrorCode::kTimeout:
    return ExitCode::kTimeout;
  case RunErrorCode::kProcess:
    return ExitCode::kProcess;
  }
  return ExitCode::kFailure;
}

bool Fail(RunError& error, const RunErrorCode code, std::string message) {
  error.code = code;
  error.message = std::move(message);
  return false;
}

std::string FormatRunError(const RunError& error) {
  std::string text(ToStableErrorCode(error.code));
  if (!error.message.empty()) {
    text += ": ";
    text += error.message;
  }
  return text;
}

} // namespace scenkit::core::errors
