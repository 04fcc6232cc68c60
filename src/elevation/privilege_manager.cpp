#include "elevation/privilege_manager.hpp"

#include "process/process_launcher.hpp"

#include <optional>
#include <utility>

namespace scenkit::elevation {

namespace {

using core::errors::Fail;
using core::errors::RunError;
using core::errors::RunErrorCode;

constexpr std::string_view kUnsupportedWarning = "Sudo is not available on Windows.";
constexpr std::string_view kPasswordPrompt = "Enter sudo password for scenario execution";
constexpr std::string_view kAuthenticationFailed = "Sudo authentication failed. Execution cancelled.";

} // namespace

const char* ToString(ElevationState state) {
  switch (state) {
  case ElevationState::kDisabled:
    return "disabled";
  case ElevationState::kRequestedButUnsupported:
    return "requested_but_unsupported";
  case ElevationState::kSessionCheck:
    return "session_check";
  case ElevationState::kPasswordPrompt:
    return "password_prompt";
  case ElevationState::kValidate:
    return "validate";
  case ElevationState::kElevated:
    return "elevated";
  }
  return "disabled";
}

PrivilegeManager::PrivilegeManager(ElevationToolConfig config,
                                   state::ScenarioStateStore& store,
                                   host::ISecretPrompt& secret_prompt,
                                   host::INotifier& notifier,
                                   core::logging::Logger& logger)
    : config_(std::move(config)),
      store_(store),
      secret_prompt_(secret_prompt),
      notifier_(notifier),
      logger_(logger) {}

bool PrivilegeManager::Resolve(const std::filesystem::path& scenario_path,
                               std::string_view scenario_name,
                               const std::filesystem::path& working_dir,
                               bool& use_elevation,
                               RunError& error) {
  use_elevation = false;

  if (!store_.IsElevationEnabled(scenario_path)) {
    SetState(ElevationState::kDisabled);
    return true;
  }

  if (!config_.platform_supported) {
    SetState(ElevationState::kRequestedButUnsupported);
    std::string persist_error;
    if (!store_.SetElevationEnabled(scenario_path, false, persist_error)) {
      // The run still proceeds unprivileged; the flag is re-cleared next time.
      logger_.Warn("failed to persist cleared elevation flag",
                   {{"scenario", scenario_name}, {"error", persist_error}});
    }
    notifier_.Warn(kUnsupportedWarning);
    logger_.Info("elevation requested on unsupported platform; running unprivileged",
                 {{"scenario", scenario_name}});
    return true;
  }

  SetState(ElevationState::kSessionCheck);
  bool active = false;
  if (!HasActiveSession(working_dir, error, active)) {
    return false;
  }
  if (active) {
    logger_.Debug("elevation session already active", {{"scenario", scenario_name}});
    SetState(ElevationState::kElevated);
    use_elevation = true;
    return true;
  }

  SetState(ElevationState::kPasswordPrompt);
  const std::optional<std::string> secret = secret_prompt_.RequestSecret(kPasswordPrompt);
  if (!secret.has_value()) {
    logger_.Info("elevation password prompt cancelled", {{"scenario", scenario_name}});
    return Fail(error, RunErrorCode::kAuthentication, "password prompt cancelled");
  }

  SetState(ElevationState::kValidate);
  bool accepted = false;
  if (!ValidateSecret(working_dir, *secret, accepted, error)) {
    return false;
  }
  if (!accepted) {
    logger_.Info("elevation password rejected",
                 {{"scenario", scenario_name}, {"tool", config_.program}});
    return Fail(error, RunErrorCode::kAuthentication, std::string(kAuthenticationFailed));
  }

  SetState(ElevationState::kElevated);
  use_elevation = true;
  return true;
}

bool PrivilegeManager::Toggle(const std::filesystem::path& scenario_path, bool& enabled_now,
                              RunError& error) {
  const bool next = !store_.IsElevationEnabled(scenario_path);
  if (!SetRequested(scenario_path, next, error)) {
    enabled_now = store_.IsElevationEnabled(scenario_path);
    return false;
  }
  enabled_now = next;
  return true;
}

bool PrivilegeManager::SetRequested(const std::filesystem::path& scenario_path, bool enabled,
                                    RunError& error) {
  if (enabled && !config_.platform_supported) {
    std::string persist_error;
    if (!store_.SetElevationEnabled(scenario_path, false, persist_error)) {
      return Fail(error, RunErrorCode::kConfiguration, persist_error);
    }
    notifier_.Warn(kUnsupportedWarning);
    return Fail(error, RunErrorCode::kEnvironment, std::string(kUnsupportedWarning));
  }

  std::string persist_error;
  if (!store_.SetElevationEnabled(scenario_path, enabled, persist_error)) {
    return Fail(error, RunErrorCode::kConfiguration, persist_error);
  }
  return true;
}

WrappedCommand PrivilegeManager::Wrap(std::string_view command,
                                      const std::vector<std::string>& args) const {
  WrappedCommand wrapped;
  wrapped.command = config_.program;
  wrapped.args.reserve(args.size() + 2);
  wrapped.args.emplace_back("-n");
  wrapped.args.emplace_back(command);
  wrapped.args.insert(wrapped.args.end(), args.begin(), args.end());
  return wrapped;
}

ElevationState PrivilegeManager::last_state() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_state_;
}

void PrivilegeManager::SetState(ElevationState state) {
  std::lock_guard<std::mutex> lock(mu_);
  last_state_ = state;
}

bool PrivilegeManager::HasActiveSession(const std::filesystem::path& working_dir,
                                        RunError& error, bool& active) {
  process::LaunchRequest request;
  request.command = config_.program;
  request.args = {"-n", "true"};
  request.working_dir = working_dir;

  process::CapturedRun result;
  std::string spawn_error;
  if (!process::RunAndWait(request, result, spawn_error)) {
    return Fail(error, RunErrorCode::kEnvironment,
                "elevation tool unavailable: " + spawn_error);
  }
  active = result.exit_code.has_value() && *result.exit_code == 0;
  return true;
}

bool PrivilegeManager::ValidateSecret(const std::filesystem::path& working_dir,
                                      const std::string& secret, bool& accepted,
                                      RunError& error) {
  process::LaunchRequest request;
  request.command = config_.program;
  request.args = {"-S", "-v"};
  request.working_dir = working_dir;
  request.stdin_text = secret + "\n";

  process::CapturedRun result;
  std::string spawn_error;
  if (!process::RunAndWait(request, result, spawn_error)) {
    return Fail(error, RunErrorCode::kEnvironment,
                "elevation tool unavailable: " + spawn_error);
  }
  accepted = result.exit_code.has_value() && *result.exit_code == 0;
  return true;
}

} // namespace scenkit::elevation
