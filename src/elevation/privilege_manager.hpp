#pragma once

#include "core/errors/run_error.hpp"
#include "core/logging/logger.hpp"
#include "core/platform.hpp"
#include "host/host_interfaces.hpp"
#include "state/state_store.hpp"

#include <filesystem>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace scenkit::elevation {

// Where the last Resolve() call stopped. Steps SessionCheck..Validate are
// re-entered on every run; nothing is cached between runs.
enum class ElevationState {
  kDisabled,
  kRequestedButUnsupported,
  kSessionCheck,
  kPasswordPrompt,
  kValidate,
  kElevated,
};

const char* ToString(ElevationState state);

struct ElevationToolConfig {
  // Elevation tool looked up on PATH. Tests point this at a fake script.
  std::string program = "sudo";
  bool platform_supported = core::kHostSupportsElevation;
};

// argv form of an elevated launch: `<tool> -n <command> <args...>`.
struct WrappedCommand {
  std::string command;
  std::vector<std::string> args;
};

class PrivilegeManager {
public:
  PrivilegeManager(ElevationToolConfig config,
                   state::ScenarioStateStore& store,
                   host::ISecretPrompt& secret_prompt,
                   host::INotifier& notifier,
                   core::logging::Logger& logger);

  // Decides whether this run of `scenario_path` is elevated.
  //
  // Flag unset            -> use_elevation=false.
  // Platform unsupported  -> flag cleared on disk, warning, use_elevation=false.
  // Otherwise the session probe runs; on failure the password is requested
  // and validated. Cancel or rejected password is kAuthentication; a missing
  // elevation tool is kEnvironment.
  bool Resolve(const std::filesystem::path& scenario_path,
               std::string_view scenario_name,
               const std::filesystem::path& working_dir,
               bool& use_elevation,
               core::errors::RunError& error);

  // Flips the persisted flag. Enabling on an unsupported platform is
  // refused with kEnvironment and leaves the flag cleared.
  bool Toggle(const std::filesystem::path& scenario_path, bool& enabled_now,
              core::errors::RunError& error);

  // Sets the flag to an explicit value under the same platform rule.
  bool SetRequested(const std::filesystem::path& scenario_path, bool enabled,
                    core::errors::RunError& error);

  WrappedCommand Wrap(std::string_view command, const std::vector<std::string>& args) const;

  ElevationState last_state() const;

  const ElevationToolConfig& config() const {
    return config_;
  }

private:
  void SetState(ElevationState state);

  bool HasActiveSession(const std::filesystem::path& working_dir, core::errors::RunError& error,
                        bool& active);
  bool ValidateSecret(const std::filesystem::path& working_dir, const std::string& secret,
                      bool& accepted, core::errors::RunError& error);

  ElevationToolConfig config_;
  state::ScenarioStateStore& store_;
  host::ISecretPrompt& secret_prompt_;
  host::INotifier& notifier_;
  core::logging::Logger& logger_;

  mutable std::mutex mu_;
  ElevationState last_state_ = ElevationState::kDisabled;
};

} // namespace scenkit::elevation
