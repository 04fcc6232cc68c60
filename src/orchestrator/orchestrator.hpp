#pragma once

#include "core/errors/run_error.hpp"
#include "core/logging/logger.hpp"
#include "core/platform.hpp"
#include "core/time_utils.hpp"
#include "debug/debug_bridge.hpp"
#include "elevation/privilege_manager.hpp"
#include "host/host_interfaces.hpp"
#include "lastexec/last_execution_resolver.hpp"
#include "process/log_sink.hpp"
#include "profile/profile.hpp"
#include "run/run_context.hpp"
#include "state/state_store.hpp"

#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace scenkit::orchestrator {

// Closed set of execution strategies, dispatched once in Execute().
enum class RunStrategy {
  kPlain,
  kDebug,
  kDetached,
};

const char* ToString(RunStrategy strategy);
bool ParseRunStrategy(std::string_view text, RunStrategy& strategy);

// Result of one facade call.
struct RunOutcome {
  // A process (or host debugger session) was started.
  bool started = false;
  // Exit code of the launched process when the call observed it.
  std::optional<int> exit_code;
  std::optional<core::errors::RunError> error;
  // Detached strategy only.
  std::optional<std::string> session_name;
};

// Host collaborators. All references must outlive the orchestrator.
struct HostServices {
  host::ISecretPrompt& secret_prompt;
  host::IConsentPrompt& consent_prompt;
  host::IDebuggerHost& debugger;
  host::INotifier& notifier;
};

struct OrchestratorOptions {
  elevation::ElevationToolConfig elevation;
  debug::DebugBridgeOptions debug_bridge = debug::DefaultDebugBridgeOptions();
  std::string detached_session_program = "screen";
  bool detached_sessions_supported = core::kHostSupportsDetachedSessions;
  core::EpochMillisClock clock = core::SystemEpochMillis;
};

// Entry point the host drives. Each call runs one independent scenario
// execution; the only state shared between runs is the most-recent
// execution cache, the state store and the output sink.
//
// Run/RunWithDebugger/RunInDetachedSession block until the strategy has
// finished with its child; Submit() runs the same work on a worker thread.
// The orchestrator must outlive every future Submit() returned.
class Orchestrator {
public:
  using ChangeListener = std::function<void(const std::optional<lastexec::LastExecutionInfo>&)>;

  Orchestrator(profile::Profile profile,
               state::ScenarioStateStore& store,
               HostServices host,
               process::LogSink& sink,
               core::logging::Logger& logger,
               OrchestratorOptions options = {});

  Orchestrator(const Orchestrator&) = delete;
  Orchestrator& operator=(const Orchestrator&) = delete;

  RunOutcome Run(const std::filesystem::path& scenario);
  RunOutcome RunWithDebugger(const std::filesystem::path& scenario);
  RunOutcome RunInDetachedSession(const std::filesystem::path& scenario);

  RunOutcome Execute(RunStrategy strategy, const std::filesystem::path& scenario);
  std::future<RunOutcome> Submit(RunStrategy strategy, std::filesystem::path scenario);

  bool ToggleElevated(const std::filesystem::path& scenario, bool& enabled_now,
                      core::errors::RunError& error);
  bool SetElevated(const std::filesystem::path& scenario, bool enabled,
                   core::errors::RunError& error);
  bool IsElevated(const std::filesystem::path& scenario) const;

  bool SetGlobalExtraFlags(std::string_view flags, core::errors::RunError& error);
  std::string GlobalExtraFlags() const;

  // Rescans the output folders, replaces the cache and notifies listeners.
  std::optional<lastexec::LastExecutionInfo> RefreshLastExecution();
  std::optional<lastexec::LastExecutionInfo> LastExecution() const;

  // Listeners run on whichever thread refreshed the cache.
  int Subscribe(ChangeListener listener);
  void Unsubscribe(int token);

  // Resolves everything a run needs, including the elevation decision.
  bool BuildRunContext(const std::filesystem::path& scenario, run::RunContext& context,
                       core::errors::RunError& error);

  // Maps a scenario argument (the scenario folder or any path inside it)
  // to the scenario folder.
  bool ResolveScenarioPath(const std::filesystem::path& scenario,
                           std::filesystem::path& scenario_path,
                           core::errors::RunError& error) const;

  const profile::Profile& profile() const {
    return profile_;
  }

private:
  RunOutcome RunPlain(const run::RunContext& context);
  RunOutcome RunDebug(const run::RunContext& context);
  RunOutcome RunDetached(const run::RunContext& context);

  RunOutcome FailRun(std::string_view strategy_tag, const core::errors::RunError& error);
  void ReportExit(const run::RunContext& context, const std::optional<int>& exit_code);

  profile::Profile profile_;
  state::ScenarioStateStore& store_;
  HostServices host_;
  process::LogSink& sink_;
  core::logging::Logger& logger_;
  OrchestratorOptions options_;

  elevation::PrivilegeManager privileges_;
  debug::DebugBridgeCoordinator bridge_;

  mutable std::mutex cache_mu_;
  std::optional<lastexec::LastExecutionInfo> last_execution_;
  std::map<int, ChangeListener> listeners_;
  int next_listener_token_ = 1;
};

} // namespace scenkit::orchestrator
