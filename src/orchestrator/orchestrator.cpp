#include "orchestrator/orchestrator.hpp"

#include "cmdline/tokenizer.hpp"
#include "core/fs_utils.hpp"
#include "debug/debug_descriptor.hpp"
#include "orchestrator/session_naming.hpp"
#include "process/process_launcher.hpp"
#include "profile/interpreter_resolver.hpp"

#include <utility>
#include <vector>

namespace fs = std::filesystem;

namespace scenkit::orchestrator {

namespace {

using core::errors::Fail;
using core::errors::FormatRunError;
using core::errors::RunError;
using core::errors::RunErrorCode;

constexpr std::string_view kPlainTag = "run";
constexpr std::string_view kDebugTag = "run-debug";
constexpr std::string_view kDetachedTag = "run-detached";

std::string DescribeExit(const std::optional<int>& exit_code) {
  return exit_code.has_value() ? std::to_string(*exit_code) : std::string("unknown");
}

// Blocks until the child's exit event arrives on `channel`. Other events
// (late connect results) are ignored.
std::optional<int> WaitForExitEvent(process::RunChannel& channel) {
  while (true) {
    std::optional<process::ProcessEvent> event = channel.Pop();
    if (!event.has_value()) {
      return std::nullopt;
    }
    if (event->kind == process::ProcessEvent::Kind::kExited) {
      return event->exit_code;
    }
  }
}

} // namespace

const char* ToString(RunStrategy strategy) {
  switch (strategy) {
  case RunStrategy::kPlain:
    return "run";
  case RunStrategy::kDebug:
    return "debug";
  case RunStrategy::kDetached:
    return "detach";
  }
  return "run";
}

bool ParseRunStrategy(std::string_view text, RunStrategy& strategy) {
  if (text == "run") {
    strategy = RunStrategy::kPlain;
    return true;
  }
  if (text == "debug") {
    strategy = RunStrategy::kDebug;
    return true;
  }
  if (text == "detach" || text == "detached") {
    strategy = RunStrategy::kDetached;
    return true;
  }
  return false;
}

Orchestrator::Orchestrator(profile::Profile profile,
                           state::ScenarioStateStore& store,
                           HostServices host,
                           process::LogSink& sink,
                           core::logging::Logger& logger,
                           OrchestratorOptions options)
    : profile_(std::move(profile)),
      store_(store),
      host_(host),
      sink_(sink),
      logger_(logger),
      options_(std::move(options)),
      privileges_(options_.elevation, store_, host_.secret_prompt, host_.notifier, logger_),
      bridge_(options_.debug_bridge, privileges_, host_.consent_prompt, host_.debugger, sink_,
              logger_) {
  if (!options_.clock) {
    options_.clock = core::SystemEpochMillis;
  }
}

RunOutcome Orchestrator::Run(const fs::path& scenario) {
  return Execute(RunStrategy::kPlain, scenario);
}

RunOutcome Orchestrator::RunWithDebugger(const fs::path& scenario) {
  return Execute(RunStrategy::kDebug, scenario);
}

RunOutcome Orchestrator::RunInDetachedSession(const fs::path& scenario) {
  return Execute(RunStrategy::kDetached, scenario);
}

RunOutcome Orchestrator::Execute(RunStrategy strategy, const fs::path& scenario) {
  const char* strategy_name = ToString(strategy);
  const std::string scenario_text = scenario.string();
  logger_.Debug("run requested", {{"strategy", strategy_name}, {"scenario", scenario_text}});

  std::string_view tag = kPlainTag;
  switch (strategy) {
  case RunStrategy::kPlain:
    tag = kPlainTag;
    break;
  case RunStrategy::kDebug:
    tag = kDebugTag;
    break;
  case RunStrategy::kDetached:
    tag = kDetachedTag;
    break;
  }

  if (strategy == RunStrategy::kDetached && !options_.detached_sessions_supported) {
    return FailRun(tag, RunError{RunErrorCode::kEnvironment,
                                 "Detached screen sessions are not available on Windows."});
  }

  run::RunContext context;
  RunError error;
  if (!BuildRunContext(scenario, context, error)) {
    return FailRun(tag, error);
  }

  switch (strategy) {
  case RunStrategy::kPlain:
    return RunPlain(context);
  case RunStrategy::kDebug:
    return RunDebug(context);
  case RunStrategy::kDetached:
    return RunDetached(context);
  }
  return RunPlain(context);
}

std::future<RunOutcome> Orchestrator::Submit(RunStrategy strategy, fs::path scenario) {
  return std::async(std::launch::async, [this, strategy, scenario = std::move(scenario)]() {
    return Execute(strategy, scenario);
  });
}

bool Orchestrator::ResolveScenarioPath(const fs::path& scenario, fs::path& scenario_path,
                                       RunError& error) const {
  if (scenario.empty()) {
    return Fail(error, RunErrorCode::kConfiguration, "scenario path is empty");
  }

  std::error_code ec;
  fs::path absolute = fs::absolute(scenario, ec);
  if (ec) {
    return Fail(error, RunErrorCode::kConfiguration,
                "cannot resolve scenario path '" + scenario.string() + "': " + ec.message());
  }
  absolute = absolute.lexically_normal();
  // "dir/" normalizes to "dir/" with an empty filename; name the folder itself.
  if (!absolute.has_filename() && absolute.has_parent_path() &&
      absolute.parent_path() != absolute) {
    absolute = absolute.parent_path();
  }

  const std::optional<fs::path> root = profile::FindScenarioRoot(absolute, profile_.ScenariosRoot());
  scenario_path = root.has_value() ? *root : absolute;
  if (!core::IsExistingDirectory(scenario_path)) {
    return Fail(error, RunErrorCode::kConfiguration,
                "scenario folder not found: " + scenario_path.string());
  }
  return true;
}

bool Orchestrator::BuildRunContext(const fs::path& scenario, run::RunContext& context,
                                   RunError& error) {
  if (profile_.base_path.empty() || !core::IsExistingDirectory(profile_.base_path)) {
    return Fail(error, RunErrorCode::kConfiguration,
                "No active program profile: base path '" + profile_.base_path.string() +
                    "' is not a directory.");
  }

  context = run::RunContext{};
  context.base_path = profile_.base_path;
  if (!ResolveScenarioPath(scenario, context.scenario_path, error)) {
    return false;
  }
  context.scenario_name = context.scenario_path.filename().string();
  if (context.scenario_name.empty()) {
    return Fail(error, RunErrorCode::kConfiguration,
                "scenario folder has no name: " + context.scenario_path.string());
  }
  context.interpreter_path = profile::ResolveInterpreter(profile_);

  if (!run::BuildInvocation(profile_.run_command_template, context.scenario_name,
                            context.base_path, context.invocation, error)) {
    return false;
  }

  context.extra_flags = cmdline::Tokenize(store_.GlobalRunFlags());

  if (!privileges_.Resolve(context.scenario_path, context.scenario_name, context.base_path,
                           context.use_sudo, error)) {
    return false;
  }

  logger_.Debug("run context resolved",
                {{"scenario", context.scenario_name},
                 {"interpreter", context.interpreter_path},
                 {"elevated", context.use_sudo ? "true" : "false"}});
  return true;
}

RunOutcome Orchestrator::RunPlain(const run::RunContext& context) {
  std::string command = context.interpreter_path;
  std::vector<std::string> args = run::InterpreterArgumentsWithFlags(context);
  if (context.use_sudo) {
    elevation::WrappedCommand wrapped = privileges_.Wrap(command, args);
    command = std::move(wrapped.command);
    args = std::move(wrapped.args);
  }

  sink_.AppendLine("[" + std::string(kPlainTag) + "] " + cmdline::FormatCommandLine(command, args));

  process::LaunchRequest request;
  request.command = command;
  request.args = args;
  request.working_dir = context.base_path;
  request.strategy_tag = std::string(kPlainTag);

  process::RunChannel channel;
  std::unique_ptr<process::ChildProcess> child;
  std::string spawn_error;
  if (!process::Spawn(request, sink_, &channel, child, spawn_error)) {
    sink_.AppendLine("[error] " + spawn_error);
    return FailRun(kPlainTag, RunError{RunErrorCode::kProcess, spawn_error});
  }

  logger_.Info("scenario started",
               {{"scenario", context.scenario_name},
                {"strategy", ToString(RunStrategy::kPlain)},
                {"pid", std::to_string(child->pid())}});

  RunOutcome outcome;
  outcome.started = true;
  outcome.exit_code = WaitForExitEvent(channel);
  child.reset();

  ReportExit(context, outcome.exit_code);
  RefreshLastExecution();
  return outcome;
}

RunOutcome Orchestrator::RunDebug(const run::RunContext& context) {
  if (!context.use_sudo) {
    const core::json::Value descriptor = debug::BuildLaunchDescriptor(context);
    sink_.AppendLine("[" + std::string(kDebugTag) + "] launching '" + context.scenario_name +
                     "' through the host debugger");
    if (!host_.debugger.StartDebugging(descriptor)) {
      return FailRun(kDebugTag,
                     RunError{RunErrorCode::kProcess, "Could not start debugger for scenario '" +
                                                          context.scenario_name + "'."});
    }
    logger_.Info("debug session handed to host",
                 {{"scenario", context.scenario_name}, {"strategy", "debug"}});

    RunOutcome outcome;
    outcome.started = true;
    RefreshLastExecution();
    return outcome;
  }

  sink_.AppendLine("[" + std::string(kDebugTag) + "] sudo enabled for scenario '" +
                   context.scenario_name + "'.");

  process::RunChannel channel;
  debug::DebugSession session;
  RunError error;
  if (!bridge_.Start(context, channel, session, error)) {
    return FailRun(kDebugTag, error);
  }

  RunOutcome outcome;
  outcome.started = true;
  outcome.exit_code = WaitForExitEvent(channel);
  session.child.reset();

  ReportExit(context, outcome.exit_code);
  RefreshLastExecution();
  return outcome;
}

RunOutcome Orchestrator::RunDetached(const run::RunContext& context) {
  const std::string session_name =
      BuildDetachedSessionName(context.scenario_name, options_.clock());

  std::vector<std::string> screen_args = {"-dmS", session_name, context.interpreter_path};
  const std::vector<std::string> target = run::InterpreterArgumentsWithFlags(context);
  screen_args.insert(screen_args.end(), target.begin(), target.end());

  std::string command = options_.detached_session_program;
  std::vector<std::string> args = std::move(screen_args);
  if (context.use_sudo) {
    elevation::WrappedCommand wrapped = privileges_.Wrap(command, args);
    command = std::move(wrapped.command);
    args = std::move(wrapped.args);
  }

  sink_.AppendLine("[" + std::string(kDetachedTag) + "] " +
                   cmdline::FormatCommandLine(command, args));

  process::LaunchRequest request;
  request.command = command;
  request.args = args;
  request.working_dir = context.base_path;
  request.strategy_tag = std::string(kDetachedTag);

  process::RunChannel channel;
  std::unique_ptr<process::ChildProcess> child;
  std::string spawn_error;
  if (!process::Spawn(request, sink_, &channel, child, spawn_error)) {
    sink_.AppendLine("[error] " + spawn_error);
    return FailRun(kDetachedTag,
                   RunError{RunErrorCode::kProcess,
                            "Failed to start detached screen session: " + spawn_error});
  }

  RunOutcome outcome;
  outcome.started = true;
  outcome.session_name = session_name;
  outcome.exit_code = WaitForExitEvent(channel);
  child.reset();

  RefreshLastExecution();
  if (outcome.exit_code.has_value() && *outcome.exit_code == 0) {
    host_.notifier.Info("Scenario started in detached screen session '" + session_name +
                        "'. Attach with: " + options_.detached_session_program + " -r " +
                        session_name);
    logger_.Info("detached session started",
                 {{"scenario", context.scenario_name}, {"session", session_name}});
  } else {
    host_.notifier.Warn("Could not start detached screen session (exit " +
                        DescribeExit(outcome.exit_code) + "). Is '" +
                        options_.detached_session_program + "' installed?");
    logger_.Warn("detached session launcher failed",
                 {{"scenario", context.scenario_name},
                  {"exit_code", DescribeExit(outcome.exit_code)}});
  }
  return outcome;
}

RunOutcome Orchestrator::FailRun(std::string_view strategy_tag, const RunError& error) {
  const std::string code(core::errors::ToStableErrorCode(error.code));
  logger_.Error("run failed",
                {{"strategy", strategy_tag}, {"error_code", code}, {"error", error.message}});
  host_.notifier.Error(FormatRunError(error));

  RunOutcome outcome;
  outcome.error = error;
  return outcome;
}

void Orchestrator::ReportExit(const run::RunContext& context, const std::optional<int>& exit_code) {
  const std::string code_text = DescribeExit(exit_code);
  if (exit_code.has_value() && *exit_code == 0) {
    logger_.Info("scenario finished", {{"scenario", context.scenario_name}, {"exit_code", code_text}});
    return;
  }
  logger_.Warn("scenario exited abnormally",
               {{"scenario", context.scenario_name}, {"exit_code", code_text}});
  host_.notifier.Warn("Scenario '" + context.scenario_name + "' exited with code " + code_text +
                      ".");
}

bool Orchestrator::ToggleElevated(const fs::path& scenario, bool& enabled_now, RunError& error) {
  fs::path scenario_path;
  if (!ResolveScenarioPath(scenario, scenario_path, error)) {
    return false;
  }
  if (!privileges_.Toggle(scenario_path, enabled_now, error)) {
    return false;
  }
  host_.notifier.Info(scenario_path.filename().string() + ": sudo " +
                      (enabled_now ? "enabled" : "disabled"));
  return true;
}

bool Orchestrator::SetElevated(const fs::path& scenario, bool enabled, RunError& error) {
  fs::path scenario_path;
  if (!ResolveScenarioPath(scenario, scenario_path, error)) {
    return false;
  }
  if (!privileges_.SetRequested(scenario_path, enabled, error)) {
    return false;
  }
  host_.notifier.Info(scenario_path.filename().string() + ": sudo " +
                      (enabled ? "enabled" : "disabled"));
  return true;
}

bool Orchestrator::IsElevated(const fs::path& scenario) const {
  fs::path scenario_path;
  RunError ignored;
  if (!ResolveScenarioPath(scenario, scenario_path, ignored)) {
    return false;
  }
  return store_.IsElevationEnabled(scenario_path);
}

bool Orchestrator::SetGlobalExtraFlags(std::string_view flags, RunError& error) {
  std::string persist_error;
  if (!store_.SetGlobalRunFlags(flags, persist_error)) {
    return Fail(error, RunErrorCode::kConfiguration, persist_error);
  }
  logger_.Info("global run flags updated", {{"flags", store_.GlobalRunFlags()}});
  return true;
}

std::string Orchestrator::GlobalExtraFlags() const {
  return store_.GlobalRunFlags();
}

std::optional<lastexec::LastExecutionInfo> Orchestrator::RefreshLastExecution() {
  std::optional<lastexec::LastExecutionInfo> latest =
      lastexec::FindLastScenarioExecution(profile_.ScenariosRoot(), profile_.output_folder_name);

  std::vector<ChangeListener> listeners;
  {
    std::lock_guard<std::mutex> lock(cache_mu_);
    last_execution_ = latest;
    listeners.reserve(listeners_.size());
    for (const auto& [token, listener] : listeners_) {
      (void)token;
      listeners.push_back(listener);
    }
  }

  for (const ChangeListener& listener : listeners) {
    listener(latest);
  }
  return latest;
}

std::optional<lastexec::LastExecutionInfo> Orchestrator::LastExecution() const {
  std::lock_guard<std::mutex> lock(cache_mu_);
  return last_execution_;
}

int Orchestrator::Subscribe(ChangeListener listener) {
  std::lock_guard<std::mutex> lock(cache_mu_);
  const int token = next_listener_token_++;
  listeners_.emplace(token, std::move(listener));
  return token;
}

void Orchestrator::Unsubscribe(int token) {
  std::lock_guard<std::mutex> lock(cache_mu_);
  listeners_.erase(token);
}

} // namespace scenkit::orchestrator
