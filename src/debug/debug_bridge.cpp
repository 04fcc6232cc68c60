#include "debug/debug_bridge.hpp"

#include "cmdline/tokenizer.hpp"
#include "debug/debug_descriptor.hpp"
#include "debug/port_allocator.hpp"

#include <optional>
#include <utility>

namespace scenkit::debug {

namespace {

using core::errors::Fail;
using core::errors::RunError;
using core::errors::RunErrorCode;

constexpr std::string_view kTag = "run-debug";

std::string DescribeExit(const std::optional<int>& exit_code) {
  return exit_code.has_value() ? std::to_string(*exit_code) : std::string("unknown");
}

} // namespace

DebugBridgeOptions DefaultDebugBridgeOptions() {
  DebugBridgeOptions options;
  options.allocate_port = AllocateEphemeralPort;
  return options;
}

std::vector<std::string> BuildBridgeArguments(const run::RunContext& context,
                                              std::string_view bridge_module, int port) {
  std::vector<std::string> args = {
      "-m",
      std::string(bridge_module),
      "--listen",
      std::string(kLoopbackHost) + ":" + std::to_string(port),
      "--wait-for-client",
  };
  const std::vector<std::string> target = run::InterpreterArgumentsWithFlags(context);
  args.insert(args.end(), target.begin(), target.end());
  return args;
}

DebugBridgeCoordinator::DebugBridgeCoordinator(DebugBridgeOptions options,
                                               elevation::PrivilegeManager& elevation,
                                               host::IConsentPrompt& consent,
                                               host::IDebuggerHost& debugger,
                                               process::LogSink& sink,
                                               core::logging::Logger& logger)
    : options_(std::move(options)),
      elevation_(elevation),
      consent_(consent),
      debugger_(debugger),
      sink_(sink),
      logger_(logger) {
  if (!options_.allocate_port) {
    options_.allocate_port = AllocateEphemeralPort;
  }
}

bool DebugBridgeCoordinator::Start(const run::RunContext& context, process::RunChannel& channel,
                                   DebugSession& session, RunError& error) {
  session = DebugSession{};

  if (!EnsureDependency(context, error)) {
    return false;
  }

  int port = 0;
  std::string port_error;
  if (!options_.allocate_port(port, port_error)) {
    return Fail(error, RunErrorCode::kPortAllocation, port_error);
  }
  session.port = port;

  const elevation::WrappedCommand wrapped = elevation_.Wrap(
      context.interpreter_path, BuildBridgeArguments(context, options_.bridge_module, port));

  sink_.AppendLine("[" + std::string(kTag) + "] " +
                   cmdline::FormatCommandLine(wrapped.command, wrapped.args));

  process::LaunchRequest request;
  request.command = wrapped.command;
  request.args = wrapped.args;
  request.working_dir = context.base_path;
  request.strategy_tag = std::string(kTag);
  request.kill_grace = options_.kill_grace;

  std::string spawn_error;
  if (!process::Spawn(request, sink_, &channel, session.child, spawn_error)) {
    sink_.AppendLine("[error] " + spawn_error);
    return Fail(error, RunErrorCode::kProcess, spawn_error);
  }

  const std::string port_text = std::to_string(port);
  logger_.Info("debug bridge started",
               {{"scenario", context.scenario_name},
                {"pid", std::to_string(session.child->pid())},
                {"port", port_text}});

  ReadinessProbe probe(std::string(kLoopbackHost), port, options_.readiness, channel);
  probe.Start();

  bool ready = false;
  while (!ready) {
    std::optional<process::ProcessEvent> event = channel.Pop();
    if (!event.has_value()) {
      StopBridge(session);
      return Fail(error, RunErrorCode::kProcess, "debug run cancelled");
    }

    switch (event->kind) {
    case process::ProcessEvent::Kind::kConnected:
      ready = true;
      break;
    case process::ProcessEvent::Kind::kConnectFailed:
      probe.Stop();
      StopBridge(session);
      logger_.Warn("debug bridge not reachable", {{"port", port_text}, {"detail", event->detail}});
      return Fail(error, RunErrorCode::kTimeout,
                  "debug bridge did not accept connections: " + event->detail);
    case process::ProcessEvent::Kind::kExited:
      probe.Stop();
      return Fail(error, RunErrorCode::kProcess,
                  "debug bridge exited before accepting connections (exit " +
                      DescribeExit(event->exit_code) + ")");
    }
  }
  probe.Stop();

  const core::json::Value descriptor = BuildAttachDescriptor(context, port);
  if (!debugger_.StartDebugging(descriptor)) {
    StopBridge(session);
    return Fail(error, RunErrorCode::kProcess,
                "host debugger could not attach to 127.0.0.1:" + port_text);
  }

  logger_.Info("debugger attached", {{"scenario", context.scenario_name}, {"port", port_text}});
  return true;
}

void DebugBridgeCoordinator::StopBridge(DebugSession& session) {
  std::string kill_error;
  if (!session.child->Kill(kill_error)) {
    logger_.Warn("failed to stop debug bridge",
                 {{"pid", std::to_string(session.child->pid())}, {"error", kill_error}});
    sink_.AppendLine("[" + std::string(kTag) + "] " + kill_error);
  }
}

bool DebugBridgeCoordinator::EnsureDependency(const run::RunContext& context, RunError& error) {
  bool present = false;
  if (!ProbeDependency(context, present, error)) {
    return false;
  }
  if (present) {
    return true;
  }

  const std::string question = "The debug bridge module '" + options_.bridge_module +
                               "' is not installed for " + context.interpreter_path +
                               ". Install it now?";
  if (!consent_.RequestConsent(question)) {
    return Fail(error, RunErrorCode::kEnvironment,
                options_.bridge_module + " is not installed and installation was declined");
  }

  if (!InstallDependency(context, error)) {
    return false;
  }

  if (!ProbeDependency(context, present, error)) {
    return false;
  }
  if (!present) {
    return Fail(error, RunErrorCode::kEnvironment,
                options_.bridge_module + " is still not importable after installation");
  }
  return true;
}

bool DebugBridgeCoordinator::ProbeDependency(const run::RunContext& context, bool& present,
                                             RunError& error) {
  process::LaunchRequest request;
  request.command = context.interpreter_path;
  request.args = {"-c", "import " + options_.bridge_module};
  request.working_dir = context.base_path;

  process::CapturedRun result;
  std::string spawn_error;
  if (!process::RunAndWait(request, result, spawn_error)) {
    return Fail(error, RunErrorCode::kEnvironment, "interpreter unavailable: " + spawn_error);
  }
  present = result.exit_code.has_value() && *result.exit_code == 0;
  logger_.Debug("debug bridge dependency probe",
                {{"module", options_.bridge_module}, {"present", present ? "true" : "false"}});
  return true;
}

bool DebugBridgeCoordinator::InstallDependency(const run::RunContext& context, RunError& error) {
  process::LaunchRequest request;
  request.command = context.interpreter_path;
  request.args = {"-m", "pip", "install", options_.bridge_module};
  request.working_dir = context.base_path;

  sink_.AppendLine("[" + std::string(kTag) + "] " +
                   cmdline::FormatCommandLine(request.command, request.args));

  process::CapturedRun result;
  std::string spawn_error;
  if (!process::RunAndWait(request, result, spawn_error)) {
    return Fail(error, RunErrorCode::kEnvironment, "interpreter unavailable: " + spawn_error);
  }
  sink_.Append(result.output);
  if (!result.exit_code.has_value() || *result.exit_code != 0) {
    return Fail(error, RunErrorCode::kEnvironment,
                "failed to install " + options_.bridge_module + " (exit " +
                    DescribeExit(result.exit_code) + ")");
  }
  return true;
}

} // namespace scenkit::debug
