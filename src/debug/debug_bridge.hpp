#pragma once

#include "core/errors/run_error.hpp"
#include "core/logging/logger.hpp"
#include "debug/readiness_probe.hpp"
#include "elevation/privilege_manager.hpp"
#include "host/host_interfaces.hpp"
#include "process/log_sink.hpp"
#include "process/process_launcher.hpp"
#include "run/run_context.hpp"

#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace scenkit::debug {

using PortAllocator = std::function<bool(int& port, std::string& error)>;

struct DebugBridgeOptions {
  // Module imported by the dependency probe and run with `-m`.
  std::string bridge_module = "debugpy";
  ReadinessOptions readiness;
  // Replaceable so tests can force PortAllocationError.
  PortAllocator allocate_port;
  // SIGTERM-to-SIGKILL escalation delay for the elevated bridge.
  std::chrono::milliseconds kill_grace{2000};
};

DebugBridgeOptions DefaultDebugBridgeOptions();

// One debug-attach flow: the bridge child and the port it listens on.
// Owned by the coordinator's caller once Start() succeeds.
struct DebugSession {
  int port = 0;
  std::unique_ptr<process::ChildProcess> child;
};

// Bridge argv tail after the interpreter:
//   -m <module> --listen 127.0.0.1:<port> --wait-for-client <target...> <extra...>
std::vector<std::string> BuildBridgeArguments(const run::RunContext& context,
                                              std::string_view bridge_module, int port);

// Drives an elevated debug run through a network debug bridge:
//   dependency check -> (consent) install -> port -> elevated spawn ->
//   readiness poll -> attach.
// Every failure after the spawn kills the child before returning.
class DebugBridgeCoordinator {
public:
  DebugBridgeCoordinator(DebugBridgeOptions options,
                         elevation::PrivilegeManager& elevation,
                         host::IConsentPrompt& consent,
                         host::IDebuggerHost& debugger,
                         process::LogSink& sink,
                         core::logging::Logger& logger);

  // On success the attach descriptor has been accepted by the host debugger
  // and `session.child` is the still-running bridge. Its kExited event will
  // arrive on `channel`; `channel` must outlive `session`.
  bool Start(const run::RunContext& context, process::RunChannel& channel, DebugSession& session,
             core::errors::RunError& error);

  // Probes for the bridge module, installing it after consent when absent.
  bool EnsureDependency(const run::RunContext& context, core::errors::RunError& error);

private:
  bool ProbeDependency(const run::RunContext& context, bool& present,
                       core::errors::RunError& error);
  bool InstallDependency(const run::RunContext& context, core::errors::RunError& error);
  void StopBridge(DebugSession& session);

  DebugBridgeOptions options_;
  elevation::PrivilegeManager& elevation_;
  host::IConsentPrompt& consent_;
  host::IDebuggerHost& debugger_;
  process::LogSink& sink_;
  core::logging::Logger& logger_;
};

} // namespace scenkit::debug
