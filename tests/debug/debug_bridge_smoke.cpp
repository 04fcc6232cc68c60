#include "debug/debug_bridge.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/workspace_fixtures.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace fs = std::filesystem;
using scenkit::core::errors::RunError;
using scenkit::core::errors::RunErrorCode;
using scenkit::debug::DebugBridgeCoordinator;
using scenkit::debug::DebugBridgeOptions;
using scenkit::debug::DebugSession;
using scenkit::tests::common::AssertContains;
using scenkit::tests::common::AssertTrue;
using scenkit::tests::common::CreateUniqueTempDir;
using scenkit::tests::common::Fail;
using scenkit::tests::common::RecordingDebuggerHost;
using scenkit::tests::common::RecordingNotifier;
using scenkit::tests::common::RemovePathBestEffort;
using scenkit::tests::common::ScriptedConsentPrompt;
using scenkit::tests::common::ScriptedSecretPrompt;
using scenkit::tests::common::WriteExecutableScript;

namespace {

// Listening socket on an OS-assigned loopback port.
class LoopbackListener {
public:
  LoopbackListener() {
    fd_ = ::socket(AF_INET, SOCK_STREAM, 0);
    if (fd_ < 0) {
      Fail("socket() failed");
    }
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = 0;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    socklen_t len = sizeof(addr);
    if (::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd_, 4) != 0 ||
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
      ::close(fd_);
      Fail("failed to open loopback listener");
    }
    port_ = ntohs(addr.sin_port);
  }
  ~LoopbackListener() {
    ::close(fd_);
  }

  int port() const {
    return port_;
  }

private:
  int fd_ = -1;
  int port_ = 0;
};

// The debug run is elevated; the fake tool drops `-n` and execs the rest.
struct Harness {
  Harness(const fs::path& root, const fs::path& python, DebugBridgeOptions options,
          bool consent, bool attach)
      : store(root / "state.json"),
        secret(std::nullopt),
        consent_prompt(consent),
        debugger(attach),
        sink(sink_out),
        logger(scenkit::core::logging::LogLevel::kDebug, log_out),
        privileges(ToolConfig(root), store, secret, notifier, logger),
        coordinator(std::move(options), privileges, consent_prompt, debugger, sink, logger) {
    context.base_path = root;
    context.interpreter_path = python.string();
    context.scenario_name = "a";
    context.scenario_path = root / "scenarios" / "a";
    context.invocation = scenkit::run::ProgramInvocation{root / "run.py", {"-s", "a"}};
    context.use_sudo = true;
  }

  static scenkit::elevation::ElevationToolConfig ToolConfig(const fs::path& root) {
    scenkit::elevation::ElevationToolConfig config;
    config.program = (root / "fake-sudo").string();
    config.platform_supported = true;
    return config;
  }

  std::ostringstream sink_out;
  std::ostringstream log_out;
  scenkit::state::ScenarioStateStore store;
  ScriptedSecretPrompt secret;
  ScriptedConsentPrompt consent_prompt;
  RecordingDebuggerHost debugger;
  RecordingNotifier notifier;
  scenkit::process::LogSink sink;
  scenkit::core::logging::Logger logger;
  scenkit::elevation::PrivilegeManager privileges;
  DebugBridgeCoordinator coordinator;
  scenkit::run::RunContext context;
  scenkit::process::RunChannel channel;
};

DebugBridgeOptions FastOptions() {
  DebugBridgeOptions options = scenkit::debug::DefaultDebugBridgeOptions();
  options.readiness.interval = std::chrono::milliseconds(100);
  options.readiness.timeout = std::chrono::milliseconds(600);
  return options;
}

void AssertChildGone(DebugSession& session) {
  AssertTrue(session.child != nullptr, "spawned bridge must stay in the session");
  AssertTrue(session.child->WaitFor(std::chrono::seconds(5)), "bridge must be reaped");
  AssertTrue(!session.child->running(), "bridge must not outlive the failure");
}

void AssertReadinessTimeoutKillsBridge(const fs::path& root, const fs::path& python) {
  Harness harness(root, python, FastOptions(), true, true);
  DebugSession session;
  RunError error;
  if (harness.coordinator.Start(harness.context, harness.channel, session, error)) {
    Fail("silent bridge must time out");
  }
  AssertTrue(error.code == RunErrorCode::kTimeout, "expected a timeout error");
  AssertContains(error.message, "no listener on 127.0.0.1:");
  AssertChildGone(session);
  AssertTrue(harness.debugger.descriptors.empty(), "timed-out bridge must not be attached");
  AssertContains(harness.sink_out.str(), "[run-debug] ");
  AssertContains(harness.sink_out.str(), "--wait-for-client");
}

// The elevation tool relays SIGTERM, so the bridge gets to shut down cleanly.
void AssertTimedOutBridgeReceivesTerm(const fs::path& root, const fs::path& python) {
  fs::remove(root / "bridge-terminated");
  DebugBridgeOptions options = FastOptions();
  options.kill_grace = std::chrono::milliseconds(3000);
  Harness harness(root, python, std::move(options), true, true);
  DebugSession session;
  RunError error;
  if (harness.coordinator.Start(harness.context, harness.channel, session, error)) {
    Fail("silent bridge must time out");
  }
  AssertTrue(error.code == RunErrorCode::kTimeout, "expected a timeout error");
  AssertChildGone(session);
  AssertTrue(session.child->exit_code() == 0, "bridge must exit through its TERM handler");
  AssertTrue(fs::exists(root / "bridge-terminated"), "bridge must see SIGTERM");
}

void AssertEarlyExitIsProcessError(const fs::path& root, const fs::path& python) {
  Harness harness(root, python, FastOptions(), true, true);
  DebugSession session;
  RunError error;
  if (harness.coordinator.Start(harness.context, harness.channel, session, error)) {
    Fail("exiting bridge must fail");
  }
  AssertTrue(error.code == RunErrorCode::kProcess, "expected a process error");
  AssertContains(error.message, "exit 4");
}

void AssertPortAllocationFailure(const fs::path& root, const fs::path& python) {
  DebugBridgeOptions options = FastOptions();
  options.allocate_port = [](int&, std::string& error) {
    error = "no free ports";
    return false;
  };
  Harness harness(root, python, std::move(options), true, true);
  DebugSession session;
  RunError error;
  if (harness.coordinator.Start(harness.context, harness.channel, session, error)) {
    Fail("allocation failure must abort");
  }
  AssertTrue(error.code == RunErrorCode::kPortAllocation, "expected a port allocation error");
  AssertTrue(session.child == nullptr, "nothing may be spawned without a port");
}

void AssertDeclinedInstall(const fs::path& root, const fs::path& python) {
  Harness harness(root, python, FastOptions(), false, true);
  DebugSession session;
  RunError error;
  if (harness.coordinator.Start(harness.context, harness.channel, session, error)) {
    Fail("declined install must abort");
  }
  AssertTrue(error.code == RunErrorCode::kEnvironment, "expected an environment error");
  AssertTrue(harness.consent_prompt.calls == 1, "consent must be asked once");
  AssertTrue(session.child == nullptr, "nothing may be spawned without the bridge module");
}

void AssertAttachAfterReadiness(const fs::path& root, const fs::path& python, bool accept) {
  LoopbackListener listener;
  DebugBridgeOptions options = FastOptions();
  options.readiness.timeout = std::chrono::milliseconds(3000);
  const int port = listener.port();
  options.allocate_port = [port](int& out, std::string&) {
    out = port;
    return true;
  };

  Harness harness(root, python, std::move(options), true, accept);
  DebugSession session;
  RunError error;
  const bool started = harness.coordinator.Start(harness.context, harness.channel, session, error);
  AssertTrue(harness.debugger.descriptors.size() == 1U, "attach descriptor must be handed over");

  const auto& descriptor = harness.debugger.descriptors.front();
  AssertTrue(scenkit::core::json::FindStringField(descriptor, "request") == std::string("attach"),
             "descriptor must request attach");
  const auto* connect = scenkit::core::json::FindField(descriptor, "connect");
  AssertTrue(connect != nullptr, "descriptor must carry connect");
  const auto* port_field = scenkit::core::json::FindField(*connect, "port");
  AssertTrue(port_field != nullptr && static_cast<int>(port_field->number_value) == port,
             "descriptor must carry the allocated port");

  if (accept) {
    if (!started) {
      Fail("accepted attach must succeed: " + error.message);
    }
    AssertTrue(session.port == port, "session must record the port");
    AssertTrue(session.child != nullptr && session.child->running(), "bridge must keep running");
    std::string kill_error;
    if (!session.child->Kill(kill_error)) {
      Fail("stopping the bridge failed: " + kill_error);
    }
    AssertChildGone(session);
  } else {
    AssertTrue(!started, "refused attach must fail");
    AssertTrue(error.code == RunErrorCode::kProcess, "refused attach is a process error");
    AssertChildGone(session);
  }
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("scenkit-debug-bridge");
  WriteExecutableScript(root / "fake-sudo", "shift\nexec \"$@\"\n");
  const fs::path silent = WriteExecutableScript(
      root / "python-silent", "[ \"$1\" = \"-c\" ] && exit 0\nexec sleep 30\n");
  const fs::path exiting = WriteExecutableScript(
      root / "python-exiting", "[ \"$1\" = \"-c\" ] && exit 0\nexit 4\n");
  const fs::path bare = WriteExecutableScript(root / "python-bare", "exit 1\n");
  const fs::path graceful = WriteExecutableScript(
      root / "python-graceful", "[ \"$1\" = \"-c\" ] && exit 0\n"
                                "trap 'touch \"" + root.string() + "/bridge-terminated\"; exit 0' TERM\n"
                                "while :; do sleep 1; done\n");

  AssertReadinessTimeoutKillsBridge(root, silent);
  AssertTimedOutBridgeReceivesTerm(root, graceful);
  AssertEarlyExitIsProcessError(root, exiting);
  AssertPortAllocationFailure(root, silent);
  AssertDeclinedInstall(root, bare);
  AssertAttachAfterReadiness(root, silent, true);
  AssertAttachAfterReadiness(root, silent, false);

  RemovePathBestEffort(root);
  return 0;
}
