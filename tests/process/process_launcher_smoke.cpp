#include "process/log_sink.hpp"
#include "process/process_launcher.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"

#include <chrono>
#include <filesystem>
#include <memory>
#include <sstream>
#include <string>
#include <thread>

namespace fs = std::filesystem;
using scenkit::tests::common::AssertContains;
using scenkit::tests::common::AssertNotContains;
using scenkit::tests::common::CreateUniqueTempDir;
using scenkit::tests::common::Fail;
using scenkit::tests::common::RemovePathBestEffort;

namespace {

using scenkit::process::ChildProcess;
using scenkit::process::LaunchRequest;
using scenkit::process::ProcessEvent;
using scenkit::process::RunChannel;

void AssertMergedOutputAndExitLine(const fs::path& cwd) {
  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);
  RunChannel channel;

  LaunchRequest request;
  request.command = "/bin/sh";
  request.args = {"-c", "echo to-stdout; echo to-stderr 1>&2; exit 7"};
  request.working_dir = cwd;
  request.strategy_tag = "run";

  std::unique_ptr<ChildProcess> child;
  std::string error;
  if (!scenkit::process::Spawn(request, sink, &channel, child, error)) {
    Fail("spawn failed: " + error);
  }

  const auto event = channel.PopFor(std::chrono::seconds(10));
  if (!event.has_value() || event->kind != ProcessEvent::Kind::kExited) {
    Fail("expected an exit event");
  }
  if (event->exit_code != 7) {
    Fail("expected exit code 7");
  }
  if (child->running()) {
    Fail("child should be reaped after its exit event");
  }

  const std::string text = captured.str();
  AssertContains(text, "to-stdout\n");
  AssertContains(text, "to-stderr\n");
  AssertContains(text, "[run-exit] code=7\n");
  if (text.find("[run-exit]") < text.find("to-stderr")) {
    Fail("exit line must follow the child's output");
  }
}

void AssertSpawnFailureHasNoExitLine(const fs::path& cwd) {
  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);
  RunChannel channel;

  LaunchRequest request;
  request.command = "scenkit-definitely-not-a-real-program";
  request.working_dir = cwd;

  std::unique_ptr<ChildProcess> child;
  std::string error;
  if (scenkit::process::Spawn(request, sink, &channel, child, error)) {
    Fail("spawning a missing executable must fail");
  }
  AssertContains(error, "failed to start 'scenkit-definitely-not-a-real-program'");
  if (child != nullptr) {
    Fail("no handle expected on spawn failure");
  }
  AssertNotContains(captured.str(), "-exit]");
  if (channel.PopFor(std::chrono::milliseconds(50)).has_value()) {
    Fail("no exit event expected on spawn failure");
  }

  request.command = "/bin/sh";
  request.working_dir = cwd / "missing-dir";
  if (scenkit::process::Spawn(request, sink, &channel, child, error)) {
    Fail("spawning into a missing working directory must fail");
  }
}

void AssertKillReportsUnknownExit(const fs::path& cwd) {
  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);

  LaunchRequest request;
  request.command = "sleep";
  request.args = {"30"};
  request.working_dir = cwd;
  request.strategy_tag = "run-debug";

  std::unique_ptr<ChildProcess> child;
  std::string error;
  if (!scenkit::process::Spawn(request, sink, nullptr, child, error)) {
    Fail("spawn failed: " + error);
  }
  if (!child->running()) {
    Fail("sleep should still be running");
  }

  const auto started = std::chrono::steady_clock::now();
  if (!child->Kill(error)) {
    Fail("kill failed: " + error);
  }
  const auto exit_code = child->Wait();
  if (exit_code.has_value()) {
    Fail("a killed child has no exit code");
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
    Fail("kill took too long");
  }
  AssertContains(captured.str(), "[run-debug-exit] code=unknown");

  std::string reaped_error;
  if (!child->Kill(reaped_error) || !reaped_error.empty()) {
    Fail("killing a reaped child is a no-op");
  }
}

// Waits for a file the child writes once its TERM trap is installed.
void WaitForFile(const fs::path& path) {
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (!fs::exists(path)) {
    if (std::chrono::steady_clock::now() > deadline) {
      Fail("timed out waiting for " + path.string());
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(20));
  }
}

void AssertKillGraceLetsChildHandleTerm(const fs::path& cwd) {
  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);
  fs::remove(cwd / "term-ready");
  fs::remove(cwd / "term-handled");

  LaunchRequest request;
  request.command = "/bin/sh";
  request.args = {"-c",
                  "trap 'touch term-handled; exit 0' TERM; touch term-ready; "
                  "while :; do sleep 1; done"};
  request.working_dir = cwd;
  request.strategy_tag = "run-debug";
  request.kill_grace = std::chrono::milliseconds(3000);

  std::unique_ptr<ChildProcess> child;
  std::string error;
  if (!scenkit::process::Spawn(request, sink, nullptr, child, error)) {
    Fail("spawn failed: " + error);
  }
  WaitForFile(cwd / "term-ready");

  if (!child->Kill(error)) {
    Fail("graceful kill failed: " + error);
  }
  const auto exit_code = child->Wait();
  if (exit_code != 0) {
    Fail("child must exit through its TERM handler");
  }
  if (!fs::exists(cwd / "term-handled")) {
    Fail("TERM handler must have run");
  }
  AssertContains(captured.str(), "[run-debug-exit] code=0");
}

void AssertKillGraceEscalatesToSigkill(const fs::path& cwd) {
  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);
  fs::remove(cwd / "term-ready");

  LaunchRequest request;
  request.command = "/bin/sh";
  request.args = {"-c", "trap '' TERM; touch term-ready; while :; do sleep 1; done"};
  request.working_dir = cwd;
  request.kill_grace = std::chrono::milliseconds(300);

  std::unique_ptr<ChildProcess> child;
  std::string error;
  if (!scenkit::process::Spawn(request, sink, nullptr, child, error)) {
    Fail("spawn failed: " + error);
  }
  WaitForFile(cwd / "term-ready");

  const auto started = std::chrono::steady_clock::now();
  if (!child->Kill(error)) {
    Fail("escalated kill failed: " + error);
  }
  const auto exit_code = child->Wait();
  if (exit_code.has_value()) {
    Fail("a child that ignores TERM must be killed");
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
    Fail("escalation took too long");
  }
  AssertContains(captured.str(), "[run-exit] code=unknown");
}

void AssertRunAndWaitFeedsStdinAndUsesWorkingDir(const fs::path& cwd) {
  LaunchRequest request;
  request.command = "/bin/sh";
  request.args = {"-c", "read secret; echo got:$secret; pwd"};
  request.working_dir = cwd;
  request.stdin_text = std::string("hunter2\n");

  scenkit::process::CapturedRun result;
  std::string error;
  if (!scenkit::process::RunAndWait(request, result, error)) {
    Fail("RunAndWait failed: " + error);
  }
  if (result.exit_code != 0) {
    Fail("expected exit code 0");
  }
  AssertContains(result.output, "got:hunter2");
  AssertContains(result.output, fs::canonical(cwd).string());
  AssertNotContains(result.output, "-exit]");
}

void AssertDestructorKillsRunningChild(const fs::path& cwd) {
  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);

  LaunchRequest request;
  request.command = "sleep";
  request.args = {"30"};
  request.working_dir = cwd;

  const auto started = std::chrono::steady_clock::now();
  {
    std::unique_ptr<ChildProcess> child;
    std::string error;
    if (!scenkit::process::Spawn(request, sink, nullptr, child, error)) {
      Fail("spawn failed: " + error);
    }
  }
  if (std::chrono::steady_clock::now() - started > std::chrono::seconds(5)) {
    Fail("destroying the handle must not wait for the child to finish on its own");
  }
  AssertContains(captured.str(), "[run-exit] code=unknown");
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("scenkit-process-launcher");

  AssertMergedOutputAndExitLine(root);
  AssertSpawnFailureHasNoExitLine(root);
  AssertKillReportsUnknownExit(root);
  AssertKillGraceLetsChildHandleTerm(root);
  AssertKillGraceEscalatesToSigkill(root);
  AssertRunAndWaitFeedsStdinAndUsesWorkingDir(root);
  AssertDestructorKillsRunningChild(root);

  RemovePathBestEffort(root);
  return 0;
}
