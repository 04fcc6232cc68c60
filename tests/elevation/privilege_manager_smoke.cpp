#include "elevation/privilege_manager.hpp"

#include "../common/assertions.hpp"
#include "../common/temp_dir.hpp"
#include "../common/workspace_fixtures.hpp"

#include <filesystem>
#include <optional>
#include <sstream>
#include <string>

namespace fs = std::filesystem;
using scenkit::core::errors::RunError;
using scenkit::core::errors::RunErrorCode;
using scenkit::elevation::ElevationState;
using scenkit::elevation::ElevationToolConfig;
using scenkit::elevation::PrivilegeManager;
using scenkit::tests::common::AssertContains;
using scenkit::tests::common::AssertTrue;
using scenkit::tests::common::CreateUniqueTempDir;
using scenkit::tests::common::Fail;
using scenkit::tests::common::RecordingNotifier;
using scenkit::tests::common::RemovePathBestEffort;
using scenkit::tests::common::ScriptedSecretPrompt;
using scenkit::tests::common::WriteExecutableScript;

namespace {

// Fake elevation tool: `-n true` succeeds only when <root>/session exists,
// `-S -v` accepts the password "hunter2" from stdin and leaves a marker.
fs::path WriteFakeSudo(const fs::path& root) {
  const std::string dir = root.string();
  return WriteExecutableScript(
      root / "fake-sudo",
      "if [ \"$1\" = \"-n\" ]; then\n"
      "  [ -f '" + dir + "/session' ] && exit 0\n"
      "  exit 1\n"
      "fi\n"
      "if [ \"$1\" = \"-S\" ]; then\n"
      "  touch '" + dir + "/validated'\n"
      "  read secret\n"
      "  [ \"$secret\" = \"hunter2\" ] && exit 0\n"
      "  exit 1\n"
      "fi\n"
      "exit 2\n");
}

struct Harness {
  Harness(const fs::path& root, ElevationToolConfig config, std::optional<std::string> secret)
      : store(root / "state.json"),
        prompt(std::move(secret)),
        logger(scenkit::core::logging::LogLevel::kDebug, log_out),
        manager(std::move(config), store, prompt, notifier, logger) {}

  std::ostringstream log_out;
  scenkit::state::ScenarioStateStore store;
  ScriptedSecretPrompt prompt;
  RecordingNotifier notifier;
  scenkit::core::logging::Logger logger;
  PrivilegeManager manager;
};

ElevationToolConfig SupportedTool(const fs::path& program) {
  ElevationToolConfig config;
  config.program = program.string();
  config.platform_supported = true;
  return config;
}

void EnableFlag(Harness& harness, const fs::path& scenario) {
  RunError error;
  if (!harness.manager.SetRequested(scenario, true, error)) {
    Fail("enabling elevation failed: " + error.message);
  }
}

void AssertFlagUnsetSkipsTool(const fs::path& root, const fs::path& sudo) {
  Harness harness(root / "unset", SupportedTool(sudo), std::string("hunter2"));
  bool use = true;
  RunError error;
  if (!harness.manager.Resolve(root / "scenarios" / "a", "a", root, use, error)) {
    Fail("unset flag must resolve: " + error.message);
  }
  AssertTrue(!use, "unset flag must not elevate");
  AssertTrue(harness.prompt.calls == 0, "unset flag must not prompt");
  AssertTrue(harness.manager.last_state() == ElevationState::kDisabled, "state must be disabled");
}

void AssertActiveSessionSkipsPrompt(const fs::path& root, const fs::path& sudo) {
  scenkit::tests::common::WriteTextFile(root / "session", "");
  Harness harness(root / "active", SupportedTool(sudo), std::nullopt);
  const fs::path scenario = root / "scenarios" / "a";
  EnableFlag(harness, scenario);

  bool use = false;
  RunError error;
  if (!harness.manager.Resolve(scenario, "a", root, use, error)) {
    Fail("active session must resolve: " + error.message);
  }
  AssertTrue(use, "active session must elevate");
  AssertTrue(harness.prompt.calls == 0, "active session must not prompt");
  AssertTrue(harness.manager.last_state() == ElevationState::kElevated, "state must be elevated");
  fs::remove(root / "session");
}

void AssertPasswordValidation(const fs::path& root, const fs::path& sudo) {
  const fs::path scenario = root / "scenarios" / "a";
  {
    Harness harness(root / "good", SupportedTool(sudo), std::string("hunter2"));
    EnableFlag(harness, scenario);
    bool use = false;
    RunError error;
    if (!harness.manager.Resolve(scenario, "a", root, use, error)) {
      Fail("correct password must validate: " + error.message);
    }
    AssertTrue(use, "validated password must elevate");
    AssertTrue(harness.prompt.calls == 1, "password must be requested once");
    AssertContains(harness.prompt.last_prompt, "sudo password");
  }
  {
    Harness harness(root / "bad", SupportedTool(sudo), std::string("letmein"));
    EnableFlag(harness, scenario);
    bool use = true;
    RunError error;
    if (harness.manager.Resolve(scenario, "a", root, use, error)) {
      Fail("wrong password must fail");
    }
    AssertTrue(!use, "rejected password must not elevate");
    AssertTrue(error.code == RunErrorCode::kAuthentication, "expected authentication error");
    AssertContains(error.message, "Sudo authentication failed. Execution cancelled.");
    AssertTrue(harness.notifier.errors.empty(), "the caller owns error notification");
  }
}

void AssertCancelNeverValidates(const fs::path& root, const fs::path& sudo) {
  fs::remove(root / "validated");
  Harness harness(root / "cancel", SupportedTool(sudo), std::nullopt);
  const fs::path scenario = root / "scenarios" / "a";
  EnableFlag(harness, scenario);

  bool use = true;
  RunError error;
  if (harness.manager.Resolve(scenario, "a", root, use, error)) {
    Fail("cancelled prompt must fail");
  }
  AssertTrue(error.code == RunErrorCode::kAuthentication, "cancel is an authentication error");
  AssertTrue(!fs::exists(root / "validated"), "cancel must not run the validation step");
  AssertTrue(harness.manager.last_state() == ElevationState::kPasswordPrompt,
             "cancel must stop at the prompt");
}

void AssertUnsupportedPlatformDowngrades(const fs::path& root, const fs::path& sudo) {
  const fs::path state_dir = root / "unsupported";
  const fs::path scenario = root / "scenarios" / "a";
  {
    // Seed the flag as an older toolkit on a supported host would have.
    scenkit::state::ScenarioStateStore seed(state_dir / "state.json");
    std::string seed_error;
    if (!seed.SetElevationEnabled(scenario, true, seed_error)) {
      Fail("seeding state failed: " + seed_error);
    }
  }

  ElevationToolConfig config = SupportedTool(sudo);
  config.platform_supported = false;
  Harness harness(state_dir, config, std::string("hunter2"));
  std::string load_error;
  if (!harness.store.Load(load_error)) {
    Fail("state reload failed: " + load_error);
  }

  bool use = true;
  RunError error;
  if (!harness.manager.Resolve(scenario, "a", root, use, error)) {
    Fail("unsupported platform must downgrade, not fail: " + error.message);
  }
  AssertTrue(!use, "unsupported platform must run unprivileged");
  AssertTrue(harness.prompt.calls == 0, "unsupported platform must not prompt");
  AssertTrue(harness.notifier.warnings.size() == 1U, "downgrade must warn once");
  AssertTrue(harness.manager.last_state() == ElevationState::kRequestedButUnsupported,
             "state must record the downgrade");

  scenkit::state::ScenarioStateStore reloaded(state_dir / "state.json");
  std::string reload_error;
  if (!reloaded.Load(reload_error)) {
    Fail("state reload failed: " + reload_error);
  }
  AssertTrue(!reloaded.IsElevationEnabled(scenario), "flag must be cleared on disk");

  bool enabled = true;
  if (harness.manager.Toggle(scenario, enabled, error)) {
    Fail("enabling on an unsupported platform must be refused");
  }
  AssertTrue(error.code == RunErrorCode::kEnvironment, "refusal is an environment error");
  AssertTrue(!enabled, "refused toggle must report the flag as off");
}

void AssertMissingToolIsEnvironmentError(const fs::path& root) {
  Harness harness(root / "missing", SupportedTool(root / "no-such-sudo"), std::string("x"));
  const fs::path scenario = root / "scenarios" / "a";
  EnableFlag(harness, scenario);
  bool use = true;
  RunError error;
  if (harness.manager.Resolve(scenario, "a", root, use, error)) {
    Fail("missing elevation tool must fail");
  }
  AssertTrue(error.code == RunErrorCode::kEnvironment, "missing tool is an environment error");
  AssertContains(error.message, "elevation tool unavailable");
}

void AssertWrapShape(const fs::path& root, const fs::path& sudo) {
  Harness harness(root / "wrap", SupportedTool(sudo), std::nullopt);
  const auto wrapped = harness.manager.Wrap("/venv/bin/python", {"run.py", "-s", "a"});
  AssertTrue(wrapped.command == sudo.string(), "wrap must run the elevation tool");
  const std::vector<std::string> expected = {"-n", "/venv/bin/python", "run.py", "-s", "a"};
  AssertTrue(wrapped.args == expected, "wrap must be non-interactive and keep argv order");
}

} // namespace

int main() {
  const fs::path root = CreateUniqueTempDir("scenkit-privilege");
  const fs::path sudo = WriteFakeSudo(root);

  AssertFlagUnsetSkipsTool(root, sudo);
  AssertActiveSessionSkipsPrompt(root, sudo);
  AssertPasswordValidation(root, sudo);
  AssertCancelNeverValidates(root, sudo);
  AssertUnsupportedPlatformDowngrades(root, sudo);
  AssertMissingToolIsEnvironmentError(root);
  AssertWrapShape(root, sudo);

  RemovePathBestEffort(root);
  return 0;
}
