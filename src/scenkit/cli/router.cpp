#include "scenkit/cli/router.hpp"

#include "cmdline/tokenizer.hpp"
#include "core/errors/exit_codes.hpp"
#include "core/errors/run_error.hpp"
#include "core/fs_utils.hpp"
#include "orchestrator/orchestrator.hpp"
#include "process/log_sink.hpp"
#include "profile/profile.hpp"
#include "scenkit/cli/terminal_host.hpp"
#include "state/state_store.hpp"

#include <iomanip>
#include <iostream>
#include <memory>
#include <sstream>
#include <system_error>

namespace fs = std::filesystem;

namespace scenkit::cli {

namespace {

using core::errors::RunError;
using core::errors::RunErrorCode;

constexpr std::string_view kVersion = "0.1.0";

constexpr int kExitSuccess = core::errors::ToInt(core::errors::ExitCode::kSuccess);
constexpr int kExitFailure = core::errors::ToInt(core::errors::ExitCode::kFailure);
constexpr int kExitUsage = core::errors::ToInt(core::errors::ExitCode::kUsage);

void PrintUsage(std::ostream& out) {
  out << "usage:\n"
      << "  scenkit run <scenario-dir> [common options]\n"
      << "  scenkit debug <scenario-dir> [common options]\n"
      << "  scenkit detach <scenario-dir> [common options]\n"
      << "  scenkit sudo <scenario-dir> [on|off|toggle] [common options]\n"
      << "  scenkit flags [-- <extra run flags...>] [common options]\n"
      << "  scenkit last [common options]\n"
      << "  scenkit version\n"
      << "common options:\n"
      << "  --base <dir>         program base path (default: current directory)\n"
      << "  --profile <file>     profile JSON (default: <base>/.scenario-toolkit/profile.json)\n"
      << "  --log-level <" << core::logging::ExpectedLogLevelList() << ">\n";
}

int ExitCodeFor(const RunError& error) {
  return core::errors::ToInt(core::errors::ToExitCode(error.code));
}

int ReportError(const RunError& error) {
  std::cerr << "error: " << core::errors::FormatRunError(error) << '\n';
  return ExitCodeFor(error);
}

// Everything one CLI invocation wires together. Members are declared in
// dependency order so the orchestrator is destroyed before its collaborators.
class CliSession {
public:
  CliSession() = default;

  CliSession(const CliSession&) = delete;
  CliSession& operator=(const CliSession&) = delete;

  bool Open(const CommonOptions& options, RunError& error) {
    logger_.SetMinLevel(options.log_level);

    fs::path base_path = options.base_path;
    if (base_path.empty()) {
      std::error_code ec;
      base_path = fs::current_path(ec);
      if (ec) {
        return core::errors::Fail(error, RunErrorCode::kConfiguration,
                                  "cannot determine current directory: " + ec.message());
      }
    }
    std::error_code ec;
    const fs::path absolute_base = fs::absolute(base_path, ec);
    if (!ec) {
      base_path = absolute_base.lexically_normal();
    }

    const fs::path profile_path =
        options.profile_path.value_or(profile::DefaultProfilePath(base_path));
    std::string load_error;
    if (!profile::LoadProfile(profile_path, base_path, profile_, load_error)) {
      return core::errors::Fail(error, RunErrorCode::kConfiguration, load_error);
    }
    logger_.Debug("profile loaded",
                  {{"profile", profile_path.string()},
                   {"base_path", profile_.base_path.string()},
                   {"template", profile_.run_command_template}});

    store_ = std::make_unique<state::ScenarioStateStore>(profile_.StateDir() /
                                                        std::string(state::kStateFileName));
    std::string state_error;
    if (!store_->Load(state_error)) {
      return core::errors::Fail(error, RunErrorCode::kConfiguration, state_error);
    }

    debugger_ = std::make_unique<DescriptorFileDebuggerHost>(profile_.StateDir() / "debug");
    orchestrator_ = std::make_unique<orchestrator::Orchestrator>(
        profile_, *store_,
        orchestrator::HostServices{secret_, consent_, *debugger_, notifier_}, sink_, logger_);
    return true;
  }

  // A scenario argument that does not exist as given is looked up under the
  // scenarios root, so `scenkit run smoke` works from anywhere.
  fs::path ResolveScenarioArgument(std::string_view raw) const {
    const fs::path given(raw);
    if (core::IsExistingDirectory(given) || given.is_absolute()) {
      return given;
    }
    return profile_.ScenariosRoot() / given;
  }

  orchestrator::Orchestrator& orchestrator() {
    return *orchestrator_;
  }

  const profile::Profile& profile() const {
    return profile_;
  }

private:
  core::logging::Logger logger_;
  process::LogSink sink_;
  StreamNotifier notifier_;
  TerminalSecretPrompt secret_;
  TerminalConsentPrompt consent_;
  profile::Profile profile_;
  std::unique_ptr<DescriptorFileDebuggerHost> debugger_;
  std::unique_ptr<state::ScenarioStateStore> store_;
  std::unique_ptr<orchestrator::Orchestrator> orchestrator_;
};

int CommandVersion(const std::vector<std::string_view>& args) {
  if (!args.empty()) {
    std::cerr << "error: version does not accept arguments\n";
    return kExitUsage;
  }

  std::cout << "scenkit " << kVersion << '\n';
  return kExitSuccess;
}

int CommandExecute(orchestrator::RunStrategy strategy, const std::vector<std::string_view>& args) {
  CommonOptions options;
  std::vector<std::string> positional;
  std::string error;
  if (!ParseCommonOptions(args, options, positional, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (positional.size() != 1) {
    std::cerr << "error: " << orchestrator::ToString(strategy)
              << " requires exactly 1 argument: <scenario-dir>\n";
    return kExitUsage;
  }

  CliSession session;
  RunError run_error;
  if (!session.Open(options, run_error)) {
    return ReportError(run_error);
  }

  std::future<orchestrator::RunOutcome> pending = session.orchestrator().Submit(
      strategy, session.ResolveScenarioArgument(positional.front()));
  const orchestrator::RunOutcome outcome = pending.get();

  if (outcome.error.has_value()) {
    return ExitCodeFor(*outcome.error);
  }
  if (outcome.session_name.has_value()) {
    std::cout << "session: " << *outcome.session_name << '\n';
  }
  if (outcome.exit_code.has_value()) {
    std::cout << "exit_code: " << *outcome.exit_code << '\n';
    return *outcome.exit_code == 0 ? kExitSuccess : kExitFailure;
  }
  return outcome.started ? kExitSuccess : kExitFailure;
}

int CommandSudo(const std::vector<std::string_view>& args) {
  CommonOptions options;
  std::vector<std::string> positional;
  std::string error;
  if (!ParseCommonOptions(args, options, positional, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (positional.empty() || positional.size() > 2) {
    std::cerr << "error: sudo requires <scenario-dir> [on|off|toggle]\n";
    return kExitUsage;
  }
  const std::string mode = positional.size() == 2 ? positional[1] : std::string("toggle");
  if (mode != "on" && mode != "off" && mode != "toggle") {
    std::cerr << "error: invalid sudo mode '" << mode << "' (expected on|off|toggle)\n";
    return kExitUsage;
  }

  CliSession session;
  RunError run_error;
  if (!session.Open(options, run_error)) {
    return ReportError(run_error);
  }

  const fs::path scenario = session.ResolveScenarioArgument(positional.front());
  bool enabled = false;
  if (mode == "toggle") {
    if (!session.orchestrator().ToggleElevated(scenario, enabled, run_error)) {
      return ReportError(run_error);
    }
  } else {
    enabled = mode == "on";
    if (!session.orchestrator().SetElevated(scenario, enabled, run_error)) {
      return ReportError(run_error);
    }
  }

  std::cout << "sudo: " << (enabled ? "enabled" : "disabled") << '\n';
  return kExitSuccess;
}

int CommandFlags(const std::vector<std::string_view>& args) {
  CommonOptions options;
  std::vector<std::string> positional;
  std::string error;
  if (!ParseCommonOptions(args, options, positional, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }

  CliSession session;
  RunError run_error;
  if (!session.Open(options, run_error)) {
    return ReportError(run_error);
  }

  bool set_requested = false;
  for (const std::string_view token : args) {
    if (token == "--") {
      set_requested = true;
      break;
    }
  }
  if (set_requested || !positional.empty()) {
    std::string joined;
    for (const std::string& token : positional) {
      if (!joined.empty()) {
        joined.push_back(' ');
      }
      joined += cmdline::QuoteIfNeeded(token);
    }
    if (!session.orchestrator().SetGlobalExtraFlags(joined, run_error)) {
      return ReportError(run_error);
    }
  }

  std::cout << "flags: " << session.orchestrator().GlobalExtraFlags() << '\n';
  return kExitSuccess;
}

int CommandLast(const std::vector<std::string_view>& args) {
  CommonOptions options;
  std::vector<std::string> positional;
  std::string error;
  if (!ParseCommonOptions(args, options, positional, error)) {
    std::cerr << "error: " << error << '\n';
    return kExitUsage;
  }
  if (!positional.empty()) {
    std::cerr << "error: last does not accept positional arguments\n";
    return kExitUsage;
  }

  CliSession session;
  RunError run_error;
  if (!session.Open(options, run_error)) {
    return ReportError(run_error);
  }

  const std::optional<lastexec::LastExecutionInfo> last =
      session.orchestrator().RefreshLastExecution();
  if (!last.has_value()) {
    std::cout << "last: none\n";
    return kExitSuccess;
  }

  std::ostringstream timestamp;
  timestamp << std::fixed << std::setprecision(0) << last->timestamp_ms;
  std::cout << "scenario: " << last->scenario_name << '\n'
            << "scenario_path: " << last->scenario_path.string() << '\n'
            << "run: " << last->run_name.value_or("") << '\n'
            << "run_path: " << (last->run_path.has_value() ? last->run_path->string() : "") << '\n'
            << "timestamp_ms: " << timestamp.str() << '\n';
  return kExitSuccess;
}

} // namespace

bool ParseCommonOptions(const std::vector<std::string_view>& args, CommonOptions& options,
                        std::vector<std::string>& positional, std::string& error) {
  positional.clear();
  bool options_ended = false;
  for (std::size_t i = 0; i < args.size(); ++i) {
    const std::string_view token = args[i];
    if (options_ended) {
      positional.emplace_back(token);
      continue;
    }
    if (token == "--") {
      options_ended = true;
      continue;
    }
    if (token == "--base") {
      if (i + 1 >= args.size()) {
        error = "missing value for --base";
        return false;
      }
      options.base_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--profile") {
      if (i + 1 >= args.size()) {
        error = "missing value for --profile";
        return false;
      }
      options.profile_path = fs::path(args[i + 1]);
      ++i;
      continue;
    }
    if (token == "--log-level") {
      if (i + 1 >= args.size()) {
        error = "missing value for --log-level";
        return false;
      }
      core::logging::LogLevel parsed = core::logging::LogLevel::kInfo;
      if (!core::logging::ParseLogLevel(args[i + 1], parsed, error)) {
        return false;
      }
      options.log_level = parsed;
      ++i;
      continue;
    }

    if (token.size() > 1 && token.front() == '-') {
      error = "unknown option: " + std::string(token);
      return false;
    }

    positional.emplace_back(token);
  }
  return true;
}

int Dispatch(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage(std::cerr);
    return kExitUsage;
  }

  const std::string_view command(argv[1]);
  const std::vector<std::string_view> args(argv + 2, argv + argc);

  if (command == "version") {
    return CommandVersion(args);
  }

  orchestrator::RunStrategy strategy = orchestrator::RunStrategy::kPlain;
  if (orchestrator::ParseRunStrategy(command, strategy)) {
    return CommandExecute(strategy, args);
  }

  if (command == "sudo") {
    return CommandSudo(args);
  }

  if (command == "flags") {
    return CommandFlags(args);
  }

  if (command == "last") {
    return CommandLast(args);
  }

  if (command == "help" || command == "--help" || command == "-h") {
    PrintUsage(std::cout);
    return kExitSuccess;
  }

  std::cerr << "error: unknown subcommand: " << command << '\n';
  PrintUsage(std::cerr);
  return kExitUsage;
}

} // namespace scenkit::cli
