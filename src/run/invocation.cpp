#include "run/invocation.hpp"

#include "cmdline/tokenizer.hpp"

#include <cctype>

namespace fs = std::filesystem;

namespace scenkit::run {

namespace {

using core::errors::RunErrorCode;

std::string_view Trim(std::string_view text) {
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
    text.remove_prefix(1);
  }
  while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
    text.remove_suffix(1);
  }
  return text;
}

} // namespace

std::string ExpandTemplate(std::string_view run_template, std::string_view scenario_name) {
  std::string expanded(run_template);
  std::size_t pos = 0;
  while ((pos = expanded.find(kScenarioNamePlaceholder, pos)) != std::string::npos) {
    expanded.replace(pos, kScenarioNamePlaceholder.size(), scenario_name);
    pos += scenario_name.size();
  }
  return expanded;
}

bool BuildInvocation(std::string_view run_template, std::string_view scenario_name,
                     const fs::path& base_path, Invocation& invocation,
                     core::errors::RunError& error) {
  const std::string_view trimmed = Trim(run_template);
  if (trimmed.find(kScenarioNamePlaceholder) == std::string_view::npos) {
    return core::errors::Fail(error, RunErrorCode::kConfiguration,
                              "run command template must include '" +
                                  std::string(kScenarioNamePlaceholder) + "'");
  }

  std::vector<std::string> parts = cmdline::Tokenize(ExpandTemplate(trimmed, scenario_name));
  if (parts.empty()) {
    return core::errors::Fail(error, RunErrorCode::kConfiguration,
                              "run command template expands to an empty command");
  }

  if (parts.front() == kModuleFlag) {
    if (parts.size() < 2U || parts[1].empty()) {
      return core::errors::Fail(error, RunErrorCode::kConfiguration,
                                "module-style run command template is missing the module name");
    }
    ModuleInvocation module;
    module.name = parts[1];
    module.args.assign(parts.begin() + 2, parts.end());
    invocation = std::move(module);
    return true;
  }

  ProgramInvocation program;
  const fs::path program_token(parts.front());
  program.path = program_token.is_absolute() ? program_token : base_path / program_token;
  program.args.assign(parts.begin() + 1, parts.end());
  invocation = std::move(program);
  return true;
}

std::vector<std::string> InterpreterArguments(const Invocation& invocation) {
  std::vector<std::string> argv;
  if (const auto* program = std::get_if<ProgramInvocation>(&invocation)) {
    argv.push_back(program->path.string());
    argv.insert(argv.end(), program->args.begin(), program->args.end());
    return argv;
  }

  const auto& module = std::get<ModuleInvocation>(invocation);
  argv.emplace_back(kModuleFlag);
  argv.push_back(module.name);
  argv.insert(argv.end(), module.args.begin(), module.args.end());
  return argv;
}

const std::vector<std::string>& InvocationArgs(const Invocation& invocation) {
  if (const auto* program = std::get_if<ProgramInvocation>(&invocation)) {
    return program->args;
  }
  return std::get<ModuleInvocation>(invocation).args;
}

} // namespace scenkit::run
