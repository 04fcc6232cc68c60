#pragma once

#include "core/errors/run_error.hpp"

#include <filesystem>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace scenkit::run {

// Placeholder every run-command template must contain.
constexpr std::string_view kScenarioNamePlaceholder = "<scenario_name>";

// Leading template token that selects named-module invocation.
constexpr std::string_view kModuleFlag = "-m";

struct ProgramInvocation {
  std::filesystem::path path;
  std::vector<std::string> args;
};

struct ModuleInvocation {
  std::string name;
  std::vector<std::string> args;
};

// Derived once per run from the profile template; never mutated afterwards.
using Invocation = std::variant<ProgramInvocation, ModuleInvocation>;

// Replaces every occurrence of the placeholder with `scenario_name`.
std::string ExpandTemplate(std::string_view run_template, std::string_view scenario_name);

// Expands and tokenizes `run_template` for one scenario.
//
// Program paths that are not absolute are joined onto `base_path`.
// Returns false with a kConfiguration error when the template lacks the
// placeholder, expands to nothing, or names `-m` without a module.
bool BuildInvocation(std::string_view run_template, std::string_view scenario_name,
                     const std::filesystem::path& base_path, Invocation& invocation,
                     core::errors::RunError& error);

// Interpreter argv tail for `invocation`:
//   Program -> [path, args...]
//   Module  -> ["-m", name, args...]
std::vector<std::string> InterpreterArguments(const Invocation& invocation);

// Invocation args only (no program path or module name).
const std::vector<std::string>& InvocationArgs(const Invocation& invocation);

} // namespace scenkit::run
