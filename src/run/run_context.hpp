#pragma once

#include "run/invocation.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace scenkit::run {

// Everything one run needs, resolved up front. Built fresh by the call that
// starts the run and never shared with another run.
struct RunContext {
  std::filesystem::path base_path;
  std::string interpreter_path;
  std::string scenario_name;
  std::filesystem::path scenario_path;
  Invocation invocation;
  std::vector<std::string> extra_flags;
  bool use_sudo = false;
};

// Interpreter argv tail plus the global extra flags.
inline std::vector<std::string> InterpreterArgumentsWithFlags(const RunContext& context) {
  std::vector<std::string> argv = InterpreterArguments(context.invocation);
  argv.insert(argv.end(), context.extra_flags.begin(), context.extra_flags.end());
  return argv;
}

} // namespace scenkit::run
