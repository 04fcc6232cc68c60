#include "run/invocation.hpp"
#include "run/run_context.hpp"

#include <catch2/catch.hpp>

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace fs = std::filesystem;

using scenkit::core::errors::RunError;
using scenkit::core::errors::RunErrorCode;
using scenkit::run::BuildInvocation;
using scenkit::run::ExpandTemplate;
using scenkit::run::Invocation;
using scenkit::run::InterpreterArguments;
using scenkit::run::ModuleInvocation;
using scenkit::run::ProgramInvocation;

namespace {

const fs::path kBase = fs::path("/srv/program");

} // namespace

TEST_CASE("ExpandTemplate replaces only the placeholder", "[run][invocation]") {
  REQUIRE(ExpandTemplate("run.py -s <scenario_name> --keep <x>", "alpha") ==
          "run.py -s alpha --keep <x>");
  REQUIRE(ExpandTemplate("<scenario_name>/<scenario_name>.py", "b") == "b/b.py");
  REQUIRE(ExpandTemplate("a  <scenario_name>  z", "<scenario_name>") == "a  <scenario_name>  z");
}

TEST_CASE("Program template joins a relative program onto the base path", "[run][invocation]") {
  Invocation invocation;
  RunError error;
  REQUIRE(BuildInvocation("<scenario_name>.py --flag", "run1", kBase, invocation, error));

  const auto* program = std::get_if<ProgramInvocation>(&invocation);
  REQUIRE(program != nullptr);
  REQUIRE(program->path == kBase / "run1.py");
  REQUIRE(program->args == std::vector<std::string>{"--flag"});
}

TEST_CASE("Program template keeps an absolute program path", "[run][invocation]") {
  Invocation invocation;
  RunError error;
  REQUIRE(BuildInvocation("  /opt/tools/run.py -s <scenario_name>  ", "smoke", kBase, invocation,
                          error));

  const auto* program = std::get_if<ProgramInvocation>(&invocation);
  REQUIRE(program != nullptr);
  REQUIRE(program->path == fs::path("/opt/tools/run.py"));
  REQUIRE(program->args == std::vector<std::string>{"-s", "smoke"});
  REQUIRE(InterpreterArguments(invocation) ==
          std::vector<std::string>{"/opt/tools/run.py", "-s", "smoke"});
}

TEST_CASE("Module template yields a module invocation", "[run][invocation]") {
  Invocation invocation;
  RunError error;
  REQUIRE(BuildInvocation("-m pkg.<scenario_name> --x 1", "mod", kBase, invocation, error));

  const auto* module = std::get_if<ModuleInvocation>(&invocation);
  REQUIRE(module != nullptr);
  REQUIRE(module->name == "pkg.mod");
  REQUIRE(module->args == std::vector<std::string>{"--x", "1"});
  REQUIRE(InterpreterArguments(invocation) ==
          std::vector<std::string>{"-m", "pkg.mod", "--x", "1"});
}

TEST_CASE("Template errors are configuration errors", "[run][invocation]") {
  Invocation invocation;
  RunError error;

  SECTION("placeholder missing") {
    REQUIRE_FALSE(BuildInvocation("-m pkg.mod --x 1", "mod", kBase, invocation, error));
    REQUIRE(error.code == RunErrorCode::kConfiguration);
    REQUIRE(error.message.find("<scenario_name>") != std::string::npos);
  }
  SECTION("module flag without module name") {
    REQUIRE_FALSE(BuildInvocation("-m <scenario_name>", "", kBase, invocation, error));
    REQUIRE(error.code == RunErrorCode::kConfiguration);
  }
  SECTION("expansion leaves nothing to run") {
    REQUIRE_FALSE(BuildInvocation("  <scenario_name>  ", "", kBase, invocation, error));
    REQUIRE(error.code == RunErrorCode::kConfiguration);
  }
}

TEST_CASE("Extra flags follow the invocation arguments", "[run][invocation]") {
  scenkit::run::RunContext context;
  context.invocation = ProgramInvocation{kBase / "run.py", {"-s", "a"}};
  context.extra_flags = {"-v", "--seed", "7"};
  REQUIRE(scenkit::run::InterpreterArgumentsWithFlags(context) ==
          std::vector<std::string>{(kBase / "run.py").string(), "-s", "a", "-v", "--seed", "7"});
}
