#include "debug/debug_descriptor.hpp"

#include <type_traits>
#include <variant>

namespace scenkit::debug {

namespace {

using core::json::MakeArray;
using core::json::MakeBool;
using core::json::MakeNumber;
using core::json::MakeObject;
using core::json::MakeString;
using core::json::Value;

Value MakeStringArray(const std::vector<std::string>& items) {
  Value array = MakeArray();
  array.array_value.reserve(items.size());
  for (const std::string& item : items) {
    array.array_value.push_back(MakeString(item));
  }
  return array;
}

} // namespace

std::string ScenarioConfigurationName(std::string_view scenario_name) {
  return "Scenario Toolkit: " + std::string(scenario_name);
}

Value BuildLaunchDescriptor(const run::RunContext& context) {
  Value descriptor = MakeObject();
  auto& fields = descriptor.object_value;
  fields["type"] = MakeString("debugpy");
  fields["request"] = MakeString("launch");
  fields["name"] = MakeString(ScenarioConfigurationName(context.scenario_name));
  fields["cwd"] = MakeString(context.base_path.string());
  fields["python"] = MakeString(context.interpreter_path);
  fields["console"] = MakeString("integratedTerminal");
  fields["justMyCode"] = MakeBool(false);

  std::visit(
      [&fields](const auto& target) {
        using T = std::decay_t<decltype(target)>;
        if constexpr (std::is_same_v<T, run::ProgramInvocation>) {
          fields["program"] = MakeString(target.path.string());
        } else {
          fields["module"] = MakeString(target.name);
        }
      },
      context.invocation);

  std::vector<std::string> args = run::InvocationArgs(context.invocation);
  args.insert(args.end(), context.extra_flags.begin(), context.extra_flags.end());
  fields["args"] = MakeStringArray(args);
  return descriptor;
}

Value BuildAttachDescriptor(const run::RunContext& context, int port) {
  Value descriptor = MakeObject();
  auto& fields = descriptor.object_value;
  fields["type"] = MakeString("python");
  fields["request"] = MakeString("attach");
  fields["name"] = MakeString(ScenarioConfigurationName(context.scenario_name));

  Value connect = MakeObject();
  connect.object_value["host"] = MakeString(std::string(kLoopbackHost));
  connect.object_value["port"] = MakeNumber(static_cast<double>(port));
  fields["connect"] = std::move(connect);

  Value mapping = MakeObject();
  mapping.object_value["localRoot"] = MakeString(context.base_path.string());
  mapping.object_value["remoteRoot"] = MakeString(context.base_path.string());
  Value mappings = MakeArray();
  mappings.array_value.push_back(std::move(mapping));
  fields["pathMappings"] = std::move(mappings);

  fields["justMyCode"] = MakeBool(false);
  return descriptor;
}

} // namespace scenkit::debug
