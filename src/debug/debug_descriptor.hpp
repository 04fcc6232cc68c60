#pragma once

#include "core/json_dom.hpp"
#include "run/run_context.hpp"

#include <string>
#include <string_view>

namespace scenkit::debug {

// Loopback host every bridge listens on and every attach connects to.
constexpr std::string_view kLoopbackHost = "127.0.0.1";

// Display name shared by launch and attach descriptors.
std::string ScenarioConfigurationName(std::string_view scenario_name);

// Launch descriptor for the unprivileged debug path. The host debugger runs
// the interpreter itself:
//   type=debugpy request=launch name cwd python console justMyCode
//   program|module args
// `args` is the invocation args followed by the global extra flags.
core::json::Value BuildLaunchDescriptor(const run::RunContext& context);

// Attach descriptor for the elevated debug path, pointing at the bridge the
// coordinator started on `port`. Local and remote roots are both the base
// path since the bridge runs on this host.
core::json::Value BuildAttachDescriptor(const run::RunContext& context, int port);

} // namespace scenkit::debug
