#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace scenkit::orchestrator {

// Replaces every character outside [A-Za-z0-9_-] with '_'.
std::string NormalizeSessionComponent(std::string_view scenario_name);

// Detached session name: "scn_<normalized name>_<epoch ms in base 36>".
std::string BuildDetachedSessionName(std::string_view scenario_name, std::int64_t epoch_ms);

} // namespace scenkit::orchestrator
