#include "orchestrator/session_naming.hpp"

#include "core/time_utils.hpp"

namespace scenkit::orchestrator {

std::string NormalizeSessionComponent(std::string_view scenario_name) {
  std::string normalized;
  normalized.reserve(scenario_name.size());
  for (const char c : scenario_name) {
    const bool keep = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                      c == '_' || c == '-';
    normalized.push_back(keep ? c : '_');
  }
  return normalized;
}

std::string BuildDetachedSessionName(std::string_view scenario_name, std::int64_t epoch_ms) {
  return "scn_" + NormalizeSessionComponent(scenario_name) + "_" + core::ToBase36(epoch_ms);
}

} // namespace scenkit::orchestrator
