#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace scenkit::state {

constexpr std::string_view kStateFileName = "state.json";

// Persisted per-workspace toolkit state that the orchestrator reads and
// clears: the per-scenario elevation flag and the global extra run flags.
//
// Layout of `state.json`:
//   {
//     "global_run_flags": "-v --seed 7",
//     "schema_version": "1.0",
//     "sudo_execution_by_scenario": {"/abs/scenarios/a": true}
//   }
// Scenario keys are normalized absolute paths. Every mutation is written
// through atomically before the setter returns. Safe to share across
// concurrent runs.
class ScenarioStateStore {
public:
  explicit ScenarioStateStore(std::filesystem::path state_path);

  ScenarioStateStore(const ScenarioStateStore&) = delete;
  ScenarioStateStore& operator=(const ScenarioStateStore&) = delete;

  // Reads `state.json`. A missing file is an empty state, not an error.
  bool Load(std::string& error);

  bool IsElevationEnabled(const std::filesystem::path& scenario_path) const;

  // Sets or clears the flag and persists. Clearing an unset flag still
  // rewrites the file so callers can rely on "flag absent on disk".
  bool SetElevationEnabled(const std::filesystem::path& scenario_path, bool enabled,
                           std::string& error);

  std::string GlobalRunFlags() const;

  // Stores the normalized form (see cmdline::NormalizeFlags) and persists.
  bool SetGlobalRunFlags(std::string_view flags, std::string& error);

  const std::filesystem::path& path() const {
    return state_path_;
  }

private:
  bool PersistLocked(std::string& error) const;

  std::filesystem::path state_path_;
  mutable std::mutex mu_;
  std::map<std::string, bool> sudo_by_scenario_;
  std::string global_run_flags_;
};

} // namespace scenkit::state
