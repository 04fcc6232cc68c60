#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scenkit::lastexec {

// Most recent execution across every scenario, recomputed wholesale.
struct LastExecutionInfo {
  std::string scenario_name;
  std::filesystem::path scenario_path;
  std::optional<std::filesystem::path> run_path;
  std::optional<std::string> run_name;
  // Modification time of the newest path found, epoch milliseconds.
  double timestamp_ms = 0.0;
};

// Directory entry names of `root`, folders first, then case-insensitive by
// name. Missing or unreadable roots yield an empty list.
std::vector<std::string> ListEntriesSorted(const std::filesystem::path& root);

// Scans `<scenarios_root>/<scenario>/<output_folder_name>` for every scenario
// folder and returns the scenario owning the newest path. The run folder is
// the first segment below the output folder on the way to that path.
// Strictly-greater comparison: on equal timestamps the first scenario in
// listing order wins. nullopt when no scenario has any output.
std::optional<LastExecutionInfo> FindLastScenarioExecution(
    const std::filesystem::path& scenarios_root, std::string_view output_folder_name);

} // namespace scenkit::lastexec
