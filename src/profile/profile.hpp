#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace scenkit::profile {

constexpr std::string_view kToolkitStateDirName = ".scenario-toolkit";
constexpr std::string_view kProfileFileName = "profile.json";
constexpr std::string_view kDefaultRunCommandTemplate = "run.py -s <scenario_name>";
constexpr std::string_view kDefaultScenariosFolderName = "scenarios";
constexpr std::string_view kDefaultOutputFolderName = "io";
constexpr std::string_view kDefaultConfigsFolderName = "configs";
constexpr std::string_view kDefaultInterpreterCommand = "python";

enum class InterpreterStrategy {
  // Look for a virtual environment under the base path, fall back to the
  // fixed path (if any) and finally to the bare interpreter command.
  kAutoDetect,
  kFixed,
};

const char* ToString(InterpreterStrategy strategy);
bool ParseInterpreterStrategy(std::string_view text, InterpreterStrategy& strategy);

// Resolved profile record. Read-only for the duration of a run.
struct Profile {
  std::filesystem::path base_path;
  InterpreterStrategy interpreter_strategy = InterpreterStrategy::kAutoDetect;
  std::optional<std::string> fixed_interpreter_path;
  std::string run_command_template = std::string(kDefaultRunCommandTemplate);
  std::string scenarios_folder_name = std::string(kDefaultScenariosFolderName);
  std::string output_folder_name = std::string(kDefaultOutputFolderName);
  std::string configs_folder_name = std::string(kDefaultConfigsFolderName);

  std::filesystem::path ScenariosRoot() const {
    return base_path / scenarios_folder_name;
  }
  std::filesystem::path StateDir() const {
    return base_path / std::string(kToolkitStateDirName);
  }
};

// Trims, strips path separators, and falls back when nothing is left.
std::string SanitizeFolderName(std::string_view value, std::string_view fallback);

// Default profile location: <base>/.scenario-toolkit/profile.json.
std::filesystem::path DefaultProfilePath(const std::filesystem::path& base_path);

// Parses a profile document. Accepted layout:
//   {
//     "base_path": "...",                       (optional)
//     "interpreter": {"strategy": "auto|fixed", "path": "..."},
//     "run_command_template": "...",
//     "folders": {"scenarios": "...", "output": "...", "configs": "..."}
//   }
// Flat editor-setting keys (`pythonCommand`, `runCommandTemplate`,
// `scenarioIoFolderName`, `scenarioConfigsFolderName`) are honoured when the
// canonical keys are absent. A relative `base_path` resolves against
// `default_base_path`.
bool ParseProfileJson(std::string_view text, const std::filesystem::path& default_base_path,
                      Profile& profile, std::string& error);

// Loads `profile_path`. A missing file yields the defaults rooted at
// `default_base_path`; an unreadable or malformed file is an error.
bool LoadProfile(const std::filesystem::path& profile_path,
                 const std::filesystem::path& default_base_path, Profile& profile,
                 std::string& error);

// Returns the scenario folder that owns `path`: the ancestor (or `path`
// itself) whose parent is the scenarios root. nullopt when `path` is not
// inside the scenarios root.
std::optional<std::filesystem::path> FindScenarioRoot(const std::filesystem::path& path,
                                                      const std::filesystem::path& scenarios_root);

} // namespace scenkit::profile
