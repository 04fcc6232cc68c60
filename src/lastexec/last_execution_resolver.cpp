#include "lastexec/last_execution_resolver.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

namespace fs = std::filesystem;

namespace scenkit::lastexec {

namespace {

struct NewestPath {
  fs::path path;
  double mtime_ms = -1.0;
};

std::string Lowercase(std::string text) {
  std::transform(text.begin(), text.end(), text.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return text;
}

// Depth-first walk tracking the single newest entry. Entries that vanish or
// cannot be stat'ed mid-walk are skipped.
void VisitNewest(const fs::path& directory, NewestPath& newest) {
  for (const std::string& name : ListEntriesSorted(directory)) {
    const fs::path full = directory / name;
    const std::optional<double> mtime = core::ModificationTimeMs(full);
    if (!mtime.has_value()) {
      continue;
    }
    if (*mtime > newest.mtime_ms) {
      newest.mtime_ms = *mtime;
      newest.path = full;
    }

    std::error_code ec;
    if (fs::is_directory(full, ec) && !fs::is_symlink(full, ec)) {
      VisitNewest(full, newest);
    }
  }
}

struct RunCandidate {
  fs::path run_path;
  double mtime_ms = -1.0;
};

std::optional<RunCandidate> FindLatestRunForScenario(const fs::path& scenario_path,
                                                    std::string_view output_folder_name) {
  const fs::path output_path = scenario_path / std::string(output_folder_name);
  if (!core::IsExistingDirectory(output_path)) {
    return std::nullopt;
  }

  NewestPath newest;
  VisitNewest(output_path, newest);
  if (newest.path.empty()) {
    return std::nullopt;
  }

  const fs::path relative = newest.path.lexically_relative(output_path);
  if (relative.empty() || relative.begin() == relative.end()) {
    return std::nullopt;
  }
  const fs::path run_folder = *relative.begin();
  if (run_folder.empty() || run_folder == "..") {
    return std::nullopt;
  }

  RunCandidate candidate;
  candidate.run_path = output_path / run_folder;
  candidate.mtime_ms = newest.mtime_ms;
  return candidate;
}

} // namespace

std::vector<std::string> ListEntriesSorted(const fs::path& root) {
  struct Entry {
    std::string name;
    std::string key;
    bool is_directory = false;
  };

  std::vector<Entry> entries;
  std::error_code ec;
  fs::directory_iterator it(root, ec);
  if (ec) {
    return {};
  }
  const fs::directory_iterator end;
  for (; it != end; it.increment(ec)) {
    if (ec) {
      break;
    }
    Entry entry;
    entry.name = it->path().filename().string();
    entry.key = Lowercase(entry.name);
    std::error_code type_ec;
    entry.is_directory = it->is_directory(type_ec);
    entries.push_back(std::move(entry));
  }

  std::sort(entries.begin(), entries.end(), [](const Entry& lhs, const Entry& rhs) {
    if (lhs.is_directory != rhs.is_directory) {
      return lhs.is_directory;
    }
    if (lhs.key != rhs.key) {
      return lhs.key < rhs.key;
    }
    return lhs.name < rhs.name;
  });

  std::vector<std::string> names;
  names.reserve(entries.size());
  for (Entry& entry : entries) {
    names.push_back(std::move(entry.name));
  }
  return names;
}

std::optional<LastExecutionInfo> FindLastScenarioExecution(const fs::path& scenarios_root,
                                                           std::string_view output_folder_name) {
  if (!core::IsExistingDirectory(scenarios_root)) {
    return std::nullopt;
  }

  std::optional<LastExecutionInfo> newest;
  for (const std::string& scenario_name : ListEntriesSorted(scenarios_root)) {
    const fs::path scenario_path = scenarios_root / scenario_name;
    if (!core::IsExistingDirectory(scenario_path)) {
      continue;
    }

    const std::optional<RunCandidate> candidate =
        FindLatestRunForScenario(scenario_path, output_folder_name);
    if (!candidate.has_value()) {
      continue;
    }
    if (newest.has_value() && !(candidate->mtime_ms > newest->timestamp_ms)) {
      continue;
    }

    LastExecutionInfo info;
    info.scenario_name = scenario_name;
    info.scenario_path = scenario_path;
    info.run_path = candidate->run_path;
    info.run_name = candidate->run_path.filename().string();
    info.timestamp_ms = candidate->mtime_ms;
    newest = std::move(info);
  }
  return newest;
}

} // namespace scenkit::lastexec
