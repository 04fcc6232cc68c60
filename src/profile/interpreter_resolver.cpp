#include "profile/interpreter_resolver.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <array>
#include <string_view>
#include <system_error>
#include <vector>

namespace fs = std::filesystem;

namespace scenkit::profile {

namespace {

constexpr std::string_view kVenvMarker = "pyvenv.cfg";
constexpr std::array<std::string_view, 3> kPreferredVenvDirs = {".venv", "venv", "env"};

std::vector<fs::path> InterpreterCandidates(const fs::path& venv_root) {
  const fs::path unix_python = venv_root / "bin" / "python";
  const fs::path unix_python3 = venv_root / "bin" / "python3";
  const fs::path windows_python = venv_root / "Scripts" / "python.exe";
#if defined(_WIN32)
  return {windows_python, unix_python, unix_python3};
#else
  return {unix_python, unix_python3, windows_python};
#endif
}

bool HasActivateScript(const fs::path& venv_root) {
  return core::IsExistingRegularFile(venv_root / "bin" / "activate") ||
         core::IsExistingRegularFile(venv_root / "Scripts" / "activate") ||
         core::IsExistingRegularFile(venv_root / "Scripts" / "activate.bat");
}

} // namespace

std::optional<fs::path> FindInterpreterInVenvRoot(const fs::path& venv_root) {
  std::optional<fs::path> interpreter;
  for (const auto& candidate : InterpreterCandidates(venv_root)) {
    if (core::IsExistingRegularFile(candidate)) {
      interpreter = candidate;
      break;
    }
  }
  if (!interpreter.has_value()) {
    return std::nullopt;
  }

  if (core::IsExistingRegularFile(venv_root / std::string(kVenvMarker)) ||
      HasActivateScript(venv_root)) {
    return interpreter;
  }
  return std::nullopt;
}

std::optional<fs::path> FindInterpreterInBasePath(const fs::path& base_path) {
  if (auto root_candidate = FindInterpreterInVenvRoot(base_path)) {
    return root_candidate;
  }

  for (const std::string_view dir_name : kPreferredVenvDirs) {
    if (auto candidate = FindInterpreterInVenvRoot(base_path / std::string(dir_name))) {
      return candidate;
    }
  }

  std::error_code ec;
  std::vector<fs::path> others;
  for (fs::directory_iterator it(base_path, ec), end; !ec && it != end; it.increment(ec)) {
    const std::string name = it->path().filename().string();
    const bool preferred = std::find(kPreferredVenvDirs.begin(), kPreferredVenvDirs.end(),
                                     name) != kPreferredVenvDirs.end();
    if (preferred || !core::IsExistingDirectory(it->path())) {
      continue;
    }
    others.push_back(it->path());
  }
  std::sort(others.begin(), others.end());

  for (const auto& candidate_dir : others) {
    if (auto candidate = FindInterpreterInVenvRoot(candidate_dir)) {
      return candidate;
    }
  }
  return std::nullopt;
}

std::string ResolveInterpreter(const Profile& profile) {
  if (profile.interpreter_strategy == InterpreterStrategy::kFixed &&
      profile.fixed_interpreter_path.has_value()) {
    return *profile.fixed_interpreter_path;
  }

  if (core::IsExistingDirectory(profile.base_path)) {
    if (auto detected = FindInterpreterInBasePath(profile.base_path)) {
      return detected->string();
    }
  }
  return profile.fixed_interpreter_path.value_or(std::string(kDefaultInterpreterCommand));
}

} // namespace scenkit::profile
