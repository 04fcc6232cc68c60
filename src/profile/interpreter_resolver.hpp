#pragma once

#include "profile/profile.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace scenkit::profile {

// Returns the interpreter inside a virtual-environment root, or nullopt.
// A root qualifies when it holds an interpreter and either a `pyvenv.cfg`
// marker or an activate script.
std::optional<std::filesystem::path> FindInterpreterInVenvRoot(const std::filesystem::path& venv_root);

// Searches `base_path` itself, then `.venv`, `venv`, `env`, then any other
// immediate subdirectory (sorted by name). Non-recursive.
std::optional<std::filesystem::path> FindInterpreterInBasePath(const std::filesystem::path& base_path);

// Resolves the interpreter for one run. The result is treated as an opaque
// executable string by the orchestrator.
std::string ResolveInterpreter(const Profile& profile);

} // namespace scenkit::profile
