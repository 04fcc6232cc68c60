#pragma once

#include "core/logging/logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace scenkit::cli {

// Options every subcommand accepts.
struct CommonOptions {
  std::filesystem::path base_path;
  std::optional<std::filesystem::path> profile_path;
  core::logging::LogLevel log_level = core::logging::LogLevel::kInfo;
};

// Splits `--base`, `--profile` and `--log-level` out of `args`; everything
// else lands in `positional` in order. Unknown `--` options are errors.
bool ParseCommonOptions(const std::vector<std::string_view>& args, CommonOptions& options,
                        std::vector<std::string>& positional, std::string& error);

// Routes `scenkit` subcommands. Exit codes follow core::errors::ExitCode:
//   0 success, 1 scenario exited non-zero, 2 usage,
//   10/20/30/40/50/60 per run error class.
int Dispatch(int argc, char** argv);

} // namespace scenkit::cli
