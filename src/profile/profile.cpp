#include "profile/profile.hpp"

#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <cctype>
#include <initializer_list>
#include <system_error>

namespace fs = std::filesystem;

namespace scenkit::profile {

namespace {

using JsonValue = core::json::Value;

const JsonValue* FindJsonPath(const JsonValue& root, std::initializer_list<std::string_view> path) {
  const JsonValue* cursor = &root;
  for (const std::string_view key : path) {
    cursor = core::json::FindField(*cursor, key);
    if (cursor == nullptr) {
      return nullptr;
    }
  }
  return cursor;
}

// Canonical nested keys win; flat editor-setting keys are the fallback so a
// profile exported from the editor add-on loads unchanged.
bool ReadStringSetting(const JsonValue& root, std::initializer_list<std::string_view> canonical_path,
                       std::string_view legacy_key, std::optional<std::string>& out,
                       std::string& error) {
  out.reset();
  const JsonValue* value = FindJsonPath(root, canonical_path);
  std::string_view label = canonical_path.size() > 0U ? *(canonical_path.end() - 1) : legacy_key;
  if (value == nullptr && !legacy_key.empty()) {
    value = core::json::FindField(root, legacy_key);
    label = legacy_key;
  }
  if (value == nullptr || value->type == JsonValue::Type::kNull) {
    return true;
  }
  if (value->type != JsonValue::Type::kString) {
    error = "profile field '" + std::string(label) + "' must be a string";
    return false;
  }
  out = value->string_value;
  return true;
}

std::string TrimCopy(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1U])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

} // namespace

const char* ToString(const InterpreterStrategy strategy) {
  switch (strategy) {
  case InterpreterStrategy::kAutoDetect:
    return "auto";
  case InterpreterStrategy::kFixed:
    return "fixed";
  }
  return "auto";
}

bool ParseInterpreterStrategy(std::string_view text, InterpreterStrategy& strategy) {
  if (text == "auto" || text == "venv") {
    strategy = InterpreterStrategy::kAutoDetect;
    return true;
  }
  if (text == "fixed") {
    strategy = InterpreterStrategy::kFixed;
    return true;
  }
  return false;
}

std::string SanitizeFolderName(std::string_view value, std::string_view fallback) {
  std::string cleaned;
  for (const char c : TrimCopy(value)) {
    if (c == '/' || c == '\\') {
      continue;
    }
    cleaned.push_back(c);
  }
  if (cleaned.empty()) {
    return std::string(fallback);
  }
  return cleaned;
}

fs::path DefaultProfilePath(const fs::path& base_path) {
  return base_path / std::string(kToolkitStateDirName) / std::string(kProfileFileName);
}

bool ParseProfileJson(std::string_view text, const fs::path& default_base_path, Profile& profile,
                      std::string& error) {
  profile = Profile{};
  profile.base_path = default_base_path;

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = "invalid profile JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = "profile root must be a JSON object";
    return false;
  }

  std::optional<std::string> base_path;
  if (!ReadStringSetting(root, {"base_path"}, "basePath", base_path, error)) {
    return false;
  }
  if (base_path.has_value() && !TrimCopy(*base_path).empty()) {
    const fs::path configured(TrimCopy(*base_path));
    profile.base_path = configured.is_absolute() ? configured : default_base_path / configured;
  }

  std::optional<std::string> strategy_text;
  if (!ReadStringSetting(root, {"interpreter", "strategy"}, "", strategy_text, error)) {
    return false;
  }
  std::optional<std::string> interpreter_path;
  if (!ReadStringSetting(root, {"interpreter", "path"}, "pythonCommand", interpreter_path,
                         error)) {
    return false;
  }
  if (interpreter_path.has_value() && !TrimCopy(*interpreter_path).empty()) {
    profile.fixed_interpreter_path = TrimCopy(*interpreter_path);
  }
  if (strategy_text.has_value()) {
    if (!ParseInterpreterStrategy(*strategy_text, profile.interpreter_strategy)) {
      error = "profile field 'strategy' must be one of auto|fixed, got '" + *strategy_text + "'";
      return false;
    }
  }
  if (profile.interpreter_strategy == InterpreterStrategy::kFixed &&
      !profile.fixed_interpreter_path.has_value()) {
    error = "profile interpreter strategy 'fixed' requires interpreter.path";
    return false;
  }

  std::optional<std::string> run_template;
  if (!ReadStringSetting(root, {"run_command_template"}, "runCommandTemplate", run_template,
                         error)) {
    return false;
  }
  if (run_template.has_value()) {
    profile.run_command_template = *run_template;
  }

  std::optional<std::string> folder;
  if (!ReadStringSetting(root, {"folders", "scenarios"}, "", folder, error)) {
    return false;
  }
  profile.scenarios_folder_name =
      SanitizeFolderName(folder.value_or(""), kDefaultScenariosFolderName);

  if (!ReadStringSetting(root, {"folders", "output"}, "scenarioIoFolderName", folder, error)) {
    return false;
  }
  profile.output_folder_name = SanitizeFolderName(folder.value_or(""), kDefaultOutputFolderName);

  if (!ReadStringSetting(root, {"folders", "configs"}, "scenarioConfigsFolderName", folder,
                         error)) {
    return false;
  }
  profile.configs_folder_name =
      SanitizeFolderName(folder.value_or(""), kDefaultConfigsFolderName);

  return true;
}

bool LoadProfile(const fs::path& profile_path, const fs::path& default_base_path,
                 Profile& profile, std::string& error) {
  std::error_code ec;
  if (!fs::exists(profile_path, ec) || ec) {
    profile = Profile{};
    profile.base_path = default_base_path;
    return true;
  }

  std::string text;
  if (!core::ReadTextFile(profile_path, text, error)) {
    return false;
  }
  if (!ParseProfileJson(text, default_base_path, profile, error)) {
    error = profile_path.string() + ": " + error;
    return false;
  }
  return true;
}

std::optional<fs::path> FindScenarioRoot(const fs::path& path, const fs::path& scenarios_root) {
  const std::string root_key = core::ToPathKey(scenarios_root);
  std::error_code ec;
  fs::path current = fs::absolute(path, ec);
  if (ec) {
    return std::nullopt;
  }
  current = current.lexically_normal();
  if (!current.has_filename() && current.has_parent_path()) {
    current = current.parent_path();
  }

  while (true) {
    const fs::path parent = current.parent_path();
    if (parent.empty() || parent == current) {
      return std::nullopt;
    }
    if (core::ToPathKey(parent) == root_key) {
      return current;
    }
    current = parent;
  }
}

} // namespace scenkit::profile
