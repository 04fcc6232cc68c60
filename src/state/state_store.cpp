#include "state/state_store.hpp"

#include "cmdline/tokenizer.hpp"
#include "core/fs_utils.hpp"
#include "core/json_dom.hpp"

#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace scenkit::state {

namespace {

using JsonValue = core::json::Value;

constexpr std::string_view kSchemaVersion = "1.0";

} // namespace

ScenarioStateStore::ScenarioStateStore(fs::path state_path) : state_path_(std::move(state_path)) {}

bool ScenarioStateStore::Load(std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  sudo_by_scenario_.clear();
  global_run_flags_.clear();

  std::error_code ec;
  if (!fs::exists(state_path_, ec) || ec) {
    return true;
  }

  std::string text;
  if (!core::ReadTextFile(state_path_, text, error)) {
    return false;
  }

  JsonValue root;
  if (!core::json::Parse(text, root, error)) {
    error = state_path_.string() + ": invalid state JSON: " + error;
    return false;
  }
  if (root.type != JsonValue::Type::kObject) {
    error = state_path_.string() + ": state root must be a JSON object";
    return false;
  }

  if (const auto flags = core::json::FindStringField(root, "global_run_flags")) {
    global_run_flags_ = cmdline::NormalizeFlags(*flags);
  }

  // Only `true` entries are meaningful; anything else reads as disabled.
  if (const JsonValue* by_scenario = core::json::FindField(root, "sudo_execution_by_scenario");
      by_scenario != nullptr && by_scenario->type == JsonValue::Type::kObject) {
    for (const auto& [key, value] : by_scenario->object_value) {
      if (value.type == JsonValue::Type::kBool && value.bool_value) {
        sudo_by_scenario_[core::ToPathKey(key)] = true;
      }
    }
  }
  return true;
}

bool ScenarioStateStore::IsElevationEnabled(const fs::path& scenario_path) const {
  std::lock_guard<std::mutex> lock(mu_);
  const auto it = sudo_by_scenario_.find(core::ToPathKey(scenario_path));
  return it != sudo_by_scenario_.end() && it->second;
}

bool ScenarioStateStore::SetElevationEnabled(const fs::path& scenario_path, const bool enabled,
                                             std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  const std::string key = core::ToPathKey(scenario_path);
  if (enabled) {
    sudo_by_scenario_[key] = true;
  } else {
    sudo_by_scenario_.erase(key);
  }
  return PersistLocked(error);
}

std::string ScenarioStateStore::GlobalRunFlags() const {
  std::lock_guard<std::mutex> lock(mu_);
  return global_run_flags_;
}

bool ScenarioStateStore::SetGlobalRunFlags(std::string_view flags, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  global_run_flags_ = cmdline::NormalizeFlags(flags);
  return PersistLocked(error);
}

bool ScenarioStateStore::PersistLocked(std::string& error) const {
  JsonValue root = core::json::MakeObject();
  root.object_value["schema_version"] = core::json::MakeString(std::string(kSchemaVersion));
  root.object_value["global_run_flags"] = core::json::MakeString(global_run_flags_);

  JsonValue by_scenario = core::json::MakeObject();
  for (const auto& [key, enabled] : sudo_by_scenario_) {
    if (enabled) {
      by_scenario.object_value[key] = core::json::MakeBool(true);
    }
  }
  root.object_value["sudo_execution_by_scenario"] = std::move(by_scenario);

  return core::WriteTextFileAtomic(state_path_, core::json::Serialize(root, 2) + "\n", error);
}

} // namespace scenkit::state
