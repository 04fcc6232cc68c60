#pragma once

#include "core/json_dom.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace scenkit::host {

// Collaborators the orchestrator consumes from its host (an editor, or the
// `scenkit` CLI). Every method is called from the run's worker thread, never
// concurrently for the same run.

// Masked secret entry. nullopt means the user cancelled.
class ISecretPrompt {
public:
  virtual ~ISecretPrompt() = default;
  virtual std::optional<std::string> RequestSecret(std::string_view prompt) = 0;
};

// Yes/no confirmation. Anything other than an explicit yes is a decline.
class IConsentPrompt {
public:
  virtual ~IConsentPrompt() = default;
  virtual bool RequestConsent(std::string_view question) = 0;
};

// Host debugger facility. Accepts a declarative launch/attach descriptor
// (a JSON object) and reports only whether a session started.
class IDebuggerHost {
public:
  virtual ~IDebuggerHost() = default;
  virtual bool StartDebugging(const core::json::Value& descriptor) = 0;
};

// User-visible message surface.
class INotifier {
public:
  virtual ~INotifier() = default;
  virtual void Info(std::string_view message) = 0;
  virtual void Warn(std::string_view message) = 0;
  virtual void Error(std::string_view message) = 0;
};

} // namespace scenkit::host
