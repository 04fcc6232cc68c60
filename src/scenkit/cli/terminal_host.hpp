#pragma once

#include "host/host_interfaces.hpp"

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace scenkit::cli {

// Reads a secret from `in` with terminal echo disabled when `in` is an
// interactive terminal. End of input is a cancel.
class TerminalSecretPrompt final : public host::ISecretPrompt {
public:
  explicit TerminalSecretPrompt(std::istream& in = std::cin, std::ostream& out = std::cerr)
      : in_(in), out_(out) {}

  std::optional<std::string> RequestSecret(std::string_view prompt) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

// "[y/N]" confirmation. Only "y" or "yes" (any case) consents.
class TerminalConsentPrompt final : public host::IConsentPrompt {
public:
  explicit TerminalConsentPrompt(std::istream& in = std::cin, std::ostream& out = std::cerr)
      : in_(in), out_(out) {}

  bool RequestConsent(std::string_view question) override;

private:
  std::istream& in_;
  std::ostream& out_;
};

// Stands in for an editor's debugger: each descriptor is written to
// `<output_dir>/<configuration name>.json` and its path printed, so an
// external debugger front end can pick it up.
class DescriptorFileDebuggerHost final : public host::IDebuggerHost {
public:
  explicit DescriptorFileDebuggerHost(std::filesystem::path output_dir,
                                      std::ostream& out = std::cout)
      : output_dir_(std::move(output_dir)), out_(out) {}

  bool StartDebugging(const core::json::Value& descriptor) override;

  const std::optional<std::filesystem::path>& last_written() const {
    return last_written_;
  }

private:
  std::filesystem::path output_dir_;
  std::ostream& out_;
  std::optional<std::filesystem::path> last_written_;
};

class StreamNotifier final : public host::INotifier {
public:
  explicit StreamNotifier(std::ostream& out = std::cerr) : out_(out) {}

  void Info(std::string_view message) override;
  void Warn(std::string_view message) override;
  void Error(std::string_view message) override;

private:
  std::ostream& out_;
};

// File-name-safe form of a descriptor name ("Scenario Toolkit: a b" ->
// "Scenario_Toolkit__a_b").
std::string DescriptorFileStem(std::string_view name);

} // namespace scenkit::cli
