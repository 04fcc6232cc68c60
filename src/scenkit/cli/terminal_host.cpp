#include "scenkit/cli/terminal_host.hpp"

#include "core/fs_utils.hpp"

#include <algorithm>
#include <cctype>

#if !defined(_WIN32)
#include <termios.h>
#include <unistd.h>
#endif

namespace scenkit::cli {

namespace {

// Restores terminal echo on scope exit.
class EchoGuard {
public:
  explicit EchoGuard(bool enabled) {
#if !defined(_WIN32)
    if (!enabled || ::isatty(STDIN_FILENO) == 0) {
      return;
    }
    if (::tcgetattr(STDIN_FILENO, &saved_) != 0) {
      return;
    }
    termios silent = saved_;
    silent.c_lflag &= static_cast<tcflag_t>(~ECHO);
    active_ = ::tcsetattr(STDIN_FILENO, TCSANOW, &silent) == 0;
#else
    (void)enabled;
#endif
  }

  ~EchoGuard() {
#if !defined(_WIN32)
    if (active_) {
      ::tcsetattr(STDIN_FILENO, TCSANOW, &saved_);
    }
#endif
  }

  EchoGuard(const EchoGuard&) = delete;
  EchoGuard& operator=(const EchoGuard&) = delete;

  bool active() const {
    return active_;
  }

private:
  bool active_ = false;
#if !defined(_WIN32)
  termios saved_{};
#endif
};

std::string Trim(std::string_view text) {
  std::size_t begin = 0;
  std::size_t end = text.size();
  while (begin < end && std::isspace(static_cast<unsigned char>(text[begin])) != 0) {
    ++begin;
  }
  while (end > begin && std::isspace(static_cast<unsigned char>(text[end - 1])) != 0) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

} // namespace

std::optional<std::string> TerminalSecretPrompt::RequestSecret(std::string_view prompt) {
  out_ << prompt << ": " << std::flush;
  std::string line;
  bool got_line = false;
  bool echo_disabled = false;
  {
    EchoGuard guard(&in_ == &std::cin);
    echo_disabled = guard.active();
    got_line = static_cast<bool>(std::getline(in_, line));
  }
  if (echo_disabled) {
    out_ << '\n';
  }
  if (!got_line) {
    return std::nullopt;
  }
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
  return line;
}

bool TerminalConsentPrompt::RequestConsent(std::string_view question) {
  out_ << question << " [y/N]: " << std::flush;
  std::string line;
  if (!std::getline(in_, line)) {
    return false;
  }
  std::string answer = Trim(line);
  std::transform(answer.begin(), answer.end(), answer.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return answer == "y" || answer == "yes";
}

std::string DescriptorFileStem(std::string_view name) {
  std::string stem;
  stem.reserve(name.size());
  for (const char c : name) {
    const bool keep = std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '-' || c == '_' ||
                      c == '.';
    stem.push_back(keep ? c : '_');
  }
  if (stem.empty()) {
    stem = "scenario";
  }
  return stem;
}

bool DescriptorFileDebuggerHost::StartDebugging(const core::json::Value& descriptor) {
  const std::string name = core::json::FindStringField(descriptor, "name").value_or("scenario");
  const std::string request = core::json::FindStringField(descriptor, "request").value_or("launch");
  const std::filesystem::path path =
      output_dir_ / (DescriptorFileStem(name) + "." + request + ".json");

  std::string error;
  if (!core::WriteTextFileAtomic(path, core::json::Serialize(descriptor, 2) + "\n", error)) {
    out_ << "debug descriptor not written: " << error << '\n';
    return false;
  }
  last_written_ = path;
  out_ << "debug_descriptor: " << path.string() << '\n';
  return true;
}

void StreamNotifier::Info(std::string_view message) {
  out_ << "info: " << message << '\n';
}

void StreamNotifier::Warn(std::string_view message) {
  out_ << "warning: " << message << '\n';
}

void StreamNotifier::Error(std::string_view message) {
  out_ << "error: " << message << '\n';
}

} // namespace scenkit::cli
