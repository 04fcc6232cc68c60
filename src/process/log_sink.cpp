#include "process/log_sink.hpp"

namespace scenkit::process {

void LogSink::Append(std::string_view chunk) {
  if (chunk.empty()) {
    return;
  }
  std::lock_guard<std::mutex> lock(mu_);
  out_->write(chunk.data(), static_cast<std::streamsize>(chunk.size()));
  out_->flush();
}

void LogSink::AppendLine(std::string_view line) {
  std::string text(line);
  text.push_back('\n');
  Append(text);
}

void LogSink::AppendExitLine(std::string_view strategy_tag, std::optional<int> exit_code) {
  AppendLine(FormatExitLine(strategy_tag, exit_code));
}

std::string FormatExitLine(std::string_view strategy_tag, std::optional<int> exit_code) {
  return "[" + std::string(strategy_tag) + "-exit] code=" +
         (exit_code.has_value() ? std::to_string(*exit_code) : std::string("unknown"));
}

} // namespace scenkit::process
