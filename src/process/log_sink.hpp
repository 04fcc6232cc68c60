#pragma once

#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace scenkit::process {

// Append-only output channel shared by every run strategy.
//
// Child stdout/stderr chunks and launcher status lines (`[run] ...`,
// `[run-exit] code=0`) land here. Each Append is atomic with respect to other
// appenders; ordering across concurrent runs is not guaranteed.
class LogSink {
public:
  explicit LogSink(std::ostream& out = std::cout) : out_(&out) {}

  LogSink(const LogSink&) = delete;
  LogSink& operator=(const LogSink&) = delete;

  void Append(std::string_view chunk);

  // Appends `line` plus a newline in one atomic write.
  void AppendLine(std::string_view line);

  // Status line written when a child exits: "[<tag>-exit] code=<n|unknown>".
  void AppendExitLine(std::string_view strategy_tag, std::optional<int> exit_code);

private:
  std::mutex mu_;
  std::ostream* out_;
};

std::string FormatExitLine(std::string_view strategy_tag, std::optional<int> exit_code);

} // namespace scenkit::process
