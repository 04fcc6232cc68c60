#include "process/log_sink.hpp"

#include "../common/assertions.hpp"

#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using scenkit::tests::common::Fail;

int main() {
  constexpr int kWriters = 8;
  constexpr int kLinesPerWriter = 250;

  std::ostringstream captured;
  scenkit::process::LogSink sink(captured);

  std::vector<std::thread> writers;
  writers.reserve(kWriters);
  for (int writer = 0; writer < kWriters; ++writer) {
    writers.emplace_back([&sink, writer]() {
      for (int line = 0; line < kLinesPerWriter; ++line) {
        sink.AppendLine("writer=" + std::to_string(writer) + " line=" + std::to_string(line) +
                        " payload=abcdefghijklmnopqrstuvwxyz");
      }
    });
  }
  for (std::thread& writer : writers) {
    writer.join();
  }

  std::istringstream lines(captured.str());
  std::set<std::string> seen;
  std::string line;
  while (std::getline(lines, line)) {
    if (line.rfind("writer=", 0) != 0 || line.find(" payload=abcdefghijklmnopqrstuvwxyz") == std::string::npos) {
      Fail("torn line: " + line);
    }
    seen.insert(line);
  }
  if (seen.size() != static_cast<std::size_t>(kWriters * kLinesPerWriter)) {
    Fail("expected every line exactly once");
  }

  if (scenkit::process::FormatExitLine("run-detached", std::nullopt) !=
      "[run-detached-exit] code=unknown") {
    Fail("unexpected exit line for unknown code");
  }
  if (scenkit::process::FormatExitLine("run", 0) != "[run-exit] code=0") {
    Fail("unexpected exit line for code 0");
  }
  return 0;
}
