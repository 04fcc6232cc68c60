#pragma once

#include "process/process_launcher.hpp"

#include <atomic>
#include <chrono>
#include <string>
#include <string_view>
#include <thread>

namespace scenkit::debug {

struct ReadinessOptions {
  std::chrono::milliseconds interval{150};
  std::chrono::milliseconds timeout{10000};
};

// One non-blocking TCP connect to host:port, bounded by `timeout`.
// True when the connection completed.
bool TryConnect(std::string_view host, int port, std::chrono::milliseconds timeout);

// Polls host:port on a background thread until it accepts a connection or
// the overall bound passes, then pushes exactly one event to `channel`:
// kConnected, or kConnectFailed with a detail message. Stopping early
// (destruction, Stop()) pushes nothing.
class ReadinessProbe {
public:
  ReadinessProbe(std::string host, int port, ReadinessOptions options,
                 process::RunChannel& channel);
  ~ReadinessProbe();

  ReadinessProbe(const ReadinessProbe&) = delete;
  ReadinessProbe& operator=(const ReadinessProbe&) = delete;

  void Start();
  void Stop();

private:
  void Loop();

  std::string host_;
  int port_ = 0;
  ReadinessOptions options_;
  process::RunChannel& channel_;
  std::atomic<bool> stop_{false};
  std::thread thread_;
};

} // namespace scenkit::debug
