#pragma once

#include "process/completion_channel.hpp"
#include "process/log_sink.hpp"

#include <chrono>
#include <condition_variable>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace scenkit::process {

// Completion events delivered to a run's channel.
struct ProcessEvent {
  enum class Kind {
    kExited,
    kConnected,
    kConnectFailed,
  };

  Kind kind = Kind::kExited;
  // kExited only; nullopt when the child died from a signal.
  std::optional<int> exit_code;
  std::string detail;
};

using RunChannel = CompletionChannel<ProcessEvent>;

struct LaunchRequest {
  std::string command;
  std::vector<std::string> args;
  std::filesystem::path working_dir;
  // Prefix for the exit status line, e.g. "run" -> "[run-exit] code=0".
  std::string strategy_tag = "run";
  // Written to the child's stdin, which is then closed. Without it the child
  // reads from /dev/null.
  std::optional<std::string> stdin_text;
  bool write_exit_line = true;
  // When non-zero, Kill() sends SIGTERM first and escalates to SIGKILL only
  // if the child is still running after this long. Needed for children that
  // run under an elevation tool, which relays SIGTERM to its command but is
  // owned by another user and refuses SIGKILL from us.
  std::chrono::milliseconds kill_grace{0};
};

// Handle to one spawned child. A watcher thread streams the child's merged
// stdout/stderr into the sink, reaps it, writes the exit line and pushes a
// kExited event. The sink and channel given to Spawn must outlive the handle.
//
// Destroying a handle whose child is still running kills the child's process
// group first, so a handle never leaks a process.
class ChildProcess {
public:
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  int pid() const {
    return pid_;
  }

  bool running() const;

  // Signals the child's process group: SIGKILL, or SIGTERM then SIGKILL
  // when the request set a kill grace. Returns false with `error` set when
  // the signal could not be delivered (e.g. EPERM). True once reaped.
  bool Kill(std::string& error);

  // Blocks until the child is reaped and its output drained.
  std::optional<int> Wait();

  template <typename Rep, typename Period>
  bool WaitFor(std::chrono::duration<Rep, Period> timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    return cv_.wait_for(lock, timeout, [this]() { return finished_; });
  }

  std::optional<int> exit_code() const;

private:
  friend bool Spawn(const LaunchRequest& request, LogSink& sink, RunChannel* channel,
                    std::unique_ptr<ChildProcess>& child, std::string& error);

  ChildProcess(int pid, int output_fd, LogSink* sink, std::string strategy_tag,
               bool write_exit_line, std::chrono::milliseconds kill_grace);

  void WatchLoop(LogSink* sink, RunChannel* channel);
  bool Signal(int signo, std::string& error);

  int pid_ = -1;
  int output_fd_ = -1;
  LogSink* sink_ = nullptr;
  std::string strategy_tag_;
  bool write_exit_line_ = true;
  std::chrono::milliseconds kill_grace_{0};

  mutable std::mutex mu_;
  std::condition_variable cv_;
  bool reaped_ = false;
  bool finished_ = false;
  std::optional<int> exit_code_;
  std::thread watcher_;
};

// Spawns `request.command` with `request.args` as an argv vector (no shell)
// in `request.working_dir`. Returns false immediately when the executable
// cannot be started (not found, permission denied, bad working directory);
// no exit line is written in that case. One attempt, never retried.
bool Spawn(const LaunchRequest& request, LogSink& sink, RunChannel* channel,
           std::unique_ptr<ChildProcess>& child, std::string& error);

struct CapturedRun {
  std::optional<int> exit_code;
  std::string output;
};

// Synchronous helper for short probes: spawn, wait, capture merged output.
// Returns false only when the process could not be started.
bool RunAndWait(const LaunchRequest& request, CapturedRun& result, std::string& error);

} // namespace scenkit::process
