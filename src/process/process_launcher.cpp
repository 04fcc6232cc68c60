#include "process/process_launcher.hpp"

#include <sstream>
#include <utility>

#if !defined(_WIN32)
#include <cerrno>
#include <csignal>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#endif

namespace scenkit::process {

#if !defined(_WIN32)

namespace {

constexpr int kPollIntervalMs = 100;

// Every launcher fd is close-on-exec; only the child's dup2() copies onto
// 0-2 survive exec.
bool MakePipe(int fds[2]) {
#if defined(__linux__)
  return ::pipe2(fds, O_CLOEXEC) == 0;
#else
  if (::pipe(fds) != 0) {
    return false;
  }
  ::fcntl(fds[0], F_SETFD, FD_CLOEXEC);
  ::fcntl(fds[1], F_SETFD, FD_CLOEXEC);
  return true;
#endif
}

void CloseFd(int& fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool WriteAll(int fd, const std::string& data) {
  std::size_t offset = 0;
  while (offset < data.size()) {
    const ssize_t written = ::write(fd, data.data() + offset, data.size() - offset);
    if (written < 0) {
      if (errno == EINTR) {
        continue;
      }
      return false;
    }
    offset += static_cast<std::size_t>(written);
  }
  return true;
}

std::optional<int> DecodeWaitStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  return std::nullopt;
}

// Runs in the forked child. Only async-signal-safe calls from here on.
[[noreturn]] void ExecChild(const std::vector<char*>& argv, const char* working_dir, int stdin_fd,
                            int output_fd, int errno_fd) {
  ::setpgid(0, 0);
  ::signal(SIGPIPE, SIG_DFL);

  if (working_dir != nullptr && working_dir[0] != '\0' && ::chdir(working_dir) != 0) {
    const int err = errno;
    (void)!::write(errno_fd, &err, sizeof(err));
    ::_exit(127);
  }

  if (::dup2(stdin_fd, STDIN_FILENO) < 0 || ::dup2(output_fd, STDOUT_FILENO) < 0 ||
      ::dup2(output_fd, STDERR_FILENO) < 0) {
    const int err = errno;
    (void)!::write(errno_fd, &err, sizeof(err));
    ::_exit(127);
  }

  ::execvp(argv[0], argv.data());

  const int err = errno;
  (void)!::write(errno_fd, &err, sizeof(err));
  ::_exit(127);
}

} // namespace

ChildProcess::ChildProcess(int pid, int output_fd, LogSink* sink, std::string strategy_tag,
                           bool write_exit_line, std::chrono::milliseconds kill_grace)
    : pid_(pid),
      output_fd_(output_fd),
      sink_(sink),
      strategy_tag_(std::move(strategy_tag)),
      write_exit_line_(write_exit_line),
      kill_grace_(kill_grace) {}

ChildProcess::~ChildProcess() {
  std::string kill_error;
  if (running() && !Kill(kill_error) && sink_ != nullptr) {
    sink_->AppendLine("[" + strategy_tag_ + "] " + kill_error);
  }
  if (watcher_.joinable()) {
    watcher_.join();
  }
}

bool ChildProcess::running() const {
  std::lock_guard<std::mutex> lock(mu_);
  return !reaped_;
}

bool ChildProcess::Kill(std::string& error) {
  if (kill_grace_.count() > 0) {
    // A refused SIGTERM falls through to SIGKILL, whose outcome is reported.
    std::string term_error;
    if (Signal(SIGTERM, term_error) && WaitFor(kill_grace_)) {
      return true;
    }
  }
  return Signal(SIGKILL, error);
}

bool ChildProcess::Signal(int signo, std::string& error) {
  std::lock_guard<std::mutex> lock(mu_);
  if (reaped_ || pid_ <= 0) {
    return true;
  }
  // The child leads its own group; also signal it directly in case setpgid
  // had not run yet. ESRCH only means that target is already gone.
  bool delivered = false;
  int failure = 0;
  for (const pid_t target : {-pid_, pid_}) {
    if (::kill(target, signo) == 0) {
      delivered = true;
    } else if (errno != ESRCH) {
      failure = errno;
    }
  }
  if (delivered || failure == 0) {
    return true;
  }
  error = "failed to send " + std::string(signo == SIGTERM ? "SIGTERM" : "SIGKILL") +
          " to pid " + std::to_string(pid_) + ": " + std::strerror(failure);
  return false;
}

std::optional<int> ChildProcess::Wait() {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait(lock, [this]() { return finished_; });
  return exit_code_;
}

std::optional<int> ChildProcess::exit_code() const {
  std::lock_guard<std::mutex> lock(mu_);
  return exit_code_;
}

void ChildProcess::WatchLoop(LogSink* sink, RunChannel* channel) {
  char buffer[4096];
  bool exited = false;
  bool output_open = true;
  int status = 0;

  while (output_open) {
    pollfd pfd{};
    pfd.fd = output_fd_;
    pfd.events = POLLIN;
    const int ready = ::poll(&pfd, 1, kPollIntervalMs);
    if (ready < 0 && errno != EINTR) {
      break;
    }

    if (ready > 0) {
      const ssize_t n = ::read(output_fd_, buffer, sizeof(buffer));
      if (n > 0) {
        sink->Append(std::string_view(buffer, static_cast<std::size_t>(n)));
        continue;
      }
      if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
        output_open = false;
      }
    }

    if (!exited) {
      const pid_t reaped = ::waitpid(pid_, &status, WNOHANG);
      if (reaped == pid_) {
        exited = true;
        std::lock_guard<std::mutex> lock(mu_);
        reaped_ = true;
      }
    } else if (ready == 0) {
      // Child is gone and nothing arrived for a full interval; a grandchild
      // may still hold the write end open.
      break;
    }
  }

  if (!exited) {
    while (::waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
    }
    std::lock_guard<std::mutex> lock(mu_);
    reaped_ = true;
  }

  ::close(output_fd_);
  output_fd_ = -1;

  const std::optional<int> code = DecodeWaitStatus(status);
  if (write_exit_line_) {
    sink->AppendExitLine(strategy_tag_, code);
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    exit_code_ = code;
    finished_ = true;
  }
  cv_.notify_all();

  if (channel != nullptr) {
    ProcessEvent event;
    event.kind = ProcessEvent::Kind::kExited;
    event.exit_code = code;
    channel->Push(std::move(event));
  }
}

bool Spawn(const LaunchRequest& request, LogSink& sink, RunChannel* channel,
           std::unique_ptr<ChildProcess>& child, std::string& error) {
  child.reset();
  if (request.command.empty()) {
    error = "command is empty";
    return false;
  }

  std::vector<std::string> argv_storage;
  argv_storage.reserve(request.args.size() + 1);
  argv_storage.push_back(request.command);
  argv_storage.insert(argv_storage.end(), request.args.begin(), request.args.end());
  std::vector<char*> argv;
  argv.reserve(argv_storage.size() + 1);
  for (std::string& arg : argv_storage) {
    argv.push_back(arg.data());
  }
  argv.push_back(nullptr);

  const std::string working_dir = request.working_dir.string();

  int output_pipe[2] = {-1, -1};
  int errno_pipe[2] = {-1, -1};
  int stdin_pipe[2] = {-1, -1};
  int stdin_read = -1;

  if (!MakePipe(output_pipe)) {
    error = std::string("failed to create output pipe: ") + std::strerror(errno);
    return false;
  }

  if (!MakePipe(errno_pipe)) {
    error = std::string("failed to create status pipe: ") + std::strerror(errno);
    CloseFd(output_pipe[0]);
    CloseFd(output_pipe[1]);
    return false;
  }

  if (request.stdin_text.has_value()) {
    if (!MakePipe(stdin_pipe)) {
      error = std::string("failed to create stdin pipe: ") + std::strerror(errno);
      CloseFd(output_pipe[0]);
      CloseFd(output_pipe[1]);
      CloseFd(errno_pipe[0]);
      CloseFd(errno_pipe[1]);
      return false;
    }
    stdin_read = stdin_pipe[0];
  } else {
    stdin_read = ::open("/dev/null", O_RDONLY | O_CLOEXEC);
    if (stdin_read < 0) {
      error = std::string("failed to open /dev/null: ") + std::strerror(errno);
      CloseFd(output_pipe[0]);
      CloseFd(output_pipe[1]);
      CloseFd(errno_pipe[0]);
      CloseFd(errno_pipe[1]);
      return false;
    }
  }

  const pid_t pid = ::fork();
  if (pid < 0) {
    error = std::string("fork failed: ") + std::strerror(errno);
    CloseFd(output_pipe[0]);
    CloseFd(output_pipe[1]);
    CloseFd(errno_pipe[0]);
    CloseFd(errno_pipe[1]);
    CloseFd(stdin_read);
    CloseFd(stdin_pipe[1]);
    return false;
  }

  if (pid == 0) {
    ExecChild(argv, working_dir.c_str(), stdin_read, output_pipe[1], errno_pipe[1]);
  }

  // Parent. Mirror the child's setpgid so Kill() never races it.
  ::setpgid(pid, pid);
  CloseFd(output_pipe[1]);
  CloseFd(errno_pipe[1]);
  CloseFd(stdin_read);

  int child_errno = 0;
  ssize_t got = 0;
  do {
    got = ::read(errno_pipe[0], &child_errno, sizeof(child_errno));
  } while (got < 0 && errno == EINTR);
  CloseFd(errno_pipe[0]);

  if (got == static_cast<ssize_t>(sizeof(child_errno))) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    CloseFd(output_pipe[0]);
    CloseFd(stdin_pipe[1]);
    error = "failed to start '" + request.command + "': " + std::strerror(child_errno);
    return false;
  }

  if (request.stdin_text.has_value()) {
    // A child that never reads its stdin must not kill us with SIGPIPE.
    struct sigaction ignore {};
    struct sigaction previous {};
    ignore.sa_handler = SIG_IGN;
    ::sigaction(SIGPIPE, &ignore, &previous);
    (void)WriteAll(stdin_pipe[1], *request.stdin_text);
    ::sigaction(SIGPIPE, &previous, nullptr);
    CloseFd(stdin_pipe[1]);
  }

  child.reset(new ChildProcess(pid, output_pipe[0], &sink, request.strategy_tag,
                               request.write_exit_line, request.kill_grace));
  ChildProcess* raw = child.get();
  raw->watcher_ = std::thread([raw, &sink, channel]() { raw->WatchLoop(&sink, channel); });
  return true;
}

#else

ChildProcess::ChildProcess(int pid, int output_fd, LogSink* sink, std::string strategy_tag,
                           bool write_exit_line, std::chrono::milliseconds kill_grace)
    : pid_(pid),
      output_fd_(output_fd),
      sink_(sink),
      strategy_tag_(std::move(strategy_tag)),
      write_exit_line_(write_exit_line),
      kill_grace_(kill_grace) {}

ChildProcess::~ChildProcess() = default;

bool ChildProcess::running() const {
  return false;
}

bool ChildProcess::Kill(std::string&) {
  return true;
}

std::optional<int> ChildProcess::Wait() {
  return std::nullopt;
}

std::optional<int> ChildProcess::exit_code() const {
  return std::nullopt;
}

void ChildProcess::WatchLoop(LogSink*, RunChannel*) {}

bool Spawn(const LaunchRequest& request, LogSink&, RunChannel*, std::unique_ptr<ChildProcess>& child,
           std::string& error) {
  child.reset();
  error = "failed to start '" + request.command + "': process launch requires a POSIX host";
  return false;
}

#endif

bool RunAndWait(const LaunchRequest& request, CapturedRun& result, std::string& error) {
  result = CapturedRun{};
  std::ostringstream captured;
  LogSink capture_sink(captured);

  LaunchRequest quiet = request;
  quiet.write_exit_line = false;

  std::unique_ptr<ChildProcess> child;
  if (!Spawn(quiet, capture_sink, nullptr, child, error)) {
    return false;
  }
  result.exit_code = child->Wait();
  child.reset();
  result.output = captured.str();
  return true;
}

} // namespace scenkit::process
