#include "debug/readiness_probe.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdint>
#include <utility>

#if !defined(_WIN32)
#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace scenkit::debug {

#if !defined(_WIN32)

bool TryConnect(std::string_view host, int port, std::chrono::milliseconds timeout) {
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<std::uint16_t>(port));
  const std::string host_text(host);
  if (::inet_pton(AF_INET, host_text.c_str(), &addr.sin_addr) != 1) {
    return false;
  }

  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    return false;
  }
  const int flags = ::fcntl(fd, F_GETFL, 0);
  ::fcntl(fd, F_SETFL, flags | O_NONBLOCK);

  bool connected = false;
  if (::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0) {
    connected = true;
  } else if (errno == EINPROGRESS) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = POLLOUT;
    if (::poll(&pfd, 1, static_cast<int>(timeout.count())) == 1) {
      int so_error = 0;
      socklen_t len = sizeof(so_error);
      if (::getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 && so_error == 0) {
        connected = true;
      }
    }
  }

  ::close(fd);
  return connected;
}

#else

bool TryConnect(std::string_view, int, std::chrono::milliseconds) {
  return false;
}

#endif

ReadinessProbe::ReadinessProbe(std::string host, int port, ReadinessOptions options,
                               process::RunChannel& channel)
    : host_(std::move(host)), port_(port), options_(options), channel_(channel) {}

ReadinessProbe::~ReadinessProbe() {
  Stop();
}

void ReadinessProbe::Start() {
  if (thread_.joinable()) {
    return;
  }
  stop_.store(false);
  thread_ = std::thread([this]() { Loop(); });
}

void ReadinessProbe::Stop() {
  stop_.store(true);
  if (thread_.joinable()) {
    thread_.join();
  }
}

void ReadinessProbe::Loop() {
  using Clock = std::chrono::steady_clock;
  const Clock::time_point deadline = Clock::now() + options_.timeout;

  while (!stop_.load()) {
    const Clock::time_point attempt_started = Clock::now();
    if (TryConnect(host_, port_, options_.interval)) {
      process::ProcessEvent event;
      event.kind = process::ProcessEvent::Kind::kConnected;
      channel_.Push(std::move(event));
      return;
    }

    const Clock::time_point now = Clock::now();
    if (now >= deadline) {
      process::ProcessEvent event;
      event.kind = process::ProcessEvent::Kind::kConnectFailed;
      event.detail = "no listener on " + host_ + ":" + std::to_string(port_) + " after " +
                     std::to_string(options_.timeout.count()) + " ms";
      channel_.Push(std::move(event));
      return;
    }

    const Clock::time_point next_attempt = attempt_started + options_.interval;
    const Clock::time_point wake = std::min(next_attempt, deadline);
    // Short slices keep Stop() responsive.
    while (!stop_.load() && Clock::now() < wake) {
      std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
  }
}

} // namespace scenkit::debug
