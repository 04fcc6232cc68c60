#include "debug/port_allocator.hpp"
#include "debug/readiness_probe.hpp"

#include "../common/assertions.hpp"

#include <chrono>
#include <cstdint>
#include <string>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

using scenkit::tests::common::AssertTrue;
using scenkit::tests::common::Fail;

namespace {

int ListenOnLoopback(int port) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    Fail("socket() failed");
  }
  const int reuse = 1;
  ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(static_cast<uint16_t>(port));
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
      ::listen(fd, 4) != 0) {
    ::close(fd);
    Fail("failed to listen on allocated port " + std::to_string(port));
  }
  return fd;
}

} // namespace

int main() {
  int first = 0;
  int second = 0;
  std::string error;
  if (!scenkit::debug::AllocateEphemeralPort(first, error) ||
      !scenkit::debug::AllocateEphemeralPort(second, error)) {
    Fail("port allocation failed: " + error);
  }
  AssertTrue(first > 0 && first <= 65535, "allocated port out of range");
  AssertTrue(second > 0 && second <= 65535, "allocated port out of range");

  // Nothing listens yet.
  AssertTrue(!scenkit::debug::TryConnect("127.0.0.1", first, std::chrono::milliseconds(200)),
             "connect must fail before a listener exists");

  // The allocator releases the port, so a listener can take it.
  const int listener = ListenOnLoopback(first);
  AssertTrue(scenkit::debug::TryConnect("127.0.0.1", first, std::chrono::milliseconds(1000)),
             "connect must succeed once the listener is up");
  ::close(listener);
  return 0;
}
