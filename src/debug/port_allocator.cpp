#include "debug/port_allocator.hpp"

#include <cerrno>
#include <cstring>

#if !defined(_WIN32)
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>
#endif

namespace scenkit::debug {

#if !defined(_WIN32)

bool AllocateEphemeralPort(int& port, std::string& error) {
  port = 0;
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  if (fd < 0) {
    error = std::string("socket() failed: ") + std::strerror(errno);
    return false;
  }

  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = htons(0);
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);

  if (::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    error = std::string("bind(127.0.0.1:0) failed: ") + std::strerror(errno);
    ::close(fd);
    return false;
  }

  sockaddr_in bound{};
  socklen_t bound_len = sizeof(bound);
  if (::getsockname(fd, reinterpret_cast<sockaddr*>(&bound), &bound_len) != 0) {
    error = std::string("getsockname() failed: ") + std::strerror(errno);
    ::close(fd);
    return false;
  }
  ::close(fd);

  port = ntohs(bound.sin_port);
  if (port <= 0) {
    error = "OS returned no ephemeral port";
    return false;
  }
  return true;
}

#else

bool AllocateEphemeralPort(int& port, std::string& error) {
  port = 0;
  error = "ephemeral port allocation requires a POSIX host";
  return false;
}

#endif

} // namespace scenkit::debug
