#pragma once

#include <string>

namespace scenkit::debug {

// Asks the OS for a free loopback TCP port: bind 127.0.0.1:0, read the
// assigned port back, close. The port is only reserved while the socket is
// open, so the caller must hand it to the listener promptly.
bool AllocateEphemeralPort(int& port, std::string& error);

} // namespace scenkit::debug
