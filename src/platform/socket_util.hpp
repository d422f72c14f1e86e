#pragma once

#include <core/types.hpp>
#include <poll.h>
#include <string>

namespace platform {

// Open a TCP connection to host:port, trying every resolved address in turn.
// The returned descriptor is non-blocking with keepalive enabled.
Result<int> connect_tcp(const std::string& host, int port, int timeout_secs);

// Returns revents, or 0 on timeout or error.
int poll_socket(int sock, short events, int timeout_ms);

void close_socket(int sock);

} // namespace platform
