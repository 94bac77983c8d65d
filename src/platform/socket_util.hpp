#pragma once

// Socket utilities for the request server and its clients.

#include <poll.h>
#include <string>
#include <core/types.hpp>

using socket_t = int;
#define JOBCAST_INVALID_SOCKET (-1)

namespace platform {

// Bind and listen on host:port (IPv4). Port 0 picks an ephemeral port.
Result<socket_t> listen_tcp(const std::string& host, int port, int backlog = 64);

// Connect to host:port (IPv4).
Result<socket_t> connect_tcp(const std::string& host, int port);

// Port a bound socket is listening on, or -1.
int local_port(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Write the whole buffer. False once the peer is gone.
bool send_all(socket_t sock, const std::string& data);

// Read one '\n'-terminated line (terminator and trailing '\r' stripped).
// `pending` carries bytes read past the line between calls.
// False on EOF before a newline, on error, or if the line exceeds max_len.
bool recv_line(socket_t sock, std::string& pending, std::string& line, size_t max_len);

// Close a socket.
void close_socket(socket_t sock);

} // namespace platform
