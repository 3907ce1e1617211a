#pragma once

// Cross-platform socket utilities.

#include <cstdint>
#include <string>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define SSHDESK_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define SSHDESK_INVALID_SOCKET (-1)
#endif

namespace platform {

// Initialize networking (WSAStartup on Windows, no-op on Unix).
void init_networking();

// Set a socket to non-blocking mode.
void set_nonblocking(socket_t sock);

// Poll events on a single socket. Returns revents, or 0 on timeout.
// events: POLLIN, POLLOUT, etc.
int poll_socket(socket_t sock, short events, int timeout_ms);

// Close a socket.
void close_socket(socket_t sock);

// Turn on TCP keepalive probes for a long-lived connection.
void enable_tcp_keepalive(socket_t sock);

// Resolve host to its first IPv4 address in dotted form.
// Returns false and fills `error` when nothing resolves.
bool resolve_ipv4(const std::string& host, std::string& address, std::string& error);

// Non-blocking TCP connect to an IPv4 address, bounded by timeout_ms.
// Returns the connected (still non-blocking) socket, or SSHDESK_INVALID_SOCKET
// with `error` filled.
socket_t connect_tcp(const std::string& ipv4, uint16_t port, int timeout_ms,
                     std::string& error);

} // namespace platform
