#pragma once

// Cross-platform socket utilities.

#include <string>
#include <core/types.hpp>

#ifdef _WIN32
#  define WIN32_LEAN_AND_MEAN
#  include <winsock2.h>
#  include <ws2tcpip.h>
   using socket_t = SOCKET;
#  define CHANHUB_INVALID_SOCKET INVALID_SOCKET
   // WSAPoll uses the same constants as POSIX poll
#else
#  include <poll.h>
   using socket_t = int;
#  define CHANHUB_INVALID_SOCKET (-1)
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

// ── TCP helpers ─────────────────────────────────────────────

// Bind and listen on host:port (port 0 = kernel chooses). SO_REUSEADDR is set.
Result<socket_t> tcp_listen(const std::string& host, int port, int backlog = 16);

// Connect with a deadline. The returned socket is in blocking mode.
Result<socket_t> tcp_connect(const std::string& host, int port, int timeout_ms);

// Wait up to timeout_ms for a connection. Ok(CHANHUB_INVALID_SOCKET) when
// nothing arrived, Err when the listener itself is broken.
// peer_host/peer_port are filled when non-null.
Result<socket_t> accept_client(socket_t listener, int timeout_ms,
                               std::string* peer_host = nullptr, int* peer_port = nullptr);

// Port a bound socket is listening on, or -1.
int local_port(socket_t sock);

// Attempt-bind probe: true if host:port can be bound right now, false if it
// is in use. Any other bind failure (permissions, bad address) is an error.
Result<bool> is_port_available(const std::string& host, int port);

// Read until '\n' (not included), EOF, max_len bytes, or timeout.
Result<std::string> read_line(socket_t sock, int timeout_ms, size_t max_len);

// Read until the peer closes, bounded by timeout and max_len.
Result<std::string> read_to_eof(socket_t sock, int timeout_ms, size_t max_len);

// Send every byte or fail. Never raises SIGPIPE.
Result<void> write_all(socket_t sock, const char* data, size_t len);

inline Result<void> write_all(socket_t sock, const std::string& data) {
    return write_all(sock, data.data(), data.size());
}

} // namespace platform
