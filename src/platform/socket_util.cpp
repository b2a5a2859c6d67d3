#include "socket_util.hpp"
#include <fmt/format.h>
#include <chrono>
#include <cerrno>
#include <cstring>

#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <fcntl.h>
#  include <poll.h>
#  include <unistd.h>
#endif

#ifndef MSG_NOSIGNAL
#  define MSG_NOSIGNAL 0
#endif

namespace platform {

void init_networking() {
#ifdef _WIN32
    static bool initialized = false;
    if (!initialized) {
        WSADATA wsa;
        WSAStartup(MAKEWORD(2, 2), &wsa);
        initialized = true;
    }
#endif
}

void set_nonblocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 1;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags | O_NONBLOCK);
#endif
}

static void set_blocking(socket_t sock) {
#ifdef _WIN32
    u_long mode = 0;
    ioctlsocket(sock, FIONBIO, &mode);
#else
    int flags = fcntl(sock, F_GETFL, 0);
    fcntl(sock, F_SETFL, flags & ~O_NONBLOCK);
#endif
}

int poll_socket(socket_t sock, short events, int timeout_ms) {
#ifdef _WIN32
    WSAPOLLFD pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = WSAPoll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#else
    struct pollfd pfd;
    pfd.fd = sock;
    pfd.events = events;
    pfd.revents = 0;
    int ret = poll(&pfd, 1, timeout_ms);
    return (ret > 0) ? pfd.revents : 0;
#endif
}

void close_socket(socket_t sock) {
#ifdef _WIN32
    closesocket(sock);
#else
    close(sock);
#endif
}

// ── TCP helpers ─────────────────────────────────────────────

// IPv4 resolution, numeric first then DNS.
static bool resolve_ipv4(const std::string& host, int port, sockaddr_in& addr) {
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(static_cast<uint16_t>(port));

    std::string h = (host.empty() || host == "localhost") ? "127.0.0.1" : host;
    if (inet_pton(AF_INET, h.c_str(), &addr.sin_addr) == 1) return true;

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(h.c_str(), nullptr, &hints, &res) != 0 || !res) return false;
    addr.sin_addr = reinterpret_cast<sockaddr_in*>(res->ai_addr)->sin_addr;
    freeaddrinfo(res);
    return true;
}

Result<socket_t> tcp_listen(const std::string& host, int port, int backlog) {
    init_networking();

    sockaddr_in addr;
    if (!resolve_ipv4(host, port, addr)) {
        return Result<socket_t>::Err(ErrorKind::Io, "Failed to resolve listen address: " + host);
    }

    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == CHANHUB_INVALID_SOCKET) {
        return Result<socket_t>::Err(ErrorKind::Io, "socket() failed");
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    if (bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        int err = errno;
        close_socket(fd);
        return Result<socket_t>::Err(ErrorKind::Io,
            fmt::format("bind() failed for {}:{}: {}", host, port, std::strerror(err)));
    }

    if (listen(fd, backlog) < 0) {
        int err = errno;
        close_socket(fd);
        return Result<socket_t>::Err(ErrorKind::Io,
            fmt::format("listen() failed for {}:{}: {}", host, port, std::strerror(err)));
    }

    return Result<socket_t>::Ok(fd);
}

Result<socket_t> tcp_connect(const std::string& host, int port, int timeout_ms) {
    init_networking();

    sockaddr_in addr;
    if (!resolve_ipv4(host, port, addr)) {
        return Result<socket_t>::Err(ErrorKind::Connection, "Failed to resolve host: " + host);
    }

    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == CHANHUB_INVALID_SOCKET) {
        return Result<socket_t>::Err(ErrorKind::Io, "socket() failed");
    }

    set_nonblocking(fd);
    int ret = connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        int err = errno;
        close_socket(fd);
        return Result<socket_t>::Err(ErrorKind::Connection,
            fmt::format("Failed to connect to {}:{}: {}", host, port, std::strerror(err)));
    }

    // Wait for non-blocking connect to complete
    if (ret < 0) {
        int revents = poll_socket(fd, POLLOUT, timeout_ms);
        if (revents == 0) {
            close_socket(fd);
            return Result<socket_t>::Err(ErrorKind::Connection,
                fmt::format("Connection timed out: {}:{}", host, port));
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(fd, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            close_socket(fd);
            return Result<socket_t>::Err(ErrorKind::Connection,
                fmt::format("Connection to {}:{} failed: {}", host, port, std::strerror(sock_err)));
        }
    }

    set_blocking(fd);
    return Result<socket_t>::Ok(fd);
}

Result<socket_t> accept_client(socket_t listener, int timeout_ms,
                               std::string* peer_host, int* peer_port) {
    int revents = poll_socket(listener, POLLIN, timeout_ms);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        return Result<socket_t>::Err(ErrorKind::Io, "listener socket failed");
    }
    if (!(revents & POLLIN)) return Result<socket_t>::Ok(CHANHUB_INVALID_SOCKET);

    sockaddr_in peer{};
    socklen_t len = sizeof(peer);
    socket_t client = accept(listener, reinterpret_cast<sockaddr*>(&peer), &len);
    if (client == CHANHUB_INVALID_SOCKET) {
        int err = errno;
        // The peer went away between poll and accept
        if (err == EINTR || err == EAGAIN || err == EWOULDBLOCK || err == ECONNABORTED) {
            return Result<socket_t>::Ok(CHANHUB_INVALID_SOCKET);
        }
        return Result<socket_t>::Err(ErrorKind::Io,
            std::string("accept() failed: ") + std::strerror(err));
    }

    if (peer_host) {
        char buf[INET_ADDRSTRLEN] = {0};
        inet_ntop(AF_INET, &peer.sin_addr, buf, sizeof(buf));
        *peer_host = buf;
    }
    if (peer_port) *peer_port = ntohs(peer.sin_port);
    return Result<socket_t>::Ok(client);
}

int local_port(socket_t sock) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) return -1;
    return ntohs(addr.sin_port);
}

Result<bool> is_port_available(const std::string& host, int port) {
    init_networking();

    sockaddr_in addr;
    if (!resolve_ipv4(host, port, addr)) {
        return Result<bool>::Err(ErrorKind::Io, "Failed to resolve listen address: " + host);
    }

    socket_t fd = socket(AF_INET, SOCK_STREAM, 0);
    if (fd == CHANHUB_INVALID_SOCKET) {
        return Result<bool>::Err(ErrorKind::Io, "socket() failed");
    }

    int reuse = 1;
    setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&reuse), sizeof(reuse));

    int rc = bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    int err = errno;
    if (rc == 0 && listen(fd, 1) < 0) {
        rc = -1;
        err = errno;
    }
    close_socket(fd);

    if (rc == 0) return Result<bool>::Ok(true);
    if (err == EADDRINUSE) return Result<bool>::Ok(false);
    return Result<bool>::Err(ErrorKind::Io,
        fmt::format("cannot bind {}:{}: {}", host, port, std::strerror(err)));
}

// Remaining budget of a deadline in ms, at least 0.
static int remaining_ms(std::chrono::steady_clock::time_point deadline) {
    auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now()).count();
    return left > 0 ? static_cast<int>(left) : 0;
}

Result<std::string> read_line(socket_t sock, int timeout_ms, size_t max_len) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string line;

    while (line.size() < max_len) {
        int left = remaining_ms(deadline);
        if (left == 0) {
            return Result<std::string>::Err(ErrorKind::Io, "Timed out reading line");
        }
        int revents = poll_socket(sock, POLLIN, left);
        if (revents == 0) continue;

        char c;
        auto n = recv(sock, &c, 1, 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Result<std::string>::Err(ErrorKind::Io,
                std::string("recv() failed: ") + std::strerror(errno));
        }
        if (c == '\n') break;
        line += c;
    }
    return Result<std::string>::Ok(line);
}

Result<std::string> read_to_eof(socket_t sock, int timeout_ms, size_t max_len) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    std::string out;
    char buf[1024];

    while (out.size() < max_len) {
        int left = remaining_ms(deadline);
        if (left == 0) {
            return Result<std::string>::Err(ErrorKind::Io, "Timed out waiting for reply");
        }
        int revents = poll_socket(sock, POLLIN, left);
        if (revents == 0) continue;

        auto n = recv(sock, buf, sizeof(buf), 0);
        if (n == 0) break;
        if (n < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return Result<std::string>::Err(ErrorKind::Io,
                std::string("recv() failed: ") + std::strerror(errno));
        }
        out.append(buf, static_cast<size_t>(n));
    }
    return Result<std::string>::Ok(out);
}

Result<void> write_all(socket_t sock, const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        auto w = send(sock, data + sent, len - sent, MSG_NOSIGNAL);
        if (w < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN) {
                poll_socket(sock, POLLOUT, 100);
                continue;
            }
            return Result<void>::Err(ErrorKind::Io,
                std::string("send() failed: ") + std::strerror(errno));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

} // namespace platform
