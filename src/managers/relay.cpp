#include "relay.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <thread>
#include <vector>
#ifndef _WIN32
#  include <sys/socket.h>
#  include <poll.h>
#endif
#include <cerrno>
#include <cstring>

namespace {

void fail(RelayStats& stats, std::string error) {
    stats.error = std::move(error);
    stats.kind = ErrorKind::Relay;
}

} // namespace

RelayStats run_relay(socket_t local, std::unique_ptr<ChannelStream> stream,
                     const std::string& label) {
    RelayStats stats;
    std::vector<char> buf(RELAY_BUF_SIZE);
    socket_t remote_fd = stream->poll_fd();

    bool done = false;
    while (!done) {
        struct pollfd fds[2];
        fds[0] = {local, POLLIN, 0};
        fds[1] = {remote_fd, POLLIN, 0};
        int nfds = (remote_fd == CHANHUB_INVALID_SOCKET) ? 1 : 2;
        int pr = poll(fds, nfds, RELAY_POLL_MS);
        if (pr < 0 && errno != EINTR) {
            fail(stats, std::string("poll failed: ") + std::strerror(errno));
            break;
        }

        // local -> channel
        if (pr > 0 && (fds[0].revents & (POLLIN | POLLHUP | POLLERR))) {
            auto n = recv(local, buf.data(), buf.size(), 0);
            if (n == 0) break;  // client closed
            if (n < 0) {
                if (errno != EINTR && errno != EAGAIN) {
                    fail(stats, std::string("local read failed: ") + std::strerror(errno));
                    break;
                }
            } else {
                auto w = stream->write_all(buf.data(), static_cast<size_t>(n));
                if (w.is_err()) {
                    fail(stats, w.error);
                    break;
                }
                stats.to_remote += static_cast<uint64_t>(n);
            }
        }

        // channel -> local, drain what is pending
        while (true) {
            int n = stream->read_some(buf.data(), buf.size());
            if (n == ChannelStream::WOULD_BLOCK) break;
            if (n == 0) { done = true; break; }  // remote closed
            if (n < 0) {
                fail(stats, "channel read failed");
                done = true;
                break;
            }
            auto w = platform::write_all(local, buf.data(), static_cast<size_t>(n));
            if (w.is_err()) {
                fail(stats, w.error);
                done = true;
                break;
            }
            stats.to_local += static_cast<uint64_t>(n);
        }
    }

    stream->close();
    platform::close_socket(local);

    if (!stats.failed()) {
        log_channel(LogLevel::Debug, label, fmt::format(
            "relay closed ({} bytes out, {} bytes in)", stats.to_remote, stats.to_local));
    } else {
        log_channel(LogLevel::Warn, label, fmt::format("{}: {}", error_kind_name(stats.kind), stats.error));
    }
    return stats;
}

void spawn_relay(socket_t local, std::unique_ptr<ChannelStream> stream, std::string label) {
    std::thread([local, s = std::move(stream), label = std::move(label)]() mutable {
        run_relay(local, std::move(s), label);
    }).detach();
}
