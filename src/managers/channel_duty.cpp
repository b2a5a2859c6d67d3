#include "channel_duty.hpp"
#include "relay.hpp"
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <thread>
#include <vector>

using Clock = std::chrono::steady_clock;

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

// Log session output line by line.
void log_output(const std::string& channel, std::string& pending, const char* data, int n) {
    pending.append(data, static_cast<size_t>(n));
    size_t pos;
    while ((pos = pending.find('\n')) != std::string::npos) {
        std::string line = pending.substr(0, pos);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        log_channel(LogLevel::Debug, channel, "output: " + line);
        pending.erase(0, pos + 1);
    }
}

} // namespace

// ── LocalForwardDuty ────────────────────────────────────────

LocalForwardDuty::LocalForwardDuty(std::string channel, LocalForward kind, DutyTiming timing)
    : channel_(std::move(channel)), kind_(std::move(kind)), timing_(timing) {}

LocalForwardDuty::~LocalForwardDuty() {
    if (listener_ != CHANHUB_INVALID_SOCKET) {
        platform::close_socket(listener_);
    }
}

Result<void> LocalForwardDuty::open(SshSession&) {
    auto r = platform::tcp_listen(kind_.listen_host, kind_.listen_port);
    if (r.is_err()) {
        return Result<void>::Err(ErrorKind::Channel, fmt::format(
            "Failed to bind {}:{}: {}. Try another port, ports below 1024 need privileges.",
            kind_.listen_host, kind_.listen_port, r.error));
    }
    listener_ = r.value;
    return Result<void>::Ok();
}

Result<void> LocalForwardDuty::run(SshSession& session, const CancelToken& cancel) {
    auto next_probe = Clock::now() + std::chrono::milliseconds(timing_.alive_check_ms);

    while (!cancel.is_cancelled()) {
        std::string peer_host;
        int peer_port = 0;
        auto accepted = platform::accept_client(listener_, timing_.accept_poll_ms,
                                                &peer_host, &peer_port);
        if (accepted.is_err()) {
            return Result<void>::Err(ErrorKind::Channel, fmt::format(
                "listener {}:{} failed: {}", kind_.listen_host, kind_.listen_port, accepted.error));
        }

        socket_t client = accepted.value;
        if (client != CHANHUB_INVALID_SOCKET) {
            auto stream = session.open_forward_channel(kind_.dest_host, kind_.dest_port,
                                                       peer_host, peer_port);
            if (stream.is_err()) {
                log_channel(LogLevel::Warn, channel_, fmt::format(
                    "forward to {}:{} for {}:{} failed: {}",
                    kind_.dest_host, kind_.dest_port, peer_host, peer_port, stream.error));
                platform::close_socket(client);
            } else {
                log_channel(LogLevel::Debug, channel_, fmt::format(
                    "accepted {}:{} -> {}:{}", peer_host, peer_port, kind_.dest_host, kind_.dest_port));
                spawn_relay(client, std::move(stream.value), channel_);
            }
        }

        if (Clock::now() >= next_probe) {
            if (!session.check_alive()) {
                return Result<void>::Err(ErrorKind::Connection, "SSH session lost");
            }
            next_probe = Clock::now() + std::chrono::milliseconds(timing_.alive_check_ms);
        }
    }
    return Result<void>::Ok();
}

std::string LocalForwardDuty::endpoint() const {
    return fmt::format("{}:{}", kind_.listen_host, kind_.listen_port);
}

// ── RemoteForwardDuty ───────────────────────────────────────

RemoteForwardDuty::RemoteForwardDuty(std::string channel, RemoteForward kind)
    : channel_(std::move(channel)), kind_(std::move(kind)) {}

Result<void> RemoteForwardDuty::open(SshSession& session) {
    auto r = session.request_remote_forward(REMOTE_BIND_ADDRESS, kind_.remote_bind_port);
    if (r.is_err()) return forward_err<void>(r);

    granted_ = r.value;
    if (r.value != kind_.remote_bind_port) {
        log_channel(LogLevel::Info, channel_, fmt::format(
            "requested remote port {}, server granted {}", kind_.remote_bind_port, r.value));
    }
    return Result<void>::Ok();
}

Result<void> RemoteForwardDuty::run(SshSession& session, const CancelToken& cancel) {
    const std::string local_host = kind_.local_host;
    const int local_port = kind_.local_port;
    const std::string channel = channel_;

    auto handler = [&](ForwardedConnection conn) {
        auto local = platform::tcp_connect(local_host, local_port, LOCAL_CONNECT_MS);
        if (local.is_err()) {
            log_channel(LogLevel::Warn, channel, fmt::format(
                "forwarded connection dropped, local {}:{} unreachable: {}",
                local_host, local_port, local.error));
            conn.stream->close();
            return;
        }
        spawn_relay(local.value, std::move(conn.stream), channel);
    };

    return session.serve_forwarded(handler, cancel);
}

std::string RemoteForwardDuty::endpoint() const {
    int port = granted_.value_or(kind_.remote_bind_port);
    return fmt::format("remote {} -> {}:{}", port, kind_.local_host, kind_.local_port);
}

// ── SessionDuty ─────────────────────────────────────────────

SessionDuty::SessionDuty(std::string channel, Session kind, DutyTiming timing)
    : channel_(std::move(channel)), kind_(std::move(kind)), timing_(timing) {}

Result<void> SessionDuty::open(SshSession& session) {
    auto ch = session.open_session();
    if (ch.is_err()) return forward_err<void>(ch);

    auto r = kind_.command ? ch.value->exec(*kind_.command) : ch.value->request_pty();
    if (r.is_err()) {
        ch.value->close();
        return r;
    }
    channel_stream_ = std::shared_ptr<SessionChannel>(std::move(ch.value));
    return Result<void>::Ok();
}

Result<void> SessionDuty::run(SshSession& session, const CancelToken& cancel) {
    auto closed = std::make_shared<std::atomic<bool>>(false);

    // Drain task: owns its share of the channel, exits when it closes
    std::thread([stream = channel_stream_, closed, channel = channel_]() {
        std::vector<char> buf(SSH_DRAIN_BUF_SIZE);
        std::string pending;
        while (true) {
            int n = stream->read_some(buf.data(), buf.size());
            if (n > 0) {
                log_output(channel, pending, buf.data(), n);
                continue;
            }
            if (n == ChannelStream::WOULD_BLOCK) {
                socket_t fd = stream->poll_fd();
                if (fd != CHANHUB_INVALID_SOCKET) {
                    platform::poll_socket(fd, POLLIN, 100);
                } else {
                    platform::sleep_ms(50);
                }
                continue;
            }
            break;  // end of stream or error
        }
        if (!pending.empty()) log_channel(LogLevel::Debug, channel, "output: " + pending);
        stream->close();
        closed->store(true);
    }).detach();
    channel_stream_.reset();

    auto next_probe = Clock::now() + std::chrono::milliseconds(timing_.alive_check_ms);
    while (!cancel.wait_for(std::chrono::milliseconds(timing_.session_tick_ms))) {
        if (closed->load()) {
            log_channel(LogLevel::Info, channel_, "session channel closed by remote");
            return Result<void>::Ok();
        }
        if (Clock::now() >= next_probe) {
            if (!session.check_alive()) {
                return Result<void>::Err(ErrorKind::Connection, "SSH session lost");
            }
            next_probe = Clock::now() + std::chrono::milliseconds(timing_.alive_check_ms);
        }
    }
    return Result<void>::Ok();
}

std::string SessionDuty::endpoint() const {
    return kind_.command ? fmt::format("exec: {}", *kind_.command) : std::string("shell (pty)");
}

// ── Dispatch ────────────────────────────────────────────────

std::unique_ptr<ChannelDuty> make_duty(const ChannelSpec& spec, const DutyTiming& timing) {
    return std::visit(overloaded{
        [&](const LocalForward& k) -> std::unique_ptr<ChannelDuty> {
            return std::make_unique<LocalForwardDuty>(spec.name, k, timing);
        },
        [&](const RemoteForward& k) -> std::unique_ptr<ChannelDuty> {
            return std::make_unique<RemoteForwardDuty>(spec.name, k);
        },
        [&](const Session& k) -> std::unique_ptr<ChannelDuty> {
            return std::make_unique<SessionDuty>(spec.name, k, timing);
        },
    }, spec.kind);
}
