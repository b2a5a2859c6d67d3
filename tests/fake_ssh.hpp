#pragma once

// In-memory stand-in for the SSH client capability. Channels are real
// loopback sockets, so relays, listeners and the control plane run for real.

#include <ssh/ssh_client.hpp>
#include <platform/platform.hpp>
#include <platform/socket_util.hpp>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <thread>
#include <vector>
#include <poll.h>
#include <sys/socket.h>

// Connected pair of stream sockets: [0] for the code under test, [1] for the test.
inline std::pair<socket_t, socket_t> make_socket_pair() {
    int fds[2] = {-1, -1};
    if (socketpair(AF_UNIX, SOCK_STREAM, 0, fds) != 0) return {-1, -1};
    return {fds[0], fds[1]};
}

// Ephemeral loopback port that was free a moment ago.
inline int free_port() {
    auto l = platform::tcp_listen("127.0.0.1", 0);
    if (l.is_err()) return 0;
    int port = platform::local_port(l.value);
    platform::close_socket(l.value);
    return port;
}

// Read exactly n bytes (or until EOF/timeout).
inline std::string read_exactly(socket_t fd, size_t n, int timeout_ms = 3000) {
    std::string out;
    char buf[4096];
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (out.size() < n && std::chrono::steady_clock::now() < deadline) {
        if (!(platform::poll_socket(fd, POLLIN, 50) & (POLLIN | POLLHUP))) continue;
        auto r = recv(fd, buf, std::min(sizeof(buf), n - out.size()), 0);
        if (r <= 0) break;
        out.append(buf, static_cast<size_t>(r));
    }
    return out;
}

// Descriptor of this process's listening socket on a loopback port, or -1.
inline socket_t find_listener(int port) {
    for (int fd = 3; fd < 1024; fd++) {
        int listening = 0;
        socklen_t optlen = sizeof(listening);
        if (getsockopt(fd, SOL_SOCKET, SO_ACCEPTCONN, &listening, &optlen) != 0 || !listening) continue;
        if (platform::local_port(fd) == port) return fd;
    }
    return -1;
}

// Loopback TCP echo server on an ephemeral port.
class EchoServer {
public:
    EchoServer() {
        auto l = platform::tcp_listen("127.0.0.1", 0);
        if (l.is_ok()) {
            listener_ = l.value;
            port_ = platform::local_port(listener_);
            thread_ = std::thread([this] { loop(); });
        }
    }

    ~EchoServer() {
        stop_.store(true);
        if (thread_.joinable()) thread_.join();
        for (auto& t : workers_) if (t.joinable()) t.join();
        if (listener_ >= 0) platform::close_socket(listener_);
    }

    int port() const { return port_; }

private:
    void loop() {
        while (!stop_.load()) {
            auto accepted = platform::accept_client(listener_, 50);
            if (accepted.is_err()) break;
            socket_t c = accepted.value;
            if (c < 0) continue;
            workers_.emplace_back([this, c] {
                char buf[4096];
                while (!stop_.load()) {
                    if (!(platform::poll_socket(c, POLLIN, 50) & (POLLIN | POLLHUP))) continue;
                    auto n = recv(c, buf, sizeof(buf), 0);
                    if (n <= 0) break;
                    if (platform::write_all(c, buf, static_cast<size_t>(n)).is_err()) break;
                }
                platform::close_socket(c);
            });
        }
    }

    socket_t listener_ = -1;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
    std::vector<std::thread> workers_;
};

// Channel stream over one end of a socket.
class FakeStream : public SessionChannel {
public:
    explicit FakeStream(socket_t fd) : fd_(fd) {}
    ~FakeStream() override { close(); }

    int read_some(char* buf, size_t len) override {
        if (fd_ < 0) return STREAM_ERROR;
        int revents = platform::poll_socket(fd_, POLLIN, 0);
        if (revents == 0) return WOULD_BLOCK;
        auto n = recv(fd_, buf, len, 0);
        if (n < 0) return STREAM_ERROR;
        return static_cast<int>(n);
    }

    Result<void> write_all(const char* data, size_t len) override {
        if (fd_ < 0) return Result<void>::Err(ErrorKind::Channel, "closed");
        return platform::write_all(fd_, data, len);
    }

    socket_t poll_fd() const override { return fd_; }

    void close() override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fd_ >= 0) {
            platform::close_socket(fd_);
            fd_ = -1;
        }
    }

    Result<void> exec(const std::string&) override { return Result<void>::Ok(); }
    Result<void> request_pty() override { return Result<void>::Ok(); }

private:
    std::mutex mutex_;
    socket_t fd_;
};

// Everything the fake records and every knob a test can turn.
struct FakeSshState {
    std::mutex mutex;

    // Scripting
    int fail_first_connects = 0;              // first N connect() calls fail
    std::set<std::string> unreachable_hosts;  // always fail to connect
    bool fail_auth = false;
    std::optional<int> granted_port;          // override for remote forwards
    bool fail_remote_forward = false;

    // Observations
    int connect_calls = 0;
    int auth_calls = 0;
    int disconnect_calls = 0;
    std::vector<std::string> exec_commands;
    int pty_requests = 0;
    std::vector<int> remote_forward_requests;
    std::vector<socket_t> session_peers;      // test ends of session channels
    std::deque<socket_t> inbound;             // pending forwarded connections
    std::atomic<bool> sessions_alive{true};

    int connects() { std::lock_guard<std::mutex> l(mutex); return connect_calls; }
    int auths() { std::lock_guard<std::mutex> l(mutex); return auth_calls; }
    int disconnects() { std::lock_guard<std::mutex> l(mutex); return disconnect_calls; }

    // Queue an inbound forwarded-tcpip connection; returns the test's end.
    socket_t inject_forwarded() {
        auto pair = make_socket_pair();
        std::lock_guard<std::mutex> l(mutex);
        inbound.push_back(pair.first);
        return pair.second;
    }

    // Most recently opened session channel, test's end.
    std::optional<socket_t> last_session_peer() {
        std::lock_guard<std::mutex> l(mutex);
        if (session_peers.empty()) return std::nullopt;
        return session_peers.back();
    }
};

class FakeSession : public SshSession {
public:
    FakeSession(std::shared_ptr<FakeSshState> state) : state_(std::move(state)) {}

    Result<void> authenticate(const std::string&, const AuthConfig&, const CancelToken&) override {
        std::lock_guard<std::mutex> l(state_->mutex);
        state_->auth_calls++;
        if (state_->fail_auth) {
            return Result<void>::Err(ErrorKind::Authentication, "fake auth rejected");
        }
        return Result<void>::Ok();
    }

    Result<std::unique_ptr<SessionChannel>> open_session() override {
        if (retired_) return Result<std::unique_ptr<SessionChannel>>::Err(ErrorKind::Channel, "session retired");
        auto pair = make_socket_pair();
        {
            std::lock_guard<std::mutex> l(state_->mutex);
            state_->session_peers.push_back(pair.second);
        }
        auto stream = std::make_unique<RecordingStream>(pair.first, state_);
        return Result<std::unique_ptr<SessionChannel>>::Ok(std::move(stream));
    }

    Result<std::unique_ptr<ChannelStream>> open_forward_channel(
        const std::string& dest_host, int dest_port,
        const std::string&, int) override {
        if (retired_) return Result<std::unique_ptr<ChannelStream>>::Err(ErrorKind::Channel, "session retired");
        // Play the server: connect to the destination directly
        auto c = platform::tcp_connect(dest_host, dest_port, 2000);
        if (c.is_err()) return Result<std::unique_ptr<ChannelStream>>::Err(ErrorKind::Channel, c.error);
        return Result<std::unique_ptr<ChannelStream>>::Ok(std::make_unique<FakeStream>(c.value));
    }

    Result<int> request_remote_forward(const std::string&, int bind_port) override {
        std::lock_guard<std::mutex> l(state_->mutex);
        state_->remote_forward_requests.push_back(bind_port);
        if (state_->fail_remote_forward) {
            return Result<int>::Err(ErrorKind::Channel, "fake remote forward refused");
        }
        return Result<int>::Ok(state_->granted_port.value_or(bind_port));
    }

    Result<void> serve_forwarded(const ForwardHandler& handler, const CancelToken& cancel) override {
        while (!cancel.is_cancelled() && !retired_) {
            if (!state_->sessions_alive.load()) {
                return Result<void>::Err(ErrorKind::Connection, "fake session lost");
            }
            std::optional<socket_t> next;
            {
                std::lock_guard<std::mutex> l(state_->mutex);
                if (!state_->inbound.empty()) {
                    next = state_->inbound.front();
                    state_->inbound.pop_front();
                }
            }
            if (next) {
                ForwardedConnection conn;
                conn.stream = std::make_unique<FakeStream>(*next);
                conn.origin_host = "127.0.0.1";
                handler(std::move(conn));
                continue;
            }
            cancel.wait_for(std::chrono::milliseconds(20));
        }
        return Result<void>::Ok();
    }

    bool check_alive() override { return !retired_ && state_->sessions_alive.load(); }

    // Like the real transport: new work is refused, open streams are left alone.
    void disconnect() override {
        if (retired_) return;
        retired_ = true;
        std::lock_guard<std::mutex> l(state_->mutex);
        state_->disconnect_calls++;
    }

private:
    // Session channel that reports exec/pty into the shared state
    class RecordingStream : public FakeStream {
    public:
        RecordingStream(socket_t fd, std::shared_ptr<FakeSshState> state)
            : FakeStream(fd), state_(std::move(state)) {}

        Result<void> exec(const std::string& command) override {
            std::lock_guard<std::mutex> l(state_->mutex);
            state_->exec_commands.push_back(command);
            return Result<void>::Ok();
        }

        Result<void> request_pty() override {
            std::lock_guard<std::mutex> l(state_->mutex);
            state_->pty_requests++;
            return Result<void>::Ok();
        }

    private:
        std::shared_ptr<FakeSshState> state_;
    };

    std::shared_ptr<FakeSshState> state_;
    std::atomic<bool> retired_{false};
};

class FakeConnector : public SshConnector {
public:
    FakeConnector() : state(std::make_shared<FakeSshState>()) {}

    Result<std::unique_ptr<SshSession>> connect(const std::string& host, int, int,
                                                const CancelToken&) override {
        std::lock_guard<std::mutex> l(state->mutex);
        state->connect_calls++;
        if (state->unreachable_hosts.count(host)) {
            return Result<std::unique_ptr<SshSession>>::Err(ErrorKind::Connection,
                "fake: host unreachable " + host);
        }
        if (state->connect_calls <= state->fail_first_connects) {
            return Result<std::unique_ptr<SshSession>>::Err(ErrorKind::Connection,
                "fake: connection refused");
        }
        return Result<std::unique_ptr<SshSession>>::Ok(std::make_unique<FakeSession>(state));
    }

    std::shared_ptr<FakeSshState> state;
};
