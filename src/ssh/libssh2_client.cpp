#include "libssh2_client.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <libssh2.h>
#ifdef _WIN32
#  include <winsock2.h>
#  include <ws2tcpip.h>
#else
#  include <sys/socket.h>
#  include <netinet/in.h>
#  include <arpa/inet.h>
#  include <netdb.h>
#  include <unistd.h>
#  include <netinet/tcp.h>
#endif
#include <chrono>
#include <cerrno>
#include <cstring>

using Clock = std::chrono::steady_clock;

namespace {

constexpr int CANCELLED = -1000;
constexpr int TIMED_OUT = -1001;

std::once_flag g_libssh2_init;

// Data passed to keyboard-interactive callback via session abstract pointer
struct KbdAuthData {
    std::string password;
    int prompt_round = 0;
};

// libssh2 keyboard-interactive callback: answer every prompt with the password
void kbd_callback(const char* /*name*/, int /*name_len*/,
                  const char* /*instruction*/, int /*instruction_len*/,
                  int num_prompts,
                  const LIBSSH2_USERAUTH_KBDINT_PROMPT* /*prompts*/,
                  LIBSSH2_USERAUTH_KBDINT_RESPONSE* responses,
                  void** abstract) {
    KbdAuthData* data = static_cast<KbdAuthData*>(*abstract);
    for (int i = 0; i < num_prompts; i++) {
        responses[i].text = strdup(data->password.c_str());
        responses[i].length = static_cast<unsigned int>(data->password.length());
    }
    data->prompt_round++;
}

// Run fn under the io lock until it stops returning EAGAIN.
// Gives up with CANCELLED or TIMED_OUT (deadline_secs <= 0 = none).
template <typename Fn>
int call_until_ready(Libssh2Core& core, Fn fn,
                     const CancelToken* cancel = nullptr, int deadline_secs = 0) {
    auto deadline = Clock::now() + std::chrono::seconds(deadline_secs);
    while (true) {
        int rc;
        {
            std::lock_guard<std::mutex> lock(core.io);
            rc = fn();
        }
        if (rc != LIBSSH2_ERROR_EAGAIN) return rc;
        if (cancel && cancel->is_cancelled()) return CANCELLED;
        if (deadline_secs > 0 && Clock::now() >= deadline) return TIMED_OUT;
        platform::sleep_ms(SSH_POLL_MS);
    }
}

// Same for calls returning a channel pointer.
template <typename Fn>
LIBSSH2_CHANNEL* open_until_ready(Libssh2Core& core, Fn fn, int deadline_secs, int* err) {
    auto deadline = Clock::now() + std::chrono::seconds(deadline_secs);
    while (Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(core.io);
            if (core.closed.load()) { *err = LIBSSH2_ERROR_SOCKET_DISCONNECT; return nullptr; }
            LIBSSH2_CHANNEL* ch = fn();
            if (ch) return ch;
            int e = libssh2_session_last_errno(core.session);
            if (e != LIBSSH2_ERROR_EAGAIN) { *err = e; return nullptr; }
        }
        platform::sleep_ms(SSH_POLL_MS);
    }
    *err = TIMED_OUT;
    return nullptr;
}

std::string session_error(LIBSSH2_SESSION* session) {
    char* msg = nullptr;
    int len = 0;
    libssh2_session_last_error(session, &msg, &len, 0);
    return (msg && len > 0) ? std::string(msg, len) : std::string("unknown error");
}

void close_sock(socket_t& sock) {
    if (sock != CHANHUB_INVALID_SOCKET) {
        platform::close_socket(sock);
        sock = CHANHUB_INVALID_SOCKET;
    }
}

} // namespace

// ── Libssh2Core ──────────────────────────────────────────────

// Runs once the session and every relay on it are gone.
Libssh2Core::~Libssh2Core() {
    if (session) {
        if (!closed.load()) {
            call_until_ready(*this, [&] {
                return libssh2_session_disconnect(session, "Normal disconnection");
            }, nullptr, 2);
        }
        libssh2_session_free(session);
        session = nullptr;
    }
    close_sock(sock);
}

// ── Libssh2Channel ───────────────────────────────────────────

Libssh2Channel::Libssh2Channel(std::shared_ptr<Libssh2Core> core, LIBSSH2_CHANNEL* channel)
    : core_(std::move(core)), channel_(channel) {}

Libssh2Channel::~Libssh2Channel() {
    close();
}

int Libssh2Channel::read_some(char* buf, size_t len) {
    std::lock_guard<std::mutex> lock(core_->io);
    if (!channel_ || core_->closed.load()) return STREAM_ERROR;

    ssize_t n = libssh2_channel_read(channel_, buf, len);
    if (n > 0) return static_cast<int>(n);
    if (n == 0) return libssh2_channel_eof(channel_) ? 0 : WOULD_BLOCK;
    if (n == LIBSSH2_ERROR_EAGAIN) {
        return libssh2_channel_eof(channel_) ? 0 : WOULD_BLOCK;
    }
    return STREAM_ERROR;
}

Result<void> Libssh2Channel::write_all(const char* data, size_t len) {
    size_t sent = 0;
    while (sent < len) {
        ssize_t w;
        {
            std::lock_guard<std::mutex> lock(core_->io);
            if (!channel_ || core_->closed.load()) {
                return Result<void>::Err(ErrorKind::Channel, "channel closed");
            }
            w = libssh2_channel_write(channel_, data + sent, len - sent);
        }
        if (w == LIBSSH2_ERROR_EAGAIN) {
            platform::sleep_ms(1);
            continue;
        }
        if (w < 0) {
            return Result<void>::Err(ErrorKind::Channel,
                fmt::format("libssh2_channel_write failed ({})", static_cast<int>(w)));
        }
        sent += static_cast<size_t>(w);
    }
    return Result<void>::Ok();
}

socket_t Libssh2Channel::poll_fd() const {
    return core_->sock;
}

void Libssh2Channel::close() {
    if (!channel_) return;
    if (!core_->closed.load()) {
        call_until_ready(*core_, [&] { return libssh2_channel_close(channel_); },
                         nullptr, 2);
    }
    {
        std::lock_guard<std::mutex> lock(core_->io);
        libssh2_channel_free(channel_);
    }
    channel_ = nullptr;
}

Result<void> Libssh2Channel::exec(const std::string& command) {
    int rc = call_until_ready(*core_,
        [&] { return libssh2_channel_exec(channel_, command.c_str()); },
        nullptr, SSH_CHANNEL_OPEN_SECS);
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Channel,
            fmt::format("exec '{}' rejected ({})", command, rc));
    }
    return Result<void>::Ok();
}

Result<void> Libssh2Channel::request_pty() {
    int rc = call_until_ready(*core_,
        [&] { return libssh2_channel_request_pty(channel_, "xterm"); },
        nullptr, SSH_CHANNEL_OPEN_SECS);
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Channel, fmt::format("pty request rejected ({})", rc));
    }
    rc = call_until_ready(*core_,
        [&] { return libssh2_channel_shell(channel_); },
        nullptr, SSH_CHANNEL_OPEN_SECS);
    if (rc != 0) {
        return Result<void>::Err(ErrorKind::Channel, fmt::format("shell request rejected ({})", rc));
    }
    return Result<void>::Ok();
}

// ── Libssh2Session ───────────────────────────────────────────

Libssh2Session::Libssh2Session(std::shared_ptr<Libssh2Core> core)
    : core_(std::move(core)) {}

Libssh2Session::~Libssh2Session() {
    disconnect();
}

std::string Libssh2Session::last_error() {
    std::lock_guard<std::mutex> lock(core_->io);
    return session_error(core_->session);
}

Result<void> Libssh2Session::authenticate(const std::string& user,
                                          const AuthConfig& auth,
                                          const CancelToken& cancel) {
    // Check what auth methods the server supports
    std::string methods;
    while (true) {
        bool again = false;
        {
            std::lock_guard<std::mutex> lock(core_->io);
            char* list = libssh2_userauth_list(core_->session, user.c_str(),
                                               static_cast<unsigned int>(user.length()));
            if (list) {
                methods = list;
            } else if (libssh2_userauth_authenticated(core_->session)) {
                return Result<void>::Ok();  // "none" auth accepted
            } else {
                again = libssh2_session_last_errno(core_->session) == LIBSSH2_ERROR_EAGAIN;
            }
        }
        if (!again) break;
        if (cancel.is_cancelled()) {
            return Result<void>::Err(ErrorKind::Authentication, "cancelled");
        }
        platform::sleep_ms(SSH_POLL_MS);
    }
    log_debug(fmt::format("{}: auth methods: {}", core_->target, methods.empty() ? "?" : methods));

    if (auth.type == AuthConfig::Type::Key) {
        return auth_key(user, auth, cancel);
    }
    return auth_password(user, auth.password, methods, cancel);
}

Result<void> Libssh2Session::auth_password(const std::string& user, const std::string& password,
                                           const std::string& methods, const CancelToken& cancel) {
    int ret = LIBSSH2_ERROR_AUTHENTICATION_FAILED;

    // Keyboard-interactive first, servers often disable plain password
    if (methods.find("keyboard-interactive") != std::string::npos) {
        KbdAuthData kbd_data;
        kbd_data.password = password;
        {
            std::lock_guard<std::mutex> lock(core_->io);
            *libssh2_session_abstract(core_->session) = &kbd_data;
        }

        ret = call_until_ready(*core_, [&] {
            return libssh2_userauth_keyboard_interactive(core_->session, user.c_str(), kbd_callback);
        }, &cancel);

        {
            std::lock_guard<std::mutex> lock(core_->io);
            *libssh2_session_abstract(core_->session) = nullptr;
        }
        if (ret == 0) return Result<void>::Ok();
        if (ret == CANCELLED) return Result<void>::Err(ErrorKind::Authentication, "cancelled");
        log_debug(fmt::format("{}: keyboard-interactive failed, trying password", core_->target));
    }

    if (methods.empty() || methods.find("password") != std::string::npos) {
        ret = call_until_ready(*core_, [&] {
            return libssh2_userauth_password(core_->session, user.c_str(), password.c_str());
        }, &cancel);
        if (ret == 0) return Result<void>::Ok();
        if (ret == CANCELLED) return Result<void>::Err(ErrorKind::Authentication, "cancelled");
    }

    return Result<void>::Err(ErrorKind::Authentication,
        fmt::format("password authentication failed for user '{}'", user));
}

Result<void> Libssh2Session::auth_key(const std::string& user, const AuthConfig& auth,
                                      const CancelToken& cancel) {
    const char* passphrase = auth.passphrase ? auth.passphrase->c_str() : nullptr;

    // Key decoding happens inside this call, on the runner's own thread
    int ret = call_until_ready(*core_, [&] {
        return libssh2_userauth_publickey_fromfile(core_->session, user.c_str(),
                                                   nullptr, auth.key_path.c_str(), passphrase);
    }, &cancel);

    if (ret == 0) return Result<void>::Ok();
    if (ret == CANCELLED) return Result<void>::Err(ErrorKind::Authentication, "cancelled");
    return Result<void>::Err(ErrorKind::Authentication,
        fmt::format("public key authentication failed for user '{}' with {}: {}",
                    user, auth.key_path, last_error()));
}

Result<std::unique_ptr<SessionChannel>> Libssh2Session::open_session() {
    int err = 0;
    LIBSSH2_CHANNEL* ch = open_until_ready(*core_,
        [&] { return libssh2_channel_open_session(core_->session); },
        SSH_CHANNEL_OPEN_SECS, &err);
    if (!ch) {
        return Result<std::unique_ptr<SessionChannel>>::Err(ErrorKind::Channel,
            fmt::format("failed to open session channel ({})", err));
    }
    return Result<std::unique_ptr<SessionChannel>>::Ok(
        std::make_unique<Libssh2Channel>(core_, ch));
}

Result<std::unique_ptr<ChannelStream>> Libssh2Session::open_forward_channel(
    const std::string& dest_host, int dest_port,
    const std::string& orig_host, int orig_port) {
    int err = 0;
    LIBSSH2_CHANNEL* ch = open_until_ready(*core_, [&] {
        return libssh2_channel_direct_tcpip_ex(core_->session, dest_host.c_str(), dest_port,
                                               orig_host.c_str(), orig_port);
    }, SSH_CHANNEL_OPEN_SECS, &err);
    if (!ch) {
        return Result<std::unique_ptr<ChannelStream>>::Err(ErrorKind::Channel,
            fmt::format("direct-tcpip to {}:{} failed ({})", dest_host, dest_port, err));
    }
    return Result<std::unique_ptr<ChannelStream>>::Ok(
        std::make_unique<Libssh2Channel>(core_, ch));
}

Result<int> Libssh2Session::request_remote_forward(const std::string& bind_address, int bind_port) {
    int bound_port = 0;
    auto deadline = Clock::now() + std::chrono::seconds(SSH_CHANNEL_OPEN_SECS);

    while (!listener_ && Clock::now() < deadline) {
        {
            std::lock_guard<std::mutex> lock(core_->io);
            listener_ = libssh2_channel_forward_listen_ex(core_->session, bind_address.c_str(),
                                                          bind_port, &bound_port, 16);
            if (!listener_ &&
                libssh2_session_last_errno(core_->session) != LIBSSH2_ERROR_EAGAIN) {
                break;
            }
        }
        if (!listener_) platform::sleep_ms(SSH_POLL_MS);
    }

    if (!listener_) {
        return Result<int>::Err(ErrorKind::Channel,
            fmt::format("remote forward of {}:{} refused: {}", bind_address, bind_port, last_error()));
    }
    return Result<int>::Ok(bound_port);
}

Result<void> Libssh2Session::serve_forwarded(const ForwardHandler& handler,
                                             const CancelToken& cancel) {
    if (!listener_) {
        return Result<void>::Err(ErrorKind::Channel, "no remote forward requested");
    }

    auto next_probe = Clock::now() + std::chrono::seconds(ALIVE_CHECK_SECS);
    while (!cancel.is_cancelled()) {
        LIBSSH2_CHANNEL* ch = nullptr;
        int err = 0;
        {
            std::lock_guard<std::mutex> lock(core_->io);
            if (core_->closed.load()) break;
            ch = libssh2_channel_forward_accept(listener_);
            if (!ch) err = libssh2_session_last_errno(core_->session);
        }

        if (ch) {
            ForwardedConnection conn;
            conn.stream = std::make_unique<Libssh2Channel>(core_, ch);
            handler(std::move(conn));
            continue;
        }
        if (err != LIBSSH2_ERROR_EAGAIN) {
            return Result<void>::Err(ErrorKind::Channel,
                fmt::format("forwarded-tcpip accept failed ({})", err));
        }

        if (Clock::now() >= next_probe) {
            if (!check_alive()) {
                return Result<void>::Err(ErrorKind::Connection, "SSH session lost");
            }
            next_probe = Clock::now() + std::chrono::seconds(ALIVE_CHECK_SECS);
        }
        platform::poll_socket(core_->sock, POLLIN, 100);
    }

    if (core_->closed.load() && !cancel.is_cancelled()) {
        return Result<void>::Err(ErrorKind::Connection, "SSH session closed");
    }
    return Result<void>::Ok();
}

bool Libssh2Session::check_alive() {
    std::lock_guard<std::mutex> lock(core_->io);
    if (retired_ || core_->closed.load() || !core_->session ||
        core_->sock == CHANHUB_INVALID_SOCKET) {
        return false;
    }

    // Send SSH keepalive and check if connection is still up
    int seconds_to_next = 0;
    int ret = libssh2_keepalive_send(core_->session, &seconds_to_next);
    if (ret != 0 && ret != LIBSSH2_ERROR_EAGAIN) {
        core_->closed.store(true);
        return false;
    }

    // Also check if the socket is still valid
    int revents = platform::poll_socket(core_->sock, POLLIN, 0);
    if (revents & (POLLERR | POLLHUP | POLLNVAL)) {
        core_->closed.store(true);
        return false;
    }
    return true;
}

// Stops new work on this session only. Relays already running keep the core
// alive and the transport is torn down when the last of them finishes.
void Libssh2Session::disconnect() {
    if (retired_) return;
    retired_ = true;

    if (listener_ && !core_->closed.load()) {
        call_until_ready(*core_, [&] { return libssh2_channel_forward_cancel(listener_); },
                         nullptr, 2);
    }
    listener_ = nullptr;
}

// ── Libssh2Connector ─────────────────────────────────────────

Result<std::unique_ptr<SshSession>> Libssh2Connector::connect(const std::string& host,
                                                              int port,
                                                              int timeout_secs,
                                                              const CancelToken& cancel) {
    using R = Result<std::unique_ptr<SshSession>>;

    int init_rc = 0;
    std::call_once(g_libssh2_init, [&] { init_rc = libssh2_init(0); });
    if (init_rc != 0) {
        return R::Err(ErrorKind::Connection, "Failed to initialize libssh2");
    }
    platform::init_networking();

    auto core = std::make_shared<Libssh2Core>();
    core->target = fmt::format("{}:{}", host, port);

    // Resolve
    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    addrinfo* res = nullptr;
    if (getaddrinfo(host.c_str(), std::to_string(port).c_str(), &hints, &res) != 0 || !res) {
        return R::Err(ErrorKind::Connection, "Failed to resolve host: " + host);
    }
    sockaddr_in addr;
    std::memcpy(&addr, res->ai_addr, sizeof(addr));
    freeaddrinfo(res);

    core->sock = socket(AF_INET, SOCK_STREAM, 0);
    if (core->sock == CHANHUB_INVALID_SOCKET) {
        return R::Err(ErrorKind::Connection, "Failed to create socket");
    }

    // Set socket to non-blocking for libssh2
    platform::set_nonblocking(core->sock);

    int ret = ::connect(core->sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    if (ret < 0 && errno != EINPROGRESS) {
        return R::Err(ErrorKind::Connection,
            fmt::format("Failed to connect to {}: {}", core->target, std::strerror(errno)));
    }

    auto deadline = Clock::now() + std::chrono::seconds(timeout_secs);

    // Wait for non-blocking connect to complete, in slices so cancel is seen
    if (ret < 0) {
        int revents = 0;
        while (revents == 0) {
            if (cancel.is_cancelled()) return R::Err(ErrorKind::Connection, "cancelled");
            if (Clock::now() >= deadline) {
                return R::Err(ErrorKind::Connection, "Connection timed out: " + core->target);
            }
            revents = platform::poll_socket(core->sock, POLLOUT, 100);
        }
        int sock_err = 0;
        socklen_t err_len = sizeof(sock_err);
        getsockopt(core->sock, SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&sock_err), &err_len);
        if (sock_err != 0) {
            return R::Err(ErrorKind::Connection,
                fmt::format("Connection to {} failed: {}", core->target, std::strerror(sock_err)));
        }
    }

    // Create SSH session
    core->session = libssh2_session_init_ex(nullptr, nullptr, nullptr, nullptr);
    if (!core->session) {
        return R::Err(ErrorKind::Connection, "Failed to create SSH session");
    }
    libssh2_session_set_blocking(core->session, 0);

    // SSH handshake (key exchange). Host keys are not verified.
    // No transport to say goodbye on until the handshake is done.
    core->closed.store(true);
    while ((ret = libssh2_session_handshake(core->session, core->sock)) == LIBSSH2_ERROR_EAGAIN) {
        if (cancel.is_cancelled()) return R::Err(ErrorKind::Connection, "cancelled");
        if (Clock::now() >= deadline) {
            return R::Err(ErrorKind::Connection, "SSH handshake timed out: " + core->target);
        }
        platform::sleep_ms(SSH_POLL_MS);
    }
    if (ret != 0) {
        return R::Err(ErrorKind::Connection,
            fmt::format("SSH handshake with {} failed: {}", core->target, session_error(core->session)));
    }

    core->closed.store(false);

    // Enable TCP keepalive on the socket
    int tcp_keepalive = 1;
    setsockopt(core->sock, SOL_SOCKET, SO_KEEPALIVE,
               reinterpret_cast<const char*>(&tcp_keepalive), sizeof(tcp_keepalive));
#ifdef TCP_KEEPIDLE
    int keepidle = 60;
    setsockopt(core->sock, IPPROTO_TCP, TCP_KEEPIDLE,
               reinterpret_cast<const char*>(&keepidle), sizeof(keepidle));
#endif

    // SSH-level keepalive
    libssh2_keepalive_config(core->session, 1, SSH_KEEPALIVE_SECS);

    return R::Ok(std::make_unique<Libssh2Session>(core));
}
