#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include "ssh_client.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;
typedef struct _LIBSSH2_LISTENER LIBSSH2_LISTENER;

// Session state shared by a session and every channel opened on it.
// libssh2 is not thread-safe per session: every call goes through io.
// Freed when the last owner (session or detached relay) lets go.
struct Libssh2Core {
    LIBSSH2_SESSION* session = nullptr;
    socket_t sock = CHANHUB_INVALID_SOCKET;
    std::mutex io;
    std::atomic<bool> closed{false};   // transport known dead
    std::string target;                 // user@host:port, for logs

    ~Libssh2Core();
};

class Libssh2Channel : public SessionChannel {
public:
    Libssh2Channel(std::shared_ptr<Libssh2Core> core, LIBSSH2_CHANNEL* channel);
    ~Libssh2Channel() override;

    int read_some(char* buf, size_t len) override;
    Result<void> write_all(const char* data, size_t len) override;
    socket_t poll_fd() const override;
    void close() override;

    Result<void> exec(const std::string& command) override;
    Result<void> request_pty() override;

private:
    std::shared_ptr<Libssh2Core> core_;
    LIBSSH2_CHANNEL* channel_;
};

class Libssh2Session : public SshSession {
public:
    explicit Libssh2Session(std::shared_ptr<Libssh2Core> core);
    ~Libssh2Session() override;

    Result<void> authenticate(const std::string& user,
                              const AuthConfig& auth,
                              const CancelToken& cancel) override;

    Result<std::unique_ptr<SessionChannel>> open_session() override;

    Result<std::unique_ptr<ChannelStream>> open_forward_channel(
        const std::string& dest_host, int dest_port,
        const std::string& orig_host, int orig_port) override;

    Result<int> request_remote_forward(const std::string& bind_address, int bind_port) override;

    Result<void> serve_forwarded(const ForwardHandler& handler,
                                 const CancelToken& cancel) override;

    bool check_alive() override;
    void disconnect() override;

private:
    std::shared_ptr<Libssh2Core> core_;
    LIBSSH2_LISTENER* listener_ = nullptr;
    bool retired_ = false;

    Result<void> auth_password(const std::string& user, const std::string& password,
                               const std::string& methods, const CancelToken& cancel);
    Result<void> auth_key(const std::string& user, const AuthConfig& auth,
                          const CancelToken& cancel);
    std::string last_error();
};

class Libssh2Connector : public SshConnector {
public:
    Result<std::unique_ptr<SshSession>> connect(const std::string& host,
                                                int port,
                                                int timeout_secs,
                                                const CancelToken& cancel) override;
};
