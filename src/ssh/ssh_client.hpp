#pragma once

#include <functional>
#include <memory>
#include <string>
#include <core/types.hpp>
#include <core/cancel_token.hpp>
#include <platform/socket_util.hpp>

// SSH client capability used by the channel runner.
//
// The runner only talks to these interfaces; the libssh2 implementation lives
// in libssh2_client.hpp and tests substitute an in-memory fake.

// Byte stream over one SSH channel. Streams may outlive the runner that
// opened them (relays are detached), so implementations keep whatever
// session state they need alive themselves.
class ChannelStream {
public:
    static constexpr int WOULD_BLOCK = -1;
    static constexpr int STREAM_ERROR = -2;

    virtual ~ChannelStream() = default;

    // Never blocks. Returns bytes read (>0), 0 at end of stream,
    // WOULD_BLOCK when nothing is pending, STREAM_ERROR on failure.
    virtual int read_some(char* buf, size_t len) = 0;

    virtual Result<void> write_all(const char* data, size_t len) = 0;

    // Socket that turns readable when read_some may have data. A hint only:
    // callers still call read_some after a poll timeout.
    virtual socket_t poll_fd() const = 0;

    virtual void close() = 0;
};

// Session channel: a stream that can run a command or an interactive shell.
class SessionChannel : public ChannelStream {
public:
    virtual Result<void> exec(const std::string& command) = 0;

    // Pseudo-terminal plus login shell.
    virtual Result<void> request_pty() = 0;
};

// Inbound connection on a remote forward.
struct ForwardedConnection {
    std::unique_ptr<ChannelStream> stream;
    std::string origin_host;
    int origin_port = 0;
};

using ForwardHandler = std::function<void(ForwardedConnection)>;

// One connected (and later authenticated) SSH transport.
class SshSession {
public:
    virtual ~SshSession() = default;

    virtual Result<void> authenticate(const std::string& user,
                                      const AuthConfig& auth,
                                      const CancelToken& cancel) = 0;

    virtual Result<std::unique_ptr<SessionChannel>> open_session() = 0;

    // direct-tcpip
    virtual Result<std::unique_ptr<ChannelStream>> open_forward_channel(
        const std::string& dest_host, int dest_port,
        const std::string& orig_host, int orig_port) = 0;

    // tcpip-forward. Returns the port the server actually bound.
    virtual Result<int> request_remote_forward(const std::string& bind_address,
                                               int bind_port) = 0;

    // Deliver forwarded-tcpip connections to handler until the session
    // ends (error) or cancel fires (ok). Requires request_remote_forward().
    virtual Result<void> serve_forwarded(const ForwardHandler& handler,
                                         const CancelToken& cancel) = 0;

    // Keepalive probe. False once the transport is gone.
    virtual bool check_alive() = 0;

    // Retire the session: no new channels or forwarded connections. Streams
    // already handed out stay usable until they close on their own.
    virtual void disconnect() = 0;
};

class SshConnector {
public:
    virtual ~SshConnector() = default;

    // TCP connect plus SSH handshake, bounded by timeout_secs.
    virtual Result<std::unique_ptr<SshSession>> connect(const std::string& host,
                                                        int port,
                                                        int timeout_secs,
                                                        const CancelToken& cancel) = 0;
};
