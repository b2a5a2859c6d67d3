#pragma once

#include <atomic>
#include <memory>
#include <optional>
#include <string>
#include <core/channel_spec.hpp>
#include <core/cancel_token.hpp>
#include <core/constants.hpp>
#include <ssh/ssh_client.hpp>

// Poll intervals used by duty loops. Tests shorten them.
struct DutyTiming {
    int accept_poll_ms = ACCEPT_POLL_MS;
    int alive_check_ms = ALIVE_CHECK_SECS * 1000;
    int session_tick_ms = SESSION_TICK_MS;
};

// Kind-specific work on an authenticated session.
//
// open() sets the channel up and decides whether the attempt succeeded;
// run() serves it until the channel ends or the token is cancelled.
// A duty object lives for exactly one attempt.
class ChannelDuty {
public:
    virtual ~ChannelDuty() = default;

    virtual Result<void> open(SshSession& session) = 0;

    // Ok when cancelled or the channel closed cleanly, error when the
    // session was lost.
    virtual Result<void> run(SshSession& session, const CancelToken& cancel) = 0;

    // Where the channel is reachable, for status output.
    virtual std::string endpoint() const = 0;

    // Port granted by the server for a remote forward.
    virtual std::optional<int> granted_port() const { return std::nullopt; }
};

class LocalForwardDuty : public ChannelDuty {
public:
    LocalForwardDuty(std::string channel, LocalForward kind, DutyTiming timing);
    ~LocalForwardDuty() override;

    Result<void> open(SshSession& session) override;
    Result<void> run(SshSession& session, const CancelToken& cancel) override;
    std::string endpoint() const override;

private:
    std::string channel_;
    LocalForward kind_;
    DutyTiming timing_;
    socket_t listener_ = CHANHUB_INVALID_SOCKET;
};

class RemoteForwardDuty : public ChannelDuty {
public:
    RemoteForwardDuty(std::string channel, RemoteForward kind);

    Result<void> open(SshSession& session) override;
    Result<void> run(SshSession& session, const CancelToken& cancel) override;
    std::string endpoint() const override;
    std::optional<int> granted_port() const override { return granted_; }

private:
    std::string channel_;
    RemoteForward kind_;
    std::optional<int> granted_;
};

class SessionDuty : public ChannelDuty {
public:
    SessionDuty(std::string channel, Session kind, DutyTiming timing);

    Result<void> open(SshSession& session) override;
    Result<void> run(SshSession& session, const CancelToken& cancel) override;
    std::string endpoint() const override;

private:
    std::string channel_;
    Session kind_;
    DutyTiming timing_;
    std::shared_ptr<SessionChannel> channel_stream_;
};

// Single dispatch point over ChannelKind.
std::unique_ptr<ChannelDuty> make_duty(const ChannelSpec& spec, const DutyTiming& timing = {});
