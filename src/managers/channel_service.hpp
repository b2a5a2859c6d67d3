#pragma once

#include <chrono>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/channel_spec.hpp>
#include <core/cancel_token.hpp>
#include <ssh/ssh_client.hpp>
#include "channel_runner.hpp"

namespace fs = std::filesystem;

enum class ServiceStateKind {
    Stopped,
    Starting,
    Running,
    Stopping,
    Failed,
};

struct ServiceState {
    ServiceStateKind kind = ServiceStateKind::Stopped;
    std::string reason;                 // Failed only

    static ServiceState failed(std::string why) {
        return ServiceState{ServiceStateKind::Failed, std::move(why)};
    }

    bool operator==(const ServiceState& o) const { return kind == o.kind && reason == o.reason; }
    bool operator!=(const ServiceState& o) const { return !(*this == o); }
};

// Name used on the control plane: Failed is sent as "Error".
const char* service_state_wire_name(ServiceStateKind kind);
std::optional<ServiceStateKind> parse_service_state(const std::string& name);

// Human form: "Running", "Failed: port 8080 already in use"
std::string describe_state(const ServiceState& state);

struct ServiceSnapshot {
    ServiceState state;
    int active_channels = 0;
    int total_channels = 0;

    bool operator==(const ServiceSnapshot& o) const {
        return state == o.state && active_channels == o.active_channels &&
               total_channels == o.total_channels;
    }
    bool operator!=(const ServiceSnapshot& o) const { return !(*this == o); }
};

struct ServiceOptions {
    RunnerOptions runner;
    std::chrono::milliseconds first_attempt_wait{FIRST_ATTEMPT_WAIT_SECS * 1000};
};

// Everything one daemon run needs. Owned by main (or a test), outlives the
// ChannelService built on it.
struct ServiceContext {
    AppConfig config;
    fs::path config_path;
    std::shared_ptr<SshConnector> connector;
    CancelToken root;                   // cancelled on shutdown
    ServiceOptions options;
};

struct StartReport {
    std::vector<std::string> started;
    std::vector<ChannelFailure> failed;
};

// Owns the configured channels and the service state machine:
// Stopped -> Starting -> Running -> Stopping -> Stopped, Starting -> Failed.
class ChannelService {
public:
    explicit ChannelService(ServiceContext& ctx);
    ~ChannelService();

    ChannelService(const ChannelService&) = delete;
    ChannelService& operator=(const ChannelService&) = delete;

    Result<StartReport> start();
    Result<void> stop();
    Result<StartReport> restart();

    ServiceSnapshot status() const;

    // Per-channel runtime detail
    std::vector<ChannelRunnerState> channels() const;

    const ServiceContext& context() const { return ctx_; }

private:
    ServiceContext& ctx_;

    mutable std::mutex state_mutex_;
    ServiceState state_;
    int active_ = 0;

    mutable std::mutex runners_mutex_;
    std::vector<std::unique_ptr<ChannelRunner>> runners_;

    void set_state(ServiceState state, std::optional<int> active = std::nullopt);
    int total_channels() const;
};

// Listen ports of direct-tcpip channels that cannot be bound right now,
// as "host:port". Fails when a port cannot be checked at all.
Result<std::vector<std::string>> occupied_listen_ports(const AppConfig& config);
