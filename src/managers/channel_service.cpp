#include "channel_service.hpp"
#include <core/log.hpp>
#include <platform/socket_util.hpp>
#include <fmt/format.h>

using Clock = std::chrono::steady_clock;

// ── ServiceState ──────────────────────────────────────────────

const char* service_state_wire_name(ServiceStateKind kind) {
    switch (kind) {
    case ServiceStateKind::Stopped:  return "Stopped";
    case ServiceStateKind::Starting: return "Starting";
    case ServiceStateKind::Running:  return "Running";
    case ServiceStateKind::Stopping: return "Stopping";
    case ServiceStateKind::Failed:   return "Error";
    }
    return "Error";
}

std::optional<ServiceStateKind> parse_service_state(const std::string& name) {
    if (name == "Stopped")  return ServiceStateKind::Stopped;
    if (name == "Starting") return ServiceStateKind::Starting;
    if (name == "Running")  return ServiceStateKind::Running;
    if (name == "Stopping") return ServiceStateKind::Stopping;
    if (name == "Error")    return ServiceStateKind::Failed;
    return std::nullopt;
}

std::string describe_state(const ServiceState& state) {
    if (state.kind == ServiceStateKind::Failed) {
        return state.reason.empty() ? "Failed" : "Failed: " + state.reason;
    }
    return service_state_wire_name(state.kind);
}

// ── Pre-flight ────────────────────────────────────────────────

Result<std::vector<std::string>> occupied_listen_ports(const AppConfig& config) {
    std::vector<std::string> busy;
    for (const auto& ch : config.channels()) {
        if (ch.channel_type != "direct-tcpip" || !ch.ports.first || *ch.ports.first == 0) continue;
        auto available = platform::is_port_available(ch.listen_host, *ch.ports.first);
        if (available.is_err()) {
            return Result<std::vector<std::string>>::Err(ErrorKind::Io,
                fmt::format("channel {}: {}", ch.name, available.error));
        }
        if (!available.value) {
            busy.push_back(fmt::format("{}:{}", ch.listen_host, *ch.ports.first));
        }
    }
    return Result<std::vector<std::string>>::Ok(std::move(busy));
}

// ── ChannelService ───────────────────────────────────────────

ChannelService::ChannelService(ServiceContext& ctx) : ctx_(ctx) {}

ChannelService::~ChannelService() {
    std::vector<std::unique_ptr<ChannelRunner>> runners;
    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        runners.swap(runners_);
    }
    for (auto& r : runners) r->request_stop();
    runners.clear();  // destructors join
}

void ChannelService::set_state(ServiceState state, std::optional<int> active) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = std::move(state);
    if (active) active_ = *active;
}

int ChannelService::total_channels() const {
    return static_cast<int>(ctx_.config.channels().size());
}

Result<StartReport> ChannelService::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.kind != ServiceStateKind::Stopped) {
            return Result<StartReport>::Err(ErrorKind::Service,
                fmt::format("cannot start: service is {}", describe_state(state_)));
        }
        state_ = ServiceState{ServiceStateKind::Starting, ""};
        active_ = 0;
    }
    log_info(fmt::format("Starting {} channel(s) from {}", total_channels(), ctx_.config_path.string()));

    // Every local listen port must be free before anything connects
    auto busy = occupied_listen_ports(ctx_.config);
    if (busy.is_err()) {
        std::string reason = "port check failed: " + busy.error;
        log_error(reason);
        set_state(ServiceState::failed(reason), 0);
        return Result<StartReport>::Err(ErrorKind::Service, reason);
    }
    if (!busy.value.empty()) {
        std::string reason = "local port(s) already in use: ";
        for (size_t i = 0; i < busy.value.size(); i++) {
            if (i) reason += ", ";
            reason += busy.value[i];
        }
        log_error(reason);
        set_state(ServiceState::failed(reason), 0);
        return Result<StartReport>::Err(ErrorKind::Service, reason);
    }

    StartReport report;
    Resolution resolution = resolve_channels(ctx_.config);
    for (const auto& f : resolution.failures) {
        log_channel(LogLevel::Error, f.channel, f.error);
        report.failed.push_back(f);
    }

    std::vector<std::unique_ptr<ChannelRunner>> runners;
    for (auto& spec : resolution.specs) {
        auto runner = std::make_unique<ChannelRunner>(spec, ctx_.config.reconnection(),
                                                      *ctx_.connector, ctx_.root.child(),
                                                      ctx_.options.runner);
        runner->start();
        runners.push_back(std::move(runner));
    }

    // Count channels that came up on their first attempt
    auto deadline = Clock::now() + ctx_.options.first_attempt_wait;
    for (auto& runner : runners) {
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (left.count() < 0) left = std::chrono::milliseconds(0);

        auto outcome = runner->wait_first_attempt(left);
        if (outcome && outcome->is_ok()) {
            report.started.push_back(runner->name());
        } else {
            std::string why = outcome ? outcome->describe()
                                      : fmt::format("no connection within {}s",
                                            std::chrono::duration_cast<std::chrono::seconds>(
                                                ctx_.options.first_attempt_wait).count());
            log_channel(LogLevel::Warn, runner->name(),
                        fmt::format("failed to start ({}), retrying in background", why));
            report.failed.push_back({runner->name(), why});
        }
    }

    if (report.started.empty()) {
        for (auto& r : runners) r->request_stop();
        for (auto& r : runners) {
            auto j = r->join();
            if (j.is_err()) log_warn(j.error);
        }

        std::string summary = "no channels started";
        for (const auto& f : report.failed) {
            summary += fmt::format("; {}: {}", f.channel, f.error);
        }
        log_error(summary);
        set_state(ServiceState::failed(summary), 0);
        return Result<StartReport>::Err(ErrorKind::Service, summary);
    }

    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        runners_ = std::move(runners);
    }
    set_state(ServiceState{ServiceStateKind::Running, ""}, static_cast<int>(report.started.size()));

    log_info(fmt::format("Service running: {}/{} channel(s) active",
                         report.started.size(), total_channels()));
    for (const auto& f : report.failed) {
        log_channel(LogLevel::Warn, f.channel, "not active: " + f.error);
    }
    return Result<StartReport>::Ok(report);
}

Result<void> ChannelService::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_.kind != ServiceStateKind::Running) {
            return Result<void>::Err(ErrorKind::Service,
                fmt::format("cannot stop: service is {}", describe_state(state_)));
        }
        state_ = ServiceState{ServiceStateKind::Stopping, ""};
    }
    log_info("Stopping service");

    std::vector<std::unique_ptr<ChannelRunner>> runners;
    {
        std::lock_guard<std::mutex> lock(runners_mutex_);
        runners.swap(runners_);
    }

    // Cancel all first so they wind down in parallel
    for (auto& r : runners) r->request_stop();

    std::vector<std::string> errors;
    for (auto& r : runners) {
        auto j = r->join();
        if (j.is_err()) errors.push_back(j.error);
    }
    runners.clear();

    set_state(ServiceState{ServiceStateKind::Stopped, ""}, 0);

    for (const auto& e : errors) log_warn(e);
    log_info("Service stopped");
    return Result<void>::Ok();
}

Result<StartReport> ChannelService::restart() {
    auto s = stop();
    if (s.is_err()) return forward_err<StartReport>(s);
    return start();
}

ServiceSnapshot ChannelService::status() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return ServiceSnapshot{state_, active_, total_channels()};
}

std::vector<ChannelRunnerState> ChannelService::channels() const {
    std::vector<ChannelRunnerState> out;
    std::lock_guard<std::mutex> lock(runners_mutex_);
    for (const auto& r : runners_) out.push_back(r->state());
    return out;
}
