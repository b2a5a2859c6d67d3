#include "channel_runner.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <system_error>

const char* runner_phase_name(RunnerPhase phase) {
    switch (phase) {
    case RunnerPhase::Idle:           return "idle";
    case RunnerPhase::Connecting:     return "connecting";
    case RunnerPhase::Authenticating: return "authenticating";
    case RunnerPhase::ChannelActive:  return "active";
    case RunnerPhase::BackoffWait:    return "backoff";
    case RunnerPhase::Stopped:        return "stopped";
    }
    return "unknown";
}

ChannelRunner::ChannelRunner(ChannelSpec spec,
                             ReconnectionConfig reconnection,
                             SshConnector& connector,
                             CancelToken token,
                             RunnerOptions options)
    : spec_(std::move(spec)),
      reconnection_(reconnection),
      connector_(connector),
      token_(std::move(token)),
      options_(options) {
    state_.name = spec_.name;
    state_.kind = channel_kind_name(spec_.kind);
}

ChannelRunner::~ChannelRunner() {
    auto r = stop();
    if (r.is_err()) log_channel(LogLevel::Warn, spec_.name, r.error);
}

void ChannelRunner::start() {
    if (thread_.joinable()) return;
    thread_ = std::thread(&ChannelRunner::supervise, this);
}

void ChannelRunner::request_stop() {
    token_.cancel();
}

Result<void> ChannelRunner::join() {
    if (!thread_.joinable()) return Result<void>::Ok();
    try {
        thread_.join();
    } catch (const std::system_error& e) {
        return Result<void>::Err(ErrorKind::Service,
            fmt::format("{}: failed to join runner: {}", spec_.name, e.what()));
    }
    return Result<void>::Ok();
}

Result<void> ChannelRunner::stop() {
    request_stop();
    return join();
}

ChannelRunnerState ChannelRunner::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_;
}

std::optional<Result<void>> ChannelRunner::wait_first_attempt(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(first_mutex_);
    first_cv_.wait_for(lock, timeout, [this] { return first_outcome_.has_value(); });
    return first_outcome_;
}

// ── Internals ────────────────────────────────────────────────

void ChannelRunner::set_phase(RunnerPhase phase) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.phase = phase;
}

void ChannelRunner::record_failure(const Result<void>& r) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_.last_error = r.error;
    state_.last_error_kind = r.kind;
    state_.failed_attempts++;
}

void ChannelRunner::signal_first_attempt(const Result<void>& r) {
    {
        std::lock_guard<std::mutex> lock(first_mutex_);
        if (first_outcome_) return;
        first_outcome_ = r;
    }
    first_cv_.notify_all();
}

void ChannelRunner::supervise() {
    log_channel(LogLevel::Info, spec_.name, fmt::format(
        "starting {} via {}@{}:{}", describe_kind(spec_.kind), spec_.username, spec_.host, spec_.port));

    while (!token_.is_cancelled()) {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_.cycles++;
        }
        run_cycle();
        if (token_.is_cancelled()) break;

        set_phase(RunnerPhase::BackoffWait);
        log_channel(LogLevel::Info, spec_.name, fmt::format(
            "cycle ended, reconnecting in {}ms", options_.cycle_pause.count()));
        if (token_.wait_for(options_.cycle_pause)) break;
    }

    set_phase(RunnerPhase::Stopped);
    signal_first_attempt(Result<void>::Err(ErrorKind::Service, "stopped before first attempt finished"));
    log_channel(LogLevel::Info, spec_.name, "stopped");
}

void ChannelRunner::run_cycle() {
    // Fresh retry budget every cycle
    BackoffPolicy policy = BackoffPolicy::from_config(reconnection_);
    int failed = 0;

    while (!token_.is_cancelled()) {
        auto r = attempt();
        if (r.is_ok()) {
            if (!token_.is_cancelled()) log_channel(LogLevel::Info, spec_.name, "channel closed");
            return;
        }

        failed++;
        record_failure(r);
        signal_first_attempt(r);
        if (token_.is_cancelled()) return;

        log_channel(LogLevel::Warn, spec_.name, fmt::format("attempt {} failed: {}", failed, r.describe()));

        if (policy.exhausted(failed)) {
            log_channel(LogLevel::Warn, spec_.name, fmt::format(
                "giving up this cycle after {} failed attempts", failed));
            return;
        }

        auto delay = policy.delay_for(failed);
        set_phase(RunnerPhase::BackoffWait);
        log_channel(LogLevel::Debug, spec_.name, fmt::format("retrying in {}ms", delay.count()));
        if (token_.wait_for(delay)) return;
    }
}

Result<void> ChannelRunner::attempt() {
    set_phase(RunnerPhase::Connecting);
    auto conn = connector_.connect(spec_.host, spec_.port, spec_.timeout, token_);
    if (conn.is_err()) return forward_err<void>(conn);
    auto session = std::move(conn.value);

    set_phase(RunnerPhase::Authenticating);
    auto auth = session->authenticate(spec_.username, spec_.auth, token_);
    if (auth.is_err()) {
        session->disconnect();
        return auth;
    }

    auto duty = make_duty(spec_, options_.timing);
    auto opened = duty->open(*session);
    if (opened.is_err()) {
        session->disconnect();
        return opened;
    }

    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state_.phase = RunnerPhase::ChannelActive;
        state_.endpoint = duty->endpoint();
        state_.granted_port = duty->granted_port();
    }
    signal_first_attempt(Result<void>::Ok());
    log_channel(LogLevel::Info, spec_.name, fmt::format("channel active: {}", duty->endpoint()));

    auto r = duty->run(*session, token_);

    duty.reset();
    session->disconnect();
    return r;
}
