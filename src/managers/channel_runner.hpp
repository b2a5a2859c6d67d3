#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <core/backoff.hpp>
#include <core/cancel_token.hpp>
#include <core/channel_spec.hpp>
#include "channel_duty.hpp"

enum class RunnerPhase {
    Idle,
    Connecting,
    Authenticating,
    ChannelActive,
    BackoffWait,
    Stopped,
};

const char* runner_phase_name(RunnerPhase phase);

struct RunnerOptions {
    std::chrono::milliseconds cycle_pause{CYCLE_PAUSE_MS};
    DutyTiming timing;
};

// Point-in-time copy of one runner, for status output and logs.
struct ChannelRunnerState {
    std::string name;
    std::string kind;                   // channel_kind_name()
    RunnerPhase phase = RunnerPhase::Idle;
    std::string endpoint;
    std::optional<int> granted_port;    // remote forwards
    std::string last_error;
    ErrorKind last_error_kind = ErrorKind::None;
    int failed_attempts = 0;            // across all cycles
    int cycles = 0;
};

// Keeps one channel connected until cancelled.
//
// Each supervision cycle builds a fresh BackoffPolicy and retries
// connect -> authenticate -> open -> run until an attempt's duty loop ends
// or the policy's retry budget is spent; then it pauses and starts over.
class ChannelRunner {
public:
    ChannelRunner(ChannelSpec spec,
                  ReconnectionConfig reconnection,
                  SshConnector& connector,
                  CancelToken token,
                  RunnerOptions options = {});
    ~ChannelRunner();

    ChannelRunner(const ChannelRunner&) = delete;
    ChannelRunner& operator=(const ChannelRunner&) = delete;

    void start();

    // Cancel without waiting.
    void request_stop();

    // Wait for the supervision thread to finish.
    Result<void> join();

    // request_stop() + join()
    Result<void> stop();

    ChannelRunnerState state() const;
    const std::string& name() const { return spec_.name; }

    // Outcome of the first connect+open attempt. Blocks up to timeout;
    // nullopt if it has not finished by then.
    std::optional<Result<void>> wait_first_attempt(std::chrono::milliseconds timeout);

private:
    void supervise();
    void run_cycle();
    Result<void> attempt();

    void set_phase(RunnerPhase phase);
    void record_failure(const Result<void>& r);
    void signal_first_attempt(const Result<void>& r);

    ChannelSpec spec_;
    ReconnectionConfig reconnection_;
    SshConnector& connector_;
    CancelToken token_;
    RunnerOptions options_;
    std::thread thread_;

    mutable std::mutex state_mutex_;
    ChannelRunnerState state_;

    std::mutex first_mutex_;
    std::condition_variable first_cv_;
    std::optional<Result<void>> first_outcome_;
};
