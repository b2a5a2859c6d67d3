#pragma once

#include <core/constants.hpp>
#include <managers/channel_service.hpp>
#include "run_files.hpp"

// Talks to a running daemon through its port file. Every failure is a
// ControlPlane error, which callers read as "no daemon running".
class ControlClient {
public:
    explicit ControlClient(RunFiles files, int timeout_ms = CONTROL_IO_TIMEOUT_MS);

    Result<ServiceSnapshot> query_status() const;
    Result<void> send_stop() const;

private:
    Result<std::string> exchange(const std::string& request) const;

    RunFiles files_;
    int timeout_ms_;
};
