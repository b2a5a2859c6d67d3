#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <thread>
#include <core/cancel_token.hpp>
#include <managers/channel_service.hpp>
#include <platform/socket_util.hpp>
#include "run_files.hpp"

using SnapshotProvider = std::function<ServiceSnapshot()>;

// Loopback control endpoint of a running daemon.
//
// One command per connection: "stop" cancels the root token and answers
// "ok\n"; anything else answers the status record. The run files are
// written once listening and removed when the server stops, including
// when a "stop" request shuts it down.
class ControlServer {
public:
    ControlServer(RunFiles files, SnapshotProvider provider, CancelToken root);
    ~ControlServer();

    ControlServer(const ControlServer&) = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    // Bind 127.0.0.1:0, write run files, start accepting. Returns the port.
    Result<int> start();

    // Stop accepting, wait briefly for in-flight requests, remove run files.
    void stop();

    int port() const { return port_; }

private:
    struct Shared;

    void accept_loop();
    static void handle_connection(std::shared_ptr<Shared> shared, socket_t client);

    RunFiles files_;
    CancelToken root_;
    std::shared_ptr<Shared> shared_;
    socket_t listener_ = CHANHUB_INVALID_SOCKET;
    int port_ = 0;
    std::atomic<bool> stop_{false};
    std::thread thread_;
};
