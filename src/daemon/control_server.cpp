#include "control_server.hpp"
#include "status_codec.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <chrono>
#include <condition_variable>
#include <mutex>

// State shared with detached connection handlers.
struct ControlServer::Shared {
    SnapshotProvider provider;
    CancelToken root;
    std::mutex mutex;
    std::condition_variable cv;
    int in_flight = 0;
};

ControlServer::ControlServer(RunFiles files, SnapshotProvider provider, CancelToken root)
    : files_(std::move(files)), root_(root), shared_(std::make_shared<Shared>()) {
    shared_->provider = std::move(provider);
    shared_->root = std::move(root);
}

ControlServer::~ControlServer() {
    stop();
}

Result<int> ControlServer::start() {
    auto l = platform::tcp_listen(DEFAULT_LOOPBACK, 0);
    if (l.is_err()) {
        return Result<int>::Err(ErrorKind::ControlPlane, "control listener: " + l.error);
    }
    listener_ = l.value;
    port_ = platform::local_port(listener_);

    auto w = files_.write(platform::current_pid(), port_);
    if (w.is_err()) {
        platform::close_socket(listener_);
        listener_ = CHANHUB_INVALID_SOCKET;
        files_.remove();
        return forward_err<int>(w);
    }

    log_info(fmt::format("Control plane listening on {}:{}", DEFAULT_LOOPBACK, port_));
    thread_ = std::thread(&ControlServer::accept_loop, this);
    return Result<int>::Ok(port_);
}

void ControlServer::stop() {
    stop_.store(true);
    if (thread_.joinable()) thread_.join();

    if (listener_ != CHANHUB_INVALID_SOCKET) {
        platform::close_socket(listener_);
        listener_ = CHANHUB_INVALID_SOCKET;
    }
    files_.remove();

    // Handlers hold the snapshot provider; let them finish first
    std::unique_lock<std::mutex> lock(shared_->mutex);
    shared_->cv.wait_for(lock, std::chrono::milliseconds(CONTROL_IO_TIMEOUT_MS),
                         [this] { return shared_->in_flight == 0; });
}

void ControlServer::accept_loop() {
    while (!stop_.load() && !root_.is_cancelled()) {
        auto accepted = platform::accept_client(listener_, CONTROL_ACCEPT_POLL_MS);
        if (accepted.is_err()) {
            log_error("Control plane stopped accepting: " + accepted.error);
            break;
        }
        socket_t client = accepted.value;
        if (client == CHANHUB_INVALID_SOCKET) continue;

        {
            std::lock_guard<std::mutex> lock(shared_->mutex);
            shared_->in_flight++;
        }
        std::thread(&ControlServer::handle_connection, shared_, client).detach();
    }

    // Any shutdown path: no daemon is listening any more
    files_.remove();
    log_debug("Control plane accept loop exited");
}

void ControlServer::handle_connection(std::shared_ptr<Shared> shared, socket_t client) {
    auto line = platform::read_line(client, CONTROL_IO_TIMEOUT_MS, CONTROL_MAX_LINE);
    std::string command = line.is_ok() ? to_lower(trimmed(line.value)) : std::string();

    Result<void> w = Result<void>::Ok();
    if (command == "stop") {
        log_info("Stop requested over control plane");
        shared->root.cancel();
        w = platform::write_all(client, "ok\n");
    } else {
        w = platform::write_all(client, encode_status(shared->provider()));
    }
    if (w.is_err()) log_debug("Control reply failed: " + w.error);
    platform::close_socket(client);

    {
        std::lock_guard<std::mutex> lock(shared->mutex);
        shared->in_flight--;
    }
    shared->cv.notify_all();
}
