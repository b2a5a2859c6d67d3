#include "control_client.hpp"
#include "status_codec.hpp"
#include <core/utils.hpp>
#include <platform/socket_util.hpp>

ControlClient::ControlClient(RunFiles files, int timeout_ms)
    : files_(std::move(files)), timeout_ms_(timeout_ms) {}

Result<std::string> ControlClient::exchange(const std::string& request) const {
    auto port = files_.read_port();
    if (port.is_err()) return forward_err<std::string>(port);

    auto sock = platform::tcp_connect(DEFAULT_LOOPBACK, port.value, timeout_ms_);
    if (sock.is_err()) {
        return Result<std::string>::Err(ErrorKind::ControlPlane, sock.error);
    }

    auto w = platform::write_all(sock.value, request);
    if (w.is_err()) {
        platform::close_socket(sock.value);
        return Result<std::string>::Err(ErrorKind::ControlPlane, w.error);
    }

    auto reply = platform::read_to_eof(sock.value, timeout_ms_, 4096);
    platform::close_socket(sock.value);
    if (reply.is_err()) {
        return Result<std::string>::Err(ErrorKind::ControlPlane, reply.error);
    }
    return reply;
}

Result<ServiceSnapshot> ControlClient::query_status() const {
    auto reply = exchange("status\n");
    if (reply.is_err()) return forward_err<ServiceSnapshot>(reply);
    return decode_status(reply.value);
}

Result<void> ControlClient::send_stop() const {
    auto reply = exchange("stop\n");
    if (reply.is_err()) return forward_err<void>(reply);
    if (trimmed(reply.value) != "ok") {
        return Result<void>::Err(ErrorKind::ControlPlane,
            "unexpected reply to stop: '" + trimmed(reply.value) + "'");
    }
    return Result<void>::Ok();
}
