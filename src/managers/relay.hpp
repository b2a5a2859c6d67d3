#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <ssh/ssh_client.hpp>

// Byte counts of one finished relay.
struct RelayStats {
    uint64_t to_remote = 0;    // local socket -> channel
    uint64_t to_local = 0;     // channel -> local socket
    std::string error;         // empty when a side closed cleanly
    ErrorKind kind = ErrorKind::None;   // Relay when error is set

    bool failed() const { return kind != ErrorKind::None; }
};

// Copy bytes both ways between a local TCP socket and a channel stream until
// either side reaches end of stream or fails, then close both.
// Takes ownership of local and stream.
RelayStats run_relay(socket_t local, std::unique_ptr<ChannelStream> stream,
                     const std::string& label);

// Same, on a detached thread. Not cancellable: it ends with its streams.
void spawn_relay(socket_t local, std::unique_ptr<ChannelStream> stream,
                 std::string label);
