#pragma once

#include <string>
#include <optional>
#include <vector>
#include <cstdint>

// Error classification carried by every failed Result.
// The supervision loop retries Connection/Authentication/Channel alike;
// the kind is kept so a retry policy can tell them apart later.
enum class ErrorKind {
    None,
    Config,
    Connection,
    Authentication,
    Channel,
    Relay,
    Service,
    ControlPlane,
    Io,
};

const char* error_kind_name(ErrorKind kind);

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<T> Ok(T val) {
        return {true, std::move(val), "", ErrorKind::None};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err, ErrorKind::Io};
    }

    static Result<T> Err(ErrorKind kind, const std::string& err) {
        return {false, T{}, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    // "SSH connection error: ..." style message for logs and the console
    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + error;
    }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;
    ErrorKind kind = ErrorKind::None;

    static Result<void> Ok() {
        return {true, "", ErrorKind::None};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err, ErrorKind::Io};
    }

    static Result<void> Err(ErrorKind kind, const std::string& err) {
        return {false, err, kind};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }

    std::string describe() const {
        return std::string(error_kind_name(kind)) + ": " + error;
    }
};

// Forward an error of any Result<U> as a Result<T> of the same kind.
template <typename T, typename U>
Result<T> forward_err(const Result<U>& r) {
    return Result<T>::Err(r.kind, r.error);
}

// ── Configuration structures ────────────────────────────────

struct AuthConfig {
    enum class Type { Password, Key };

    Type type = Type::Password;
    std::string password;                     // Password
    std::string key_path;                     // Key (tilde already expanded)
    std::optional<std::string> passphrase;    // Key

    static AuthConfig with_password(const std::string& secret) {
        AuthConfig a;
        a.type = Type::Password;
        a.password = secret;
        return a;
    }

    static AuthConfig with_key(const std::string& path,
                               std::optional<std::string> passphrase = std::nullopt) {
        AuthConfig a;
        a.type = Type::Key;
        a.key_path = path;
        a.passphrase = std::move(passphrase);
        return a;
    }
};

struct HostConfig {
    std::string name;          // referenced by channels
    std::string host;          // address
    int port = 22;
    std::string username;
    int timeout = 30;          // connect + handshake, seconds
    AuthConfig auth;
};

// "a:b" as written in the config; either side may be missing.
struct PortPair {
    std::optional<int> first;
    std::optional<int> second;
};

struct ChannelConfig {
    std::string name;
    std::string hostname;                     // HostConfig::name
    std::string channel_type = "direct-tcpip";
    PortPair ports;                           // direct: listen:dest, forwarded: local:remote
    std::string dest_host = "127.0.0.1";
    std::string listen_host = "127.0.0.1";
    std::optional<std::string> command;       // session only
};

struct ReconnectionConfig {
    int max_retries = 0;                      // 0 = unlimited per cycle
    int initial_delay_secs = 1;
    int max_delay_secs = 30;
    bool use_exponential_backoff = true;
};

