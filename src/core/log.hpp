#pragma once

#include <string>
#include <fmt/format.h>

// Process-wide file logger. Lines look like:
//   [14:02:11.408] INFO  web: connected to prod.example.com:22
// Safe to call from any thread.

enum class LogLevel { Debug, Info, Warn, Error };

struct LogOptions {
    std::string path;                 // empty = <temp>/chanhub.log
    LogLevel min_level = LogLevel::Info;
    bool echo_stderr = false;         // mirror lines to stderr (foreground runs)
};

void log_init(const LogOptions& options);

// Current sink path.
std::string log_path();

void hub_log(LogLevel level, const std::string& msg);

inline void log_debug(const std::string& msg) { hub_log(LogLevel::Debug, msg); }
inline void log_info(const std::string& msg)  { hub_log(LogLevel::Info, msg); }
inline void log_warn(const std::string& msg)  { hub_log(LogLevel::Warn, msg); }
inline void log_error(const std::string& msg) { hub_log(LogLevel::Error, msg); }

// Channel-scoped helper: "name: message"
inline void log_channel(LogLevel level, const std::string& channel, const std::string& msg) {
    hub_log(level, fmt::format("{}: {}", channel, msg));
}
