#include "log.hpp"
#include <platform/platform.hpp>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <mutex>

namespace {

std::mutex g_log_mutex;
LogOptions g_options;

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "DEBUG";
    case LogLevel::Info:  return "INFO ";
    case LogLevel::Warn:  return "WARN ";
    case LogLevel::Error: return "ERROR";
    }
    return "?    ";
}

std::string timestamp() {
    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));
    return ts;
}

std::string default_log_path() {
    return (platform::temp_dir() / "chanhub.log").string();
}

} // namespace

void log_init(const LogOptions& options) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    g_options = options;
    if (g_options.path.empty()) g_options.path = default_log_path();
}

std::string log_path() {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    return g_options.path.empty() ? default_log_path() : g_options.path;
}

void hub_log(LogLevel level, const std::string& msg) {
    std::lock_guard<std::mutex> lock(g_log_mutex);
    if (level < g_options.min_level) return;

    std::string line = fmt::format("[{}] {} {}", timestamp(), level_tag(level), msg);

    if (g_options.echo_stderr) {
        std::cerr << line << "\n";
    }

    const std::string& path = g_options.path.empty() ? default_log_path() : g_options.path;
    std::ofstream out(path, std::ios::app);
    if (!out) return;
    out << line << "\n";
}
