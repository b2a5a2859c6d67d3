#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include <core/config.hpp>
#include <core/log.hpp>

namespace fs = std::filesystem;

// Options shared by every command.
struct CliOptions {
    fs::path config_path;          // empty = AppConfig::default_path()
    bool debug = false;
    std::string log_path;          // empty = chanhub.log beside the config
    std::string argv0;             // fallback for re-exec when /proc is unavailable
};

// Global options plus the command and its own arguments.
struct CommandLine {
    CliOptions options;
    std::string command;               // empty when none was given
    std::vector<std::string> args;     // everything after the command that is not global
    bool help = false;
    bool version = false;
};

// Global options (-c, -d, --log) are accepted before or after the command.
// Unknown options before the command and missing values are errors.
Result<CommandLine> parse_command_line(const std::vector<std::string>& argv);

// One-line channel description for status/validate output, e.g.
// "listen 8080 -> 127.0.0.1:80 (host: prod)"
std::string describe_channel(const ChannelConfig& channel);

// Command handlers. Each returns the process exit code.
class HubCLI {
public:
    explicit HubCLI(CliOptions options);

    int run_start(bool daemon);
    int run_stop();
    int run_restart();
    int run_status();
    int run_validate(const std::string& path_arg);
    int run_generate(const std::string& ssh_config_arg, const std::string& output_arg);
    int run_test();

private:
    CliOptions options_;
    fs::path config_path_;

    void init_logging(bool echo_stderr);
    int run_foreground();
    int spawn_daemon();
    bool daemon_running() const;
    void stop_daemon();
};
