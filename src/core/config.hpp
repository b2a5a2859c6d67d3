#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

// Parse "local:dest". Either side may be empty; anything else that is not a
// port number is an error.
Result<PortPair> parse_port_pair(const std::string& text);
std::string format_port_pair(const PortPair& ports);

class AppConfig {
public:
    // Load from a YAML file
    static Result<AppConfig> load(const fs::path& path);

    // Parse YAML text (path is only used in messages)
    static Result<AppConfig> parse(const std::string& yaml_text);

    // Write back as YAML, with a "# Host: name (address)" line before each host
    Result<void> save(const fs::path& path) const;
    std::string to_yaml() const;

    // ./chanhub.yaml, then ~/.config/chanhub/config.yaml
    static std::vector<fs::path> default_path_candidates();

    // First candidate that exists, or the first candidate
    static fs::path default_path();

    // Accessors
    const std::vector<HostConfig>& hosts() const { return hosts_; }
    const std::vector<ChannelConfig>& channels() const { return channels_; }
    const ReconnectionConfig& reconnection() const { return reconnection_; }

    const HostConfig* find_host(const std::string& name) const;

    // Builders (generate command, tests)
    void add_host(const HostConfig& host) { hosts_.push_back(host); }
    void add_channel(const ChannelConfig& channel) { channels_.push_back(channel); }
    void set_reconnection(const ReconnectionConfig& r) { reconnection_ = r; }

public:
    AppConfig() = default;

private:
    std::vector<HostConfig> hosts_;
    std::vector<ChannelConfig> channels_;
    ReconnectionConfig reconnection_;
};

// Directory holding run files, lock and log for a config path
fs::path run_dir(const fs::path& config_path);
