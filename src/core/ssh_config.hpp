#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include "types.hpp"

class AppConfig;

// One "Host" block of an OpenSSH client config.
struct SshConfigEntry {
    std::string alias;                         // first name after "Host"
    std::string hostname;
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> identity_file;  // tilde expanded
};

// ~/.ssh/config
std::filesystem::path default_ssh_config_path();

// Blocks without HostName are skipped. "Host *" supplies defaults for the
// blocks that follow it.
std::vector<SshConfigEntry> parse_ssh_config_text(const std::string& text);

Result<std::vector<SshConfigEntry>> parse_ssh_config_file(const std::filesystem::path& path);

// Hosts only, no channels. Entries without a user are dropped; entries
// without an identity file get a placeholder password.
AppConfig config_from_ssh_entries(const std::vector<SshConfigEntry>& entries);
