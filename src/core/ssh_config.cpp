#include "ssh_config.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fstream>
#include <map>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct Defaults {
    std::optional<int> port;
    std::optional<std::string> user;
    std::optional<std::string> identity_file;
};

using Directives = std::map<std::string, std::string>;

std::optional<std::string> lookup(const Directives& d, const std::string& key) {
    auto it = d.find(key);
    if (it == d.end()) return std::nullopt;
    return it->second;
}

std::optional<int> lookup_port(const Directives& d) {
    auto v = lookup(d, "port");
    if (!v) return std::nullopt;
    return parse_port(*v);
}

Defaults extract_defaults(const Directives& d) {
    Defaults out;
    out.port = lookup_port(d);
    out.user = lookup(d, "user");
    if (auto id = lookup(d, "identityfile")) out.identity_file = expand_tilde(*id);
    return out;
}

std::optional<SshConfigEntry> build_entry(const std::string& alias,
                                          const Directives& d,
                                          const Defaults& defaults) {
    auto hostname = lookup(d, "hostname");
    if (!hostname) return std::nullopt;

    SshConfigEntry e;
    e.alias = alias;
    e.hostname = *hostname;
    e.port = lookup_port(d);
    if (!e.port) e.port = defaults.port;
    e.user = lookup(d, "user");
    if (!e.user) e.user = defaults.user;
    if (auto id = lookup(d, "identityfile")) {
        e.identity_file = expand_tilde(*id);
    } else {
        e.identity_file = defaults.identity_file;
    }
    return e;
}

} // namespace

fs::path default_ssh_config_path() {
    return platform::home_dir() / ".ssh" / "config";
}

std::vector<SshConfigEntry> parse_ssh_config_text(const std::string& text) {
    std::vector<SshConfigEntry> entries;
    std::optional<std::string> current;
    bool current_is_default = false;
    Directives directives;
    Defaults defaults;

    auto flush = [&]() {
        if (!current) return;
        if (current_is_default) {
            defaults = extract_defaults(directives);
        } else if (auto e = build_entry(*current, directives, defaults)) {
            entries.push_back(*e);
        }
    };

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty() || line[0] == '#') continue;

        std::istringstream words(line);
        std::string key;
        words >> key;
        std::string rest;
        std::getline(words, rest);
        trim(rest);

        if (to_lower(key) == "host") {
            flush();
            directives.clear();
            current.reset();
            current_is_default = false;

            std::istringstream names(rest);
            std::string first;
            names >> first;
            if (first == "*") {
                current_is_default = true;
                current = first;
            } else if (!first.empty()) {
                current = first;
            }
            continue;
        }

        if (current && !rest.empty()) {
            directives[to_lower(key)] = rest;
        }
    }
    flush();

    return entries;
}

Result<std::vector<SshConfigEntry>> parse_ssh_config_file(const fs::path& path) {
    fs::path p = expand_tilde(path.string());
    std::ifstream in(p);
    if (!in) {
        return Result<std::vector<SshConfigEntry>>::Err(ErrorKind::Config,
            "Failed to read SSH config file: " + p.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();
    return Result<std::vector<SshConfigEntry>>::Ok(parse_ssh_config_text(ss.str()));
}

AppConfig config_from_ssh_entries(const std::vector<SshConfigEntry>& entries) {
    AppConfig config;
    for (const auto& e : entries) {
        if (!e.user) continue;

        HostConfig h;
        h.name = e.alias;
        h.host = e.hostname;
        h.port = e.port.value_or(DEFAULT_SSH_PORT);
        h.username = *e.user;
        h.auth = e.identity_file ? AuthConfig::with_key(*e.identity_file)
                                 : AuthConfig::with_password(PASSWORD_PLACEHOLDER);
        config.add_host(h);
    }
    return config;
}
