#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

// ── Ports ─────────────────────────────────────────────────────

Result<PortPair> parse_port_pair(const std::string& text) {
    std::string s = trimmed(text);
    auto colon = s.find(':');
    if (colon == std::string::npos || s.find(':', colon + 1) != std::string::npos) {
        return Result<PortPair>::Err(ErrorKind::Config, fmt::format(
            "Invalid port format '{}'. Expected format: 'local:dest' (e.g., '80:3923')", text));
    }

    PortPair pair;
    std::string left = trimmed(s.substr(0, colon));
    std::string right = trimmed(s.substr(colon + 1));

    if (!left.empty()) {
        auto p = parse_port(left);
        if (!p) {
            return Result<PortPair>::Err(ErrorKind::Config,
                fmt::format("Invalid port '{}' in '{}'", left, text));
        }
        pair.first = *p;
    }
    if (!right.empty()) {
        auto p = parse_port(right);
        if (!p) {
            return Result<PortPair>::Err(ErrorKind::Config,
                fmt::format("Invalid port '{}' in '{}'", right, text));
        }
        pair.second = *p;
    }
    return Result<PortPair>::Ok(pair);
}

std::string format_port_pair(const PortPair& ports) {
    return fmt::format("{}:{}",
        ports.first ? std::to_string(*ports.first) : "",
        ports.second ? std::to_string(*ports.second) : "");
}

// ── Parsing ───────────────────────────────────────────────────

static Result<AuthConfig> parse_auth(const YAML::Node& node, const std::string& host_name) {
    if (!node || !node.IsMap()) {
        return Result<AuthConfig>::Err(ErrorKind::Config,
            fmt::format("Host '{}': missing auth section", host_name));
    }

    std::string type = to_lower(node["type"].as<std::string>(""));
    if (type == "password") {
        return Result<AuthConfig>::Ok(
            AuthConfig::with_password(node["password"].as<std::string>("")));
    }
    if (type == "key") {
        std::string key_path = node["key_path"].as<std::string>("");
        if (key_path.empty()) {
            return Result<AuthConfig>::Err(ErrorKind::Config,
                fmt::format("Host '{}': key auth requires key_path", host_name));
        }
        std::optional<std::string> passphrase;
        if (node["passphrase"] && !node["passphrase"].IsNull()) {
            passphrase = node["passphrase"].as<std::string>();
        }
        return Result<AuthConfig>::Ok(AuthConfig::with_key(expand_tilde(key_path), passphrase));
    }
    return Result<AuthConfig>::Err(ErrorKind::Config,
        fmt::format("Host '{}': unknown auth type '{}' (expected password or key)", host_name, type));
}

static Result<HostConfig> parse_host(const YAML::Node& node) {
    HostConfig host;
    host.name = node["name"].as<std::string>("");
    host.host = node["host"].as<std::string>("");
    host.port = node["port"].as<int>(DEFAULT_SSH_PORT);
    host.username = node["username"].as<std::string>("");
    host.timeout = node["timeout"].as<int>(30);

    if (host.name.empty()) {
        return Result<HostConfig>::Err(ErrorKind::Config, "Host entry without a name");
    }
    if (host.host.empty()) {
        return Result<HostConfig>::Err(ErrorKind::Config,
            fmt::format("Host '{}': missing host address", host.name));
    }
    if (host.port <= 0 || host.port > 65535) {
        return Result<HostConfig>::Err(ErrorKind::Config,
            fmt::format("Host '{}': invalid port {}", host.name, host.port));
    }

    auto auth = parse_auth(node["auth"], host.name);
    if (auth.is_err()) return forward_err<HostConfig>(auth);
    host.auth = auth.value;

    return Result<HostConfig>::Ok(host);
}

static Result<ChannelConfig> parse_channel(const YAML::Node& node) {
    ChannelConfig ch;
    ch.name = node["name"].as<std::string>("");
    ch.hostname = node["hostname"].as<std::string>("");
    ch.channel_type = node["channel_type"].as<std::string>("direct-tcpip");
    ch.dest_host = node["dest_host"].as<std::string>(DEFAULT_LOOPBACK);
    ch.listen_host = node["listen_host"].as<std::string>(DEFAULT_LOOPBACK);

    if (ch.name.empty()) {
        return Result<ChannelConfig>::Err(ErrorKind::Config, "Channel entry without a name");
    }

    if (node["ports"] && !node["ports"].IsNull()) {
        auto ports = parse_port_pair(node["ports"].as<std::string>());
        if (ports.is_err()) {
            return Result<ChannelConfig>::Err(ErrorKind::Config,
                fmt::format("Channel '{}': {}", ch.name, ports.error));
        }
        ch.ports = ports.value;
    }

    if (node["command"] && !node["command"].IsNull()) {
        ch.command = node["command"].as<std::string>();
    }

    return Result<ChannelConfig>::Ok(ch);
}

static ReconnectionConfig parse_reconnection(const YAML::Node& node) {
    ReconnectionConfig r;
    if (!node) return r;
    r.max_retries = node["max_retries"].as<int>(0);
    r.initial_delay_secs = node["initial_delay_secs"].as<int>(1);
    r.max_delay_secs = node["max_delay_secs"].as<int>(30);
    r.use_exponential_backoff = node["use_exponential_backoff"].as<bool>(true);
    return r;
}

static Result<AppConfig> from_root(const YAML::Node& root) {
    AppConfig config;

    if (root["hosts"] && root["hosts"].IsSequence()) {
        for (const auto& n : root["hosts"]) {
            auto host = parse_host(n);
            if (host.is_err()) return forward_err<AppConfig>(host);
            config.add_host(host.value);
        }
    }

    if (root["channels"] && root["channels"].IsSequence()) {
        for (const auto& n : root["channels"]) {
            auto ch = parse_channel(n);
            if (ch.is_err()) return forward_err<AppConfig>(ch);
            config.add_channel(ch.value);
        }
    }

    config.set_reconnection(parse_reconnection(root["reconnection"]));
    return Result<AppConfig>::Ok(config);
}

Result<AppConfig> AppConfig::parse(const std::string& yaml_text) {
    try {
        return from_root(YAML::Load(yaml_text));
    } catch (const std::exception& e) {
        return Result<AppConfig>::Err(ErrorKind::Config,
            std::string("Failed to parse config: ") + e.what());
    }
}

Result<AppConfig> AppConfig::load(const fs::path& path) {
    if (!fs::exists(path)) {
        return Result<AppConfig>::Err(ErrorKind::Config,
            "Config file not found at " + path.string());
    }

    try {
        return from_root(YAML::LoadFile(path.string()));
    } catch (const std::exception& e) {
        return Result<AppConfig>::Err(ErrorKind::Config,
            fmt::format("Failed to parse config {}: {}", path.string(), e.what()));
    }
}

const HostConfig* AppConfig::find_host(const std::string& name) const {
    for (const auto& h : hosts_) {
        if (h.name == name) return &h;
    }
    return nullptr;
}

// ── Writing ───────────────────────────────────────────────────

// Insert "# Host: name (address)" above each "- name:" item of the hosts list.
static std::string add_host_comments(const std::string& yaml, const std::vector<HostConfig>& hosts) {
    std::istringstream in(yaml);
    std::string out;
    std::string line;
    bool in_hosts = false;
    size_t host_index = 0;

    while (std::getline(in, line)) {
        if (!line.empty() && line[0] != ' ' && line[0] != '-') {
            in_hosts = (line.rfind("hosts:", 0) == 0);
        }

        auto dash = line.find("- name:");
        if (in_hosts && dash != std::string::npos &&
            line.find_first_not_of(' ') == dash && host_index < hosts.size()) {
            const auto& h = hosts[host_index++];
            if (!out.empty() && out.substr(out.size() - 2) != "\n\n") out += "\n";
            out += std::string(dash, ' ') + fmt::format("# Host: {} ({})\n", h.name, h.host);
        }

        out += line;
        out += "\n";
    }
    return out;
}

std::string AppConfig::to_yaml() const {
    YAML::Emitter out;
    out << YAML::BeginMap;

    out << YAML::Key << "hosts" << YAML::Value << YAML::BeginSeq;
    for (const auto& h : hosts_) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << h.name;
        out << YAML::Key << "host" << YAML::Value << h.host;
        out << YAML::Key << "port" << YAML::Value << h.port;
        out << YAML::Key << "username" << YAML::Value << h.username;
        out << YAML::Key << "timeout" << YAML::Value << h.timeout;
        out << YAML::Key << "auth" << YAML::Value << YAML::BeginMap;
        if (h.auth.type == AuthConfig::Type::Password) {
            out << YAML::Key << "type" << YAML::Value << "password";
            out << YAML::Key << "password" << YAML::Value << h.auth.password;
        } else {
            out << YAML::Key << "type" << YAML::Value << "key";
            out << YAML::Key << "key_path" << YAML::Value << h.auth.key_path;
            if (h.auth.passphrase) {
                out << YAML::Key << "passphrase" << YAML::Value << *h.auth.passphrase;
            }
        }
        out << YAML::EndMap;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "channels" << YAML::Value << YAML::BeginSeq;
    for (const auto& c : channels_) {
        out << YAML::BeginMap;
        out << YAML::Key << "name" << YAML::Value << c.name;
        out << YAML::Key << "hostname" << YAML::Value << c.hostname;
        out << YAML::Key << "channel_type" << YAML::Value << c.channel_type;
        out << YAML::Key << "ports" << YAML::Value << format_port_pair(c.ports);
        out << YAML::Key << "dest_host" << YAML::Value << c.dest_host;
        out << YAML::Key << "listen_host" << YAML::Value << c.listen_host;
        if (c.command) {
            out << YAML::Key << "command" << YAML::Value << *c.command;
        }
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "reconnection" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "max_retries" << YAML::Value << reconnection_.max_retries;
    out << YAML::Key << "initial_delay_secs" << YAML::Value << reconnection_.initial_delay_secs;
    out << YAML::Key << "max_delay_secs" << YAML::Value << reconnection_.max_delay_secs;
    out << YAML::Key << "use_exponential_backoff" << YAML::Value << reconnection_.use_exponential_backoff;
    out << YAML::EndMap;

    out << YAML::EndMap;

    return add_host_comments(out.c_str(), hosts_);
}

Result<void> AppConfig::save(const fs::path& path) const {
    try {
        if (path.has_parent_path()) {
            fs::create_directories(path.parent_path());
        }
        std::ofstream fout(path);
        if (!fout) {
            return Result<void>::Err(ErrorKind::Io, "Failed to create config file at " + path.string());
        }
        fout << to_yaml();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err(ErrorKind::Io, std::string("Failed to write config file: ") + e.what());
    }
}

// ── Paths ─────────────────────────────────────────────────────

std::vector<fs::path> AppConfig::default_path_candidates() {
    std::vector<fs::path> candidates;
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    candidates.push_back((ec ? fs::path(".") : cwd) / CONFIG_FILE_NAME);

    const char* xdg = std::getenv("XDG_CONFIG_HOME");
    fs::path config_dir = (xdg && *xdg) ? fs::path(xdg) : platform::home_dir() / ".config";
    candidates.push_back(config_dir / "chanhub" / "config.yaml");
    return candidates;
}

fs::path AppConfig::default_path() {
    auto candidates = default_path_candidates();
    for (const auto& p : candidates) {
        if (fs::exists(p)) return p;
    }
    return candidates.front();
}

fs::path run_dir(const fs::path& config_path) {
    fs::path parent = config_path.parent_path();
    return parent.empty() ? fs::path(".") : parent;
}
