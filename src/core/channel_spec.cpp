#include "channel_spec.hpp"
#include "config.hpp"
#include <fmt/format.h>

namespace {

template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };
template <class... Ts> overloaded(Ts...) -> overloaded<Ts...>;

Result<ChannelKind> build_kind(const ChannelConfig& ch) {
    const std::string& type = ch.channel_type;

    if (type == "direct-tcpip") {
        if (!ch.ports.first || !ch.ports.second) {
            return Result<ChannelKind>::Err(ErrorKind::Config, fmt::format(
                "Channel '{}': direct-tcpip requires ports 'listen:dest'", ch.name));
        }
        LocalForward lf;
        lf.listen_host = ch.listen_host;
        lf.listen_port = *ch.ports.first;
        lf.dest_host = ch.dest_host;
        lf.dest_port = *ch.ports.second;
        return Result<ChannelKind>::Ok(lf);
    }

    if (type == "forwarded-tcpip") {
        if (!ch.ports.first || !ch.ports.second) {
            return Result<ChannelKind>::Err(ErrorKind::Config, fmt::format(
                "Channel '{}': forwarded-tcpip requires ports 'local:remote'", ch.name));
        }
        RemoteForward rf;
        rf.local_port = *ch.ports.first;
        rf.remote_bind_port = *ch.ports.second;
        rf.local_host = ch.dest_host;
        return Result<ChannelKind>::Ok(rf);
    }

    if (type == "session") {
        return Result<ChannelKind>::Ok(Session{ch.command});
    }

    return Result<ChannelKind>::Err(ErrorKind::Config, fmt::format(
        "Channel '{}': unknown channel_type '{}'", ch.name, type));
}

} // namespace

const char* channel_kind_name(const ChannelKind& kind) {
    return std::visit(overloaded{
        [](const LocalForward&) { return "local-forward"; },
        [](const RemoteForward&) { return "remote-forward"; },
        [](const Session&) { return "session"; },
    }, kind);
}

std::string describe_kind(const ChannelKind& kind) {
    return std::visit(overloaded{
        [](const LocalForward& k) {
            return fmt::format("listen {} -> {}:{}", k.listen_port, k.dest_host, k.dest_port);
        },
        [](const RemoteForward& k) {
            return fmt::format("remote {} -> local {}:{}", k.remote_bind_port, k.local_host, k.local_port);
        },
        [](const Session& k) {
            return k.command ? fmt::format("session: {}", *k.command) : std::string("session (pty)");
        },
    }, kind);
}

Result<ChannelSpec> resolve_channel(const ChannelConfig& channel,
                                    const std::vector<HostConfig>& hosts) {
    const HostConfig* host = nullptr;
    for (const auto& h : hosts) {
        if (h.name == channel.hostname) { host = &h; break; }
    }
    if (!host) {
        return Result<ChannelSpec>::Err(ErrorKind::Config, fmt::format(
            "Channel '{}': host '{}' not found in configuration", channel.name, channel.hostname));
    }

    auto kind = build_kind(channel);
    if (kind.is_err()) return forward_err<ChannelSpec>(kind);

    ChannelSpec spec;
    spec.name = channel.name;
    spec.host_name = host->name;
    spec.host = host->host;
    spec.port = host->port;
    spec.username = host->username;
    spec.timeout = host->timeout;
    spec.auth = host->auth;
    spec.kind = kind.value;
    return Result<ChannelSpec>::Ok(spec);
}

Resolution resolve_channels(const AppConfig& config) {
    Resolution out;
    for (const auto& ch : config.channels()) {
        auto r = resolve_channel(ch, config.hosts());
        if (r.is_ok()) {
            out.specs.push_back(std::move(r.value));
        } else {
            out.failures.push_back({ch.name, r.error});
        }
    }
    return out;
}
