#include "status_codec.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <sstream>

std::string encode_status(const ServiceSnapshot& snapshot) {
    return fmt::format("state = \"{}\"\nactive_channels = {}\ntotal_channels = {}",
                       service_state_wire_name(snapshot.state.kind),
                       snapshot.active_channels,
                       snapshot.total_channels);
}

static Result<int> parse_count(const std::string& key, const std::string& value) {
    std::string v = trimmed(value);
    if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos) {
        return Result<int>::Err(ErrorKind::ControlPlane,
            fmt::format("invalid {} value '{}'", key, value));
    }
    return Result<int>::Ok(safe_stoi(v, 0));
}

Result<ServiceSnapshot> decode_status(const std::string& text) {
    ServiceSnapshot snap;
    bool have_state = false, have_active = false, have_total = false;

    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        trim(line);
        if (line.empty()) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            return Result<ServiceSnapshot>::Err(ErrorKind::ControlPlane,
                "malformed status line: " + line);
        }
        std::string key = trimmed(line.substr(0, eq));
        std::string value = trimmed(line.substr(eq + 1));

        if (key == "state") {
            if (value.size() < 2 || value.front() != '"' || value.back() != '"') {
                return Result<ServiceSnapshot>::Err(ErrorKind::ControlPlane,
                    "state must be a quoted string: " + value);
            }
            auto kind = parse_service_state(value.substr(1, value.size() - 2));
            if (!kind) {
                return Result<ServiceSnapshot>::Err(ErrorKind::ControlPlane,
                    "unknown service state " + value);
            }
            snap.state.kind = *kind;
            have_state = true;
        } else if (key == "active_channels") {
            auto n = parse_count(key, value);
            if (n.is_err()) return forward_err<ServiceSnapshot>(n);
            snap.active_channels = n.value;
            have_active = true;
        } else if (key == "total_channels") {
            auto n = parse_count(key, value);
            if (n.is_err()) return forward_err<ServiceSnapshot>(n);
            snap.total_channels = n.value;
            have_total = true;
        }
    }

    if (!have_state || !have_active || !have_total) {
        return Result<ServiceSnapshot>::Err(ErrorKind::ControlPlane, "incomplete status record");
    }
    return Result<ServiceSnapshot>::Ok(snap);
}
