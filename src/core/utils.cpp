#include "utils.hpp"
#include <platform/platform.hpp>
#include <algorithm>
#include <cctype>
#include <stdexcept>

int safe_stoi(const std::string& s, int fallback) {
    try {
        return std::stoi(s);
    } catch (const std::exception&) {
        return fallback;
    }
}

std::optional<int> parse_port(const std::string& s) {
    if (s.empty() || s.size() > 5) return std::nullopt;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
    }
    int port = safe_stoi(s, -1);
    if (port < 0 || port > 65535) return std::nullopt;
    return port;
}

std::string expand_tilde(const std::string& path) {
    if (path == "~") return platform::home_dir().string();
    if (path.rfind("~/", 0) == 0) {
        return (platform::home_dir() / path.substr(2)).string();
    }
    return path;
}

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}
