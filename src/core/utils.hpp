#pragma once

#include <string>
#include <optional>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Strict port parse: digits only, 0..65535.
std::optional<int> parse_port(const std::string& s);

// Expand a leading "~" or "~/" against the home directory.
std::string expand_tilde(const std::string& path);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

inline std::string trimmed(std::string s) {
    trim(s);
    return s;
}

std::string to_lower(std::string s);
