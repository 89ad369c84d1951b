#pragma once

#include <string>

// Generate a UTC ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SSZ).
std::string now_utc_iso();

// Generate a random RFC 4122 version 4 UUID string.
std::string generate_uuid();

// True if the environment variable is set to 1/true/yes (case-insensitive).
bool env_flag_enabled(const char* name);

// Environment variable value, or "" when unset.
std::string env_or_empty(const char* name);

std::string to_lower(std::string s);

// Replace every occurrence of `from` in `s` with `to`.
std::string replace_all(std::string s, const std::string& from, const std::string& to);

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
