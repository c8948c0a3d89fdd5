#pragma once

#include <chrono>
#include <string>
#include <vector>

// RFC 3339 UTC timestamp with second precision, e.g. "2025-01-15T10:00:45Z".
// This is the format kubectl expects for --since-time.
std::string format_rfc3339(std::chrono::system_clock::time_point tp);

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Quote a single argument for a POSIX shell.
std::string shell_quote(const std::string& arg);

// Join argv into one shell command line, quoting every element.
std::string shell_join(const std::vector<std::string>& argv);

// Split on a single character. Empty fields are kept.
std::vector<std::string> split(const std::string& str, char delimiter);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
