#pragma once

#include <string>
#include <vector>

// Generate an ISO 8601 timestamp (YYYY-MM-DDTHH:MM:SS) for the current local time.
std::string now_iso();

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

std::string to_lower(std::string s);

// Case-insensitive equality for ASCII names (extensions, file names).
bool iequals(const std::string& a, const std::string& b);

bool starts_with(const std::string& s, const std::string& prefix);

// "a, b, c"
std::string join(const std::vector<std::string>& parts, const std::string& sep);
