#pragma once

#include <string>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

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

// Expand a leading "~/" to the user's home directory.
std::string expand_home(const std::string& path);
