#pragma once

#include <string>
#include <vector>
#include <filesystem>

// Safe integer parse: returns fallback on failure (no exceptions).
int safe_stoi(const std::string& s, int fallback = 0);

// Split on a single character. Empty fields are kept.
std::vector<std::string> split(const std::string& s, char delimiter);

// Join with a separator.
std::string join(const std::vector<std::string>& parts, const std::string& sep);

// Read an environment variable; empty string when unset.
std::string env_or_empty(const char* name);

// Last path element as a string ("" for an empty path).
std::string file_name_of(const std::filesystem::path& p);

// True if `p` equals `base` or lies below it, compared component-wise.
bool path_starts_with(const std::filesystem::path& p, const std::filesystem::path& base);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}
