#pragma once

#include <string>
#include <filesystem>

// Debug log at <tmp>/cratecache_debug.log. Off unless enabled by config
// (debug_log: true) or the CRATECACHE_LOG environment variable.
std::string cc_log_path();

void set_log_enabled(bool enabled);
bool log_enabled();

// Append a "[HH:MM:SS.mmm] msg" line. Thread-safe; no-op when disabled.
void cc_log(const std::string& msg);
