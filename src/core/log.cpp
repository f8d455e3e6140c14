#include "log.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <mutex>
#include <system_error>

static std::atomic<bool> g_log_enabled{false};
static std::mutex g_log_mutex;

std::string cc_log_path() {
    static std::string path = [] {
        std::error_code ec;
        auto dir = std::filesystem::temp_directory_path(ec);
        if (ec) dir = "/tmp";
        return (dir / "cratecache_debug.log").string();
    }();
    return path;
}

void set_log_enabled(bool enabled) {
    g_log_enabled = enabled;
}

bool log_enabled() {
    return g_log_enabled;
}

void cc_log(const std::string& msg) {
    if (!g_log_enabled) return;

    auto now = std::chrono::system_clock::now();
    auto t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    struct tm tm_buf;
    localtime_r(&t, &tm_buf);

    char ts[32];
    std::snprintf(ts, sizeof(ts), "%02d:%02d:%02d.%03d",
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec,
                  static_cast<int>(ms.count()));

    // walker and size workers log from several threads
    std::lock_guard<std::mutex> lock(g_log_mutex);
    std::ofstream out(cc_log_path(), std::ios::app);
    if (!out) return;
    out << "[" << ts << "] " << msg << "\n";
}
