#include "walker.hpp"
#include "parallel.hpp"
#include <core/log.hpp>
#include <sys/stat.h>
#include <algorithm>
#include <atomic>
#include <cerrno>
#include <system_error>

namespace fs = std::filesystem;

namespace platform {

// Not-found is expected while a build deletes its temporaries.
static bool is_not_found(const std::error_code& ec) {
    return ec == std::errc::no_such_file_or_directory;
}

static void note_walk_error(const fs::path& p, const std::error_code& ec) {
    if (is_not_found(ec)) return;
    cc_log("walk: skipping " + p.string() + ": " + ec.message());
}

static void walk_into(const fs::path& dir, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        note_walk_error(dir, ec);
        return;
    }

    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        std::error_code sec;
        auto st = entry.symlink_status(sec);
        if (sec) {
            note_walk_error(entry.path(), sec);
            continue;
        }
        if (st.type() == fs::file_type::not_found) continue;

        if (st.type() == fs::file_type::directory) {
            walk_into(entry.path(), out);
        } else {
            out.push_back(entry.path());
        }
    }
    if (ec) note_walk_error(dir, ec);
}

std::vector<fs::path> walk_files(const fs::path& root) {
    std::vector<fs::path> out;
    std::error_code ec;
    auto st = fs::symlink_status(root, ec);
    if (ec || st.type() == fs::file_type::not_found) return out;

    if (st.type() == fs::file_type::directory) {
        walk_into(root, out);
    } else {
        out.push_back(root);
    }
    return out;
}

static void collect_at_depth(const fs::path& dir, int remaining, std::vector<fs::path>& out) {
    std::error_code ec;
    fs::directory_iterator it(dir, ec);
    if (ec) {
        note_walk_error(dir, ec);
        return;
    }
    for (; it != fs::directory_iterator(); it.increment(ec)) {
        const auto& entry = *it;
        if (remaining == 1) {
            out.push_back(entry.path());
            continue;
        }
        std::error_code sec;
        auto st = entry.symlink_status(sec);
        if (sec) {
            note_walk_error(entry.path(), sec);
            continue;
        }
        if (st.type() == fs::file_type::directory) {
            collect_at_depth(entry.path(), remaining - 1, out);
        }
    }
    if (ec) note_walk_error(dir, ec);
}

std::vector<fs::path> entries_at_depth(const fs::path& root, int depth) {
    std::vector<fs::path> out;
    if (depth < 1) return out;
    std::error_code ec;
    if (!fs::is_directory(fs::symlink_status(root, ec))) return out;
    collect_at_depth(root, depth, out);
    return out;
}

std::vector<fs::path> subdirectories(const fs::path& root) {
    std::vector<fs::path> out;
    for (const auto& p : entries_at_depth(root, 1)) {
        std::error_code ec;
        if (fs::is_directory(fs::symlink_status(p, ec))) out.push_back(p);
    }
    return out;
}

// Symlinks and special files occupy no cache bytes of their own.
static uint64_t regular_size(const struct stat& st) {
    return S_ISREG(st.st_mode) ? static_cast<uint64_t>(st.st_size) : 0;
}

uint64_t entry_size(const fs::path& p) {
    struct stat st;
    if (lstat(p.c_str(), &st) != 0) return 0;
    return regular_size(st);
}

uint64_t sum_sizes(const std::vector<fs::path>& files) {
    std::atomic<uint64_t> total{0};
    parallel_for(files.size(), [&](size_t i) {
        total += entry_size(files[i]);
    });
    return total;
}

uint64_t tree_size(const fs::path& root) {
    return sum_sizes(walk_files(root));
}

static FileTime stat_atime(const struct stat& st) {
    return static_cast<FileTime>(st.st_atim.tv_sec) * 1000000000LL + st.st_atim.tv_nsec;
}

FileTime access_time(const fs::path& p) {
    struct stat st;
    if (lstat(p.c_str(), &st) != 0) return 0;
    return stat_atime(st);
}

FileTime item_access_time(const fs::path& p) {
    return item_stats(p).atime;
}

ItemStats item_stats(const fs::path& p) {
    ItemStats stats;
    struct stat st;
    if (lstat(p.c_str(), &st) != 0) return stats;
    if (!S_ISDIR(st.st_mode)) {
        stats.size = regular_size(st);
        stats.atime = stat_atime(st);
        return stats;
    }

    auto files = walk_files(p);
    if (files.empty()) {
        stats.atime = stat_atime(st);
        return stats;
    }

    for (const auto& f : files) {
        struct stat fst;
        if (lstat(f.c_str(), &fst) != 0) continue;
        stats.size += regular_size(fst);
        stats.atime = std::max(stats.atime, stat_atime(fst));
    }
    return stats;
}

std::vector<ItemStats> stats_of_items(const std::vector<fs::path>& items) {
    std::vector<ItemStats> out(items.size());
    parallel_for(items.size(), [&](size_t i) {
        out[i] = item_stats(items[i]);
    });
    return out;
}

} // namespace platform
