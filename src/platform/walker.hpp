#pragma once

#include <vector>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>

namespace platform {

// Recursively list every non-directory entry under root (files and symlinks).
// Symlinks are listed, never followed. Entries that vanish mid-walk are
// skipped silently; other read errors are skipped and go to the debug log.
// A missing root yields an empty list.
std::vector<std::filesystem::path> walk_files(const std::filesystem::path& root);

// Entries (files and directories) exactly `depth` levels below root.
// depth 1 is the immediate children.
std::vector<std::filesystem::path> entries_at_depth(const std::filesystem::path& root, int depth);

// Immediate subdirectories of root (symlinks to directories excluded).
std::vector<std::filesystem::path> subdirectories(const std::filesystem::path& root);

// lstat size of a regular file; 0 for directories, symlinks, special files
// and entries that cannot be read.
uint64_t entry_size(const std::filesystem::path& p);

// Sum of entry_size over the list, computed across the worker threads.
uint64_t sum_sizes(const std::vector<std::filesystem::path>& files);

// Total size of every regular file below root (root itself if it is one).
uint64_t tree_size(const std::filesystem::path& root);

// Access time (lstat st_atim) in nanoseconds; 0 if it cannot be read.
FileTime access_time(const std::filesystem::path& p);

// Access time of a cache item: for a directory the newest access time of any
// file inside it (the directory's own if it holds no files), else its own.
FileTime item_access_time(const std::filesystem::path& p);

// Size and access time of one cache item in a single walk.
struct ItemStats {
    uint64_t size = 0;
    FileTime atime = 0;
};

ItemStats item_stats(const std::filesystem::path& p);

// item_stats for every path, fanned out across the worker threads.
// The result is index-aligned with the input.
std::vector<ItemStats> stats_of_items(const std::vector<std::filesystem::path>& items);

} // namespace platform
