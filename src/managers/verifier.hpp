#pragma once

#include <string>
#include <vector>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>

struct FileSizeDiff {
    std::string path;
    uint64_t archive_size;
    uint64_t source_size;
};

// Difference between an extracted source tree and the archive it came from.
// Paths are relative to the registry directory, e.g. "serde-1.0.0/src/lib.rs".
struct SourceDiff {
    fs::path source;
    fs::path archive;
    std::vector<std::string> missing;        // in the archive, not on disk
    std::vector<std::string> additional;     // on disk, not in the archive
    std::vector<FileSizeDiff> size_differences;
    std::string error;                       // archive could not be read

    bool empty() const {
        return missing.empty() && additional.empty() && size_differences.empty() && error.empty();
    }
};

// registry/src/<reg>/<pkg> -> registry/cache/<reg>/<pkg>.crate
fs::path archive_for_source(const fs::path& source);

// Compare one source directory with one archive.
SourceDiff diff_source(const fs::path& source, const fs::path& archive);

// Check every extracted source that still has its archive. Pairs run in
// parallel; only non-empty diffs are returned, ordered by source path.
std::vector<SourceDiff> verify_sources(CacheInventory& inventory);

// Remove the source directories of the given diffs so the package manager
// re-extracts them.
RemovalReport clean_corrupted(CacheInventory& inventory, const std::vector<SourceDiff>& diffs,
                              bool dry_run, const StatusCallback& cb);
