#pragma once

#include <string>
#include <vector>
#include <cache/inventory.hpp>

struct GcOutcome {
    fs::path repo;
    uint64_t before = 0;
    uint64_t after = 0;
    bool ok = true;
    std::string error;
};

struct GcSummary {
    std::vector<GcOutcome> repos;
    uint64_t before = 0;
    uint64_t after = 0;

    size_t failures() const;
};

// Bare mirrors under git/db plus every registry index that is a git checkout.
std::vector<fs::path> gc_targets(CacheInventory& inventory);

// reflog expire, pack-refs, gc --aggressive, all run inside `repo`.
// Fails with GitFailed carrying git's stderr.
Result<void> gc_repo(const std::string& git_program, const fs::path& repo);

// Recompress every target. A failing repo is reported and skipped; sizes are
// measured before and after. Dry-run only measures.
GcSummary gc_everything(CacheInventory& inventory, const std::string& git_program,
                        bool dry_run, const StatusCallback& cb);
