#pragma once

#include <vector>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>

struct TrimItem {
    fs::path path;
    uint64_t size;
    FileTime atime;
};

// Items eligible for trimming: git checkouts, git bare repos, crate archives
// and extracted sources. The registry index and binaries are never trimmed.
std::vector<TrimItem> gather_trim_items(CacheInventory& inventory);

// Newest first; walking that order with a running total (deleted items
// included), every item that takes the total over `limit` is planned.
DeletionPlan plan_trim(std::vector<TrimItem> items, uint64_t limit);

// Combined size of the trimmable components.
uint64_t trimmable_size(CacheInventory& inventory);

// No-op when the trimmable components already fit in `limit`.
RemovalReport trim_cache(CacheInventory& inventory, uint64_t limit,
                         bool dry_run, const StatusCallback& cb);
