#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

struct PlannedRemoval {
    fs::path path;
    uint64_t size;
};

// What an operator intends to delete, computed before anything is touched.
struct DeletionPlan {
    std::vector<PlannedRemoval> items;

    void add(const fs::path& path, uint64_t size) { items.push_back({path, size}); }
    bool empty() const { return items.empty(); }
    size_t size() const { return items.size(); }
    uint64_t total_bytes() const;
};

// Outcome of executing a plan. Failures never stop the remaining items.
struct RemovalReport {
    bool dry_run = false;
    size_t removed = 0;
    uint64_t bytes_removed = 0;
    std::vector<std::string> failures;

    bool ok() const { return failures.empty(); }
    bool anything_removed() const { return removed > 0; }

    void merge(const RemovalReport& other);
};

// Remove every planned path. In dry-run mode print "would remove" lines
// through cb instead and count what would have gone.
RemovalReport execute_plan(const DeletionPlan& plan, bool dry_run, const StatusCallback& cb);
