#include "trim.hpp"
#include <core/size_spec.hpp>
#include <platform/walker.hpp>
#include <fmt/format.h>
#include <algorithm>

static const ComponentKind kTrimmable[] = {
    ComponentKind::MirrorCheckouts,
    ComponentKind::MirrorRepos,
    ComponentKind::RegistryArchives,
    ComponentKind::RegistrySources,
};

std::vector<TrimItem> gather_trim_items(CacheInventory& inventory) {
    std::vector<fs::path> paths;
    for (auto kind : kTrimmable) {
        const auto& items = inventory.component(kind).items();
        paths.insert(paths.end(), items.begin(), items.end());
    }

    auto stats = platform::stats_of_items(paths);

    std::vector<TrimItem> out;
    out.reserve(paths.size());
    for (size_t i = 0; i < paths.size(); i++) {
        out.push_back({paths[i], stats[i].size, stats[i].atime});
    }
    return out;
}

DeletionPlan plan_trim(std::vector<TrimItem> items, uint64_t limit) {
    std::sort(items.begin(), items.end(), [](const TrimItem& a, const TrimItem& b) {
        if (a.atime != b.atime) return a.atime > b.atime;
        return a.path < b.path;
    });

    DeletionPlan plan;
    uint64_t running = 0;
    for (const auto& item : items) {
        running += item.size;
        if (running > limit) plan.add(item.path, item.size);
    }
    return plan;
}

uint64_t trimmable_size(CacheInventory& inventory) {
    uint64_t total = 0;
    for (auto kind : kTrimmable) total += inventory.component(kind).total_size();
    return total;
}

RemovalReport trim_cache(CacheInventory& inventory, uint64_t limit,
                         bool dry_run, const StatusCallback& cb) {
    uint64_t current = trimmable_size(inventory);
    if (current <= limit) {
        if (cb) cb(fmt::format("Cache size {} is within the limit of {}, nothing to trim",
                               format_bytes(current), format_bytes(limit)));
        RemovalReport report;
        report.dry_run = dry_run;
        return report;
    }

    auto plan = plan_trim(gather_trim_items(inventory), limit);
    if (cb) cb(fmt::format("Trimming {} item(s) ({}) to fit {}",
                           plan.size(), format_bytes(plan.total_bytes()), format_bytes(limit)));

    auto report = execute_plan(plan, dry_run, cb);
    if (!dry_run) {
        for (auto kind : kTrimmable) inventory.component(kind).invalidate();
    }
    return report;
}
