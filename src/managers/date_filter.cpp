#include "date_filter.hpp"
#include <core/time_utils.hpp>
#include <platform/walker.hpp>

bool DateWindow::selects(FileTime atime) const {
    if (older && younger) return atime < *younger || atime > *older;
    if (older) return atime > *older;
    if (younger) return atime < *younger;
    return false;
}

Result<DateWindow> make_date_window(const std::optional<std::string>& older,
                                    const std::optional<std::string>& younger,
                                    std::time_t now) {
    if (!older && !younger) {
        return Result<DateWindow>::Err(ErrorKind::DateParseFailure,
            "no date given: pass --remove-if-older-than and/or --remove-if-younger-than");
    }

    DateWindow window;
    if (older) {
        auto parsed = parse_cutoff_date(*older, now);
        if (parsed.is_err()) return Result<DateWindow>::Err(parsed.kind, parsed.error);
        window.older = parsed.value;
    }
    if (younger) {
        auto parsed = parse_cutoff_date(*younger, now);
        if (parsed.is_err()) return Result<DateWindow>::Err(parsed.kind, parsed.error);
        window.younger = parsed.value;
    }
    return Result<DateWindow>::Ok(window);
}

Result<DateWindow> make_date_window(const std::optional<std::string>& older,
                                    const std::optional<std::string>& younger) {
    return make_date_window(older, younger, std::time(nullptr));
}

DeletionPlan plan_date_removal(CacheInventory& inventory,
                               const std::vector<ComponentKind>& kinds,
                               const DateWindow& window) {
    DeletionPlan plan;
    for (auto kind : kinds) {
        for (const auto& file : inventory.component(kind).files_sorted()) {
            auto stats = platform::item_stats(file);
            if (window.selects(stats.atime)) plan.add(file, stats.size);
        }
    }
    return plan;
}

RemovalReport remove_by_date(CacheInventory& inventory,
                             const std::vector<ComponentKind>& kinds,
                             const DateWindow& window,
                             bool dry_run, const StatusCallback& cb) {
    auto plan = plan_date_removal(inventory, kinds, window);
    auto report = execute_plan(plan, dry_run, cb);
    if (!dry_run) {
        for (auto kind : kinds) inventory.component(kind).invalidate();
    }
    return report;
}
