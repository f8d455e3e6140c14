#include "deletion.hpp"
#include <core/log.hpp>
#include <core/size_spec.hpp>
#include <platform/remove_dir.hpp>
#include <fmt/format.h>

uint64_t DeletionPlan::total_bytes() const {
    uint64_t total = 0;
    for (const auto& item : items) total += item.size;
    return total;
}

void RemovalReport::merge(const RemovalReport& other) {
    dry_run = dry_run || other.dry_run;
    removed += other.removed;
    bytes_removed += other.bytes_removed;
    failures.insert(failures.end(), other.failures.begin(), other.failures.end());
}

RemovalReport execute_plan(const DeletionPlan& plan, bool dry_run, const StatusCallback& cb) {
    RemovalReport report;
    report.dry_run = dry_run;

    for (const auto& item : plan.items) {
        if (dry_run) {
            if (cb) cb(fmt::format("dry-run: would remove '{}' ({})",
                                   item.path.string(), format_bytes(item.size)));
            report.removed++;
            report.bytes_removed += item.size;
            continue;
        }

        auto result = platform::remove_path(item.path);
        if (result.is_err()) {
            report.failures.push_back(result.error);
            continue;
        }
        if (result.value == platform::RemoveOutcome::NotFound) {
            cc_log("remove: already gone " + item.path.string());
            continue;
        }
        cc_log("removed " + item.path.string());
        report.removed++;
        report.bytes_removed += item.size;
    }

    return report;
}
