#include "keep_duplicates.hpp"
#include "package_name.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/walker.hpp>
#include <algorithm>
#include <map>

namespace {

struct Versioned {
    fs::path path;
    std::string version;
};

} // namespace

Result<DeletionPlan> plan_keep_duplicates(RegistryPkgCaches& archives, size_t keep) {
    DeletionPlan plan;

    for (auto& registry : archives.caches()) {
        std::map<std::string, std::vector<Versioned>> by_name;

        for (const auto& item : registry.items_sorted()) {
            std::string file = item.filename().string();
            if (item.extension().string() != CRATE_EXTENSION) {
                cc_log("keep-duplicates: ignoring " + item.string());
                continue;
            }
            auto parsed = parse_package_file_name(file);
            if (parsed.is_err()) return Result<DeletionPlan>::Err(parsed.kind, parsed.error);
            by_name[parsed.value.name].push_back({item, parsed.value.version});
        }

        for (auto& [name, versions] : by_name) {
            // Newest first
            std::stable_sort(versions.begin(), versions.end(),
                             [](const Versioned& a, const Versioned& b) {
                                 return compare_versions(a.version, b.version) > 0;
                             });
            for (size_t i = keep; i < versions.size(); i++) {
                plan.add(versions[i].path, platform::entry_size(versions[i].path));
            }
        }
    }

    return Result<DeletionPlan>::Ok(plan);
}

Result<RemovalReport> keep_duplicate_crates(CacheInventory& inventory, size_t keep,
                                            bool dry_run, const StatusCallback& cb) {
    auto plan = plan_keep_duplicates(inventory.registry_archives(), keep);
    if (plan.is_err()) return Result<RemovalReport>::Err(plan.kind, plan.error);

    auto report = execute_plan(plan.value, dry_run, cb);
    if (!dry_run) inventory.registry_archives().invalidate();
    return Result<RemovalReport>::Ok(report);
}
