#include "verifier.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/archive.hpp>
#include <platform/parallel.hpp>
#include <platform/walker.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

fs::path archive_for_source(const fs::path& source) {
    fs::path out;
    std::vector<fs::path> parts(source.begin(), source.end());
    // The last "src" segment above the package directory is the component name
    size_t replace_at = parts.size();
    for (size_t i = 0; i + 2 < parts.size(); i++) {
        if (parts[i].string() == SEGMENT_SRC) replace_at = i;
    }
    for (size_t i = 0; i < parts.size(); i++) {
        out /= (i == replace_at) ? fs::path(SEGMENT_CACHE) : parts[i];
    }
    return fs::path(out.string() + CRATE_EXTENSION);
}

// "./pkg/file" and "pkg//file" both become "pkg/file"
static std::string normalize_entry(const std::string& entry) {
    return fs::path(entry).lexically_normal().generic_string();
}

SourceDiff diff_source(const fs::path& source, const fs::path& archive) {
    SourceDiff diff;
    diff.source = source;
    diff.archive = archive;

    auto entries = platform::list_archive(archive);
    if (entries.is_err()) {
        diff.error = entries.error;
        return diff;
    }

    std::map<std::string, uint64_t> in_archive;
    for (const auto& e : entries.value) in_archive[normalize_entry(e.path)] = e.size;

    std::map<std::string, uint64_t> on_disk;
    fs::path registry_dir = source.parent_path();
    for (const auto& file : platform::walk_files(source)) {
        if (file.filename().string() == EXTRACTION_SENTINEL) continue;
        std::string rel = file.lexically_relative(registry_dir).generic_string();
        on_disk[rel] = platform::entry_size(file);
    }

    for (const auto& [path, size] : in_archive) {
        auto it = on_disk.find(path);
        if (it == on_disk.end()) {
            diff.missing.push_back(path);
        } else if (it->second != size) {
            diff.size_differences.push_back({path, size, it->second});
        }
    }
    for (const auto& [path, size] : on_disk) {
        if (!in_archive.count(path)) diff.additional.push_back(path);
    }
    return diff;
}

std::vector<SourceDiff> verify_sources(CacheInventory& inventory) {
    struct Pair {
        fs::path source;
        fs::path archive;
    };

    std::vector<Pair> pairs;
    for (const auto& source : inventory.registry_sources().items_sorted()) {
        fs::path archive = archive_for_source(source);
        std::error_code ec;
        if (!fs::is_regular_file(archive, ec)) {
            cc_log("verify: no archive for " + source.string());
            continue;
        }
        pairs.push_back({source, archive});
    }

    std::vector<SourceDiff> diffs(pairs.size());
    platform::parallel_for(pairs.size(), [&](size_t i) {
        diffs[i] = diff_source(pairs[i].source, pairs[i].archive);
    });

    diffs.erase(std::remove_if(diffs.begin(), diffs.end(),
                               [](const SourceDiff& d) { return d.empty(); }),
                diffs.end());
    return diffs;
}

RemovalReport clean_corrupted(CacheInventory& inventory, const std::vector<SourceDiff>& diffs,
                              bool dry_run, const StatusCallback& cb) {
    DeletionPlan plan;
    for (const auto& diff : diffs) {
        plan.add(diff.source, platform::tree_size(diff.source));
    }
    auto report = execute_plan(plan, dry_run, cb);
    if (!dry_run) inventory.registry_sources().invalidate();
    return report;
}
