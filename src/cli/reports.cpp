#include "reports.hpp"
#include "tables.hpp"
#include <core/size_spec.hpp>
#include <core/utils.hpp>
#include <managers/package_name.hpp>
#include <platform/walker.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>

namespace report {

// Label column width of the summary; nested lines shift by 2 per level.
static constexpr size_t SUMMARY_WIDTH = 40;

// ── Cache summary ───────────────────────────────────────────

CacheSummary collect_summary(CacheInventory& inventory) {
    CacheSummary s;
    s.root = inventory.paths().root;
    s.bin_size = inventory.bin().total_size();
    s.bin_count = inventory.bin().number_of_items();
    s.index_size = inventory.registry_index().total_size();
    s.archives_size = inventory.registry_archives().total_size();
    s.archives_count = inventory.registry_archives().number_of_items();
    s.sources_size = inventory.registry_sources().total_size();
    s.sources_count = inventory.registry_sources().number_of_items();
    s.repos_size = inventory.git_repos().total_size();
    s.repos_count = inventory.git_repos().number_of_items();
    s.checkouts_size = inventory.git_checkouts().total_size();
    s.checkouts_count = inventory.git_checkouts().number_of_items();
    s.total_size = s.bin_size + s.registry_size() + s.git_size();
    return s;
}

std::string summary(const CacheSummary& s) {
    std::string out = fmt::format("Cargo cache '{}':\n\n", s.root.string());
    out += pad_line(0, SUMMARY_WIDTH, "Total size: ", format_bytes(s.total_size));
    out += pad_line(1, SUMMARY_WIDTH,
                    fmt::format("Size of {} installed binaries: ", s.bin_count),
                    format_bytes(s.bin_size));
    out += pad_line(1, SUMMARY_WIDTH, "Size of registry: ", format_bytes(s.registry_size()));
    out += pad_line(2, SUMMARY_WIDTH, "Size of registry index: ", format_bytes(s.index_size));
    out += pad_line(2, SUMMARY_WIDTH,
                    fmt::format("Size of {} crate archives: ", s.archives_count),
                    format_bytes(s.archives_size));
    out += pad_line(2, SUMMARY_WIDTH,
                    fmt::format("Size of {} crate source checkouts: ", s.sources_count),
                    format_bytes(s.sources_size));
    out += pad_line(1, SUMMARY_WIDTH, "Size of git db: ", format_bytes(s.git_size()));
    out += pad_line(2, SUMMARY_WIDTH,
                    fmt::format("Size of {} bare git repos: ", s.repos_count),
                    format_bytes(s.repos_size));
    out += pad_line(2, SUMMARY_WIDTH,
                    fmt::format("Size of {} git repo checkouts: ", s.checkouts_count),
                    format_bytes(s.checkouts_size));
    return out;
}

std::string list_dirs(const CachePaths& paths) {
    std::vector<TableRow> rows = {
        {"cargo home:", paths.root.string()},
        {"binaries directory:", paths.bin.string()},
        {"registry directory:", paths.registry.string()},
        {"registry index:", paths.registry_index.string()},
        {"crate archives:", paths.registry_cache.string()},
        {"crate source checkouts:", paths.registry_sources.string()},
        {"git db directory:", paths.git_db.string()},
        {"git checkouts dir:", paths.git_checkouts.string()},
    };
    return format_table(rows);
}

std::string info_text(const CachePaths& paths, const CacheSummary& s) {
    std::string out;
    auto entry = [&](const std::string& title, const fs::path& dir, uint64_t size,
                     const std::string& note) {
        out += title + "\n";
        out += fmt::format("\t'{}', size: {}\n", dir.string(), format_bytes(size));
        if (!note.empty()) out += "\tNote: " + note + "\n";
    };

    entry("Found CARGO_HOME / cargo cache base dir", paths.root, s.total_size, "");
    entry(fmt::format("Found {} binaries installed in", s.bin_count), paths.bin, s.bin_size,
          "use 'cargo uninstall' to remove binaries, if needed.");
    entry("Found registry base dir:", paths.registry, s.registry_size(), "");
    entry("Found registry index:", paths.registry_index, s.index_size,
          "the index is re-fetched from the network when removed.");
    entry("Found registry crate source cache:", paths.registry_cache, s.archives_size,
          "removed crate archives will be redownloaded if necessary.");
    entry("Found registry unpacked sources:", paths.registry_sources, s.sources_size,
          "removed unpacked sources will be re-extracted from local cache (no net access needed).");
    entry("Found git repo database:", paths.git_db, s.repos_size,
          "removed git repositories will be recloned if necessary.");
    entry("Found git repo checkouts:", paths.git_checkouts, s.checkouts_size,
          "removed git checkouts will be rechecked-out from repo database if necessary "
          "(no net access needed, if repos are up-to-date).");
    return out;
}

// ── Top items ───────────────────────────────────────────────

std::vector<TopEntry> group_by_name(const std::vector<std::pair<std::string, uint64_t>>& sized) {
    std::map<std::string, TopEntry> by_name;
    for (const auto& [name, size] : sized) {
        auto& e = by_name[name];
        e.name = name;
        e.count++;
        e.total += size;
    }

    std::vector<TopEntry> out;
    for (auto& [name, e] : by_name) out.push_back(e);
    std::stable_sort(out.begin(), out.end(), [](const TopEntry& a, const TopEntry& b) {
        return a.total > b.total;
    });
    return out;
}

std::string top_table(const fs::path& path, uint64_t total,
                      const std::vector<TopEntry>& entries, size_t limit) {
    std::string out = fmt::format("\nSummary of: {} ({} total)\n", path.string(),
                                  format_bytes(total));
    if (entries.empty()) return out;

    std::vector<TableRow> rows = {{"Name", "Count", "Average", "Total"}};
    for (size_t i = 0; i < entries.size() && i < limit; i++) {
        const auto& e = entries[i];
        rows.push_back({e.name, std::to_string(e.count),
                        format_bytes(e.count ? e.total / e.count : 0),
                        format_bytes(e.total)});
    }
    return out + format_table(rows);
}

// Package name of an archive or extracted source, or the whole name when it
// has no version part.
static std::string package_of(const std::string& file_name) {
    auto parsed = parse_package_file_name(file_name);
    return parsed.is_ok() ? parsed.value.name : file_name;
}

// Repo name of a "<name>-<hash>" directory.
static std::string repo_of(const std::string& dir_name) {
    std::string name = registry_name_of(dir_name);
    return name.empty() ? dir_name : name;
}

template <typename NameFn>
static std::vector<std::pair<std::string, uint64_t>> sized_items(const std::vector<fs::path>& items,
                                                                 NameFn name_of) {
    auto stats = platform::stats_of_items(items);
    std::vector<std::pair<std::string, uint64_t>> out;
    out.reserve(items.size());
    for (size_t i = 0; i < items.size(); i++) {
        out.emplace_back(name_of(items[i]), stats[i].size);
    }
    return out;
}

std::string top_items(CacheInventory& inventory, size_t limit) {
    std::string out;

    auto& bin = inventory.bin();
    out += top_table(bin.path(), bin.total_size(),
                     group_by_name(sized_items(bin.items_sorted(), [](const fs::path& p) {
                         return file_name_of(p);
                     })), limit);

    auto& checkouts = inventory.git_checkouts();
    out += top_table(checkouts.path(), checkouts.total_size(),
                     group_by_name(sized_items(checkouts.items_sorted(), [](const fs::path& p) {
                         return repo_of(file_name_of(p.parent_path()));
                     })), limit);

    auto& repos = inventory.git_repos();
    out += top_table(repos.path(), repos.total_size(),
                     group_by_name(sized_items(repos.items_sorted(), [](const fs::path& p) {
                         return repo_of(file_name_of(p));
                     })), limit);

    auto& archives = inventory.registry_archives();
    out += top_table(archives.path(), archives.total_size(),
                     group_by_name(sized_items(archives.items_sorted(), [](const fs::path& p) {
                         return package_of(file_name_of(p));
                     })), limit);

    auto& sources = inventory.registry_sources();
    out += top_table(sources.path(), sources.total_size(),
                     group_by_name(sized_items(sources.items_sorted(), [](const fs::path& p) {
                         return package_of(file_name_of(p));
                     })), limit);
    return out;
}

// ── Registries ──────────────────────────────────────────────

std::vector<RegistryRow> collect_registry_rows(CacheInventory& inventory) {
    std::map<std::string, RegistryRow> rows;

    for (auto& index : inventory.registry_index().caches()) {
        auto& row = rows[index.name()];
        row.name = index.name();
        row.index_size += index.total_size();
    }
    for (auto& archives : inventory.registry_archives().caches()) {
        auto& row = rows[archives.name()];
        row.name = archives.name();
        row.archive_count += archives.number_of_items();
        row.archive_size += archives.total_size();
    }
    for (auto& sources : inventory.registry_sources().caches()) {
        auto& row = rows[sources.name()];
        row.name = sources.name();
        row.source_count += sources.number_of_items();
        row.source_size += sources.total_size();
    }

    std::vector<RegistryRow> out;
    for (auto& [name, row] : rows) out.push_back(row);
    return out;
}

std::string registry_table(const std::vector<RegistryRow>& rows) {
    if (rows.empty()) return "No registries found.\n";

    std::vector<TableRow> table = {
        {"Registry", "Index", "Archives", "Archive size", "Sources", "Source size", "Total"}};
    RegistryRow sum;
    sum.name = "Total";
    for (const auto& r : rows) {
        table.push_back({r.name, format_bytes(r.index_size), std::to_string(r.archive_count),
                         format_bytes(r.archive_size), std::to_string(r.source_count),
                         format_bytes(r.source_size), format_bytes(r.total())});
        sum.index_size += r.index_size;
        sum.archive_count += r.archive_count;
        sum.archive_size += r.archive_size;
        sum.source_count += r.source_count;
        sum.source_size += r.source_size;
    }
    if (rows.size() > 1) {
        table.push_back({sum.name, format_bytes(sum.index_size), std::to_string(sum.archive_count),
                         format_bytes(sum.archive_size), std::to_string(sum.source_count),
                         format_bytes(sum.source_size), format_bytes(sum.total())});
    }
    return format_table(table, {2, 4});
}

// ── Subcommands ─────────────────────────────────────────────

std::string query_output(const std::vector<QueryGroup>& groups, QuerySort sort,
                         bool human_readable) {
    const char* order = sort == QuerySort::Name ? "name" : "size";
    std::string out;
    for (size_t g = 0; g < groups.size(); g++) {
        if (g > 0) out += "\n";
        out += fmt::format("{} sorted by {}:\n", groups[g].title, order);
        for (const auto& m : groups[g].matches) {
            out += fmt::format("\t{}: {}\n", m.name,
                               human_readable ? format_bytes(m.size) : std::to_string(m.size));
        }
    }
    return out;
}

std::string toolchain_table(const std::vector<ToolchainInfo>& toolchains) {
    if (toolchains.empty()) return "No toolchains found.\n";

    uint64_t total_size = 0;
    size_t total_files = 0;
    for (const auto& t : toolchains) {
        total_size += t.size;
        total_files += t.files;
    }

    std::vector<TableRow> rows = {{"Toolchain Name", "Files", "Size", "Percentage"}};
    for (const auto& t : toolchains) {
        rows.push_back({t.name, std::to_string(t.files), format_bytes(t.size),
                        format_percent(t.size, total_size) + " %"});
    }
    rows.push_back({"Total", std::to_string(total_files), format_bytes(total_size), "100 %"});
    return format_table(rows, {1, 2, 3});
}

std::string local_summary(const TargetDirSummary& summary) {
    std::string out = fmt::format("Project '{}'\n", summary.workspace_root.string());
    if (!summary.target_exists) {
        out += fmt::format("No target dir found at '{}'\n", summary.target_dir.string());
        return out;
    }

    out += pad_line(0, 24, "Target dir: ", summary.target_dir.string());
    out += "\n";
    out += pad_line(0, 24, "Total size: ", format_bytes(summary.total_size));
    for (const auto& [name, size] : summary.subdirs) {
        out += pad_line(1, 22, "Size of " + name + ": ", format_bytes(size));
    }
    return out;
}

std::string verify_report(const std::vector<SourceDiff>& diffs, size_t checked) {
    std::string out;
    for (const auto& d : diffs) {
        out += fmt::format("Possibly corrupted source: {}\n", d.source.string());
        if (!d.error.empty()) out += fmt::format("\tcould not read archive: {}\n", d.error);
        for (const auto& m : d.missing) out += fmt::format("\tMissing from source: {}\n", m);
        for (const auto& a : d.additional) out += fmt::format("\tNot in archive: {}\n", a);
        for (const auto& s : d.size_differences) {
            out += fmt::format("\tSize differs: {} (archive: {}, source: {})\n",
                               s.path, s.archive_size, s.source_size);
        }
    }
    out += fmt::format("Checked {} sources, {} possibly corrupted.\n", checked, diffs.size());
    return out;
}

// ── Operator results ────────────────────────────────────────

std::string removal_summary(const RemovalReport& result) {
    const char* verb = result.dry_run ? "Would remove" : "Removed";
    std::string out = fmt::format("{} {} {}, {}", verb, result.removed,
                                  result.removed == 1 ? "item" : "items",
                                  format_bytes(result.bytes_removed));
    if (!result.failures.empty()) {
        out += fmt::format(" ({} failed)", result.failures.size());
    }
    return out;
}

std::string size_change(uint64_t before, uint64_t after) {
    return "Size changed " + size_diff_format(before, after);
}

std::string gc_report(const GcSummary& gc) {
    std::string out = fmt::format("Compressed {} repos: {}", gc.repos.size() - gc.failures(),
                                  size_diff_format(gc.before, gc.after));
    if (gc.failures() > 0) out += fmt::format(", {} failed", gc.failures());
    return out;
}

} // namespace report
