#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>
#include <managers/git_gc.hpp>
#include <managers/local_project.hpp>
#include <managers/query.hpp>
#include <managers/toolchains.hpp>
#include <managers/verifier.hpp>

// Rendering of everything the tool prints. Functions taking plain data are
// pure; the collect_* functions read (and memoize) cache aggregates.
namespace report {

// ── Cache summary ───────────────────────────────────────────

struct CacheSummary {
    fs::path root;
    uint64_t total_size = 0;
    uint64_t bin_size = 0;
    size_t bin_count = 0;
    uint64_t index_size = 0;
    uint64_t archives_size = 0;
    size_t archives_count = 0;
    uint64_t sources_size = 0;
    size_t sources_count = 0;
    uint64_t repos_size = 0;
    size_t repos_count = 0;
    uint64_t checkouts_size = 0;
    size_t checkouts_count = 0;

    uint64_t registry_size() const { return index_size + archives_size + sources_size; }
    uint64_t git_size() const { return repos_size + checkouts_size; }
};

CacheSummary collect_summary(CacheInventory& inventory);

// "Cargo cache '<root>':" followed by the total and one line per component.
std::string summary(const CacheSummary& s);

// Resolved path of the root and every component.
std::string list_dirs(const CachePaths& paths);

// What each component holds and what removing it costs.
std::string info_text(const CachePaths& paths, const CacheSummary& s);

// ── Top items ───────────────────────────────────────────────

struct TopEntry {
    std::string name;
    size_t count = 0;
    uint64_t total = 0;
};

// Fold (name, size) pairs into one entry per name, largest total first.
std::vector<TopEntry> group_by_name(const std::vector<std::pair<std::string, uint64_t>>& sized);

// "Summary of: <path> (<total> total)" and a Name/Count/Average/Total table
// holding at most `limit` entries.
std::string top_table(const fs::path& path, uint64_t total,
                      const std::vector<TopEntry>& entries, size_t limit);

// One top table per category.
std::string top_items(CacheInventory& inventory, size_t limit);

// ── Registries ──────────────────────────────────────────────

struct RegistryRow {
    std::string name;
    uint64_t index_size = 0;
    size_t archive_count = 0;
    uint64_t archive_size = 0;
    size_t source_count = 0;
    uint64_t source_size = 0;

    uint64_t total() const { return index_size + archive_size + source_size; }
};

// One row per registry name, merged across index, archives and sources.
std::vector<RegistryRow> collect_registry_rows(CacheInventory& inventory);

std::string registry_table(const std::vector<RegistryRow>& rows);

// ── Subcommands ─────────────────────────────────────────────

// "<Title> sorted by <name|size>:" then "\t<name>: <size>" per match.
std::string query_output(const std::vector<QueryGroup>& groups, QuerySort sort,
                         bool human_readable);

std::string toolchain_table(const std::vector<ToolchainInfo>& toolchains);

std::string local_summary(const TargetDirSummary& summary);

// Per-source diff listing plus a closing count.
std::string verify_report(const std::vector<SourceDiff>& diffs, size_t checked);

// ── Operator results ────────────────────────────────────────

// "Removed 3 items, 1.23 MB" or "Would remove ..." for a dry run.
std::string removal_summary(const RemovalReport& result);

// "Size changed <before> => <after> (-<diff>, -<pct>%)"
std::string size_change(uint64_t before, uint64_t after);

// Per-repo and total before/after lines.
std::string gc_report(const GcSummary& gc);

} // namespace report
