#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <filesystem>

namespace fs = std::filesystem;

enum class ComponentKind {
    InstalledBinaries,
    RegistryIndex,
    RegistryArchives,
    RegistrySources,
    MirrorRepos,
    MirrorCheckouts,
};

// Display name, e.g. "registry sources".
const char* component_name(ComponentKind kind);

// Every kind, in the order they are reported.
const std::vector<ComponentKind>& all_components();

// Aggregate interface shared by the single-directory caches and the
// per-registry super caches. Every accessor computes on first use and
// memoizes until invalidate().
class CacheView {
public:
    virtual ~CacheView() = default;

    virtual const fs::path& path() const = 0;

    virtual uint64_t total_size() = 0;
    virtual const std::vector<fs::path>& files() = 0;
    virtual const std::vector<fs::path>& files_sorted() = 0;
    virtual const std::vector<fs::path>& items() = 0;
    virtual const std::vector<fs::path>& items_sorted() = 0;
    virtual size_t number_of_items() = 0;

    // Drop every memoized aggregate; the next query walks the disk again.
    virtual void invalidate() = 0;

    // Set every aggregate to empty without touching the disk. Called right
    // after the whole component directory was removed.
    virtual void known_to_be_empty() = 0;
};

// Cache over one directory. Items default to the file list; subclasses
// override compute_items() for their own unit.
class DirCache : public CacheView {
public:
    explicit DirCache(fs::path root);

    const fs::path& path() const override { return root_; }

    uint64_t total_size() override;
    const std::vector<fs::path>& files() override;
    const std::vector<fs::path>& files_sorted() override;
    const std::vector<fs::path>& items() override;
    const std::vector<fs::path>& items_sorted() override;
    size_t number_of_items() override { return items().size(); }
    size_t number_of_files() { return files().size(); }

    void invalidate() override;
    void known_to_be_empty() override;

    bool path_exists() const;

protected:
    virtual std::vector<fs::path> compute_items();

private:
    // True (and known-empty set) when the root is gone.
    bool check_missing_root();

    fs::path root_;
    std::optional<uint64_t> total_size_;
    std::optional<std::vector<fs::path>> files_;
    std::optional<std::vector<fs::path>> files_sorted_;
    std::optional<std::vector<fs::path>> items_;
    std::optional<std::vector<fs::path>> items_sorted_;
};

// ── Root-level components ─────────────────────────────────────

// bin/: every installed executable is an item.
class BinaryCache : public DirCache {
public:
    using DirCache::DirCache;
};

// git/db/: each bare mirror directory is an item.
class GitBareRepoCache : public DirCache {
public:
    using DirCache::DirCache;

protected:
    std::vector<fs::path> compute_items() override;
};

// git/checkouts/: each <name-hash>/<rev> directory is an item.
class GitCheckoutCache : public DirCache {
public:
    using DirCache::DirCache;

protected:
    std::vector<fs::path> compute_items() override;
};
