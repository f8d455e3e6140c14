#include "component_cache.hpp"
#include <platform/walker.hpp>
#include <algorithm>

const char* component_name(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::InstalledBinaries: return "installed binaries";
        case ComponentKind::RegistryIndex:     return "registry index";
        case ComponentKind::RegistryArchives:  return "registry crate cache";
        case ComponentKind::RegistrySources:   return "registry sources";
        case ComponentKind::MirrorRepos:       return "git bare repos";
        case ComponentKind::MirrorCheckouts:   return "git checkouts";
    }
    return "unknown";
}

const std::vector<ComponentKind>& all_components() {
    static const std::vector<ComponentKind> kinds = {
        ComponentKind::InstalledBinaries,
        ComponentKind::RegistryIndex,
        ComponentKind::RegistryArchives,
        ComponentKind::RegistrySources,
        ComponentKind::MirrorRepos,
        ComponentKind::MirrorCheckouts,
    };
    return kinds;
}

// ── DirCache ──────────────────────────────────────────────────

DirCache::DirCache(fs::path root) : root_(std::move(root)) {}

bool DirCache::path_exists() const {
    std::error_code ec;
    return fs::exists(fs::symlink_status(root_, ec));
}

bool DirCache::check_missing_root() {
    if (path_exists()) return false;
    known_to_be_empty();
    return true;
}

uint64_t DirCache::total_size() {
    if (!total_size_) {
        if (check_missing_root()) return 0;
        total_size_ = platform::sum_sizes(files());
    }
    return *total_size_;
}

const std::vector<fs::path>& DirCache::files() {
    if (!files_) {
        if (check_missing_root()) return *files_;
        files_ = platform::walk_files(root_);
    }
    return *files_;
}

const std::vector<fs::path>& DirCache::files_sorted() {
    if (!files_sorted_) {
        auto sorted = files();
        std::sort(sorted.begin(), sorted.end());
        files_sorted_ = std::move(sorted);
    }
    return *files_sorted_;
}

const std::vector<fs::path>& DirCache::items() {
    if (!items_) {
        if (check_missing_root()) return *items_;
        items_ = compute_items();
    }
    return *items_;
}

const std::vector<fs::path>& DirCache::items_sorted() {
    if (!items_sorted_) {
        auto sorted = items();
        std::sort(sorted.begin(), sorted.end());
        items_sorted_ = std::move(sorted);
    }
    return *items_sorted_;
}

std::vector<fs::path> DirCache::compute_items() {
    return files();
}

void DirCache::invalidate() {
    total_size_.reset();
    files_.reset();
    files_sorted_.reset();
    items_.reset();
    items_sorted_.reset();
}

void DirCache::known_to_be_empty() {
    total_size_ = 0;
    files_ = std::vector<fs::path>();
    files_sorted_ = std::vector<fs::path>();
    items_ = std::vector<fs::path>();
    items_sorted_ = std::vector<fs::path>();
}

// ── Git components ────────────────────────────────────────────

std::vector<fs::path> GitBareRepoCache::compute_items() {
    return platform::subdirectories(path());
}

std::vector<fs::path> GitCheckoutCache::compute_items() {
    std::vector<fs::path> out;
    for (const auto& repo : platform::subdirectories(path())) {
        auto revs = platform::subdirectories(repo);
        out.insert(out.end(), revs.begin(), revs.end());
    }
    return out;
}
