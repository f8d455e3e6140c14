#pragma once

#include "component_cache.hpp"
#include <core/log.hpp>
#include <platform/walker.hpp>
#include <algorithm>
#include <string>

// Registry name from a "<name>-<hash>" directory: everything before the last
// '-'. Returns "" when the name has no '-'.
std::string registry_name_of(const std::string& dir_name);

// True if a directory name follows the "<name>-<hash>" pattern.
bool is_registry_dir_name(const std::string& dir_name);

// ── Per-registry sub caches ───────────────────────────────────
//
// Rooted at registry/<component>/<registry-id>. Items are the entries
// directly below that directory.

class RegistrySubCache : public DirCache {
public:
    explicit RegistrySubCache(fs::path root);

    const std::string& name() const { return name_; }

protected:
    std::vector<fs::path> compute_items() override;

private:
    std::string name_;
};

// registry/index/<registry-id>
class RegistryIndexCache : public RegistrySubCache {
public:
    using RegistrySubCache::RegistrySubCache;
};

// registry/cache/<registry-id>: every .crate archive is an item.
class RegistryPkgCache : public RegistrySubCache {
public:
    using RegistrySubCache::RegistrySubCache;

protected:
    std::vector<fs::path> compute_items() override;
};

// registry/src/<registry-id>: every extracted package directory is an item.
class RegistrySourceCache : public RegistrySubCache {
public:
    using RegistrySubCache::RegistrySubCache;

protected:
    std::vector<fs::path> compute_items() override;
};

// ── Super cache ───────────────────────────────────────────────

// Fans out over every registry directory of one component. Aggregates are
// sums (or concatenations) over the sub caches; invalidate() drops the sub
// caches too, so registries that appeared or vanished are rediscovered.
template <typename Sub>
class RegistrySuperCache : public CacheView {
public:
    explicit RegistrySuperCache(fs::path root) : root_(std::move(root)) {}

    const fs::path& path() const override { return root_; }

    std::vector<Sub>& caches() {
        if (!caches_) caches_ = discover();
        return *caches_;
    }

    size_t number_of_subcaches() { return caches().size(); }

    uint64_t total_size() override {
        uint64_t total = 0;
        for (auto& sub : caches()) total += sub.total_size();
        return total;
    }

    const std::vector<fs::path>& files() override {
        if (!files_) {
            std::vector<fs::path> all;
            for (auto& sub : caches()) {
                const auto& f = sub.files();
                all.insert(all.end(), f.begin(), f.end());
            }
            files_ = std::move(all);
        }
        return *files_;
    }

    const std::vector<fs::path>& files_sorted() override {
        if (!files_sorted_) {
            auto sorted = files();
            std::sort(sorted.begin(), sorted.end());
            files_sorted_ = std::move(sorted);
        }
        return *files_sorted_;
    }

    const std::vector<fs::path>& items() override {
        if (!items_) {
            std::vector<fs::path> all;
            for (auto& sub : caches()) {
                const auto& i = sub.items();
                all.insert(all.end(), i.begin(), i.end());
            }
            items_ = std::move(all);
        }
        return *items_;
    }

    const std::vector<fs::path>& items_sorted() override {
        if (!items_sorted_) {
            auto sorted = items();
            std::sort(sorted.begin(), sorted.end());
            items_sorted_ = std::move(sorted);
        }
        return *items_sorted_;
    }

    size_t number_of_items() override {
        size_t n = 0;
        for (auto& sub : caches()) n += sub.number_of_items();
        return n;
    }

    size_t total_number_of_files() {
        size_t n = 0;
        for (auto& sub : caches()) n += sub.number_of_files();
        return n;
    }

    void invalidate() override {
        caches_.reset();
        files_.reset();
        files_sorted_.reset();
        items_.reset();
        items_sorted_.reset();
    }

    void known_to_be_empty() override {
        caches_ = std::vector<Sub>();
        files_ = std::vector<fs::path>();
        files_sorted_ = std::vector<fs::path>();
        items_ = std::vector<fs::path>();
        items_sorted_ = std::vector<fs::path>();
    }

private:
    std::vector<Sub> discover() const {
        std::vector<Sub> subs;
        auto dirs = platform::subdirectories(root_);
        std::sort(dirs.begin(), dirs.end());
        for (const auto& dir : dirs) {
            std::string name = dir.filename().string();
            if (!is_registry_dir_name(name)) {
                cc_log("registry: skipping " + dir.string() + " (no '-' in name)");
                continue;
            }
            subs.emplace_back(dir);
        }
        return subs;
    }

    fs::path root_;
    std::optional<std::vector<Sub>> caches_;
    std::optional<std::vector<fs::path>> files_;
    std::optional<std::vector<fs::path>> files_sorted_;
    std::optional<std::vector<fs::path>> items_;
    std::optional<std::vector<fs::path>> items_sorted_;
};

using RegistryIndexCaches = RegistrySuperCache<RegistryIndexCache>;
using RegistryPkgCaches = RegistrySuperCache<RegistryPkgCache>;
using RegistrySourceCaches = RegistrySuperCache<RegistrySourceCache>;
