#pragma once

#include "component_cache.hpp"
#include "registry_caches.hpp"
#include <core/paths.hpp>

// One cache object per component. Operators borrow the inventory mutably
// and are responsible for invalidating what they touch.
class CacheInventory {
public:
    explicit CacheInventory(const CachePaths& paths);

    CacheInventory(const CacheInventory&) = delete;
    CacheInventory& operator=(const CacheInventory&) = delete;

    const CachePaths& paths() const { return paths_; }

    BinaryCache& bin() { return bin_; }
    RegistryIndexCaches& registry_index() { return registry_index_; }
    RegistryPkgCaches& registry_archives() { return registry_archives_; }
    RegistrySourceCaches& registry_sources() { return registry_sources_; }
    GitBareRepoCache& git_repos() { return git_repos_; }
    GitCheckoutCache& git_checkouts() { return git_checkouts_; }

    CacheView& component(ComponentKind kind);

    // Sum over all six components.
    uint64_t total_size();

    void invalidate_all();

private:
    CachePaths paths_;
    BinaryCache bin_;
    RegistryIndexCaches registry_index_;
    RegistryPkgCaches registry_archives_;
    RegistrySourceCaches registry_sources_;
    GitBareRepoCache git_repos_;
    GitCheckoutCache git_checkouts_;
};
