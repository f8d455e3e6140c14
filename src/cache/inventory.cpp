#include "inventory.hpp"

CacheInventory::CacheInventory(const CachePaths& paths)
    : paths_(paths),
      bin_(paths.bin),
      registry_index_(paths.registry_index),
      registry_archives_(paths.registry_cache),
      registry_sources_(paths.registry_sources),
      git_repos_(paths.git_db),
      git_checkouts_(paths.git_checkouts) {}

CacheView& CacheInventory::component(ComponentKind kind) {
    switch (kind) {
        case ComponentKind::InstalledBinaries: return bin_;
        case ComponentKind::RegistryIndex:     return registry_index_;
        case ComponentKind::RegistryArchives:  return registry_archives_;
        case ComponentKind::RegistrySources:   return registry_sources_;
        case ComponentKind::MirrorRepos:       return git_repos_;
        case ComponentKind::MirrorCheckouts:   return git_checkouts_;
    }
    return bin_;
}

uint64_t CacheInventory::total_size() {
    uint64_t total = 0;
    for (auto kind : all_components()) total += component(kind).total_size();
    return total;
}

void CacheInventory::invalidate_all() {
    for (auto kind : all_components()) component(kind).invalidate();
}
