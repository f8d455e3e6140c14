#pragma once

#include <set>
#include <vector>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>
#include <managers/manifest_resolver.hpp>

// The cache entry a dependency manifest needs kept.
//   <root>/git/checkouts/<name-hash>/<rev>/...   -> <root>/git/db/<name-hash>
//   <root>/registry/src/<registry>/<pkg>/...     -> <root>/registry/cache/<registry>/<pkg>.crate
// Returns an empty path for manifests outside the cache root, and fails with
// UnknownSourcePath for anything else under it.
Result<fs::path> required_source_for(const CachePaths& paths, const fs::path& manifest);

struct UnrefPlan {
    std::set<fs::path> referenced_repos;
    std::set<fs::path> referenced_archives;
    DeletionPlan plan;
};

// Everything in git checkouts and registry sources, plus every bare repo and
// crate archive not referenced by the dependency manifests.
Result<UnrefPlan> plan_clean_unref(CacheInventory& inventory,
                                   const std::vector<fs::path>& dependency_manifests);

// Resolve the manifest, plan, execute, reconcile.
Result<RemovalReport> clean_unref(CacheInventory& inventory, ManifestResolver& resolver,
                                  const fs::path& manifest, bool dry_run,
                                  const StatusCallback& cb);
