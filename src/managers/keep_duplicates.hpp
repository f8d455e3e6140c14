#pragma once

#include <cache/inventory.hpp>
#include <managers/deletion.hpp>

// Per registry, keep the `keep` newest versions of every package's .crate
// archives and plan the rest for removal. keep == 0 plans every archive.
// Fails with MalformedPackageName before anything is planned if an archive
// name cannot be split into name and version.
Result<DeletionPlan> plan_keep_duplicates(RegistryPkgCaches& archives, size_t keep);

// Plan, execute, invalidate the archive cache.
Result<RemovalReport> keep_duplicate_crates(CacheInventory& inventory, size_t keep,
                                            bool dry_run, const StatusCallback& cb);
