#pragma once

#include <string>
#include <vector>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>

// Expand a comma-separated token list ("git-db,registry-index", "all", ...)
// into the components it names. Duplicates collapse; the result is in
// component order whatever the token order. Unknown tokens fail with
// InvalidCategoryToken listing every offender.
Result<std::vector<ComponentKind>> parse_categories(const std::string& tokens);

// The accepted tokens, for help and error text.
const std::vector<std::string>& category_tokens();

// Plan removal of whole component directories.
DeletionPlan plan_component_removal(CacheInventory& inventory,
                                    const std::vector<ComponentKind>& kinds);

// Remove whole components, then mark them known-empty (or invalidate them
// if something could not be removed).
RemovalReport remove_components(CacheInventory& inventory,
                                const std::vector<ComponentKind>& kinds,
                                bool dry_run, const StatusCallback& cb);

// Remove the regenerable components: git checkouts and registry sources.
RemovalReport autoclean(CacheInventory& inventory, bool dry_run, const StatusCallback& cb);
