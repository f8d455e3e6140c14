#include "categories.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <map>
#include <set>

namespace {

const std::map<std::string, std::vector<ComponentKind>>& token_table() {
    static const std::map<std::string, std::vector<ComponentKind>> table = {
        {"git-db",               {ComponentKind::MirrorRepos, ComponentKind::MirrorCheckouts}},
        {"git-repos",            {ComponentKind::MirrorCheckouts}},
        {"registry-sources",     {ComponentKind::RegistrySources}},
        {"registry-crate-cache", {ComponentKind::RegistryArchives}},
        {"registry-index",       {ComponentKind::RegistryIndex}},
        {"registry",             {ComponentKind::RegistryIndex, ComponentKind::RegistryArchives,
                                  ComponentKind::RegistrySources}},
        {"all",                  {ComponentKind::RegistryIndex, ComponentKind::RegistryArchives,
                                  ComponentKind::RegistrySources, ComponentKind::MirrorRepos,
                                  ComponentKind::MirrorCheckouts}},
    };
    return table;
}

} // namespace

const std::vector<std::string>& category_tokens() {
    static const std::vector<std::string> tokens = {
        "git-db", "git-repos", "registry-sources", "registry-crate-cache",
        "registry-index", "registry", "all",
    };
    return tokens;
}

Result<std::vector<ComponentKind>> parse_categories(const std::string& tokens) {
    using R = Result<std::vector<ComponentKind>>;

    std::set<ComponentKind> kinds;
    std::vector<std::string> invalid;
    for (auto token : split(tokens, ',')) {
        trim(token);
        auto it = token_table().find(token);
        if (it == token_table().end()) {
            invalid.push_back(token.empty() ? "''" : token);
            continue;
        }
        kinds.insert(it->second.begin(), it->second.end());
    }

    if (!invalid.empty()) {
        return R::Err(ErrorKind::InvalidCategoryToken,
            fmt::format("invalid deletable dir(s): {} (valid: {})",
                        join(invalid, ", "), join(category_tokens(), ", ")));
    }
    return R::Ok(std::vector<ComponentKind>(kinds.begin(), kinds.end()));
}

DeletionPlan plan_component_removal(CacheInventory& inventory,
                                    const std::vector<ComponentKind>& kinds) {
    DeletionPlan plan;
    for (auto kind : kinds) {
        auto& cache = inventory.component(kind);
        std::error_code ec;
        if (!fs::exists(fs::symlink_status(cache.path(), ec))) continue;
        plan.add(cache.path(), cache.total_size());
    }
    return plan;
}

RemovalReport remove_components(CacheInventory& inventory,
                                const std::vector<ComponentKind>& kinds,
                                bool dry_run, const StatusCallback& cb) {
    auto plan = plan_component_removal(inventory, kinds);
    auto report = execute_plan(plan, dry_run, cb);
    if (dry_run) return report;

    for (auto kind : kinds) {
        auto& cache = inventory.component(kind);
        if (report.ok()) {
            cache.known_to_be_empty();
        } else {
            cache.invalidate();
        }
    }
    return report;
}

RemovalReport autoclean(CacheInventory& inventory, bool dry_run, const StatusCallback& cb) {
    if (cb) cb("Clearing regenerable git checkouts and registry sources");
    return remove_components(inventory,
                             {ComponentKind::RegistrySources, ComponentKind::MirrorCheckouts},
                             dry_run, cb);
}
