#include "clean_unref.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/walker.hpp>
#include <fmt/format.h>

static fs::path normalized(const fs::path& p) {
    std::error_code ec;
    fs::path out = fs::weakly_canonical(p, ec);
    if (ec) return p.lexically_normal();
    return out;
}

Result<fs::path> required_source_for(const CachePaths& paths, const fs::path& manifest) {
    fs::path root = normalized(paths.root);
    fs::path target = normalized(manifest);
    if (!path_starts_with(target, root)) return Result<fs::path>::Ok(fs::path());

    std::vector<std::string> parts;
    for (const auto& part : target.lexically_relative(root)) parts.push_back(part.string());

    // git/checkouts/<name-hash>/<rev>/...
    if (parts.size() >= 4 && parts[0] == GIT_SUBDIR && parts[1] == SEGMENT_CHECKOUTS) {
        return Result<fs::path>::Ok(paths.git_db / parts[2]);
    }
    // registry/src/<registry>/<pkg>/...
    if (parts.size() >= 4 && parts[0] == REGISTRY_SUBDIR && parts[1] == SEGMENT_SRC) {
        return Result<fs::path>::Ok(paths.registry_cache / parts[2] / (parts[3] + CRATE_EXTENSION));
    }

    return Result<fs::path>::Err(ErrorKind::UnknownSourcePath,
        fmt::format("dependency manifest '{}' is inside the cache but neither in a git "
                    "checkout nor in registry sources", manifest.string()));
}

Result<UnrefPlan> plan_clean_unref(CacheInventory& inventory,
                                   const std::vector<fs::path>& dependency_manifests) {
    UnrefPlan out;
    const auto& paths = inventory.paths();

    for (const auto& manifest : dependency_manifests) {
        auto required = required_source_for(paths, manifest);
        if (required.is_err()) return Result<UnrefPlan>::Err(required.kind, required.error);
        if (required.value.empty()) continue;

        if (path_starts_with(required.value, paths.git_db)) {
            out.referenced_repos.insert(required.value);
        } else {
            out.referenced_archives.insert(required.value);
        }
    }

    // Regenerable components go completely
    for (auto* cache : std::initializer_list<CacheView*>{&inventory.git_checkouts(),
                                                         &inventory.registry_sources()}) {
        std::error_code ec;
        if (fs::exists(fs::symlink_status(cache->path(), ec))) {
            out.plan.add(cache->path(), cache->total_size());
        }
    }

    for (const auto& repo : inventory.git_repos().items_sorted()) {
        if (out.referenced_repos.count(repo)) continue;
        out.plan.add(repo, platform::tree_size(repo));
    }
    for (const auto& archive : inventory.registry_archives().items_sorted()) {
        if (out.referenced_archives.count(archive)) continue;
        out.plan.add(archive, platform::entry_size(archive));
    }

    return Result<UnrefPlan>::Ok(out);
}

Result<RemovalReport> clean_unref(CacheInventory& inventory, ManifestResolver& resolver,
                                  const fs::path& manifest, bool dry_run,
                                  const StatusCallback& cb) {
    auto resolved = resolver.resolve(manifest);
    if (resolved.is_err()) return Result<RemovalReport>::Err(resolved.kind, resolved.error);

    auto planned = plan_clean_unref(inventory, resolved.value.package_manifests);
    if (planned.is_err()) return Result<RemovalReport>::Err(planned.kind, planned.error);

    cc_log(fmt::format("clean-unref: {} repo(s) and {} archive(s) referenced by {}",
                       planned.value.referenced_repos.size(),
                       planned.value.referenced_archives.size(), manifest.string()));

    auto report = execute_plan(planned.value.plan, dry_run, cb);
    if (!dry_run) {
        if (report.ok()) {
            inventory.git_checkouts().known_to_be_empty();
            inventory.registry_sources().known_to_be_empty();
        } else {
            inventory.git_checkouts().invalidate();
            inventory.registry_sources().invalidate();
        }
        inventory.git_repos().invalidate();
        inventory.registry_archives().invalidate();
    }
    return Result<RemovalReport>::Ok(report);
}
