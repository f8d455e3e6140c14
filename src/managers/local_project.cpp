#include "local_project.hpp"
#include <platform/walker.hpp>

TargetDirSummary summarize_target_dir(const fs::path& workspace_root, const fs::path& target_dir) {
    TargetDirSummary summary;
    summary.workspace_root = workspace_root;
    summary.target_dir = target_dir;

    std::error_code ec;
    summary.target_exists = fs::is_directory(target_dir, ec);
    if (!summary.target_exists) return summary;

    summary.total_size = platform::tree_size(target_dir);
    for (const char* sub : {"debug", "rls", "release", "package", "doc"}) {
        uint64_t size = platform::tree_size(target_dir / sub);
        if (size > 0) summary.subdirs.emplace_back(sub, size);
    }
    return summary;
}

Result<TargetDirSummary> summarize_local(ManifestResolver& resolver, const fs::path& manifest) {
    auto resolved = resolver.resolve(manifest);
    if (resolved.is_err()) return Result<TargetDirSummary>::Err(resolved.kind, resolved.error);

    fs::path target = resolved.value.target_directory;
    if (target.empty()) target = manifest.parent_path() / "target";
    fs::path workspace = resolved.value.workspace_root;
    if (workspace.empty()) workspace = manifest.parent_path();

    return Result<TargetDirSummary>::Ok(summarize_target_dir(workspace, target));
}
