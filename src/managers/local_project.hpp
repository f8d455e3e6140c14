#pragma once

#include <string>
#include <vector>
#include <utility>
#include <managers/manifest_resolver.hpp>

struct TargetDirSummary {
    fs::path workspace_root;
    fs::path target_dir;
    bool target_exists = false;
    uint64_t total_size = 0;
    // Non-empty well-known subdirectories (debug, rls, release, package, doc)
    std::vector<std::pair<std::string, uint64_t>> subdirs;
};

// Ask the resolver where the project's target directory is and measure it.
Result<TargetDirSummary> summarize_local(ManifestResolver& resolver, const fs::path& manifest);

// Measure an already-known target directory.
TargetDirSummary summarize_target_dir(const fs::path& workspace_root, const fs::path& target_dir);
