#pragma once

#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

class Config;

// The fixed layout under a cache root.
struct CachePaths {
    fs::path root;
    fs::path bin;
    fs::path registry;
    fs::path registry_index;
    fs::path registry_cache;
    fs::path registry_sources;
    fs::path git;
    fs::path git_db;
    fs::path git_checkouts;

    // Derive every component path. Fails with CacheRootMissing unless `root`
    // is an existing directory.
    static Result<CachePaths> from_root(const fs::path& root);
};

// CARGO_HOME, then config cargo_home, then ~/.cargo. Not checked for existence.
fs::path resolve_cache_root(const Config& config);

// RUSTUP_HOME, then config rustup_home, then ~/.rustup.
// Fails with NoRustupHome if the directory does not exist.
Result<fs::path> resolve_toolchain_root(const Config& config);
