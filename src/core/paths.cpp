#include "paths.hpp"
#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <fmt/format.h>

Result<CachePaths> CachePaths::from_root(const fs::path& root) {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<CachePaths>::Err(ErrorKind::CacheRootMissing,
            fmt::format("cargo home directory '{}' does not exist", root.string()));
    }

    CachePaths p;
    p.root = root;
    p.bin = root / BIN_SUBDIR;
    p.registry = root / REGISTRY_SUBDIR;
    p.registry_index = root / REGISTRY_INDEX_SUBDIR;
    p.registry_cache = root / REGISTRY_CACHE_SUBDIR;
    p.registry_sources = root / REGISTRY_SRC_SUBDIR;
    p.git = root / GIT_SUBDIR;
    p.git_db = root / GIT_DB_SUBDIR;
    p.git_checkouts = root / GIT_CHECKOUTS_SUBDIR;
    return Result<CachePaths>::Ok(p);
}

fs::path resolve_cache_root(const Config& config) {
    std::string env = env_or_empty(ENV_CARGO_HOME);
    if (!env.empty()) return fs::path(env);
    if (!config.cargo_home().empty()) return fs::path(config.cargo_home());
    return platform::home_dir() / ".cargo";
}

Result<fs::path> resolve_toolchain_root(const Config& config) {
    fs::path root;
    std::string env = env_or_empty(ENV_RUSTUP_HOME);
    if (!env.empty()) {
        root = env;
    } else if (!config.rustup_home().empty()) {
        root = config.rustup_home();
    } else {
        root = platform::home_dir() / ".rustup";
    }

    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Result<fs::path>::Err(ErrorKind::NoRustupHome,
            fmt::format("rustup home directory '{}' does not exist", root.string()));
    }
    return Result<fs::path>::Ok(root);
}
