#pragma once

#include <cstdint>

// ── Cache layout (relative to the cache root) ───────────────
constexpr const char* BIN_SUBDIR              = "bin";
constexpr const char* REGISTRY_SUBDIR         = "registry";
constexpr const char* REGISTRY_INDEX_SUBDIR   = "registry/index";
constexpr const char* REGISTRY_CACHE_SUBDIR   = "registry/cache";
constexpr const char* REGISTRY_SRC_SUBDIR     = "registry/src";
constexpr const char* GIT_SUBDIR              = "git";
constexpr const char* GIT_DB_SUBDIR           = "git/db";
constexpr const char* GIT_CHECKOUTS_SUBDIR    = "git/checkouts";

// Path segment names used when mapping sources back to archives
constexpr const char* SEGMENT_SRC             = "src";
constexpr const char* SEGMENT_CACHE           = "cache";
constexpr const char* SEGMENT_CHECKOUTS       = "checkouts";

constexpr const char* CRATE_EXTENSION         = ".crate";
constexpr const char* EXTRACTION_SENTINEL     = ".cargo-ok";
constexpr const char* MANIFEST_FILE_NAME      = "Cargo.toml";

// ── Environment ─────────────────────────────────────────────
constexpr const char* ENV_CARGO_HOME          = "CARGO_HOME";
constexpr const char* ENV_RUSTUP_HOME         = "RUSTUP_HOME";
constexpr const char* ENV_CONFIG_PATH         = "CRATECACHE_CONFIG";
constexpr const char* ENV_DEBUG_LOG           = "CRATECACHE_LOG";
constexpr const char* ENV_NO_COLOR            = "NO_COLOR";

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_TOP_ITEMS               = 20;
constexpr const char* DEFAULT_CARGO_PROGRAM   = "cargo";
constexpr const char* DEFAULT_GIT_PROGRAM     = "git";
constexpr const char* CRATECACHE_VERSION      = "0.6.3";

// ── Sizes ───────────────────────────────────────────────────
constexpr int64_t SIZE_UNIT_BASE              = 1024;   // trim --limit suffixes
constexpr int64_t SIZE_DISPLAY_BASE           = 1000;   // human-readable output
