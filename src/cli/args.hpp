#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

enum class Subcommand {
    None,
    Local,
    Query,
    Trim,
    CleanUnref,
    Toolchain,
    Registry,
    Verify,
};

// Everything the command line can ask for.
struct CliOptions {
    bool list_dirs = false;
    bool info = false;
    bool dry_run = false;
    bool autoclean = false;
    bool autoclean_expensive = false;
    bool gc = false;
    bool version = false;
    bool help = false;

    std::optional<std::string> remove_dir;
    std::optional<size_t> keep_duplicate_crates;
    std::optional<size_t> top_cache_items;
    std::optional<std::string> older_than;
    std::optional<std::string> younger_than;

    Subcommand subcommand = Subcommand::None;

    // query
    std::string query_pattern;
    std::string query_sort = "name";
    bool query_hr = false;

    // trim
    std::optional<std::string> trim_limit;

    // clean-unref, local
    std::optional<std::string> manifest_path;

    // verify
    bool clean_corrupted = false;

    // True when nothing but -d was given, i.e. the summary should be shown.
    bool wants_summary() const;
};

// Parse argv (without the program name). A leading "cache" is skipped so the
// tool also works as `cargo cache ...`. Accepts "--flag value" and
// "--flag=value", and clusters of short switches such as "-ad".
// Unknown flags, missing values and bad numbers fail with InvalidArgument.
Result<CliOptions> parse_args(const std::vector<std::string>& args);

// Name used in help and dispatch ("query", "clean-unref", ...).
const char* subcommand_name(Subcommand sub);
