#include "args.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace {

struct FlagSpec {
    const char* name;
    char short_name;    // 0 if none
    bool takes_value;
};

const std::vector<FlagSpec> GLOBAL_FLAGS = {
    {"list-dirs",              'l', false},
    {"info",                   'i', false},
    {"dry-run",                'd', false},
    {"autoclean",              'a', false},
    {"autoclean-expensive",    'e', false},
    {"gc",                     'g', false},
    {"version",                'V', false},
    {"help",                   'h', false},
    {"remove-dir",             'r', true},
    {"keep-duplicate-crates",  'k', true},
    {"top-cache-items",        't', true},
    {"remove-if-older-than",   'o', true},
    {"remove-if-younger-than", 'y', true},
};

const std::vector<FlagSpec> QUERY_FLAGS = {
    {"sort",           's', true},
    {"sort-by",        0,   true},
    {"hr",             'h', false},
    {"human-readable", 0,   false},
};

const std::vector<FlagSpec> TRIM_FLAGS = {
    {"limit", 'l', true},
};

const std::vector<FlagSpec> MANIFEST_FLAGS = {
    {"manifest-path", 0, true},
};

const std::vector<FlagSpec> VERIFY_FLAGS = {
    {"clean-corrupted", 0, false},
};

const std::vector<FlagSpec>& subcommand_flags(Subcommand sub) {
    static const std::vector<FlagSpec> none;
    switch (sub) {
        case Subcommand::Query:      return QUERY_FLAGS;
        case Subcommand::Trim:       return TRIM_FLAGS;
        case Subcommand::CleanUnref: return MANIFEST_FLAGS;
        case Subcommand::Local:      return MANIFEST_FLAGS;
        case Subcommand::Verify:     return VERIFY_FLAGS;
        default:                     return none;
    }
}

// Subcommand flags shadow global ones ("trim -l" is the limit).
const FlagSpec* find_long(Subcommand sub, const std::string& name) {
    for (const auto* table : {&subcommand_flags(sub), &GLOBAL_FLAGS}) {
        for (const auto& f : *table) {
            if (name == f.name) return &f;
        }
    }
    return nullptr;
}

const FlagSpec* find_short(Subcommand sub, char c) {
    for (const auto* table : {&subcommand_flags(sub), &GLOBAL_FLAGS}) {
        for (const auto& f : *table) {
            if (f.short_name != 0 && f.short_name == c) return &f;
        }
    }
    return nullptr;
}

Result<void> invalid(const std::string& msg) {
    return Result<void>::Err(ErrorKind::InvalidArgument, msg);
}

Result<size_t> parse_count(const std::string& flag, const std::string& text) {
    bool digits = !text.empty() && std::all_of(text.begin(), text.end(), [](char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
    });
    if (!digits) {
        return Result<size_t>::Err(ErrorKind::InvalidArgument,
            fmt::format("--{} expects a non-negative integer, got '{}'", flag, text));
    }
    try {
        return Result<size_t>::Ok(static_cast<size_t>(std::stoull(text)));
    } catch (const std::exception&) {
        return Result<size_t>::Err(ErrorKind::InvalidArgument,
            fmt::format("--{}: '{}' is out of range", flag, text));
    }
}

Result<void> apply_flag(CliOptions& opts, const std::string& name, const std::string& value) {
    if (name == "list-dirs")               opts.list_dirs = true;
    else if (name == "info")               opts.info = true;
    else if (name == "dry-run")            opts.dry_run = true;
    else if (name == "autoclean")          opts.autoclean = true;
    else if (name == "autoclean-expensive") opts.autoclean_expensive = true;
    else if (name == "gc")                 opts.gc = true;
    else if (name == "version")            opts.version = true;
    else if (name == "help")               opts.help = true;
    else if (name == "remove-dir")         opts.remove_dir = value;
    else if (name == "remove-if-older-than")   opts.older_than = value;
    else if (name == "remove-if-younger-than") opts.younger_than = value;
    else if (name == "keep-duplicate-crates" || name == "top-cache-items") {
        auto n = parse_count(name, value);
        if (n.is_err()) return invalid(n.error);
        if (name == "keep-duplicate-crates") opts.keep_duplicate_crates = n.value;
        else opts.top_cache_items = n.value;
    }
    else if (name == "sort" || name == "sort-by") {
        if (value != "name" && value != "size") {
            return invalid(fmt::format("--sort expects 'name' or 'size', got '{}'", value));
        }
        opts.query_sort = value;
    }
    else if (name == "hr" || name == "human-readable") opts.query_hr = true;
    else if (name == "limit")              opts.trim_limit = value;
    else if (name == "manifest-path")      opts.manifest_path = value;
    else if (name == "clean-corrupted")    opts.clean_corrupted = true;
    else return invalid("unknown flag --" + name);
    return Result<void>::Ok();
}

std::optional<Subcommand> subcommand_from(const std::string& word) {
    if (word == "local" || word == "l")     return Subcommand::Local;
    if (word == "query" || word == "q")     return Subcommand::Query;
    if (word == "trim")                     return Subcommand::Trim;
    if (word == "clean-unref")              return Subcommand::CleanUnref;
    if (word == "toolchain")                return Subcommand::Toolchain;
    if (word == "registry")                 return Subcommand::Registry;
    if (word == "verify")                   return Subcommand::Verify;
    return std::nullopt;
}

} // namespace

bool CliOptions::wants_summary() const {
    return subcommand == Subcommand::None && !list_dirs && !info && !autoclean &&
           !autoclean_expensive && !gc && !version && !help && !remove_dir &&
           !keep_duplicate_crates && !top_cache_items;
}

const char* subcommand_name(Subcommand sub) {
    switch (sub) {
        case Subcommand::None:       return "";
        case Subcommand::Local:      return "local";
        case Subcommand::Query:      return "query";
        case Subcommand::Trim:       return "trim";
        case Subcommand::CleanUnref: return "clean-unref";
        case Subcommand::Toolchain:  return "toolchain";
        case Subcommand::Registry:   return "registry";
        case Subcommand::Verify:     return "verify";
    }
    return "";
}

Result<CliOptions> parse_args(const std::vector<std::string>& args) {
    using R = Result<CliOptions>;
    CliOptions opts;

    size_t i = 0;
    if (!args.empty() && args[0] == "cache") i = 1;

    bool saw_pattern = false;
    for (; i < args.size(); i++) {
        const std::string& arg = args[i];

        // ── --long[=value] ──────────────────────────────
        if (arg.size() > 2 && arg.compare(0, 2, "--") == 0) {
            std::string name = arg.substr(2);
            std::optional<std::string> inline_value;
            auto eq = name.find('=');
            if (eq != std::string::npos) {
                inline_value = name.substr(eq + 1);
                name = name.substr(0, eq);
            }

            const FlagSpec* spec = find_long(opts.subcommand, name);
            if (!spec) return R::Err(ErrorKind::InvalidArgument, "unknown flag '" + arg + "'");

            std::string value;
            if (spec->takes_value) {
                if (inline_value) {
                    value = *inline_value;
                } else if (i + 1 < args.size()) {
                    value = args[++i];
                } else {
                    return R::Err(ErrorKind::InvalidArgument,
                                  fmt::format("--{} requires a value", name));
                }
            } else if (inline_value) {
                return R::Err(ErrorKind::InvalidArgument,
                              fmt::format("--{} does not take a value", name));
            }

            auto applied = apply_flag(opts, spec->name, value);
            if (applied.is_err()) return R::Err(applied.kind, applied.error);
            continue;
        }

        // ── -abc / -k 3 / -k3 ───────────────────────────
        if (arg.size() > 1 && arg[0] == '-' && arg != "--") {
            for (size_t c = 1; c < arg.size(); c++) {
                const FlagSpec* spec = find_short(opts.subcommand, arg[c]);
                if (!spec) {
                    return R::Err(ErrorKind::InvalidArgument,
                                  fmt::format("unknown flag '-{}'", arg[c]));
                }

                std::string value;
                if (spec->takes_value) {
                    if (c + 1 < arg.size()) {
                        value = arg.substr(c + 1);
                    } else if (i + 1 < args.size()) {
                        value = args[++i];
                    } else {
                        return R::Err(ErrorKind::InvalidArgument,
                                      fmt::format("-{} requires a value", arg[c]));
                    }
                    c = arg.size();
                }

                auto applied = apply_flag(opts, spec->name, value);
                if (applied.is_err()) return R::Err(applied.kind, applied.error);
            }
            continue;
        }

        // ── positionals ─────────────────────────────────
        if (opts.subcommand == Subcommand::None) {
            auto sub = subcommand_from(arg);
            if (!sub) return R::Err(ErrorKind::InvalidArgument, "unknown command '" + arg + "'");
            opts.subcommand = *sub;
            continue;
        }
        if (opts.subcommand == Subcommand::Query && !saw_pattern) {
            opts.query_pattern = arg;
            saw_pattern = true;
            continue;
        }
        return R::Err(ErrorKind::InvalidArgument,
                      fmt::format("unexpected argument '{}' for '{}'", arg,
                                  subcommand_name(opts.subcommand)));
    }

    return R::Ok(opts);
}
