#include "../base_cli.hpp"
#include "../reports.hpp"
#include "../theme.hpp"
#include <core/size_spec.hpp>
#include <managers/categories.hpp>
#include <managers/clean_unref.hpp>
#include <managers/date_filter.hpp>
#include <managers/git_gc.hpp>
#include <managers/keep_duplicates.hpp>
#include <managers/manifest_resolver.hpp>
#include <managers/trim.hpp>
#include <managers/verifier.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

// ── Helpers ──────────────────────────────────────────────────

static fs::path manifest_for(const BaseCLI& cli) {
    if (cli.options.manifest_path) return fs::path(*cli.options.manifest_path);
    return unwrap_or_throw(find_manifest(platform::current_dir()));
}

// ── Commands ─────────────────────────────────────────────────

static void do_remove_dir(BaseCLI& cli) {
    const auto& o = cli.options;
    auto kinds = unwrap_or_throw(parse_categories(*o.remove_dir));
    auto& inv = cli.inventory();

    if (o.older_than || o.younger_than) {
        auto window = unwrap_or_throw(make_date_window(o.older_than, o.younger_than));
        cli.begin_mutation();
        cli.print_removal(remove_by_date(inv, kinds, window, o.dry_run, cli.status()));
        return;
    }

    cli.begin_mutation();
    cli.print_removal(remove_components(inv, kinds, o.dry_run, cli.status()));
}

static void do_keep_duplicates(BaseCLI& cli) {
    const auto& o = cli.options;
    cli.begin_mutation();
    auto report = unwrap_or_throw(keep_duplicate_crates(cli.inventory(), *o.keep_duplicate_crates,
                                                        o.dry_run, cli.status()));
    cli.print_removal(report);
}

static void do_autoclean(BaseCLI& cli) {
    cli.begin_mutation();
    cli.print_removal(autoclean(cli.inventory(), cli.options.dry_run, cli.status()));
}

static void do_gc(BaseCLI& cli) {
    cli.begin_mutation();
    auto gc = gc_everything(cli.inventory(), cli.config.git_program(),
                            cli.options.dry_run, cli.status());
    if (gc.repos.empty()) {
        std::cout << theme::info("No git repositories to recompress.");
        return;
    }
    if (gc.failures() == 0) {
        std::cout << theme::ok(report::gc_report(gc));
    } else {
        std::cout << theme::warn(report::gc_report(gc));
    }
    if (!cli.options.dry_run && gc.after != gc.before) cli.mark_changed();
}

static void do_autoclean_expensive(BaseCLI& cli) {
    do_autoclean(cli);
    do_gc(cli);
}

static void do_trim(BaseCLI& cli) {
    std::string text = cli.options.trim_limit.value_or(cli.config.trim_limit());
    if (text.empty()) {
        throw CacheError(ErrorKind::InvalidArgument,
                         "trim needs a size limit: --limit <size> or trim_limit in the config");
    }
    uint64_t limit = unwrap_or_throw(parse_size_limit(text));

    cli.begin_mutation();
    cli.print_removal(trim_cache(cli.inventory(), limit, cli.options.dry_run, cli.status()));
}

static void do_clean_unref(BaseCLI& cli) {
    fs::path manifest = manifest_for(cli);
    CargoMetadataResolver resolver(cli.config.cargo_program());

    cli.begin_mutation();
    auto report = unwrap_or_throw(clean_unref(cli.inventory(), resolver, manifest,
                                              cli.options.dry_run, cli.status()));
    cli.print_removal(report);
}

static void do_verify(BaseCLI& cli) {
    auto& inv = cli.inventory();
    size_t checked = inv.registry_sources().number_of_items();
    auto diffs = verify_sources(inv);
    std::cout << report::verify_report(diffs, checked);

    if (cli.options.clean_corrupted) {
        if (diffs.empty()) return;
        cli.begin_mutation();
        cli.print_removal(clean_corrupted(inv, diffs, cli.options.dry_run, cli.status()));
        return;
    }
    if (!diffs.empty()) {
        throw CacheError(ErrorKind::VerificationFailed,
            fmt::format("{} extracted sources differ from their archives", diffs.size()));
    }
}

void register_clean_commands(BaseCLI& cli) {
    cli.add_command("remove-dir", "-r, --remove-dir <dir1,dir2>", do_remove_dir,
                    "Remove cache components (git-db, git-repos, registry-sources, "
                    "registry-crate-cache, registry-index, registry, all); with "
                    "-o/-y <DATE> only files accessed outside the window");
    cli.add_command("keep-duplicates", "-k, --keep-duplicate-crates <N>", do_keep_duplicates,
                    "Remove all but N versions of every crate archive");
    cli.add_command("autoclean", "-a, --autoclean", do_autoclean,
                    "Remove crate source checkouts and git repo checkouts");
    cli.add_command("autoclean-expensive", "-e, --autoclean-expensive", do_autoclean_expensive,
                    "As --autoclean, but also recompress git repositories");
    cli.add_command("gc", "-g, --gc", do_gc,
                    "Recompress git repositories (may take some time)");
    cli.add_command("trim", "trim --limit <size>", do_trim,
                    "Remove least recently used items until the cache fits <size>");
    cli.add_command("clean-unref", "clean-unref [--manifest-path <P>]", do_clean_unref,
                    "Remove everything a project's dependencies do not need");
    cli.add_command("verify", "verify [--clean-corrupted]", do_verify,
                    "Compare extracted sources with their crate archives");
}
