#include "../base_cli.hpp"
#include "../reports.hpp"
#include "../theme.hpp"
#include <managers/query.hpp>
#include <iostream>

static void do_summary(BaseCLI& cli) {
    std::cout << report::summary(report::collect_summary(cli.inventory()));
}

static void do_list_dirs(BaseCLI& cli) {
    std::cout << report::list_dirs(cli.inventory().paths());
}

static void do_info(BaseCLI& cli) {
    auto& inv = cli.inventory();
    std::cout << report::info_text(inv.paths(), report::collect_summary(inv));
}

static void do_top_items(BaseCLI& cli) {
    // -t 0 falls back to the configured default
    size_t limit = *cli.options.top_cache_items;
    if (limit == 0) limit = static_cast<size_t>(cli.config.top_items());
    std::cout << report::top_items(cli.inventory(), limit);
}

static void do_registry(BaseCLI& cli) {
    std::cout << report::registry_table(report::collect_registry_rows(cli.inventory()));
}

static void do_query(BaseCLI& cli) {
    const auto& o = cli.options;
    QuerySort sort = unwrap_or_throw(parse_query_sort(o.query_sort));
    auto groups = unwrap_or_throw(run_query(cli.inventory(), o.query_pattern, sort));

    if (groups.empty()) {
        std::cout << theme::info("No matches for '" + o.query_pattern + "'");
        return;
    }
    std::cout << report::query_output(groups, sort, o.query_hr);
}

void register_inspect_commands(BaseCLI& cli) {
    cli.add_command("summary", "(no flags)", do_summary,
                    "Show the size of every cache component");
    cli.add_command("list-dirs", "-l, --list-dirs", do_list_dirs,
                    "List all found directory paths");
    cli.add_command("info", "-i, --info", do_info,
                    "Print information on found cache directories");
    cli.add_command("top-items", "-t, --top-cache-items <N>", do_top_items,
                    "List the top N items taking most space in the cache");
    cli.add_command("registry", "registry", do_registry,
                    "Per-registry breakdown of index, archives and sources");
    cli.add_command("query", "query|q [--sort name|size] [--hr] [RE]", do_query,
                    "List cache items whose names match a regex");
}
