#include "cratecache_cli.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <managers/categories.hpp>
#include <managers/date_filter.hpp>
#include <managers/query.hpp>
#include <core/size_spec.hpp>
#include <iostream>

CrateCacheCLI::CrateCacheCLI(CliOptions opts) : BaseCLI(std::move(opts)) {
    register_all_commands();
}

void CrateCacheCLI::register_all_commands() {
    add_command("help", "-h, --help", [](BaseCLI& cli) {
        cli.print_help();
    }, "Show this help message");

    add_command("version", "-V, --version", [](BaseCLI& cli) {
        std::cout << theme::color::ORANGE << theme::color::BOLD << "cratecache"
                  << theme::color::RESET << theme::color::DIM
                  << " version " << CRATECACHE_VERSION << theme::color::RESET << "\n";
    }, "Show version");

    register_inspect_commands(*this);
    register_clean_commands(*this);
    register_project_commands(*this);
}

void CrateCacheCLI::validate_inputs() const {
    const auto& o = options;

    if ((o.older_than || o.younger_than) && !o.remove_dir) {
        throw CacheError(ErrorKind::InvalidArgument,
            "--remove-if-older-than and --remove-if-younger-than require --remove-dir");
    }
    if (o.remove_dir) {
        unwrap_or_throw(parse_categories(*o.remove_dir));
    }
    if (o.older_than || o.younger_than) {
        unwrap_or_throw(make_date_window(o.older_than, o.younger_than));
    }
    if (o.subcommand == Subcommand::Query) {
        unwrap_or_throw(parse_query_sort(o.query_sort));
    }
    if (o.subcommand == Subcommand::Trim && o.trim_limit) {
        unwrap_or_throw(parse_size_limit(*o.trim_limit));
    }
}

void CrateCacheCLI::run() {
    const auto& o = options;

    if (o.help) {
        execute_command("help");
        return;
    }
    if (o.version) {
        execute_command("version");
        return;
    }

    validate_inputs();

    if (o.subcommand != Subcommand::None) {
        execute_command(subcommand_name(o.subcommand));
        print_size_change();
        return;
    }

    if (o.wants_summary()) {
        execute_command("summary");
        return;
    }

    if (o.list_dirs) execute_command("list-dirs");
    if (o.info) execute_command("info");
    if (o.remove_dir) execute_command("remove-dir");
    if (o.keep_duplicate_crates) execute_command("keep-duplicates");
    if (o.autoclean_expensive) {
        execute_command("autoclean-expensive");
    } else {
        if (o.autoclean) execute_command("autoclean");
        if (o.gc) execute_command("gc");
    }
    if (o.top_cache_items) execute_command("top-items");

    print_size_change();
}
