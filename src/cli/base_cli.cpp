#include "base_cli.hpp"
#include "reports.hpp"
#include "theme.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/paths.hpp>
#include <core/utils.hpp>
#include <platform/parallel.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <vector>
#include <fmt/format.h>

BaseCLI::BaseCLI(CliOptions opts)
    : options(std::move(opts)), config(unwrap_or_throw(Config::load())) {
    platform::set_worker_threads(config.threads());
    set_log_enabled(config.debug_log() || !env_or_empty(ENV_DEBUG_LOG).empty());
    theme::set_color_enabled(config.color() && platform::stdout_is_tty() &&
                             env_or_empty(ENV_NO_COLOR).empty());
    cc_log(fmt::format("cratecache {} started, {} worker threads",
                       CRATECACHE_VERSION, platform::worker_threads()));
}

void BaseCLI::add_command(const std::string& name,
                          const std::string& usage,
                          CommandHandler handler,
                          const std::string& help) {
    commands_[name] = {usage, handler, help};
}

bool BaseCLI::has_command(const std::string& name) const {
    return commands_.count(name) > 0;
}

void BaseCLI::execute_command(const std::string& command) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        throw CacheError(ErrorKind::InvalidArgument, "unknown command: " + command);
    }
    cc_log("command: " + command);
    std::get<1>(it->second)(*this);
}

void BaseCLI::print_help() const {
    std::cout << theme::banner(CRATECACHE_VERSION);
    std::cout << theme::section("Usage");
    std::cout << theme::color::ORANGE << "    cratecache " << theme::color::RESET
              << theme::color::DIM << "[cache] [FLAGS] [OPTIONS] [SUBCOMMAND]"
              << theme::color::RESET << "\n";

    // Group commands by category
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Inspect",     {"summary", "list-dirs", "info", "top-items"}},
        {"Clean",       {"remove-dir", "keep-duplicates", "autoclean", "autoclean-expensive",
                         "gc"}},
        {"Subcommands", {"local", "query", "trim", "clean-unref", "toolchain",
                         "registry", "verify"}},
        {"General",     {"version", "help"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        bool has_any = false;
        for (const auto& name : cmd_names) {
            if (commands_.count(name)) {
                has_any = true;
                break;
            }
        }
        if (!has_any) continue;

        std::cout << "\n" << theme::color::ORANGE << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it == commands_.end()) continue;
            const auto& [usage, handler, help] = it->second;
            std::cout << theme::color::SLATE
                      << fmt::format("    {:<36}", usage)
                      << theme::color::RESET
                      << theme::color::DIM
                      << help
                      << theme::color::RESET << "\n";
        }
    }

    std::cout << "\n" << theme::color::SLATE << fmt::format("    {:<36}", "-d, --dry-run")
              << theme::color::RESET << theme::color::DIM
              << "Don't remove anything, just pretend" << theme::color::RESET << "\n\n";
}

CacheInventory& BaseCLI::inventory() {
    if (!inventory_) {
        fs::path root = resolve_cache_root(config);
        auto paths = unwrap_or_throw(CachePaths::from_root(root));
        cc_log("cache root: " + paths.root.string());
        inventory_ = std::make_unique<CacheInventory>(paths);
    }
    return *inventory_;
}

StatusCallback BaseCLI::status() const {
    return [](const std::string& msg) {
        std::cout << theme::log(msg) << std::flush;
    };
}

void BaseCLI::begin_mutation() {
    if (!size_before_) size_before_ = inventory().total_size();
}

void BaseCLI::print_removal(const RemovalReport& result) {
    if (result.ok()) {
        std::cout << theme::ok(report::removal_summary(result));
    } else {
        std::cout << theme::warn(report::removal_summary(result));
        for (const auto& failure : result.failures) {
            std::cout << theme::fail(failure);
        }
    }
    if (!result.dry_run && result.anything_removed()) changed_ = true;
}

void BaseCLI::print_size_change() {
    if (!changed_ || !size_before_) return;
    auto& inv = inventory();
    inv.invalidate_all();
    std::cout << theme::info(report::size_change(*size_before_, inv.total_size()));
}
