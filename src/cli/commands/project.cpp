#include "../base_cli.hpp"
#include "../reports.hpp"
#include <core/paths.hpp>
#include <managers/local_project.hpp>
#include <managers/manifest_resolver.hpp>
#include <managers/toolchains.hpp>
#include <platform/platform.hpp>
#include <iostream>

static void do_local(BaseCLI& cli) {
    fs::path manifest = cli.options.manifest_path
        ? fs::path(*cli.options.manifest_path)
        : unwrap_or_throw(find_manifest(platform::current_dir()));

    CargoMetadataResolver resolver(cli.config.cargo_program());
    auto summary = unwrap_or_throw(summarize_local(resolver, manifest));
    std::cout << report::local_summary(summary);
}

static void do_toolchain(BaseCLI& cli) {
    fs::path root = unwrap_or_throw(resolve_toolchain_root(cli.config));
    std::cout << report::toolchain_table(list_toolchains(root));
}

void register_project_commands(BaseCLI& cli) {
    cli.add_command("local", "local|l", do_local,
                    "Check the build cache (target dir) of the current project");
    cli.add_command("toolchain", "toolchain", do_toolchain,
                    "Summarize the installed rustup toolchains");
}
