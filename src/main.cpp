#include <iostream>
#include <vector>
#include <string>
#include "cli/cratecache_cli.hpp"
#include "cli/theme.hpp"
#include <core/log.hpp>

int main(int argc, char** argv) {
    try {
        std::vector<std::string> args(argv + 1, argv + argc);
        CliOptions options = unwrap_or_throw(parse_args(args));

        CrateCacheCLI cli(std::move(options));
        cli.run();
        return 0;
    } catch (const CacheError& e) {
        cc_log(std::string("fatal ") + error_kind_name(e.kind()) + ": " + e.what());
        std::cout << theme::fail(std::string(e.what()));
        return exit_code_for(e.kind());
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
