#pragma once

#include "base_cli.hpp"

// Forward declarations for command registration
void register_inspect_commands(BaseCLI& cli);
void register_clean_commands(BaseCLI& cli);
void register_project_commands(BaseCLI& cli);

class CrateCacheCLI : public BaseCLI {
public:
    explicit CrateCacheCLI(CliOptions opts);

    // Run everything the options ask for, in a fixed order: help/version,
    // a subcommand, or the flag commands (inspection first, then removals).
    // Fatal errors propagate as CacheError.
    void run();

private:
    void register_all_commands();

    // Reject bad flag values before anything is removed.
    void validate_inputs() const;
};
