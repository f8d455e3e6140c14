#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <tuple>
#include <core/config.hpp>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>
#include "args.hpp"

class BaseCLI {
public:
    // Loads the config and applies its thread, colour and log settings.
    // Throws CacheError(ConfigInvalid) on a broken config file.
    explicit BaseCLI(CliOptions opts);
    virtual ~BaseCLI() = default;

    using CommandHandler = std::function<void(BaseCLI&)>;

    void add_command(const std::string& name,
                     const std::string& usage,
                     CommandHandler handler,
                     const std::string& help);

    bool has_command(const std::string& name) const;

    // Run a registered command. Fatal errors propagate as CacheError.
    void execute_command(const std::string& command);
    void print_help() const;

    // Resolve the cache root and build the inventory on first use.
    // Throws CacheError(CacheRootMissing).
    CacheInventory& inventory();

    // Prints operator progress as dim log lines.
    StatusCallback status() const;

    // Call before a command touches the disk; remembers the cache size.
    void begin_mutation();

    // Print the outcome of an operator and its failures.
    void print_removal(const RemovalReport& result);

    // For commands that shrink the cache without a RemovalReport (gc).
    void mark_changed() { changed_ = true; }

    // Print the overall size change if anything was removed.
    void print_size_change();

    // Public state
    CliOptions options;
    Config config;

protected:
    std::map<std::string, std::tuple<std::string, CommandHandler, std::string>> commands_;

private:
    std::unique_ptr<CacheInventory> inventory_;
    std::optional<uint64_t> size_before_;
    bool changed_ = false;
};
