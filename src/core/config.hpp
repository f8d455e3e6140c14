#pragma once

#include <string>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

class Config {
public:
    // Load from $CRATECACHE_CONFIG or ~/.config/cratecache/config.yaml.
    // A missing file yields the defaults.
    static Result<Config> load();

    // Load a specific file. A missing file yields the defaults.
    static Result<Config> load_file(const fs::path& path);

    // Parse YAML text (used by load_file and tests).
    static Result<Config> parse(const std::string& text);

    const std::string& cargo_home() const { return cargo_home_; }
    const std::string& rustup_home() const { return rustup_home_; }
    const std::string& cargo_program() const { return cargo_program_; }
    const std::string& git_program() const { return git_program_; }
    int top_items() const { return top_items_; }
    int threads() const { return threads_; }
    bool color() const { return color_; }
    bool debug_log() const { return debug_log_; }
    const std::string& trim_limit() const { return trim_limit_; }

public:
    Config();

private:
    std::string cargo_home_;
    std::string rustup_home_;
    std::string cargo_program_;
    std::string git_program_;
    int top_items_;
    int threads_;
    bool color_;
    bool debug_log_;
    std::string trim_limit_;
};

// Get paths
fs::path get_config_dir();
fs::path get_config_path();
