#include "config.hpp"
#include "constants.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

Config::Config()
    : cargo_program_(DEFAULT_CARGO_PROGRAM),
      git_program_(DEFAULT_GIT_PROGRAM),
      top_items_(DEFAULT_TOP_ITEMS),
      threads_(0),
      color_(true),
      debug_log_(false) {}

fs::path get_config_dir() {
    return platform::home_dir() / ".config" / "cratecache";
}

fs::path get_config_path() {
    std::string env = env_or_empty(ENV_CONFIG_PATH);
    if (!env.empty()) return fs::path(env);
    return get_config_dir() / "config.yaml";
}

Result<Config> Config::parse(const std::string& text) {
    try {
        YAML::Node root = YAML::Load(text);
        Config config;

        // Empty file
        if (!root || root.IsNull()) {
            return Result<Config>::Ok(config);
        }
        if (!root.IsMap()) {
            return Result<Config>::Err(ErrorKind::ConfigInvalid,
                                       "config must be a mapping of keys to values");
        }

        config.cargo_home_ = root["cargo_home"].as<std::string>("");
        config.rustup_home_ = root["rustup_home"].as<std::string>("");
        config.cargo_program_ = root["cargo"].as<std::string>(DEFAULT_CARGO_PROGRAM);
        config.git_program_ = root["git"].as<std::string>(DEFAULT_GIT_PROGRAM);
        config.top_items_ = root["top_items"].as<int>(DEFAULT_TOP_ITEMS);
        config.threads_ = root["threads"].as<int>(0);
        config.color_ = root["color"].as<bool>(true);
        config.debug_log_ = root["debug_log"].as<bool>(false);
        config.trim_limit_ = root["trim_limit"].as<std::string>("");

        if (config.top_items_ < 0) {
            return Result<Config>::Err(ErrorKind::ConfigInvalid,
                                       "top_items must not be negative");
        }
        if (config.threads_ < 0) {
            return Result<Config>::Err(ErrorKind::ConfigInvalid,
                                       "threads must not be negative");
        }

        return Result<Config>::Ok(config);
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err(ErrorKind::ConfigInvalid,
                                   std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Ok(Config());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err(ErrorKind::ConfigInvalid,
                                   "Failed to read config at " + path.string());
    }
    std::stringstream ss;
    ss << in.rdbuf();

    auto result = parse(ss.str());
    if (result.is_err()) {
        result.error += " (" + path.string() + ")";
    }
    return result;
}

Result<Config> Config::load() {
    return load_file(get_config_path());
}
