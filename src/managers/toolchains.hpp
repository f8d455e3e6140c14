#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>

struct ToolchainInfo {
    std::string name;
    size_t files;
    uint64_t size;
};

// One entry per directory under <toolchain-root>/toolchains, largest first.
std::vector<ToolchainInfo> list_toolchains(const std::filesystem::path& toolchain_root);
