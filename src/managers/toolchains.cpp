#include "toolchains.hpp"
#include <platform/walker.hpp>
#include <algorithm>

namespace fs = std::filesystem;

std::vector<ToolchainInfo> list_toolchains(const fs::path& toolchain_root) {
    std::vector<ToolchainInfo> out;
    for (const auto& dir : platform::subdirectories(toolchain_root / "toolchains")) {
        auto files = platform::walk_files(dir);
        out.push_back({dir.filename().string(), files.size(), platform::sum_sizes(files)});
    }

    std::sort(out.begin(), out.end(), [](const ToolchainInfo& a, const ToolchainInfo& b) {
        if (a.size != b.size) return a.size > b.size;
        return a.name < b.name;
    });
    return out;
}
