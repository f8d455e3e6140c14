#include "registry_caches.hpp"
#include <core/utils.hpp>

std::string registry_name_of(const std::string& dir_name) {
    auto pos = dir_name.rfind('-');
    if (pos == std::string::npos) return "";
    return dir_name.substr(0, pos);
}

bool is_registry_dir_name(const std::string& dir_name) {
    auto pos = dir_name.rfind('-');
    return pos != std::string::npos && pos > 0 && pos + 1 < dir_name.size();
}

RegistrySubCache::RegistrySubCache(fs::path root)
    : DirCache(root), name_(registry_name_of(file_name_of(root))) {}

std::vector<fs::path> RegistrySubCache::compute_items() {
    return platform::entries_at_depth(path(), 1);
}

std::vector<fs::path> RegistryPkgCache::compute_items() {
    std::vector<fs::path> out;
    for (const auto& p : platform::entries_at_depth(path(), 1)) {
        std::error_code ec;
        if (fs::is_regular_file(fs::symlink_status(p, ec))) out.push_back(p);
    }
    return out;
}

std::vector<fs::path> RegistrySourceCache::compute_items() {
    return platform::subdirectories(path());
}
