#include "utils.hpp"
#include <cstdlib>
#include <stdexcept>

namespace fs = std::filesystem;

int safe_stoi(const std::string& s, int fallback) {
    try {
        size_t used = 0;
        int v = std::stoi(s, &used);
        return used == s.size() ? v : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::vector<std::string> split(const std::string& s, char delimiter) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t pos = s.find(delimiter, start);
        if (pos == std::string::npos) {
            out.push_back(s.substr(start));
            break;
        }
        out.push_back(s.substr(start, pos - start));
        start = pos + 1;
    }
    return out;
}

std::string join(const std::vector<std::string>& parts, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < parts.size(); i++) {
        if (i > 0) out += sep;
        out += parts[i];
    }
    return out;
}

std::string env_or_empty(const char* name) {
    const char* v = std::getenv(name);
    return v ? std::string(v) : std::string();
}

std::string file_name_of(const fs::path& p) {
    // "registry/src/" has an empty filename(); look at the parent instead
    fs::path f = p.filename();
    if (f.empty() && p.has_parent_path()) f = p.parent_path().filename();
    return f.string();
}

bool path_starts_with(const fs::path& p, const fs::path& base) {
    auto pi = p.begin();
    for (auto bi = base.begin(); bi != base.end(); ++bi) {
        // trailing slash on base shows up as an empty element
        if (bi->empty()) continue;
        if (pi == p.end() || *pi != *bi) return false;
        ++pi;
    }
    return true;
}
