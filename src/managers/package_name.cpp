#include "package_name.hpp"
#include <core/constants.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <string>
#include <vector>

static bool starts_with_digit(const std::string& s) {
    return !s.empty() && std::isdigit(static_cast<unsigned char>(s[0]));
}

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

Result<PackageName> parse_package_file_name(const std::string& file_name) {
    std::string stem = file_name;
    std::string ext = CRATE_EXTENSION;
    if (stem.size() > ext.size() && stem.compare(stem.size() - ext.size(), ext.size(), ext) == 0) {
        stem.erase(stem.size() - ext.size());
    }

    auto segments = split(stem, '-');

    size_t version_start = 0;
    for (size_t i = 1; i < segments.size(); i++) {
        if (starts_with_digit(segments[i]) && segments[i].find('.') != std::string::npos) {
            version_start = i;
            break;
        }
    }
    if (version_start == 0) {
        for (size_t i = 1; i < segments.size(); i++) {
            if (starts_with_digit(segments[i])) {
                version_start = i;
                break;
            }
        }
    }
    if (version_start == 0) {
        return Result<PackageName>::Err(ErrorKind::MalformedPackageName,
            fmt::format("'{}' does not look like <name>-<version>", file_name));
    }

    std::vector<std::string> name_parts(segments.begin(), segments.begin() + version_start);
    std::vector<std::string> version_parts(segments.begin() + version_start, segments.end());

    PackageName parsed{join(name_parts, "-"), join(version_parts, "-")};
    if (parsed.name.empty()) {
        return Result<PackageName>::Err(ErrorKind::MalformedPackageName,
            fmt::format("'{}' has an empty package name", file_name));
    }
    return Result<PackageName>::Ok(parsed);
}

// ── Version precedence ───────────────────────────────────────

namespace {

struct SemVer {
    std::vector<unsigned long long> core;
    std::vector<std::string> pre;
};

// Build metadata ("+...") never affects precedence.
bool parse_semver(const std::string& text, SemVer& out) {
    std::string v = text.substr(0, text.find('+'));
    std::string core = v;
    std::string pre;
    auto dash = v.find('-');
    if (dash != std::string::npos) {
        core = v.substr(0, dash);
        pre = v.substr(dash + 1);
    }

    for (const auto& part : split(core, '.')) {
        if (!all_digits(part)) return false;
        try {
            out.core.push_back(std::stoull(part));
        } catch (const std::exception&) {
            return false;
        }
    }
    if (!pre.empty()) out.pre = split(pre, '.');
    return !out.core.empty();
}

int compare_identifier(const std::string& a, const std::string& b) {
    bool an = all_digits(a), bn = all_digits(b);
    if (an && bn) {
        // Compare by length first so huge numbers need no conversion
        std::string as = a.substr(std::min(a.find_first_not_of('0'), a.size() - 1));
        std::string bs = b.substr(std::min(b.find_first_not_of('0'), b.size() - 1));
        if (as.size() != bs.size()) return as.size() < bs.size() ? -1 : 1;
        return as.compare(bs) < 0 ? -1 : (as == bs ? 0 : 1);
    }
    // Numeric identifiers sort below alphanumeric ones
    if (an) return -1;
    if (bn) return 1;
    int c = a.compare(b);
    return c < 0 ? -1 : (c > 0 ? 1 : 0);
}

} // namespace

int compare_versions(const std::string& a, const std::string& b) {
    SemVer va, vb;
    if (!parse_semver(a, va) || !parse_semver(b, vb)) {
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }

    size_t n = std::max(va.core.size(), vb.core.size());
    for (size_t i = 0; i < n; i++) {
        unsigned long long x = i < va.core.size() ? va.core[i] : 0;
        unsigned long long y = i < vb.core.size() ? vb.core[i] : 0;
        if (x != y) return x < y ? -1 : 1;
    }

    // A pre-release sorts below the release it precedes
    if (va.pre.empty() && vb.pre.empty()) return 0;
    if (va.pre.empty()) return 1;
    if (vb.pre.empty()) return -1;

    size_t m = std::min(va.pre.size(), vb.pre.size());
    for (size_t i = 0; i < m; i++) {
        int c = compare_identifier(va.pre[i], vb.pre[i]);
        if (c != 0) return c;
    }
    if (va.pre.size() == vb.pre.size()) return 0;
    return va.pre.size() < vb.pre.size() ? -1 : 1;
}
