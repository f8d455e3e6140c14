#include "size_spec.hpp"
#include "constants.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <cctype>
#include <cmath>

Result<uint64_t> parse_size_limit(const std::string& text) {
    auto fail = [&](const std::string& why) {
        return Result<uint64_t>::Err(ErrorKind::TrimLimitUnitParseFailure,
                                     fmt::format("failed to parse size limit '{}': {}", text, why));
    };

    if (text.empty()) return fail("empty value");

    // Find where the numeric part ends
    size_t i = 0;
    bool seen_dot = false;
    while (i < text.size()) {
        char c = text[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            i++;
        } else if (c == '.' && !seen_dot) {
            seen_dot = true;
            i++;
        } else {
            break;
        }
    }
    std::string mantissa = text.substr(0, i);
    std::string suffix = text.substr(i);

    if (mantissa.empty() || mantissa == ".") return fail("missing number");
    if (suffix.size() != 1) return fail("expected a single unit suffix B, K, M, G or T");

    double value = 0.0;
    try {
        value = std::stod(mantissa);
    } catch (const std::exception&) {
        return fail("invalid number");
    }

    int exponent = 0;
    switch (std::toupper(static_cast<unsigned char>(suffix[0]))) {
        case 'B': exponent = 0; break;
        case 'K': exponent = 1; break;
        case 'M': exponent = 2; break;
        case 'G': exponent = 3; break;
        case 'T': exponent = 4; break;
        default: return fail(fmt::format("unknown unit '{}'", suffix));
    }

    double bytes = value * std::pow(static_cast<double>(SIZE_UNIT_BASE), exponent);
    // 2^64: anything at or past it has no uint64_t representation.
    if (!std::isfinite(bytes) || bytes >= 18446744073709551616.0) {
        return fail("value does not fit in 64 bits");
    }
    return Result<uint64_t>::Ok(static_cast<uint64_t>(bytes));
}

std::string format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    if (bytes < static_cast<uint64_t>(SIZE_DISPLAY_BASE)) {
        return fmt::format("{} B", bytes);
    }
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= SIZE_DISPLAY_BASE && unit < 5) {
        value /= SIZE_DISPLAY_BASE;
        unit++;
    }
    return fmt::format("{:.2f} {}", value, units[unit]);
}

std::string format_bytes_signed(int64_t bytes) {
    if (bytes < 0) {
        return "-" + format_bytes(static_cast<uint64_t>(-bytes));
    }
    return format_bytes(static_cast<uint64_t>(bytes));
}

// Two decimals, truncated toward zero, trailing zeros dropped: "-33.33", "-50", "12.5"
static std::string format_change_percent(uint64_t before, uint64_t after) {
    if (before == 0) return after == 0 ? "0" : "+inf";
    double pct = (static_cast<double>(after) / static_cast<double>(before)) * 100.0 - 100.0;
    pct = std::trunc(pct * 100.0) / 100.0;
    std::string s = fmt::format("{:.2f}", pct);
    s.erase(s.find_last_not_of('0') + 1);
    if (!s.empty() && s.back() == '.') s.pop_back();
    if (s == "-0") s = "0";
    return s;
}

std::string size_diff_format(uint64_t before, uint64_t after, bool show_before) {
    if (before == after) {
        if (show_before) return fmt::format("{} => {}", format_bytes(before), format_bytes(after));
        return format_bytes(after);
    }

    int64_t diff = static_cast<int64_t>(after) - static_cast<int64_t>(before);
    std::string sign = diff > 0 ? "+" : "";
    std::string change = fmt::format("({}{}, {}%)", sign, format_bytes_signed(diff),
                                     format_change_percent(before, after));
    if (show_before) {
        return fmt::format("{} => {} {}", format_bytes(before), format_bytes(after), change);
    }
    return fmt::format("{} {}", format_bytes(after), change);
}

std::string format_percent(uint64_t part, uint64_t whole) {
    if (whole == 0) return "0.00";
    return fmt::format("{:.2f}", static_cast<double>(part) * 100.0 / static_cast<double>(whole));
}
