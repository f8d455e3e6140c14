#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cctype>

// All characters digits, exact length.
static bool all_digits(const std::string& s, size_t len) {
    if (s.size() != len) return false;
    for (char c : s) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
    }
    return true;
}

static Result<FileTime> date_error(const std::string& text, const std::string& why) {
    return Result<FileTime>::Err(ErrorKind::DateParseFailure,
                                 fmt::format("failed to parse date '{}': {}", text, why));
}

// mktime normalizes out-of-range fields; a changed field means the input was invalid.
static bool make_local(struct tm& want, std::time_t& out) {
    struct tm probe = want;
    probe.tm_isdst = -1;
    std::time_t t = mktime(&probe);
    if (t == static_cast<std::time_t>(-1)) return false;
    if (probe.tm_year != want.tm_year || probe.tm_mon != want.tm_mon ||
        probe.tm_mday != want.tm_mday) {
        return false;
    }
    out = t;
    return true;
}

Result<FileTime> parse_cutoff_date(const std::string& text, std::time_t now) {
    struct tm now_tm;
    localtime_r(&now, &now_tm);

    auto dot = split(text, '.');
    if (dot.size() == 3 && all_digits(dot[0], 4) && all_digits(dot[1], 2) && all_digits(dot[2], 2)) {
        struct tm want = now_tm;
        want.tm_year = safe_stoi(dot[0]) - 1900;
        want.tm_mon = safe_stoi(dot[1]) - 1;
        want.tm_mday = safe_stoi(dot[2]);
        if (want.tm_mon < 0 || want.tm_mon > 11 || want.tm_mday < 1) {
            return date_error(text, "no such calendar day");
        }
        std::time_t t;
        if (!make_local(want, t)) return date_error(text, "no such calendar day");
        return Result<FileTime>::Ok(seconds_to_file_time(t));
    }

    auto colon = split(text, ':');
    if (colon.size() == 3 && all_digits(colon[0], 2) && all_digits(colon[1], 2) && all_digits(colon[2], 2)) {
        int h = safe_stoi(colon[0]);
        int m = safe_stoi(colon[1]);
        int s = safe_stoi(colon[2]);
        if (h > 23 || m > 59 || s > 59) {
            return date_error(text, "time of day out of range");
        }
        struct tm want = now_tm;
        want.tm_hour = h;
        want.tm_min = m;
        want.tm_sec = s;
        std::time_t t;
        if (!make_local(want, t)) return date_error(text, "time of day out of range");
        return Result<FileTime>::Ok(seconds_to_file_time(t));
    }

    return date_error(text, "expected YYYY.MM.DD or HH:MM:SS");
}

Result<FileTime> parse_cutoff_date(const std::string& text) {
    return parse_cutoff_date(text, std::time(nullptr));
}

std::string format_file_time(FileTime t) {
    std::time_t secs = static_cast<std::time_t>(t / 1000000000LL);
    struct tm tm_buf;
    localtime_r(&secs, &tm_buf);
    char buf[32];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
    return std::string(buf);
}
