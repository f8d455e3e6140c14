#pragma once

#include <string>
#include <ctime>
#include <core/types.hpp>

// Parse a cutoff for the date-window filter, in local time.
//   "YYYY.MM.DD" -> that day at the current time of day
//   "HH:MM:SS"   -> today at that time
// Anything else fails with DateParseFailure.
// The result is in nanoseconds since the epoch, comparable with access times.
Result<FileTime> parse_cutoff_date(const std::string& text);

// Same, relative to an explicit "now" (seconds since the epoch).
Result<FileTime> parse_cutoff_date(const std::string& text, std::time_t now);

// Seconds since the epoch to nanoseconds.
inline FileTime seconds_to_file_time(std::time_t s) {
    return static_cast<FileTime>(s) * 1000000000LL;
}

// Format as "YYYY-MM-DD HH:MM:SS" in local time.
std::string format_file_time(FileTime t);
