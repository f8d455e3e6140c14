#pragma once

#include <string>
#include <vector>

using TableRow = std::vector<std::string>;

// Pad every column to its widest cell, separate cells with one space and
// strip trailing whitespace from each line. Rows may be ragged; missing
// cells count as empty. An empty table yields "".
std::string format_table(const std::vector<TableRow>& rows);

// Same, but the columns listed in right_aligned are padded on the left.
std::string format_table(const std::vector<TableRow>& rows,
                         const std::vector<size_t>& right_aligned);

// "<label><spaces><value>\n" with the value starting at column
// width + 2 * indent.
std::string pad_line(int indent, size_t width, const std::string& label,
                     const std::string& value);
