#include "tables.hpp"
#include <algorithm>
#include <fmt/format.h>

std::string format_table(const std::vector<TableRow>& rows) {
    return format_table(rows, {});
}

std::string format_table(const std::vector<TableRow>& rows,
                         const std::vector<size_t>& right_aligned) {
    std::vector<size_t> widths;
    for (const auto& row : rows) {
        if (row.size() > widths.size()) widths.resize(row.size(), 0);
        for (size_t i = 0; i < row.size(); i++) {
            widths[i] = std::max(widths[i], row[i].size());
        }
    }

    auto is_right = [&](size_t col) {
        return std::find(right_aligned.begin(), right_aligned.end(), col) != right_aligned.end();
    };

    std::string out;
    for (const auto& row : rows) {
        std::string line;
        for (size_t i = 0; i < widths.size(); i++) {
            const std::string cell = i < row.size() ? row[i] : std::string();
            if (is_right(i)) {
                line += fmt::format("{:>{}}", cell, widths[i]);
            } else {
                line += fmt::format("{:<{}}", cell, widths[i]);
            }
            line += ' ';
        }
        line.erase(line.find_last_not_of(' ') + 1);
        out += line;
        out += '\n';
    }
    return out;
}

std::string pad_line(int indent, size_t width, const std::string& label,
                     const std::string& value) {
    size_t column = width + static_cast<size_t>(indent) * 2;
    size_t padding = label.size() < column ? column - label.size() : 0;
    return label + std::string(padding, ' ') + value + "\n";
}
