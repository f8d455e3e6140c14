#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>
#include <cache/inventory.hpp>
#include <managers/deletion.hpp>

// Which access times get a file deleted.
//   older only   -> accessed after `older`
//   younger only -> accessed before `younger`
//   both         -> before `younger` or after `older`
struct DateWindow {
    std::optional<FileTime> older;
    std::optional<FileTime> younger;

    bool selects(FileTime atime) const;
};

// Parse the -o / -y arguments. Fails with DateParseFailure on a bad date or
// when neither is given.
Result<DateWindow> make_date_window(const std::optional<std::string>& older,
                                    const std::optional<std::string>& younger);

// Same, with an explicit reference "now" for the date-only and time-only forms.
Result<DateWindow> make_date_window(const std::optional<std::string>& older,
                                    const std::optional<std::string>& younger,
                                    std::time_t now);

// Files of the given components whose access time the window selects.
DeletionPlan plan_date_removal(CacheInventory& inventory,
                               const std::vector<ComponentKind>& kinds,
                               const DateWindow& window);

RemovalReport remove_by_date(CacheInventory& inventory,
                             const std::vector<ComponentKind>& kinds,
                             const DateWindow& window,
                             bool dry_run, const StatusCallback& cb);
