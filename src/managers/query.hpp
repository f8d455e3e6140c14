#pragma once

#include <string>
#include <vector>
#include <cache/inventory.hpp>

enum class QuerySort {
    Name,
    Size,
};

struct QueryMatch {
    std::string name;
    uint64_t size;
};

struct QueryGroup {
    std::string title;
    std::vector<QueryMatch> matches;

    uint64_t total_size() const;
};

// Parse "name" or "size"; anything else fails with InvalidArgument.
Result<QuerySort> parse_query_sort(const std::string& text);

// Items of every category whose name contains a match of `pattern`
// (ECMAScript regex; empty matches everything). Crate archives are named
// without ".crate", git checkouts as "<name-hash>/<rev>". Sorting is by name, or by ascending size.
// Groups with no matches are omitted.
Result<std::vector<QueryGroup>> run_query(CacheInventory& inventory,
                                          const std::string& pattern, QuerySort sort);
