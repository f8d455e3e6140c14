#include "query.hpp"
#include <core/constants.hpp>
#include <platform/walker.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <regex>

uint64_t QueryGroup::total_size() const {
    uint64_t total = 0;
    for (const auto& m : matches) total += m.size;
    return total;
}

Result<QuerySort> parse_query_sort(const std::string& text) {
    if (text == "name") return Result<QuerySort>::Ok(QuerySort::Name);
    if (text == "size") return Result<QuerySort>::Ok(QuerySort::Size);
    return Result<QuerySort>::Err(ErrorKind::InvalidArgument,
        fmt::format("invalid sort order '{}', expected 'name' or 'size'", text));
}

namespace {

enum class ItemLabel {
    FileName,
    Stem,       // foo-1.0.0.crate -> foo-1.0.0
    RepoAndRev, // git/checkouts/<name-hash>/<rev> -> <name-hash>/<rev>
};

std::string label_of(const fs::path& item, ItemLabel label) {
    switch (label) {
        case ItemLabel::Stem:
            return item.stem().string();
        case ItemLabel::RepoAndRev:
            return (item.parent_path().filename() / item.filename()).generic_string();
        case ItemLabel::FileName:
            break;
    }
    return item.filename().string();
}

} // namespace

static QueryGroup match_items(const std::string& title, const std::vector<fs::path>& items,
                              const std::regex& re, ItemLabel label, QuerySort sort) {
    QueryGroup group;
    group.title = title;

    std::vector<fs::path> hits;
    std::vector<std::string> names;
    for (const auto& item : items) {
        std::string name = label_of(item, label);
        if (!std::regex_search(name, re)) continue;
        hits.push_back(item);
        names.push_back(name);
    }

    auto stats = platform::stats_of_items(hits);
    for (size_t i = 0; i < hits.size(); i++) {
        group.matches.push_back({names[i], stats[i].size});
    }

    if (sort == QuerySort::Name) {
        std::stable_sort(group.matches.begin(), group.matches.end(),
                         [](const QueryMatch& a, const QueryMatch& b) { return a.name < b.name; });
    } else {
        std::stable_sort(group.matches.begin(), group.matches.end(),
                         [](const QueryMatch& a, const QueryMatch& b) { return a.size < b.size; });
    }
    return group;
}

Result<std::vector<QueryGroup>> run_query(CacheInventory& inventory,
                                          const std::string& pattern, QuerySort sort) {
    using R = Result<std::vector<QueryGroup>>;

    std::regex re;
    try {
        re = std::regex(pattern, std::regex::ECMAScript);
    } catch (const std::regex_error& e) {
        return R::Err(ErrorKind::QueryRegexFailure,
                      fmt::format("invalid query regex '{}': {}", pattern, e.what()));
    }

    std::vector<QueryGroup> groups = {
        match_items("Binaries", inventory.bin().items(), re, ItemLabel::FileName, sort),
        match_items("Git checkouts", inventory.git_checkouts().items(), re,
                    ItemLabel::RepoAndRev, sort),
        match_items("Git bare repos", inventory.git_repos().items(), re, ItemLabel::FileName, sort),
        match_items("Registry cache", inventory.registry_archives().items(), re,
                    ItemLabel::Stem, sort),
        match_items("Registry source", inventory.registry_sources().items(), re,
                    ItemLabel::FileName, sort),
    };

    groups.erase(std::remove_if(groups.begin(), groups.end(),
                                [](const QueryGroup& g) { return g.matches.empty(); }),
                 groups.end());
    return R::Ok(groups);
}
