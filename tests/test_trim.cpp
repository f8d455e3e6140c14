#include "cache_fixture.hpp"
#include <managers/trim.hpp>

TEST(TrimPlan, YoungestKeptUntilLimit) {
    std::vector<TrimItem> items = {
        {"/c/A", 100, 1}, {"/c/B", 200, 2}, {"/c/C", 300, 3},
    };
    auto plan = plan_trim(items, 350);
    ASSERT_EQ(plan.size(), 2u);
    EXPECT_EQ(plan.items[0].path, fs::path("/c/B"));
    EXPECT_EQ(plan.items[1].path, fs::path("/c/A"));
    EXPECT_EQ(plan.total_bytes(), 300u);
}

TEST(TrimPlan, RunningTotalIncludesDeletedItems) {
    // A small old item after a big young one still goes
    std::vector<TrimItem> items = {
        {"/c/big", 500, 10}, {"/c/small", 1, 1},
    };
    auto plan = plan_trim(items, 100);
    EXPECT_EQ(plan.size(), 2u);
}

TEST(TrimPlan, EverythingFits) {
    std::vector<TrimItem> items = {{"/c/a", 10, 1}, {"/c/b", 10, 2}};
    EXPECT_TRUE(plan_trim(items, 20).empty());
    EXPECT_EQ(plan_trim(items, 0).size(), 2u);
}

class TrimCache : public CacheFixture {
protected:
    void seed() {
        std::time_t t = local_time(2024, 3, 1);
        set_atime(write_file("registry/cache/reg-abcd/a-1.0.0.crate", 100), t - 3);
        set_atime(write_file("registry/cache/reg-abcd/b-1.0.0.crate", 200), t - 2);
        set_atime(write_file("registry/cache/reg-abcd/c-1.0.0.crate", 300), t - 1);
    }
};

TEST_F(TrimCache, RemovesOldestBeyondLimit) {
    seed();
    write_file("registry/index/reg-abcd/config.json", 1000);
    auto inv = inventory();
    auto report = trim_cache(*inv, 350, false, nullptr);

    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.removed, 2u);
    EXPECT_EQ(report.bytes_removed, 300u);
    EXPECT_FALSE(exists(root / "registry/cache/reg-abcd/a-1.0.0.crate"));
    EXPECT_FALSE(exists(root / "registry/cache/reg-abcd/b-1.0.0.crate"));
    EXPECT_TRUE(exists(root / "registry/cache/reg-abcd/c-1.0.0.crate"));
    EXPECT_TRUE(exists(root / "registry/index/reg-abcd/config.json"));
    EXPECT_EQ(trimmable_size(*inv), 300u);
}

TEST_F(TrimCache, WithinLimitIsNoop) {
    seed();
    auto inv = inventory();
    auto report = trim_cache(*inv, 600, false, nullptr);
    EXPECT_EQ(report.removed, 0u);
    EXPECT_TRUE(exists(root / "registry/cache/reg-abcd/a-1.0.0.crate"));
}

TEST_F(TrimCache, DirectoryItemsUseNewestFile) {
    std::time_t t = local_time(2024, 3, 1);
    auto old_file = write_file("registry/src/reg-abcd/old-1.0.0/lib.rs", 100);
    auto fresh = write_file("registry/src/reg-abcd/mixed-1.0.0/lib.rs", 100);
    auto stale = write_file("registry/src/reg-abcd/mixed-1.0.0/Cargo.toml", 100);
    set_atime(old_file, t - 100);
    set_atime(fresh, t);
    set_atime(stale, t - 1000);

    auto inv = inventory();
    auto report = trim_cache(*inv, 200, false, nullptr);
    EXPECT_EQ(report.removed, 1u);
    EXPECT_FALSE(exists(root / "registry/src/reg-abcd/old-1.0.0"));
    EXPECT_TRUE(exists(root / "registry/src/reg-abcd/mixed-1.0.0"));
}

TEST_F(TrimCache, DryRunLeavesDiskAndMatchesRealRun) {
    seed();
    auto before = snapshot();
    std::vector<fs::path> planned;
    {
        auto inv = inventory();
        auto report = trim_cache(*inv, 350, true, collect_planned(planned));
        EXPECT_TRUE(report.dry_run);
        EXPECT_EQ(report.removed, 2u);
        EXPECT_EQ(report.bytes_removed, 300u);
    }
    EXPECT_EQ(snapshot(), before);
    ASSERT_EQ(planned.size(), 2u);

    auto inv = inventory();
    auto report = trim_cache(*inv, 350, false, nullptr);
    EXPECT_EQ(report.removed, planned.size());
    for (const auto& p : planned) EXPECT_FALSE(exists(p)) << p;
    EXPECT_TRUE(exists(root / "registry/cache/reg-abcd/c-1.0.0.crate"));
}
