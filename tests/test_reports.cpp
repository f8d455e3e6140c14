#include "cache_fixture.hpp"
#include <cli/reports.hpp>
#include <cli/tables.hpp>

// ── Tables ──────────────────────────────────────────────────

TEST(Tables, PadsColumnsAndTrimsLines) {
    std::vector<TableRow> rows = {
        {"wasdwasdwasd", "word", "word"},
        {"oh", "why", "this"},
        {"AAAAAA", "", "I don't get it"},
    };
    EXPECT_EQ(format_table(rows),
              "wasdwasdwasd word word\n"
              "oh           why  this\n"
              "AAAAAA            I don't get it\n");
}

TEST(Tables, RightAlignedColumns) {
    std::vector<TableRow> rows = {{"a", "1"}, {"bb", "100"}};
    EXPECT_EQ(format_table(rows, {1}), "a    1\nbb 100\n");
}

TEST(Tables, EmptyTable) {
    EXPECT_EQ(format_table({}), "");
}

TEST(Tables, PadLine) {
    EXPECT_EQ(pad_line(0, 10, "Total: ", "5 B"), "Total:    5 B\n");
    EXPECT_EQ(pad_line(1, 10, "Sub: ", "5 B"), "Sub:        5 B\n");
    EXPECT_EQ(pad_line(0, 3, "longer label ", "x"), "longer label x\n");
}

// ── Summary ─────────────────────────────────────────────────

TEST(Reports, SummaryLayout) {
    report::CacheSummary s;
    s.root = "/home/user/.cargo";
    s.bin_size = 121212;
    s.bin_count = 31;
    s.repos_size = 121212;
    s.repos_count = 37;
    s.checkouts_size = 34984;
    s.checkouts_count = 8;
    s.archives_size = 89;
    s.archives_count = 23445;
    s.sources_size = 1938493989;
    s.sources_count = 123909849;
    s.index_size = 23;
    s.total_size = s.bin_size + s.registry_size() + s.git_size();

    EXPECT_EQ(report::summary(s),
              "Cargo cache '/home/user/.cargo':\n"
              "\n"
              "Total size:                             1.94 GB\n"
              "Size of 31 installed binaries:            121.21 KB\n"
              "Size of registry:                         1.94 GB\n"
              "Size of registry index:                     23 B\n"
              "Size of 23445 crate archives:               89 B\n"
              "Size of 123909849 crate source checkouts:   1.94 GB\n"
              "Size of git db:                           156.20 KB\n"
              "Size of 37 bare git repos:                  121.21 KB\n"
              "Size of 8 git repo checkouts:               34.98 KB\n");
}

TEST_F(CacheFixture, CollectSummaryAddsComponents) {
    write_file("bin/a", 10);
    write_file("registry/index/reg-1111/x", 1);
    write_file("registry/cache/reg-1111/a-1.0.0.crate", 2);
    write_file("registry/src/reg-1111/a-1.0.0/lib.rs", 3);
    write_file("git/db/r-1/HEAD", 4);
    write_file("git/checkouts/r-1/abc/lib.rs", 5);

    auto inv = inventory();
    auto s = report::collect_summary(*inv);
    EXPECT_EQ(s.total_size, 25u);
    EXPECT_EQ(s.registry_size(), 6u);
    EXPECT_EQ(s.git_size(), 9u);
    EXPECT_EQ(s.archives_count, 1u);
    EXPECT_EQ(s.checkouts_count, 1u);
    EXPECT_EQ(s.total_size, inv->total_size());
}

// ── Top items ───────────────────────────────────────────────

TEST(Reports, GroupByNameLargestFirst) {
    auto entries = report::group_by_name({{"serde", 10}, {"tokio", 50}, {"serde", 30}});
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].name, "tokio");
    EXPECT_EQ(entries[1].name, "serde");
    EXPECT_EQ(entries[1].count, 2u);
    EXPECT_EQ(entries[1].total, 40u);
}

TEST(Reports, TopTableHonoursLimit) {
    std::vector<report::TopEntry> entries = {{"big", 2, 3000}, {"small", 1, 100}};
    EXPECT_EQ(report::top_table("/c/registry/cache", 3100, entries, 1),
              "\nSummary of: /c/registry/cache (3.10 KB total)\n"
              "Name Count Average Total\n"
              "big  2     1.50 KB 3.00 KB\n");
    EXPECT_EQ(report::top_table("/c/bin", 0, {}, 5), "\nSummary of: /c/bin (0 B total)\n");
}

TEST_F(CacheFixture, TopItemsGroupsByPackage) {
    write_file("registry/cache/reg-1111/serde-1.0.0.crate", 100);
    write_file("registry/cache/reg-1111/serde-1.0.1.crate", 200);
    write_file("registry/cache/reg-1111/libc-0.2.0.crate", 50);
    auto inv = inventory();
    std::string out = report::top_items(*inv, 10);
    EXPECT_NE(out.find("serde 2     150 B   300 B"), std::string::npos) << out;
    EXPECT_NE(out.find("libc  1     50 B    50 B"), std::string::npos) << out;
}

// ── Registries ──────────────────────────────────────────────

TEST_F(CacheFixture, RegistryRowsMergeComponents) {
    write_file("registry/index/crates-1111/config.json", 5);
    write_file("registry/cache/crates-1111/a-1.0.0.crate", 10);
    write_file("registry/src/crates-1111/a-1.0.0/lib.rs", 20);
    write_file("registry/cache/mirror-2222/b-1.0.0.crate", 7);
    auto inv = inventory();

    auto rows = report::collect_registry_rows(*inv);
    ASSERT_EQ(rows.size(), 2u);
    EXPECT_EQ(rows[0].name, "crates");
    EXPECT_EQ(rows[0].total(), 35u);
    EXPECT_EQ(rows[1].name, "mirror");
    EXPECT_EQ(rows[1].archive_count, 1u);

    std::string table = report::registry_table(rows);
    EXPECT_NE(table.find("Total"), std::string::npos);
    EXPECT_EQ(report::registry_table({}), "No registries found.\n");
}

// ── Subcommand output ───────────────────────────────────────

TEST(Reports, QueryOutput) {
    QueryGroup bins{"Binaries", {{"rg", 1500}}};
    QueryGroup srcs{"Registry source", {{"serde-1.0.0", 20}}};
    EXPECT_EQ(report::query_output({bins, srcs}, QuerySort::Size, true),
              "Binaries sorted by size:\n\trg: 1.50 KB\n"
              "\n"
              "Registry source sorted by size:\n\tserde-1.0.0: 20 B\n");
    EXPECT_EQ(report::query_output({bins}, QuerySort::Name, false),
              "Binaries sorted by name:\n\trg: 1500\n");
}

TEST(Reports, ToolchainTable) {
    std::vector<ToolchainInfo> t = {{"stable-x86_64", 3, 300}, {"nightly-x86_64", 1, 100}};
    std::string out = report::toolchain_table(t);
    EXPECT_NE(out.find("75.00 %"), std::string::npos) << out;
    EXPECT_NE(out.find("25.00 %"), std::string::npos) << out;
    EXPECT_NE(out.find("100 %"), std::string::npos) << out;
    EXPECT_EQ(report::toolchain_table({}), "No toolchains found.\n");
}

TEST(Reports, VerifyReport) {
    SourceDiff d;
    d.source = "/c/registry/src/reg-1/pkg-1.0.0";
    d.additional = {"pkg-1.0.0/extra.txt"};
    d.size_differences = {{"pkg-1.0.0/src/lib.rs", 200, 201}};
    EXPECT_EQ(report::verify_report({d}, 4),
              "Possibly corrupted source: /c/registry/src/reg-1/pkg-1.0.0\n"
              "\tNot in archive: pkg-1.0.0/extra.txt\n"
              "\tSize differs: pkg-1.0.0/src/lib.rs (archive: 200, source: 201)\n"
              "Checked 4 sources, 1 possibly corrupted.\n");
}

TEST(Reports, RemovalSummary) {
    RemovalReport r;
    r.removed = 1;
    r.bytes_removed = 100;
    EXPECT_EQ(report::removal_summary(r), "Removed 1 item, 100 B");

    r.dry_run = true;
    r.removed = 3;
    r.bytes_removed = 1230;
    EXPECT_EQ(report::removal_summary(r), "Would remove 3 items, 1.23 KB");

    r.dry_run = false;
    r.failures = {"failed to unlink 'x'"};
    EXPECT_EQ(report::removal_summary(r), "Removed 3 items, 1.23 KB (1 failed)");
}

TEST(Reports, SizeChange) {
    EXPECT_EQ(report::size_change(200, 100), "Size changed 200 B => 100 B (-100 B, -50%)");
}

TEST(Reports, GcReport) {
    GcSummary gc;
    gc.repos.resize(2);
    gc.repos[1].ok = false;
    gc.before = 2000;
    gc.after = 1000;
    EXPECT_EQ(report::gc_report(gc),
              "Compressed 1 repos: 2.00 KB => 1.00 KB (-1.00 KB, -50%), 1 failed");
}
