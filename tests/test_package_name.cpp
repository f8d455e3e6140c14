#include <gtest/gtest.h>
#include <managers/package_name.hpp>
#include <fmt/format.h>

// ── parse_package_file_name ─────────────────────────────────

TEST(PackageName, Simple) {
    auto r = parse_package_file_name("foo-0.1.0.crate");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.name, "foo");
    EXPECT_EQ(r.value.version, "0.1.0");
}

TEST(PackageName, HyphenatedName) {
    auto r = parse_package_file_name("foo-bar-baz-2.0.0.crate");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.name, "foo-bar-baz");
    EXPECT_EQ(r.value.version, "2.0.0");
}

TEST(PackageName, DigitLeadingNameSegment) {
    auto r = parse_package_file_name("x86-64-0.2.1");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.name, "x86-64");
    EXPECT_EQ(r.value.version, "0.2.1");
}

TEST(PackageName, PreRelease) {
    auto r = parse_package_file_name("foo-0.1.0-beta.1.crate");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.name, "foo");
    EXPECT_EQ(r.value.version, "0.1.0-beta.1");
}

TEST(PackageName, SourceDirectoryName) {
    auto r = parse_package_file_name("serde_json-1.0.108");
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.name, "serde_json");
    EXPECT_EQ(r.value.version, "1.0.108");
}

TEST(PackageName, RoundTrip) {
    for (const char* file : {"a-1.crate", "foo-bar-0.0.1.crate", "winapi-x86_64-pc-windows-gnu-0.4.0.crate",
                             "tokio-1.0.0-alpha.2.crate", "k8s-openapi-0.20.0.crate"}) {
        auto r = parse_package_file_name(file);
        ASSERT_TRUE(r.is_ok()) << file;
        EXPECT_EQ(fmt::format("{}-{}.crate", r.value.name, r.value.version), file);
    }
}

TEST(PackageName, Malformed) {
    for (const char* bad : {"foo.crate", "noversion", "-1.0.0.crate", "foo-bar.crate"}) {
        auto r = parse_package_file_name(bad);
        EXPECT_TRUE(r.is_err()) << bad;
        EXPECT_EQ(r.kind, ErrorKind::MalformedPackageName) << bad;
    }
}

// ── compare_versions ────────────────────────────────────────

TEST(PackageName, CompareNumeric) {
    EXPECT_GT(compare_versions("0.2.0", "0.1.0"), 0);
    EXPECT_GT(compare_versions("0.10.0", "0.9.0"), 0);
    EXPECT_LT(compare_versions("1.0.0", "1.0.1"), 0);
    EXPECT_EQ(compare_versions("1.2.3", "1.2.3"), 0);
}

TEST(PackageName, ComparePreRelease) {
    EXPECT_GT(compare_versions("1.0.0", "1.0.0-beta.1"), 0);
    EXPECT_LT(compare_versions("1.0.0-alpha", "1.0.0-alpha.1"), 0);
    EXPECT_LT(compare_versions("1.0.0-alpha.1", "1.0.0-alpha.beta"), 0);
    EXPECT_LT(compare_versions("1.0.0-beta.2", "1.0.0-beta.11"), 0);
    EXPECT_LT(compare_versions("1.0.0-beta", "1.0.0-rc.1"), 0);
}

TEST(PackageName, CompareIgnoresBuildMetadata) {
    EXPECT_EQ(compare_versions("1.0.0+build.5", "1.0.0"), 0);
}

TEST(PackageName, CompareFallsBackToText) {
    EXPECT_LT(compare_versions("abc", "abd"), 0);
}
