#include <gtest/gtest.h>
#include <core/size_spec.hpp>

// ── parse_size_limit ────────────────────────────────────────

TEST(SizeSpec, ParseBytes) {
    auto r = parse_size_limit("350B");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 350u);
}

TEST(SizeSpec, ParseBinaryUnits) {
    EXPECT_EQ(parse_size_limit("1K").value, 1024u);
    EXPECT_EQ(parse_size_limit("10M").value, 10u * 1024 * 1024);
    EXPECT_EQ(parse_size_limit("2G").value, 2ull * 1024 * 1024 * 1024);
    EXPECT_EQ(parse_size_limit("1T").value, 1024ull * 1024 * 1024 * 1024);
}

TEST(SizeSpec, ParseCaseInsensitive) {
    EXPECT_EQ(parse_size_limit("2g").value, parse_size_limit("2G").value);
    EXPECT_EQ(parse_size_limit("5b").value, 5u);
}

TEST(SizeSpec, ParseFraction) {
    EXPECT_EQ(parse_size_limit("1.5K").value, 1536u);
    EXPECT_EQ(parse_size_limit("0.5M").value, 512u * 1024);
}

TEST(SizeSpec, ParseErrors) {
    for (const char* bad : {"", "10", "10KB", "K", "1.2.3K", "abc", "10X", "-5M"}) {
        auto r = parse_size_limit(bad);
        EXPECT_TRUE(r.is_err()) << bad;
        EXPECT_EQ(r.kind, ErrorKind::TrimLimitUnitParseFailure) << bad;
    }
}

TEST(SizeSpec, ParseOverflow) {
    for (const char* huge : {"100000000T", "16777216T", "99999999999999999999B"}) {
        auto r = parse_size_limit(huge);
        EXPECT_TRUE(r.is_err()) << huge;
        EXPECT_EQ(r.kind, ErrorKind::TrimLimitUnitParseFailure) << huge;
    }
    auto r = parse_size_limit("16000000T");
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value, 16000000ull * (1ull << 40));
}

// ── format_bytes ────────────────────────────────────────────

TEST(SizeSpec, FormatBytesSmall) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(100), "100 B");
    EXPECT_EQ(format_bytes(999), "999 B");
}

TEST(SizeSpec, FormatBytesDecimal) {
    EXPECT_EQ(format_bytes(1000), "1.00 KB");
    EXPECT_EQ(format_bytes(1230), "1.23 KB");
    EXPECT_EQ(format_bytes(121212), "121.21 KB");
    EXPECT_EQ(format_bytes(1938493989), "1.94 GB");
}

TEST(SizeSpec, FormatBytesSigned) {
    EXPECT_EQ(format_bytes_signed(-100), "-100 B");
    EXPECT_EQ(format_bytes_signed(2500), "2.50 KB");
}

// ── size_diff_format ────────────────────────────────────────

TEST(SizeSpec, DiffShrink) {
    EXPECT_EQ(size_diff_format(200, 100), "200 B => 100 B (-100 B, -50%)");
    EXPECT_EQ(size_diff_format(3000, 2000), "3.00 KB => 2.00 KB (-1.00 KB, -33.33%)");
}

TEST(SizeSpec, DiffGrow) {
    EXPECT_EQ(size_diff_format(100, 150), "100 B => 150 B (+50 B, 50%)");
}

TEST(SizeSpec, DiffUnchanged) {
    EXPECT_EQ(size_diff_format(5, 5), "5 B => 5 B");
    EXPECT_EQ(size_diff_format(5, 5, false), "5 B");
}

TEST(SizeSpec, DiffWithoutBefore) {
    EXPECT_EQ(size_diff_format(200, 100, false), "100 B (-100 B, -50%)");
}

TEST(SizeSpec, Percent) {
    EXPECT_EQ(format_percent(1, 8), "12.50");
    EXPECT_EQ(format_percent(5, 0), "0.00");
    EXPECT_EQ(format_percent(10, 10), "100.00");
}
