#include <gtest/gtest.h>
#include <core/log.hpp>
#include <fstream>
#include <sstream>
#include <unistd.h>

static std::string read_log() {
    std::ifstream in(cc_log_path());
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

TEST(LogTest, PathEndsInLogFileName) {
    auto path = std::filesystem::path(cc_log_path());
    EXPECT_EQ(path.filename().string(), "cratecache_debug.log");
}

TEST(LogTest, DisabledWritesNothing) {
    set_log_enabled(false);
    std::string marker = "disabled-marker-" + std::to_string(getpid());
    cc_log(marker);
    EXPECT_EQ(read_log().find(marker), std::string::npos);
}

TEST(LogTest, EnabledAppendsTimestampedLine) {
    set_log_enabled(true);
    std::string marker = "enabled-marker-" + std::to_string(getpid());
    cc_log(marker);
    set_log_enabled(false);

    std::string text = read_log();
    auto pos = text.find(marker);
    ASSERT_NE(pos, std::string::npos);
    auto line_start = text.rfind('\n', pos);
    line_start = (line_start == std::string::npos) ? 0 : line_start + 1;
    EXPECT_EQ(text[line_start], '[');
    EXPECT_EQ(text.substr(pos - 2, 2), "] ");
}
