#include <fstream>
#include <regex>
#include <sstream>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "include/logger.hpp"
#include "tests/test_support.hpp"

using namespace sigmaxfer;
using sigmaxfer::test_support::TempDir;

TEST(Logger, FormatsTimestampNameLevelAndMessage) {
    Logger logger("sigmaxfer");
    std::vector<std::string> lines;
    logger.add_sink([&](LogLevel, std::string_view line) { lines.emplace_back(line); });

    logger.info("Transfer successful: {} -> {}", "a.bin", "/srv/a.bin");

    ASSERT_EQ(lines.size(), 1u);
    std::regex pattern(
        R"(^\d{4}-\d{2}-\d{2} \d{2}:\d{2}:\d{2} - sigmaxfer - INFO - Transfer successful: a\.bin -> /srv/a\.bin$)");
    EXPECT_TRUE(std::regex_match(lines.front(), pattern)) << lines.front();
}

TEST(Logger, DropsMessagesBelowThreshold) {
    Logger logger("t", LogLevel::Warning);
    std::vector<LogLevel> levels;
    logger.add_sink([&](LogLevel level, std::string_view) { levels.push_back(level); });

    logger.debug("hidden");
    logger.info("hidden");
    logger.warning("shown");
    logger.error("shown");
    logger.critical("shown");

    EXPECT_EQ(levels, (std::vector<LogLevel>{LogLevel::Warning, LogLevel::Error, LogLevel::Critical}));

    logger.set_level(LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_EQ(levels.size(), 4u);
}

TEST(Logger, FeedsEverySink) {
    Logger logger("t");
    int first = 0;
    int second = 0;
    logger.add_sink([&](LogLevel, std::string_view) { ++first; });
    logger.add_sink([&](LogLevel, std::string_view) { ++second; });
    logger.error("boom");
    EXPECT_EQ(first, 1);
    EXPECT_EQ(second, 1);
}

TEST(Logger, AppendsToFile) {
    TempDir dir;
    auto path = dir.path() / "run.log";
    {
        Logger logger("t");
        ASSERT_TRUE(logger.add_file_sink(path).has_value());
        logger.info("first");
        logger.warning("second");
    }

    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    auto text = ss.str();
    EXPECT_NE(text.find(" - t - INFO - first\n"), std::string::npos);
    EXPECT_NE(text.find(" - t - WARNING - second\n"), std::string::npos);
}

TEST(Logger, ReportsUnopenableFile) {
    TempDir dir;
    Logger logger("t");
    EXPECT_FALSE(logger.add_file_sink(dir.path() / "no" / "such" / "dir.log").has_value());
}

TEST(LogLevel, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level(" info "), LogLevel::Info);
    EXPECT_EQ(parse_level("warn"), LogLevel::Warning);
    EXPECT_EQ(parse_level("Warning"), LogLevel::Warning);
    EXPECT_EQ(parse_level("error"), LogLevel::Error);
    EXPECT_EQ(parse_level("critical"), LogLevel::Critical);
    EXPECT_FALSE(parse_level("verbose").has_value());
    EXPECT_EQ(level_name(LogLevel::Critical), "CRITICAL");
}
