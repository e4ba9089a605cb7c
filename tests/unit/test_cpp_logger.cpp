#include <gtest/gtest.h>
#include <string>
#include <vector>
#include "utils/cpp_logger.h"

using namespace voicetap::audio::logging;

class CppLoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        drain();
        set_cpp_log_level(LogLevel::DEBUG);
    }

    void TearDown() override {
        set_cpp_log_level(LogLevel::INFO);
        drain();
    }

    static void drain() {
        while (!retrieve_log_entries(0).empty()) {
        }
    }

    static std::vector<LogEntry> collect() {
        std::vector<LogEntry> all;
        for (;;) {
            auto batch = retrieve_log_entries(0);
            if (batch.empty()) {
                break;
            }
            all.insert(all.end(), batch.begin(), batch.end());
        }
        return all;
    }
};

TEST_F(CppLoggerTest, FormatsMessageWithLocation) {
    LOG_CPP_INFO("[Test] SSRC 0x%08X has %d packets", 0xABCDu, 3);
    auto entries = collect();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].level, LogLevel::INFO);
    EXPECT_EQ(entries[0].message, "[Test] SSRC 0x0000ABCD has 3 packets");
    EXPECT_EQ(entries[0].filename, "test_cpp_logger.cpp");
    EXPECT_GT(entries[0].line_number, 0);
}

TEST_F(CppLoggerTest, LevelFiltersMessages) {
    set_cpp_log_level(LogLevel::WARNING);
    LOG_CPP_DEBUG("hidden");
    LOG_CPP_INFO("hidden");
    LOG_CPP_WARNING("shown");
    LOG_CPP_ERROR("shown too");

    auto entries = collect();
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].level, LogLevel::WARNING);
    EXPECT_EQ(entries[1].level, LogLevel::ERR);
}

TEST_F(CppLoggerTest, LongMessagesAreNotTruncated) {
    const std::string long_text(2000, 'x');
    LOG_CPP_INFO("%s", long_text.c_str());
    auto entries = collect();
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].message.size(), 2000u);
}

TEST(LogLevelTest, ParsesNamesCaseInsensitively) {
    LogLevel level = LogLevel::INFO;
    EXPECT_TRUE(parse_log_level("DEBUG", level));
    EXPECT_EQ(level, LogLevel::DEBUG);
    EXPECT_TRUE(parse_log_level("warn", level));
    EXPECT_EQ(level, LogLevel::WARNING);
    EXPECT_TRUE(parse_log_level("Error", level));
    EXPECT_EQ(level, LogLevel::ERR);
    EXPECT_FALSE(parse_log_level("loud", level));
    EXPECT_EQ(level, LogLevel::ERR);
}

TEST(LogLevelTest, Names) {
    EXPECT_STREQ(log_level_name(LogLevel::DEBUG), "DEBUG");
    EXPECT_STREQ(log_level_name(LogLevel::ERR), "ERROR");
}
