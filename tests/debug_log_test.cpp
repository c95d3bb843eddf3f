#include "log/debug_log.hpp"
#include "test_env.hpp"

#include <gtest/gtest.h>

#include <regex>

using namespace voiceflow;

TEST(DebugLogTest, FixedLocation) {
    EXPECT_STREQ(debugLogPath(), "/tmp/voiceflow_debug.log");
}

TEST(DebugLogTest, AppendsTimestampedLines) {
    const std::string first = test::uniqueToken("first");
    const std::string second = test::uniqueToken("second");
    debugLog(first);
    debugLog(second.c_str());

    const std::string log = test::readDebugLog();
    const auto a = log.find(first);
    const auto b = log.find(second);
    ASSERT_NE(a, std::string::npos);
    ASSERT_NE(b, std::string::npos);
    EXPECT_LT(a, b);

    EXPECT_TRUE(std::regex_search(log, std::regex("\\[[0-9]+\\] " + first + "\n")));
}

TEST(DebugLogTest, NullMessageIsHarmless) {
    debugLog(static_cast<const char*>(nullptr));
}
