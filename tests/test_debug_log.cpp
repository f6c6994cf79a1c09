#include <gtest/gtest.h>
#include <rewrite_search/debug_log.hpp>
#include <string>
#include <vector>

using namespace rewrite_search;

namespace {

std::vector<std::string> captured;

void capture(const char* line) {
    captured.emplace_back(line);
}

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured.clear();
        debug::set_log_sink(&capture);
        debug::set_log_enabled(true);
    }

    void TearDown() override {
        debug::clear_log_sink();
        debug::set_log_enabled(true);
    }
};

} // anonymous namespace

TEST_F(DebugLogTest, SinkReceivesFormattedLine) {
    debug::log_line("vertex %zu at depth %d: '%s'", static_cast<std::size_t>(4), 2, "a+b");
    ASSERT_EQ(captured.size(), 1);
    EXPECT_EQ(captured[0], "[rewrite_search] vertex 4 at depth 2: 'a+b'");
}

TEST_F(DebugLogTest, DisabledLoggingIsSilent) {
    debug::set_log_enabled(false);
    EXPECT_FALSE(debug::log_enabled());
    debug::log_line("ignored");
    EXPECT_TRUE(captured.empty());
}

TEST_F(DebugLogTest, LongLinesAreTruncated) {
    std::string long_text(3 * debug::MAX_LINE, 'x');
    debug::log_line("%s", long_text.c_str());
    ASSERT_EQ(captured.size(), 1);
    EXPECT_LT(captured[0].size(), debug::MAX_LINE + 32);
}
