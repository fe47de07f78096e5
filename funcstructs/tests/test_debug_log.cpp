#include <gtest/gtest.h>
#include <funcstructs/debug_log.hpp>
#include <string>
#include <vector>

using namespace funcstructs;

namespace {

std::vector<std::string> captured;

void capture(const char* message) {
    captured.emplace_back(message);
}

} // namespace

class DebugLogTest : public ::testing::Test {
protected:
    void SetUp() override {
        captured.clear();
        debug::set_debug_callback(capture);
    }
    void TearDown() override {
        debug::clear_debug_callback();
    }
};

TEST_F(DebugLogTest, RoutesToCallback) {
    debug::debug_output("generated %zu objects", std::size_t{12});
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_EQ(captured[0].rfind("[DEBUG][T", 0), 0u);
    const std::string suffix = "generated 12 objects";
    ASSERT_GE(captured[0].size(), suffix.size());
    EXPECT_EQ(captured[0].substr(captured[0].size() - suffix.size()), suffix);
}

TEST_F(DebugLogTest, MacroFollowsBuildOption) {
    DEBUG_LOG("macro message %d", 1);
#ifdef ENABLE_DEBUG_OUTPUT
    EXPECT_EQ(captured.size(), 1u);
#else
    EXPECT_TRUE(captured.empty());
#endif
}

TEST_F(DebugLogTest, EmissionTraceReportsOnce) {
    debug::EmissionTrace trace("TestGenerator");
    trace.emitted();
    trace.emitted();
    EXPECT_EQ(trace.count(), 2u);
    trace.exhausted();
    trace.exhausted();
#ifdef ENABLE_DEBUG_OUTPUT
    ASSERT_EQ(captured.size(), 1u);
    EXPECT_NE(captured[0].find("TestGenerator exhausted after 2 objects"), std::string::npos);
#else
    EXPECT_TRUE(captured.empty());
#endif
}
