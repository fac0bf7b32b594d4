// =============================================================================
// Unit tests for ActionExecutor (src/action_executor.hpp)
// =============================================================================
#include <gtest/gtest.h>

#include "action_executor.hpp"
#include "fake_process_runner.hpp"

using namespace rampart;
using rampart::test::FakeProcessRunner;
using namespace std::chrono_literals;

namespace {

class ActionExecutorTest : public ::testing::Test {
protected:
    ActionExecutorTest()
        : bridge(runner, config::BridgeConfig{}, "/opt/adb"),
          executor(bridge, "com.my.defense", [this] { return now; }) {}

    FakeProcessRunner runner;
    AdbBridge bridge;
    ActionExecutor::Clock::time_point now{};
    ActionExecutor executor;
};

} // namespace

TEST_F(ActionExecutorTest, TapBuildsInputCommand) {
    runner.on("input tap", 0, "");
    EXPECT_TRUE(executor.tap("emulator-5554", 540, 300));
    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 1u);
    EXPECT_EQ(calls[0], "-s emulator-5554 shell input tap 540 300");
    EXPECT_EQ(executor.actionsSent(), 1u);
    EXPECT_EQ(executor.actionsFailed(), 0u);
}

TEST_F(ActionExecutorTest, SwipeAndLongPress) {
    runner.on("input swipe", 0, "");
    EXPECT_TRUE(executor.swipe("emulator-5554", 100, 200, 300, 400, 250));
    EXPECT_TRUE(executor.longPress("emulator-5554", 50, 60));
    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], "-s emulator-5554 shell input swipe 100 200 300 400 250");
    EXPECT_EQ(calls[1], "-s emulator-5554 shell input swipe 50 60 50 60 1000");
}

TEST_F(ActionExecutorTest, KeyEventsAndLaunch) {
    runner.on("shell", 0, "");
    EXPECT_TRUE(executor.back("emulator-5554"));
    EXPECT_TRUE(executor.sendKeyEvent("emulator-5554", keycode::HOME));
    EXPECT_TRUE(executor.launchApp("emulator-5554"));
    auto calls = runner.calls();
    ASSERT_EQ(calls.size(), 3u);
    EXPECT_EQ(calls[0], "-s emulator-5554 shell input keyevent 4");
    EXPECT_EQ(calls[1], "-s emulator-5554 shell input keyevent 3");
    EXPECT_EQ(calls[2],
              "-s emulator-5554 shell monkey -p com.my.defense -c android.intent.category.LAUNCHER 1");
}

TEST_F(ActionExecutorTest, FailuresReportFalseAndCount) {
    runner.on("input tap", 1, "", "error: device offline");
    runner.timeoutOn("input swipe");
    EXPECT_FALSE(executor.tap("emulator-5554", 1, 2));
    EXPECT_FALSE(executor.swipe("emulator-5554", 1, 2, 3, 4, 100));
    EXPECT_EQ(executor.actionsSent(), 2u);
    EXPECT_EQ(executor.actionsFailed(), 2u);
}

TEST_F(ActionExecutorTest, BridgeUnavailablePropagates) {
    runner.onCall("input tap", [](const std::string&) -> Result<CommandOutput> {
        return Err<CommandOutput>("adb vanished", ErrorCode::BridgeUnavailable);
    });
    EXPECT_THROW(executor.tap("emulator-5554", 1, 2), BridgeUnavailable);
}

TEST_F(ActionExecutorTest, ScreenshotCachedForOneSecond) {
    runner.on("exec-out screencap -p", 0, std::string("\x89PNG\r\n\x1a\n", 8));

    auto first = executor.screenshot("emulator-5554");
    ASSERT_EQ(first.size(), 8u);
    EXPECT_EQ(first[0], 0x89);

    now += 900ms;
    auto second = executor.screenshot("emulator-5554");
    EXPECT_EQ(second, first);
    EXPECT_EQ(runner.count("screencap"), 1u);

    now += 200ms;
    executor.screenshot("emulator-5554");
    EXPECT_EQ(runner.count("screencap"), 2u);
}

TEST_F(ActionExecutorTest, ScreenshotCacheIsPerDevice) {
    runner.on("screencap", 0, "png");
    executor.screenshot("emulator-5554");
    executor.screenshot("emulator-5556");
    EXPECT_EQ(runner.count("screencap"), 2u);

    executor.invalidateCache("emulator-5554");
    executor.screenshot("emulator-5554");
    executor.screenshot("emulator-5556");
    EXPECT_EQ(runner.count("screencap"), 3u);

    executor.invalidateCache();
    executor.screenshot("emulator-5556");
    EXPECT_EQ(runner.count("screencap"), 4u);
}

TEST_F(ActionExecutorTest, ScreenshotFailureIsEmptyAndNotCached) {
    runner.on("screencap", 1, "", "error: closed");
    EXPECT_TRUE(executor.screenshot("emulator-5554").empty());
    runner.timeoutOn("screencap");
    EXPECT_TRUE(executor.screenshot("emulator-5554").empty());
    EXPECT_EQ(runner.count("screencap"), 2u);
}

TEST_F(ActionExecutorTest, SendTextEscapes) {
    runner.on("input text", 0, "");
    EXPECT_TRUE(executor.sendText("emulator-5554", "gg wp"));
    EXPECT_EQ(runner.calls().back(), "-s emulator-5554 shell input text gg%swp");

    // nothing left after escaping -> no command
    EXPECT_TRUE(executor.sendText("emulator-5554", "\n\t"));
    EXPECT_EQ(runner.calls().size(), 1u);
}

TEST(EscapeTextTest, Rules) {
    EXPECT_EQ(ActionExecutor::escapeText("hello world"), "hello%sworld");
    EXPECT_EQ(ActionExecutor::escapeText("a;b"), "a\\;b");
    EXPECT_EQ(ActionExecutor::escapeText("$(rm)"), "\\$\\(rm\\)");
    EXPECT_EQ(ActionExecutor::escapeText("it's"), "it\\'s");
    EXPECT_EQ(ActionExecutor::escapeText("line\nbreak"), "linebreak");
    EXPECT_EQ(ActionExecutor::escapeText(""), "");
}

int main(int argc, char** argv) {
    testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
