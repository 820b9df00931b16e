#include "utils/colors.hpp"
#include "utils/logs.hpp"
#include <gtest/gtest.h>

TEST(ColorsTest, DisabledOutputIsPlainText) {
    Colors::setEnabled(false);
    EXPECT_FALSE(Colors::isEnabled());
    EXPECT_EQ(Colors::red("fail"), "fail");
    EXPECT_EQ(Colors::bold(Colors::green("ok")), "ok");
}

TEST(ColorsTest, EnabledOutputIsWrapped) {
    Colors::setEnabled(true);
    EXPECT_TRUE(Colors::isEnabled());
    EXPECT_EQ(Colors::cyan("info"), Colors::CYAN + "info" + Colors::RESET);
    Colors::setEnabled(false);
}

TEST(LogsTest, DebugIsSilentUnlessVerbose) {
    Colors::setEnabled(false);
    
    Logs::setVerbose(false);
    EXPECT_FALSE(Logs::isVerbose());
    testing::internal::CaptureStdout();
    Logs::debug("hidden");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "");
    
    Logs::setVerbose(true);
    EXPECT_TRUE(Logs::isVerbose());
    testing::internal::CaptureStdout();
    Logs::debug("shown");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "[DEBUG] shown\n");
    Logs::setVerbose(false);
}

TEST(LogsTest, InfoGoesToStdout) {
    Colors::setEnabled(false);
    testing::internal::CaptureStdout();
    Logs::info("loaded");
    EXPECT_EQ(testing::internal::GetCapturedStdout(), "[INFO] loaded\n");
}
