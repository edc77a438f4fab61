#include <gtest/gtest.h>

#include <string>

#include "repocat/platform.hpp"

using namespace repocat;

TEST(RunCommand, CapturesOutputAndExitStatus) {
    const auto result = platform::run_command("printf 'cloning'; printf ' failed' >&2; exit 3");
    EXPECT_TRUE(result.launched);
    EXPECT_EQ(result.exit_code, 3);
    EXPECT_EQ(result.output, "cloning failed");
}

TEST(RunCommand, ReadsOutputLargerThanOneBuffer) {
    const auto result = platform::run_command("head -c 10000 /dev/zero | tr '\\0' 'x'");
    EXPECT_EQ(result.exit_code, 0);
    EXPECT_EQ(result.output, std::string(10000, 'x'));
}

TEST(RunCommand, RepeatedRunsDoNotExhaustHandles) {
    for (int i = 0; i < 300; ++i) {
        const auto result = platform::run_command("true");
        ASSERT_TRUE(result.launched) << "run " << i;
        ASSERT_EQ(result.exit_code, 0) << "run " << i;
    }
}

TEST(ShellQuote, SurvivesTheShell) {
    const std::string tricky = "it's a $HOME `x` \"path\"";
    const auto result = platform::run_command("printf '%s' " + platform::shell_quote(tricky));
    EXPECT_EQ(result.output, tricky);
}
