/**
 * @file test_command_driver.cpp
 * @brief Unit tests for confirmation-gated command execution
 */

#include <gtest/gtest.h>

#include "command_driver.hpp"
#include "debug_session.hpp"
#include "fakes.hpp"

#include <string>
#include <vector>

using namespace lldb_cognitrace;
using namespace lldb_cognitrace::testing;

class CommandDriverTest : public ::testing::Test
{
  protected:
    ExecuteFn Recorder()
    {
        return [this](const std::string& command) { timeline.push_back("exec:" + command); };
    }

    ConfirmFn Answer(bool granted)
    {
        return [this, granted]() {
            ++confirm_calls;
            return granted;
        };
    }

    RecordingConsole console;
    CommandDriver driver{console};
    std::vector<std::string> timeline;
    int confirm_calls = 0;
};

// ============================================================
// Confirmation
// ============================================================

TEST_F(CommandDriverTest, EmptyListDoesNothing)
{
    EXPECT_EQ(driver.Drive({}, Answer(true), Recorder()), 0u);

    EXPECT_EQ(confirm_calls, 0);
    EXPECT_TRUE(timeline.empty());
    EXPECT_TRUE(console.output.empty());
}

TEST_F(CommandDriverTest, DeclineRunsNothing)
{
    EXPECT_EQ(driver.Drive({"bt", "frame variable"}, Answer(false), Recorder()), 0u);

    EXPECT_EQ(confirm_calls, 1);
    EXPECT_TRUE(timeline.empty());
    EXPECT_TRUE(console.commands.empty());
    EXPECT_TRUE(console.Printed("Skipped autonomous commands."));
}

TEST_F(CommandDriverTest, ListsCommandsBeforeAsking)
{
    driver.Drive({"bt", "up", "p y"}, Answer(false), Recorder());

    ASSERT_EQ(console.headers.size(), 1u);
    EXPECT_EQ(console.headers[0], "Suggested Autonomous Commands:");
    EXPECT_TRUE(console.Printed(" 1. bt\n 2. up\n 3. p y\n"));
}

// ============================================================
// Execution
// ============================================================

TEST_F(CommandDriverTest, ApprovedCommandsRunInOrderEachEchoedFirst)
{
    console.timeline = &timeline;

    EXPECT_EQ(driver.Drive({"bt", "up", "frame variable"}, Answer(true), Recorder()), 3u);

    std::vector<std::string> expected = {"echo:bt",       "exec:bt",       "echo:up", "exec:up",
                                         "echo:frame variable", "exec:frame variable"};
    EXPECT_EQ(timeline, expected);
    EXPECT_TRUE(console.Printed("Taking the wheel..."));
}

TEST_F(CommandDriverTest, FailingCommandStopsTheRest)
{
    FakeSession session;
    session.failing_commands = {"up"};

    EXPECT_THROW(driver.Drive({"bt", "up", "frame variable"}, Answer(true),
                              [&session](const std::string& command) { session.ExecuteCommand(command); }),
                 CommandExecutionError);

    EXPECT_EQ(session.executed, (std::vector<std::string>{"bt"}));
    EXPECT_EQ(console.commands, (std::vector<std::string>{"bt", "up"}));
}

TEST_F(CommandDriverTest, CommandsAreRunVerbatim)
{
    std::vector<std::string> seen;
    driver.Drive({"  p   (int)x  "}, Answer(true),
                 [&seen](const std::string& command) { seen.push_back(command); });

    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "  p   (int)x  ");
}

// ============================================================
// Console prompt
// ============================================================

TEST(IsAffirmativeTest, OnlyYesAuthorizes)
{
    EXPECT_TRUE(IsAffirmative("y"));
    EXPECT_TRUE(IsAffirmative("Y"));
    EXPECT_TRUE(IsAffirmative("  y\n"));

    EXPECT_FALSE(IsAffirmative(""));
    EXPECT_FALSE(IsAffirmative("n"));
    EXPECT_FALSE(IsAffirmative("yes"));
    EXPECT_FALSE(IsAffirmative("yy"));
    EXPECT_FALSE(IsAffirmative("sure"));
}

TEST(ConsoleConfirmTest, AsksWithDefaultNo)
{
    RecordingConsole console;
    console.answers = {"y", "no"};
    ConfirmFn confirm = MakeConsoleConfirm(console, "Run?");

    EXPECT_TRUE(confirm());
    EXPECT_FALSE(confirm());
    // Out of input reads as an empty line
    EXPECT_FALSE(confirm());

    ASSERT_EQ(console.prompts.size(), 3u);
    EXPECT_EQ(console.prompts[0], "Run? [y/N]: ");
}
