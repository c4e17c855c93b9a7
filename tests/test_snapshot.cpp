/**
 * @file test_snapshot.cpp
 * @brief Unit tests for snapshot capture and the source line cache
 */

#include <gtest/gtest.h>

#include "fakes.hpp"
#include "snapshot.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

using namespace lldb_cognitrace;
using namespace lldb_cognitrace::testing;

namespace fs = std::filesystem;

namespace
{
// Writes "line 1" .. "line N" to a fresh temporary file
class TempSource
{
  public:
    explicit TempSource(int lines, const std::string& tag = "src")
    {
        path_ = fs::temp_directory_path() /
                ("cognitrace_" + tag + "_" +
                 std::to_string(std::chrono::steady_clock::now().time_since_epoch().count()) +
                 ".c");
        Write(lines, "line ");
    }
    ~TempSource()
    {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void Write(int lines, const std::string& prefix)
    {
        std::ofstream out(path_);
        for (int i = 1; i <= lines; ++i)
            out << prefix << i << "   \n";
    }

    std::string Path() const { return path_.string(); }

  private:
    fs::path path_;
};

uint32_t LineNumberOf(const std::string& annotated)
{
    // "--> 12: text" or "    12: text"
    return static_cast<uint32_t>(std::stoul(annotated.substr(4)));
}
} // namespace

class SnapshotBuilderTest : public ::testing::Test
{
  protected:
    SnapshotBuilder Builder() { return SnapshotBuilder(settings, console, sources); }

    Settings settings;
    RecordingConsole console;
    SourceCache sources;
    NodePool pool;
    FakeFrame frame;
};

// ============================================================
// Source window
// ============================================================

TEST_F(SnapshotBuilderTest, SourceWindowIsCenteredOnCurrentLine)
{
    TempSource source(50);
    frame.path = source.Path();
    frame.line = 20;

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.source_window.size(), 11u);
    EXPECT_EQ(snapshot.source_window.front(), "    15: line 15");
    EXPECT_EQ(snapshot.source_window[5], "--> 20: line 20");
    EXPECT_EQ(snapshot.source_window.back(), "    25: line 25");
}

TEST_F(SnapshotBuilderTest, SourceWindowClampsAtFirstLine)
{
    TempSource source(50);
    frame.path = source.Path();
    frame.line = 2;

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.source_window.size(), 7u);
    EXPECT_EQ(snapshot.source_window[0], "    1: line 1");
    EXPECT_EQ(snapshot.source_window[1], "--> 2: line 2");
}

TEST_F(SnapshotBuilderTest, SourceWindowStopsAtEndOfFile)
{
    TempSource source(50);
    frame.path = source.Path();
    frame.line = 48;

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.source_window.size(), 8u);
    EXPECT_EQ(snapshot.source_window.back(), "    50: line 50");
}

TEST_F(SnapshotBuilderTest, EveryLineMarksExactlyTheCurrentLine)
{
    TempSource source(30);
    frame.path = source.Path();
    SnapshotBuilder builder = Builder();

    for (uint32_t line = 1; line <= 30; ++line)
    {
        frame.line = line;
        Snapshot snapshot = builder.Capture(frame, nullptr);

        EXPECT_LE(snapshot.source_window.size(), 11u);
        int marked = 0;
        for (const auto& annotated : snapshot.source_window)
        {
            uint32_t number = LineNumberOf(annotated);
            EXPECT_GE(number, 1u);
            if (annotated.compare(0, 4, "--> ") == 0)
            {
                ++marked;
                EXPECT_EQ(number, line);
            }
        }
        EXPECT_EQ(marked, 1) << "line " << line;
    }
}

TEST_F(SnapshotBuilderTest, MissingSourceGivesPlaceholder)
{
    frame.path = "/nonexistent/cognitrace/main.c";
    frame.line = 42;

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.source_window.size(), 1u);
    EXPECT_EQ(snapshot.source_window[0], "<Source not available for /nonexistent/cognitrace/main.c>");
    EXPECT_FALSE(console.warnings.empty());
}

TEST_F(SnapshotBuilderTest, LinePastEndOfFileGivesPlaceholder)
{
    TempSource source(10);
    frame.path = source.Path();
    frame.line = 500;

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.source_window.size(), 1u);
    EXPECT_NE(snapshot.source_window[0].find("<Source not available for"), std::string::npos);
    EXPECT_FALSE(console.warnings.empty());
}

TEST_F(SnapshotBuilderTest, NoLineInformationGivesPlaceholder)
{
    frame.path = "";
    frame.line = 0;

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.source_window.size(), 1u);
    EXPECT_EQ(snapshot.source_window[0], "<Source not available for <unknown file>>");
}

TEST_F(SnapshotBuilderTest, SourcePathErrorDegrades)
{
    frame.throw_on_path = true;
    frame.line = 3;

    Snapshot snapshot;
    EXPECT_NO_THROW(snapshot = Builder().Capture(frame, nullptr));
    ASSERT_EQ(snapshot.source_window.size(), 1u);
    EXPECT_EQ(console.warnings.size(), 1u);
}

TEST(SourceCacheTest, ReloadsFileWhenModified)
{
    TempSource source(5);
    SourceCache cache;

    auto before = cache.GetLines(source.Path(), 1, 1);
    ASSERT_EQ(before.size(), 1u);
    EXPECT_EQ(before[0].second, "line 1   ");

    auto stamp = fs::last_write_time(source.Path());
    source.Write(5, "changed ");
    fs::last_write_time(source.Path(), stamp + std::chrono::hours(1));

    auto after = cache.GetLines(source.Path(), 1, 1);
    ASSERT_EQ(after.size(), 1u);
    EXPECT_EQ(after[0].second, "changed 1   ");
}

TEST(SourceCacheTest, MissingFileThrows)
{
    SourceCache cache;
    EXPECT_THROW(cache.GetLines("/nonexistent/cognitrace.c", 1, 3), std::runtime_error);
}

// ============================================================
// Variables
// ============================================================

TEST_F(SnapshotBuilderTest, VariablesKeepBindingOrder)
{
    frame.variables = {pool.Scalar("zeta", "1"), pool.Scalar("alpha", "2"),
                       pool.Scalar("mid", "3")};

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.variables.size(), 3u);
    EXPECT_EQ(snapshot.variables[0], std::make_pair(std::string("zeta"), std::string("1")));
    EXPECT_EQ(snapshot.variables[1], std::make_pair(std::string("alpha"), std::string("2")));
    EXPECT_EQ(snapshot.variables[2], std::make_pair(std::string("mid"), std::string("3")));
}

TEST_F(SnapshotBuilderTest, ShadowedVariableKeepsFirstBinding)
{
    frame.variables = {pool.Scalar("i", "7"), pool.Scalar("i", "0")};

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.variables.size(), 1u);
    EXPECT_EQ(snapshot.variables[0].second, "7");
}

TEST_F(SnapshotBuilderTest, LargeVariablesAreTruncated)
{
    frame.variables = {pool.String("blob", std::string(100000, 'b')),
                       pool.Sequence("samples", 5000000)};

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.variables.size(), 2u);
    for (const auto& [name, text] : snapshot.variables)
        EXPECT_LE(text.size(), 500u) << name;
}

TEST_F(SnapshotBuilderTest, VariableThatFailsToRenderIsMarked)
{
    FakeNode* broken = pool.Scalar("broken", "?");
    broken->throw_on_text = true;
    frame.variables = {broken, pool.Scalar("ok", "1")};

    Snapshot snapshot = Builder().Capture(frame, nullptr);

    ASSERT_EQ(snapshot.variables.size(), 2u);
    EXPECT_EQ(snapshot.variables[0].first, "broken");
    EXPECT_EQ(snapshot.variables[0].second, "<unavailable: boom>");
    EXPECT_EQ(snapshot.variables[1].second, "1");
    EXPECT_EQ(console.warnings.size(), 1u);
}

TEST_F(SnapshotBuilderTest, UnreadableFrameGivesNoVariables)
{
    frame.throw_on_variables = true;

    Snapshot snapshot;
    EXPECT_NO_THROW(snapshot = Builder().Capture(frame, nullptr));
    EXPECT_TRUE(snapshot.variables.empty());
    EXPECT_FALSE(console.warnings.empty());
}

TEST_F(SnapshotBuilderTest, ConfiguredLimitBoundsEveryField)
{
    settings.max_value_length = 40;
    TempSource source(20);
    frame.path = source.Path();
    frame.line = 10;
    frame.function = std::string(300, 'f');
    frame.variables = {pool.String("s", std::string(300, 's'))};
    FailureContext failure{"SIGSEGV", std::string(300, 'm')};

    Snapshot snapshot = Builder().Capture(frame, &failure);

    EXPECT_LE(snapshot.function_name.size(), 40u);
    EXPECT_LE(snapshot.exception_summary.size(), 40u);
    for (const auto& line : snapshot.source_window)
        EXPECT_LE(line.size(), 40u);
    for (const auto& [name, text] : snapshot.variables)
        EXPECT_LE(text.size(), 40u);
}

// ============================================================
// Failure summary
// ============================================================

TEST(FormatFailureTest, TypeAndMessage)
{
    EXPECT_EQ(FormatFailure({"SIGFPE", "integer divide by zero"}), "SIGFPE: integer divide by zero");
    EXPECT_EQ(FormatFailure({"SIGABRT", ""}), "SIGABRT");
    EXPECT_EQ(FormatFailure({"", "odd"}), "Failure: odd");
}

TEST_F(SnapshotBuilderTest, DivisionByZeroScenario)
{
    TempSource source(60);
    frame.path = source.Path();
    frame.function = "risky_calculation";
    frame.line = 42;
    frame.variables = {pool.Scalar("x", "10"), pool.Scalar("y", "0")};
    SnapshotBuilder builder = Builder();

    Snapshot at_breakpoint = builder.Capture(frame, nullptr);
    EXPECT_EQ(at_breakpoint.exception_summary, "Breakpoint (No Exception)");
    EXPECT_EQ(at_breakpoint.function_name, "risky_calculation");
    EXPECT_EQ(at_breakpoint.line_number, 42u);
    ASSERT_EQ(at_breakpoint.variables.size(), 2u);
    EXPECT_EQ(at_breakpoint.variables[0].first, "x");
    EXPECT_EQ(at_breakpoint.variables[1].second, "0");

    FailureContext failure{"SIGFPE", "integer divide by zero"};
    Snapshot post_mortem = builder.Capture(frame, &failure);
    EXPECT_NE(post_mortem.exception_summary.find("SIGFPE"), std::string::npos);
    EXPECT_NE(post_mortem.exception_summary.find("divide by zero"), std::string::npos);
}
