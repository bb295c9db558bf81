#include "wslint/core/check_result.hpp"
#include "wslint/core/line_classifier.hpp"
#include "wslint/core/line_fixer.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace wslint::core {

class MockReporter : public IReporter {
public:
    MOCK_METHOD(void, report_diagnostic, (const Diagnostic& diagnostic), (override));
    MOCK_METHOD(void, report_error,
                (const std::string& verb, const std::string& subject, const std::string& message),
                (override));
    MOCK_METHOD(void, report_outcome,
                (const std::string& path, FileOutcome outcome, const CheckResult& totals),
                (override));
    MOCK_METHOD(void, report_summary, (const RunSummary& summary), (override));
};

using Tags = std::vector<std::string_view>;

class LineFixerTest : public ::testing::Test {
protected:
    Config config_{.expand_tabs = false, .tab_size = 4, .line_length = 80};
    Config expanding_{.expand_tabs = true, .tab_size = 4, .line_length = 80};
};

TEST_F(LineFixerTest, CleanLineIsBorrowed)
{
    std::string line = "int x = 1;\n";
    auto fixed = fix_line(config_, line);

    EXPECT_FALSE(fixed.modified());
    EXPECT_TRUE(fixed.tags.empty());
    EXPECT_EQ(fixed.view().data(), line.data());
    EXPECT_EQ(fixed.view(), line);
}

TEST_F(LineFixerTest, ExpandsTabs)
{
    auto fixed = fix_line(expanding_, "a\tb\n");

    EXPECT_TRUE(fixed.modified());
    EXPECT_EQ(fixed.view(), "a    b\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_EXPANDED_TABS}));
}

TEST_F(LineFixerTest, ExpandsEveryTabToFullTabSize)
{
    Config two{.expand_tabs = true, .tab_size = 2, .line_length = 80};
    EXPECT_EQ(fix_line(two, "\t\tx\ty\n").view(), "    x  y\n");
}

TEST_F(LineFixerTest, TabsAfterContentReportedNotRewritten)
{
    std::string line = "\t\ta\tb\n";
    auto fixed = fix_line(config_, line);

    EXPECT_FALSE(fixed.modified());
    EXPECT_EQ(fixed.view(), line);
    EXPECT_EQ(fixed.tags, (Tags{TAG_TABS_AFTER_OTHER}));
}

TEST_F(LineFixerTest, FixesWindowsLineEnding)
{
    auto fixed = fix_line(config_, "foo\r\n");
    EXPECT_EQ(fixed.view(), "foo\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_WINDOWS_ENDING}));
}

TEST_F(LineFixerTest, FixesMacLineEnding)
{
    auto fixed = fix_line(config_, "foo\r");
    EXPECT_EQ(fixed.view(), "foo\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_MAC_ENDING}));
}

TEST_F(LineFixerTest, RemovesTrailingWhitespace)
{
    auto fixed = fix_line(config_, "foo   \n");
    EXPECT_EQ(fixed.view(), "foo\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, WhitespaceOnlyLineBecomesEmpty)
{
    auto fixed = fix_line(config_, "  \t \n");
    EXPECT_EQ(fixed.view(), "\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_TABS_AFTER_OTHER, TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, FragmentWithoutTerminatorGetsNoNewline)
{
    auto fixed = fix_line(config_, "foo  ");
    EXPECT_EQ(fixed.view(), "foo");
    EXPECT_EQ(fixed.tags, (Tags{TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, SingleSpaceFragmentBecomesEmpty)
{
    auto fixed = fix_line(config_, " ");
    EXPECT_EQ(fixed.view(), "");
    EXPECT_EQ(fixed.tags, (Tags{TAG_TRAILING_WHITESPACE}));
    EXPECT_TRUE(classify_line(config_, fixed.view()).clean());

    auto expanded = fix_line(expanding_, "\t");
    EXPECT_EQ(expanded.view(), "");
    EXPECT_EQ(expanded.tags, (Tags{TAG_EXPANDED_TABS, TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, RemovesUnicodeTrailingWhitespace)
{
    auto fixed = fix_line(config_, "foo \xC2\xA0\xE3\x80\x80\n");
    EXPECT_EQ(fixed.view(), "foo\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_TRAILING_WHITESPACE}));
    EXPECT_TRUE(classify_line(config_, fixed.view()).clean());

    auto kept = fix_line(config_, "caf\xC3\xA9 \r\n");
    EXPECT_EQ(kept.view(), "caf\xC3\xA9\n");
    EXPECT_EQ(kept.tags, (Tags{TAG_WINDOWS_ENDING, TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, LongLineReportedNotRewritten)
{
    std::string line = "\t" + std::string(77, 'x') + "\n";
    auto fixed = fix_line(config_, line);

    EXPECT_FALSE(fixed.modified());
    EXPECT_EQ(fixed.view(), line);
    EXPECT_EQ(fixed.tags, (Tags{TAG_LINE_TOO_LONG}));
}

TEST_F(LineFixerTest, LengthRecomputedAfterFixes)
{
    // Only the trailing blanks push this line over the limit
    auto fixed = fix_line(config_, std::string(80, 'x') + "   \n");
    EXPECT_EQ(fixed.view(), std::string(80, 'x') + "\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, ExpandedTabsCanStillBeTooLong)
{
    auto fixed = fix_line(expanding_, "\t" + std::string(77, 'x') + "\n");
    EXPECT_EQ(fixed.view(), "    " + std::string(77, 'x') + "\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_EXPANDED_TABS, TAG_LINE_TOO_LONG}));
}

TEST_F(LineFixerTest, TagsInDetectionOrder)
{
    auto fixed = fix_line(expanding_, "a\tb \r\n");
    EXPECT_EQ(fixed.view(), "a    b\n");
    EXPECT_EQ(fixed.tags, (Tags{TAG_WINDOWS_ENDING, TAG_EXPANDED_TABS, TAG_TRAILING_WHITESPACE}));

    auto mac = fix_line(config_, "x\ty \r");
    EXPECT_EQ(mac.view(), "x\ty\n");
    EXPECT_EQ(mac.tags, (Tags{TAG_MAC_ENDING, TAG_TABS_AFTER_OTHER, TAG_TRAILING_WHITESPACE}));
}

TEST_F(LineFixerTest, FixedLinesHaveNoFixableViolations)
{
    const std::vector<std::string> lines = {
        "a\tb \r\n", "  \t \n", "foo\r", "\t\tx\ty\t\n", "   ", "\r\n", "x \t\r",
    };

    for (const auto& config : {config_, expanding_}) {
        for (const auto& line : lines) {
            auto fixed = fix_line(config, line);
            EXPECT_EQ(classify_line(config, fixed.view()).fixable, 0u) << "line: " << line;

            auto again = fix_line(config, fixed.view());
            EXPECT_EQ(again.view(), fixed.view()) << "line: " << line;
        }
    }
}

TEST_F(LineFixerTest, ReportsDiagnosticForViolatingLine)
{
    MockReporter reporter;
    Diagnostic expected{.file_path = "src/a.c",
                        .line_number = 7,
                        .tags = {"fixed windows line ending", "removed whitespace from end"}};
    EXPECT_CALL(reporter, report_diagnostic(expected)).Times(1);

    auto fixed = fix_line(config_, "src/a.c", 7, "x \r\n", reporter);
    EXPECT_EQ(fixed.view(), "x\n");
}

TEST_F(LineFixerTest, NoDiagnosticForCleanLine)
{
    MockReporter reporter;
    EXPECT_CALL(reporter, report_diagnostic(::testing::_)).Times(0);

    fix_line(config_, "src/a.c", 1, "fine\n", reporter);
}

} // namespace wslint::core
