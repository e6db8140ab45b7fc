/**
 * @file test_transaction_framer.cpp
 * @brief Prompt framing against adversarial output
 */

#include <tether/core/Error.hpp>
#include <tether/session/TransactionFramer.hpp>

#include <gtest/gtest.h>

using namespace tether;

namespace {

TransactionFramer MakeFramer() { return TransactionFramer("Vivado%", ErrorMarker::Defaults()); }

} // namespace

// =============================================================================
// Prompt detection
// =============================================================================

TEST(TransactionFramer, PromptAtEndCompletes) {
    auto framer = MakeFramer();
    framer.Begin("puts hi");
    EXPECT_FALSE(framer.Feed("hi\n"));
    EXPECT_TRUE(framer.Feed("Vivado% "));
    EXPECT_EQ(framer.Text(), "hi");
}

TEST(TransactionFramer, PromptSplitAcrossChunks) {
    auto framer = MakeFramer();
    framer.Begin("x");
    EXPECT_FALSE(framer.Feed("result\nViv"));
    EXPECT_FALSE(framer.Complete());
    EXPECT_TRUE(framer.Feed("ado% "));
}

TEST(TransactionFramer, PromptInsideLineIsNotBoundary) {
    auto framer = MakeFramer();
    framer.Begin("x");
    EXPECT_FALSE(framer.Feed("the prompt is Vivado% "));
    EXPECT_FALSE(framer.Feed("\nthe prompt is Vivado%"));
}

TEST(TransactionFramer, PromptFollowedByNewlineIsOutput) {
    auto framer = MakeFramer();
    framer.Begin("x");
    EXPECT_FALSE(framer.Feed("Vivado%\n"));
    EXPECT_FALSE(framer.Feed("Vivado% text\n"));
    EXPECT_TRUE(framer.Feed("Vivado% "));
    EXPECT_EQ(framer.Text(), "Vivado%\nVivado% text");
}

TEST(TransactionFramer, LargeOutputOnlyExaminesTail) {
    auto framer = MakeFramer();
    framer.Begin("x");
    std::string big(100000, 'a');
    big += "\nVivado% in the middle\n";
    EXPECT_FALSE(framer.Feed(big));
    EXPECT_TRUE(framer.Feed("Vivado% "));
    EXPECT_EQ(framer.Text().size(), big.size() - 1);
}

TEST(TransactionFramer, CarriageReturnsAndAnsiRemoved) {
    auto framer = MakeFramer();
    framer.Begin("");
    framer.Feed("line1\r\n\x1b[1mbold\x1b[0m\r\nVivado% ");
    EXPECT_TRUE(framer.Complete());
    EXPECT_EQ(framer.Text(), "line1\nbold");
}

TEST(TransactionFramer, EchoLineStripped) {
    auto framer = MakeFramer();
    framer.Begin("get_ports *");
    framer.Feed("get_ports *\nclk rst\nVivado% ");
    EXPECT_EQ(framer.Text(), "clk rst");
}

TEST(TransactionFramer, NonEchoFirstLineKept) {
    auto framer = MakeFramer();
    framer.Begin("puts a");
    framer.Feed("a\nVivado% ");
    EXPECT_EQ(framer.Text(), "a");
}

TEST(TransactionFramer, EndsWithPromptStatic) {
    EXPECT_TRUE(TransactionFramer::EndsWithPrompt("Vivado% ", "Vivado%"));
    EXPECT_TRUE(TransactionFramer::EndsWithPrompt("a\nVivado%\t ", "Vivado%"));
    EXPECT_FALSE(TransactionFramer::EndsWithPrompt("aVivado% ", "Vivado%"));
    EXPECT_FALSE(TransactionFramer::EndsWithPrompt("Viv", "Vivado%"));
    EXPECT_FALSE(TransactionFramer::EndsWithPrompt("Vivado%", ""));
}

// =============================================================================
// Error markers
// =============================================================================

TEST(TransactionFramer, DetectsToolErrorAnywhere) {
    auto framer = MakeFramer();
    std::string text;
    for (int i = 0; i < 20; ++i) {
        text += "INFO: [Synth 8-6157] synthesizing module\n";
    }
    text += "ERROR: [Synth 8-285] failed synthesizing module 'top'\n";
    auto errors = framer.DetectErrors(text);
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_EQ(errors[0], "ERROR: [Synth 8-285] failed synthesizing module 'top'");
}

TEST(TransactionFramer, TclErrorsOnlyNearTop) {
    auto framer = MakeFramer();
    EXPECT_EQ(framer.DetectErrors("invalid command name \"foo\"").size(), 1u);
    const std::string wrong_args =
        "wrong # args: should be \"puts ?-nonewline? ?channelId? string\"";
    EXPECT_EQ(framer.DetectErrors(wrong_args).size(), 1u);

    std::string report;
    for (int i = 0; i < 10; ++i) {
        report += "| row " + std::to_string(i) + " |\n";
    }
    report += "invalid command name in a quoted log\n";
    EXPECT_TRUE(framer.DetectErrors(report).empty());
}

TEST(TransactionFramer, ReportTableErrorColumnIgnored) {
    auto framer = MakeFramer();
    auto errors = framer.DetectErrors("| Timing ERROR | 0 |\n| Check ERROR: none |\nWNS: 0.1");
    EXPECT_TRUE(errors.empty());
}

TEST(TransactionFramer, MarkersAreCaseInsensitive) {
    auto framer = MakeFramer();
    EXPECT_EQ(framer.DetectErrors("error: [Common 17-55] 'get_property' expects").size(), 1u);
}

TEST(TransactionFramer, InvalidMarkerRejected) {
    EXPECT_THROW(TransactionFramer("Vivado%", {ErrorMarker{"([unclosed"}}), ConfigError);
}
