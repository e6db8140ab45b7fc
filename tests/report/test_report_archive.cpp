/**
 * @file test_report_archive.cpp
 * @brief Report artifacts on disk and paged reads
 */

#include <tether/core/Error.hpp>
#include <tether/report/ReportArchive.hpp>
#include <tether/session/Session.hpp>

#include "testing/FakeEngine.hpp"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <limits>
#include <sstream>

using namespace tether;
using tether::testing::FakeEngine;
using tether::testing::FakeReply;
using std::chrono::milliseconds;

namespace fs = std::filesystem;

class ReportArchiveTest : public ::testing::Test {
  protected:
    void SetUp() override {
        dir = fs::temp_directory_path() / ("tether_archive_" + ReportArchive::NewReportId());
        config.reports_dir = dir.string();
        config.max_chars = 64;
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    std::string WriteFile(const std::string &name, const std::string &text) {
        fs::create_directories(dir);
        const auto path = dir / name;
        std::ofstream(path, std::ios::binary) << text;
        return path.string();
    }

    static std::string Slurp(const std::string &path) {
        std::ifstream in(path, std::ios::binary);
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    static std::string NumberedLines(int count) {
        std::string text;
        for (int i = 1; i <= count; ++i) {
            text += "line " + std::to_string(i) + "\n";
        }
        return text;
    }

    fs::path dir;
    EnvelopeConfig config;
};

// =============================================================================
// Configuration and housekeeping
// =============================================================================

TEST_F(ReportArchiveTest, RejectsInvalidConfig) {
    config.max_chars = 0;
    EXPECT_THROW(ReportArchive{config}, ConfigError);
}

TEST_F(ReportArchiveTest, PrepareCreatesDirectory) {
    ReportArchive archive(config);
    EXPECT_FALSE(fs::exists(dir));
    EXPECT_EQ(archive.Prepare(), dir);
    EXPECT_TRUE(fs::is_directory(dir));
}

TEST_F(ReportArchiveTest, ReportIdsAreEightHexDigits) {
    const auto id = ReportArchive::NewReportId();
    ASSERT_EQ(id.size(), 8u);
    EXPECT_EQ(id.find_first_not_of("0123456789abcdef"), std::string::npos);

    ReportArchive archive(config);
    EXPECT_EQ(archive.ReportPath("timing", "0badf00d"), dir / "timing_0badf00d.txt");
}

TEST_F(ReportArchiveTest, CleanupRemovesExpiredReports) {
    const auto old_path = WriteFile("timing_00000001.txt", "old");
    const auto fresh_path = WriteFile("timing_00000002.txt", "fresh");
    const auto other_path = WriteFile("notes.log", "kept");
    fs::last_write_time(old_path, fs::file_time_type::clock::now() - std::chrono::hours(3));

    ReportArchive archive(config);
    EXPECT_EQ(archive.Cleanup(), 1u);
    EXPECT_FALSE(fs::exists(old_path));
    EXPECT_TRUE(fs::exists(fresh_path));
    EXPECT_TRUE(fs::exists(other_path));
}

// =============================================================================
// Wrap / Resolve
// =============================================================================

TEST_F(ReportArchiveTest, WrapKeepsShortContentInline) {
    ReportArchive archive(config);
    auto env = archive.Wrap("short", 64, "utilization");
    EXPECT_FALSE(env.truncated);
    EXPECT_FALSE(env.artifact_path.has_value());
    EXPECT_FALSE(fs::exists(dir));
}

TEST_F(ReportArchiveTest, WrapArchivesFullTextWhenTruncated) {
    ReportArchive archive(config);
    const auto text = NumberedLines(40);
    auto env = archive.Wrap(text, 64, "utilization");

    ASSERT_TRUE(env.truncated);
    ASSERT_TRUE(env.artifact_path.has_value());
    EXPECT_EQ(env.content.size(), 64u);
    EXPECT_EQ(Slurp(*env.artifact_path), text);

    const auto stem = fs::path(*env.artifact_path).stem().string();
    ASSERT_EQ(stem.rfind("utilization_", 0), 0u);
    const auto id = stem.substr(std::string("utilization_").size());
    EXPECT_EQ(archive.Resolve(id), *env.artifact_path);
    ASSERT_TRUE(archive.Find(id).has_value());
    EXPECT_EQ(archive.Find(id)->line_count, 40u);
}

TEST_F(ReportArchiveTest, ResolveFallsBackToDirectoryScan) {
    const auto path = WriteFile("drc_cafe0123.txt", "DRC\n");
    ReportArchive archive(config);
    EXPECT_EQ(archive.Resolve("cafe0123"), path);
}

TEST_F(ReportArchiveTest, ResolveUnknownIdThrows) {
    ReportArchive archive(config);
    try {
        (void)archive.Resolve("deadbeef");
        FAIL() << "expected ReportError";
    } catch (const ReportError &e) {
        EXPECT_EQ(e.kind(), ReportErrorKind::FileNotFound);
        EXPECT_EQ(e.category(), "report");
    }
}

// =============================================================================
// Paged reads
// =============================================================================

TEST_F(ReportArchiveTest, ReadSectionByOffset) {
    const auto path = WriteFile("r.txt", "0123456789");
    auto section = ReportArchive::ReadReportSection(path, 3, 4);
    EXPECT_EQ(section.content, "3456");
    EXPECT_EQ(section.offset, 3u);
    EXPECT_EQ(section.total_length, 10u);
}

TEST_F(ReportArchiveTest, ReadSectionClipsAtEnd) {
    const auto path = WriteFile("r.txt", "0123456789");
    EXPECT_EQ(ReportArchive::ReadReportSection(path, 8, 100).content, "89");
    EXPECT_EQ(ReportArchive::ReadReportSection(path, 10, 5).content, "");
}

TEST_F(ReportArchiveTest, ReadSectionFromLargeFileTail) {
    const std::string body(1 << 20, 'x');
    const auto path = WriteFile("big.txt", body + "TAIL");
    auto section = ReportArchive::ReadReportSection(path, body.size(),
                                                    std::numeric_limits<std::size_t>::max());
    EXPECT_EQ(section.content, "TAIL");
    EXPECT_EQ(section.total_length, body.size() + 4);
}

TEST_F(ReportArchiveTest, ReadSectionPastEndThrows) {
    const auto path = WriteFile("r.txt", "0123456789");
    try {
        (void)ReportArchive::ReadReportSection(path, 11, 1);
        FAIL() << "expected ReportError";
    } catch (const ReportError &e) {
        EXPECT_EQ(e.kind(), ReportErrorKind::RangeOutOfBounds);
    }
}

TEST_F(ReportArchiveTest, ReadMissingFileThrows) {
    EXPECT_THROW((void)ReportArchive::ReadReportSection((dir / "none.txt").string(), 0, 10),
                 ReportError);
    EXPECT_THROW((void)ReportArchive::ReadReportLines((dir / "none.txt").string()), ReportError);
}

TEST_F(ReportArchiveTest, ReadLinesWindow) {
    const auto path = WriteFile("r.txt", NumberedLines(10));
    auto lines = ReportArchive::ReadReportLines(path, 4, 3);
    EXPECT_EQ(lines.start_line, 4u);
    EXPECT_EQ(lines.end_line, 6u);
    EXPECT_EQ(lines.returned_lines, 3u);
    EXPECT_EQ(lines.total_lines, 10u);
    EXPECT_EQ(lines.content, "line 4\nline 5\nline 6\n");
}

TEST_F(ReportArchiveTest, ReadLinesWindowClipsAtEnd) {
    const auto path = WriteFile("r.txt", NumberedLines(10));
    auto lines = ReportArchive::ReadReportLines(path, 9, 100);
    EXPECT_EQ(lines.end_line, 10u);
    EXPECT_EQ(lines.returned_lines, 2u);
}

TEST_F(ReportArchiveTest, ReadLinesUnboundedCountReturnsRest) {
    const auto path = WriteFile("r.txt", NumberedLines(10));
    auto lines =
        ReportArchive::ReadReportLines(path, 8, std::numeric_limits<std::size_t>::max());
    EXPECT_EQ(lines.start_line, 8u);
    EXPECT_EQ(lines.end_line, 10u);
    EXPECT_EQ(lines.returned_lines, 3u);
    EXPECT_EQ(lines.content, "line 8\nline 9\nline 10\n");
}

TEST_F(ReportArchiveTest, SearchPlacesMatchAQuarterIntoWindow) {
    const auto path = WriteFile("r.txt", NumberedLines(100));
    auto lines = ReportArchive::ReadReportLines(path, 1, 20, "LINE 50$");
    EXPECT_TRUE(lines.pattern_found);
    EXPECT_EQ(lines.start_line, 45u);
    EXPECT_EQ(lines.returned_lines, 20u);
    EXPECT_NE(lines.content.find("line 50\n"), std::string::npos);
}

TEST_F(ReportArchiveTest, SearchNearTopStartsAtFirstLine) {
    const auto path = WriteFile("r.txt", NumberedLines(100));
    auto lines = ReportArchive::ReadReportLines(path, 1, 40, "line 2\\b");
    EXPECT_EQ(lines.start_line, 1u);
}

TEST_F(ReportArchiveTest, SearchWithoutMatch) {
    const auto path = WriteFile("r.txt", NumberedLines(5));
    auto lines = ReportArchive::ReadReportLines(path, 1, 10, "slack");
    EXPECT_FALSE(lines.pattern_found);
    EXPECT_TRUE(lines.content.empty());
    EXPECT_EQ(lines.total_lines, 5u);
}

TEST_F(ReportArchiveTest, InvalidSearchPatternThrows) {
    const auto path = WriteFile("r.txt", NumberedLines(5));
    EXPECT_THROW((void)ReportArchive::ReadReportLines(path, 1, 10, "([unclosed"), ConfigError);
}

// =============================================================================
// GenerateFullReport
// =============================================================================

class FullReportTest : public ReportArchiveTest {
  protected:
    void SetUp() override {
        ReportArchiveTest::SetUp();
        engine = std::make_shared<FakeEngine>();
        SessionConfig session_config;
        session_config.startup_timeout = milliseconds{1000};
        session_config.command_timeout = milliseconds{1000};
        session_config.resync_timeout = milliseconds{300};
        session_config.exit_grace = milliseconds{50};
        session = std::make_unique<Session>(session_config, engine->Factory());
    }

    std::shared_ptr<FakeEngine> engine;
    std::unique_ptr<Session> session;
};

TEST_F(FullReportTest, WritesCompleteOutput) {
    engine->On("report_utilization -return_string", NumberedLines(300));
    session->Start();

    ReportArchive archive(config);
    auto full = archive.GenerateFullReport(*session, "report_utilization -return_string",
                                           "utilization");
    ASSERT_TRUE(full.Ok());
    EXPECT_TRUE(full.transaction.Ok());
    EXPECT_EQ(full.record->kind, "utilization");
    EXPECT_EQ(full.record->line_count, 300u);
    EXPECT_EQ(fs::path(full.record->path).parent_path(), dir);

    // The artifact holds everything regardless of the inline budget
    const auto text = Slurp(full.record->path);
    EXPECT_GT(text.size(), config.max_chars);
    EXPECT_EQ(text, full.transaction.raw);
    EXPECT_EQ(archive.Resolve(full.record->id), full.record->path);
}

TEST_F(FullReportTest, ExplicitDestination) {
    engine->On("report_clocks -return_string", "clk 10.000 {0.000 5.000}");
    session->Start();

    ReportArchive archive(config);
    const auto dest = (dir / "custom" / "clocks.rpt").string();
    auto full = archive.GenerateFullReport(*session, "report_clocks -return_string", "clocks",
                                           dest);
    ASSERT_TRUE(full.Ok());
    EXPECT_EQ(full.record->path, dest);
    EXPECT_EQ(Slurp(dest), "clk 10.000 {0.000 5.000}");
}

TEST_F(FullReportTest, EngineErrorWritesNothing) {
    engine->On("report_timing_summary -return_string",
               "ERROR: [Common 17-53] User Exception: No open design.");
    session->Start();

    ReportArchive archive(config);
    auto full = archive.GenerateFullReport(*session, "report_timing_summary -return_string",
                                           "timing");
    EXPECT_FALSE(full.Ok());
    EXPECT_TRUE(full.transaction.HasError());
    ASSERT_TRUE(fs::is_directory(dir));
    EXPECT_TRUE(fs::is_empty(dir));
}
