#pragma once

/**
 * @file ReportArchive.hpp
 * @brief Full-text report artifacts on disk and paged reads back out of them
 *
 * Reports too large to return inline are written under a per-process reports
 * directory as `<kind>_<id>.txt`, where id is 8 hex digits. Files older than
 * the configured cache age are removed whenever the directory is prepared.
 */

#include <tether/report/Envelope.hpp>
#include <tether/session/SessionConfig.hpp>
#include <tether/session/Transaction.hpp>

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace tether {

class Session;

struct ReportRecord {
    std::string id;
    std::string path;
    std::string kind;
    std::chrono::system_clock::time_point created;
    std::uintmax_t size_bytes = 0;
    std::size_t line_count = 0;
};

/// Result of generating a report artifact
struct FullReport {
    Transaction transaction;

    /// Set when the command completed without engine errors and the file was written
    std::optional<ReportRecord> record;

    [[nodiscard]] bool Ok() const { return record.has_value(); }
};

/// Character-range read
struct ReportSection {
    std::string path;
    std::size_t offset = 0;
    std::size_t total_length = 0;
    std::string content;
};

/// Line-range read (lines are 1-based)
struct ReportLines {
    std::string path;
    std::size_t start_line = 0;
    std::size_t end_line = 0;
    std::size_t total_lines = 0;
    std::size_t returned_lines = 0;
    std::string content;

    /// False when a search pattern was given and nothing matched (content empty)
    bool pattern_found = true;
};

class ReportArchive {
  public:
    explicit ReportArchive(EnvelopeConfig config = {});

    /// Create the reports directory and remove expired reports
    std::filesystem::path Prepare();

    /// Remove reports older than the cache age. @return number of files removed
    std::size_t Cleanup();

    /// Fresh 8-hex-digit report id
    [[nodiscard]] static std::string NewReportId();

    /// `<reports_dir>/<kind>_<id>.txt`
    [[nodiscard]] std::filesystem::path ReportPath(const std::string &kind,
                                                   const std::string &id) const;

    /**
     * @brief Run `command` and store its complete output at `destination`
     *
     * The response is written verbatim; only metadata is returned. With no
     * destination the file goes to ReportPath(kind, NewReportId()).
     *
     * @throws IOError if the file cannot be written
     */
    FullReport GenerateFullReport(Session &session, const std::string &command,
                                  const std::string &kind,
                                  const std::optional<std::string> &destination = std::nullopt,
                                  std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /**
     * @brief Envelope `content`; when truncated, also archive the full text
     *
     * The artifact path is reported in Envelope::artifact_path.
     */
    Envelope Wrap(const std::string &content, std::size_t max_chars, const std::string &kind);

    /// Record an existing file under a new id
    ReportRecord Register(const std::string &path, const std::string &kind);

    /**
     * @brief Path of a report by id
     *
     * Looks in the id cache first, then for `*_<id>.txt` in the reports directory.
     * @throws ReportError::FileNotFound
     */
    [[nodiscard]] std::string Resolve(const std::string &id) const;

    [[nodiscard]] std::optional<ReportRecord> Find(const std::string &id) const;

    /**
     * @brief Read `length` characters starting at `offset`
     *
     * A range running past the end is clipped.
     * @throws ReportError FileNotFound, RangeOutOfBounds (offset > file length)
     */
    [[nodiscard]] static ReportSection ReadReportSection(const std::string &path,
                                                         std::size_t offset, std::size_t length);

    /**
     * @brief Read `num_lines` lines starting at `start_line`
     *
     * With a search pattern (case-insensitive regex) the window is placed so
     * the first matching line sits a quarter of the way into it.
     *
     * @throws ReportError::FileNotFound, ConfigError for an invalid pattern
     */
    [[nodiscard]] static ReportLines
    ReadReportLines(const std::string &path, std::size_t start_line = 1,
                    std::size_t num_lines = 100,
                    const std::optional<std::string> &search_pattern = std::nullopt);

    [[nodiscard]] const EnvelopeConfig &Config() const { return config_; }

  private:
    ReportRecord Store(const std::string &id, const std::filesystem::path &path,
                       const std::string &kind, const std::string &text);

    EnvelopeConfig config_;
    mutable std::mutex cache_mutex_;
    std::map<std::string, ReportRecord> cache_;
};

} // namespace tether
