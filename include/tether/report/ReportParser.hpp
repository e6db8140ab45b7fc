#pragma once

/**
 * @file ReportParser.hpp
 * @brief Stateless conversion of engine report text into ParsedReport
 *
 * Parsing never throws on malformed input. Missing required fields set
 * ParsedReport::parse_incomplete and are listed in missing_fields; the raw
 * text always travels with the result.
 *
 * List-shaped query output follows two conventions:
 * - a single-line Tcl list (what get_cells / get_nets / get_ports return)
 * - one record per line, "name attribute" (e.g. a foreach that prints
 *   REF_NAME or DIRECTION next to each object)
 * Lines beginning with an engine message prefix (ERROR:, WARNING:, ...) are
 * not records.
 */

#include <tether/report/ParsedReport.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>

namespace tether {

class ReportParser {
  public:
    /// Dispatch on kind with default options
    [[nodiscard]] static ParsedReport Parse(ReportKind kind, const std::string &raw);

    /// report_timing_summary: "LABEL: value" lines or the tabular design summary
    [[nodiscard]] static ParsedReport ParseTimingSummary(const std::string &raw);

    /// report_timing: one block per path, each starting at a "Slack" line
    [[nodiscard]] static ParsedReport ParseTimingPaths(const std::string &raw,
                                                       std::size_t max_paths = 5);

    /// report_utilization: LUT / FF / BRAM / DSP / IO rows, columns mapped by header
    [[nodiscard]] static ParsedReport ParseUtilization(const std::string &raw);

    /// get_cells -hierarchical output; depth = number of '/' separators
    [[nodiscard]] static ParsedReport
    ParseHierarchy(const std::string &raw, std::optional<int> max_depth = std::nullopt,
                   const std::map<std::string, std::string> &refs = {});

    /// report_clocks
    [[nodiscard]] static ParsedReport ParseClocks(const std::string &raw);

    /// Port names (bus bits grouped into one port with a width), optional direction
    [[nodiscard]] static ParsedReport ParsePorts(const std::string &raw);

    [[nodiscard]] static ParsedReport ParseNets(const std::string &raw);
    [[nodiscard]] static ParsedReport ParseCells(const std::string &raw);

    /// Classify lines by severity prefix, preserving order
    [[nodiscard]] static ParsedReport ParseMessages(const std::string &raw);

    /// Hierarchical depth of a cell path
    [[nodiscard]] static int HierarchyDepth(const std::string &path);
};

} // namespace tether
