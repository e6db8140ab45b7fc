#pragma once

/**
 * @file ParsedReport.hpp
 * @brief Typed results extracted from the engine's text reports
 *
 * Every field the parser could not find stays empty (std::optional or absent
 * map entry). Nothing is defaulted to a plausible-looking zero.
 */

#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace tether {

// =============================================================================
// Report payloads
// =============================================================================

struct TimingSummary {
    std::optional<double> wns; ///< Worst negative slack, setup (ns)
    std::optional<double> tns; ///< Total negative slack, setup (ns)
    std::optional<double> whs; ///< Worst hold slack (ns)
    std::optional<double> ths; ///< Total hold slack (ns)
    std::optional<double> wpws; ///< Worst pulse width slack (ns)
    std::optional<double> tpws; ///< Total pulse width slack (ns)
    std::optional<int> failing_endpoints;

    /// wns >= 0 && whs >= 0, only when both are known
    std::optional<bool> met;
};

struct TimingPath {
    double slack = 0.0;
    std::optional<std::string> source;
    std::optional<std::string> destination;
    std::optional<std::string> source_clock;
    std::optional<std::string> destination_clock;
    std::optional<double> requirement;
    std::optional<double> data_path_delay;
    std::optional<int> logic_levels;
};

struct TimingPaths {
    std::vector<TimingPath> paths;
};

struct ResourceUsage {
    double used = 0.0;
    std::optional<double> available;
    std::optional<double> percent;
};

/// Keys: "lut", "ff", "bram", "dsp", "io"
struct UtilizationReport {
    std::map<std::string, ResourceUsage> resources;
};

struct HierarchyEntry {
    std::string path;
    int depth = 0;                  ///< Number of '/' separators
    std::optional<std::string> ref; ///< Module (REF_NAME), when known
};

struct Hierarchy {
    std::vector<HierarchyEntry> cells;
    std::size_t total_cells = 0; ///< Before depth filtering
    std::optional<int> max_depth;
};

struct ClockInfo {
    std::string name;
    std::optional<double> period;
    std::optional<double> rise;
    std::optional<double> fall;
    std::optional<std::string> attributes;
    std::vector<std::string> sources;
};

struct ClockList {
    std::vector<ClockInfo> clocks;
};

struct PortInfo {
    std::string name;
    std::optional<std::string> direction; ///< IN, OUT, INOUT
    int width = 1;
    std::optional<int> msb;
    std::optional<int> lsb;
};

struct PortList {
    std::vector<PortInfo> ports;
};

/// Net or cell with an optional type (REF_NAME / TYPE)
struct ObjectRecord {
    std::string name;
    std::optional<std::string> type;
};

struct NetList {
    std::vector<ObjectRecord> nets;
};

struct CellList {
    std::vector<ObjectRecord> cells;
};

enum class MessageSeverity { Error, CriticalWarning, Warning, Info };

struct EngineMessage {
    MessageSeverity severity = MessageSeverity::Info;
    std::optional<std::string> id; ///< e.g. "Synth 8-439"
    std::string text;              ///< Full original line
};

struct MessageList {
    std::vector<EngineMessage> messages; ///< In output order

    [[nodiscard]] std::size_t Count(MessageSeverity severity) const {
        std::size_t n = 0;
        for (const auto &m : messages) {
            n += m.severity == severity ? 1 : 0;
        }
        return n;
    }
};

// =============================================================================
// ParsedReport
// =============================================================================

enum class ReportKind {
    TimingSummary,
    TimingPaths,
    Utilization,
    Hierarchy,
    ClockList,
    PortList,
    NetList,
    CellList,
    MessageList
};

using ReportData = std::variant<TimingSummary, TimingPaths, UtilizationReport, Hierarchy,
                                ClockList, PortList, NetList, CellList, MessageList>;

struct ParsedReport {
    ReportKind kind = ReportKind::TimingSummary;
    ReportData data;
    std::string raw;

    /// An expected field or record could not be extracted
    bool parse_incomplete = false;
    std::vector<std::string> missing_fields;

    template <typename T> [[nodiscard]] const T &As() const { return std::get<T>(data); }
    template <typename T> [[nodiscard]] const T *TryAs() const { return std::get_if<T>(&data); }
};

[[nodiscard]] inline const char *ReportKindName(ReportKind kind) {
    switch (kind) {
    case ReportKind::TimingSummary:
        return "timing_summary";
    case ReportKind::TimingPaths:
        return "timing_paths";
    case ReportKind::Utilization:
        return "utilization";
    case ReportKind::Hierarchy:
        return "hierarchy";
    case ReportKind::ClockList:
        return "clocks";
    case ReportKind::PortList:
        return "ports";
    case ReportKind::NetList:
        return "nets";
    case ReportKind::CellList:
        return "cells";
    case ReportKind::MessageList:
        return "messages";
    }
    return "unknown";
}

[[nodiscard]] inline const char *MessageSeverityName(MessageSeverity severity) {
    switch (severity) {
    case MessageSeverity::Error:
        return "ERROR";
    case MessageSeverity::CriticalWarning:
        return "CRITICAL WARNING";
    case MessageSeverity::Warning:
        return "WARNING";
    case MessageSeverity::Info:
        return "INFO";
    }
    return "INFO";
}

} // namespace tether
