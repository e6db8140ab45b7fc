/**
 * @file ReportParser.cpp
 * @brief Extractor tables and parse loops for each report shape
 */

#include <tether/report/ReportParser.hpp>

#include <tether/core/Tcl.hpp>
#include <tether/report/FieldExtractor.hpp>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <functional>
#include <regex>
#include <set>
#include <sstream>
#include <type_traits>

namespace tether {

namespace {

const std::string kNum = R"(([-+]?[0-9]*\.?[0-9]+))";

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::vector<std::string> Words(const std::string &line) {
    std::istringstream iss(line);
    std::vector<std::string> words;
    std::string w;
    while (iss >> w) {
        words.push_back(w);
    }
    return words;
}

void MarkMissing(ParsedReport &report, const std::string &field) {
    report.parse_incomplete = true;
    if (std::find(report.missing_fields.begin(), report.missing_fields.end(), field) ==
        report.missing_fields.end()) {
        report.missing_fields.push_back(field);
    }
}

bool IsMessageLine(const std::string &trimmed) {
    static const std::regex prefix(R"(^(ERROR|CRITICAL WARNING|WARNING|INFO):)");
    return std::regex_search(trimmed, prefix);
}

/// Non-empty, non-message lines of a query result
struct ListBody {
    std::vector<std::string> lines;
    bool had_error = false;
};

ListBody SplitListBody(const std::string &raw) {
    ListBody body;
    for (const auto &line : parse::Lines(raw)) {
        const auto trimmed = parse::Trim(line);
        if (trimmed.empty()) {
            continue;
        }
        if (IsMessageLine(trimmed)) {
            body.had_error = body.had_error || trimmed.rfind("ERROR:", 0) == 0;
            continue;
        }
        body.lines.push_back(trimmed);
    }
    return body;
}

/// True when every line is exactly "name attribute"
bool IsPairPerLine(const std::vector<std::string> &lines, std::size_t min_lines) {
    if (lines.size() < min_lines) {
        return false;
    }
    return std::all_of(lines.begin(), lines.end(),
                       [](const std::string &l) { return Words(l).size() == 2; });
}

std::vector<ObjectRecord> ParseObjectRecords(const ListBody &body) {
    std::vector<ObjectRecord> records;
    if (IsPairPerLine(body.lines, 2)) {
        for (const auto &line : body.lines) {
            auto words = Words(line);
            records.push_back({words[0], words[1]});
        }
        return records;
    }
    std::string joined;
    for (const auto &line : body.lines) {
        joined += line + "\n";
    }
    for (auto &name : tcl::SplitList(joined)) {
        records.push_back({std::move(name), std::nullopt});
    }
    return records;
}

ParsedReport MakeReport(ReportKind kind, const std::string &raw, ReportData data) {
    ParsedReport report;
    report.kind = kind;
    report.raw = raw;
    report.data = std::move(data);
    return report;
}

// =============================================================================
// Timing summary
// =============================================================================

FieldExtractor<TimingSummary> SlackField(const char *name, const char *label,
                                         std::optional<double> TimingSummary::*member,
                                         bool required) {
    return {name, std::regex(std::string(label) + R"(\s*:\s*)" + kNum), required,
            [member](TimingSummary &s, const std::smatch &m) {
                s.*member = parse::Number(m[1].str());
            }};
}

const std::vector<FieldExtractor<TimingSummary>> &TimingSummaryTable() {
    static const std::vector<FieldExtractor<TimingSummary>> table = {
        SlackField("wns", R"(WNS\(ns\))", &TimingSummary::wns, true),
        SlackField("tns", R"(TNS\(ns\))", &TimingSummary::tns, true),
        SlackField("whs", R"(WHS\(ns\))", &TimingSummary::whs, true),
        SlackField("ths", R"(THS\(ns\))", &TimingSummary::ths, true),
        SlackField("wpws", R"(WPWS\(ns\))", &TimingSummary::wpws, false),
        SlackField("tpws", R"(TPWS\(ns\))", &TimingSummary::tpws, false),
        {"failing_endpoints", std::regex(R"(([0-9]+)\s+failing\s+endpoints?)", std::regex::icase),
         false,
         [](TimingSummary &s, const std::smatch &m) {
             s.failing_endpoints = parse::Integer(m[1].str());
         }},
    };
    return table;
}

/// @return false when the column held a value that could not be read
bool AssignSummaryColumn(TimingSummary &s, const std::string &label, const std::string &value) {
    static const std::map<std::string, std::optional<double> TimingSummary::*> slack_columns = {
        {"WNS(ns)", &TimingSummary::wns},   {"TNS(ns)", &TimingSummary::tns},
        {"WHS(ns)", &TimingSummary::whs},   {"THS(ns)", &TimingSummary::ths},
        {"WPWS(ns)", &TimingSummary::wpws}, {"TPWS(ns)", &TimingSummary::tpws},
    };
    if (auto it = slack_columns.find(label); it != slack_columns.end()) {
        auto &field = s.*(it->second);
        if (!field) {
            field = parse::Number(value);
        }
        return true;
    }
    if (label == "TNS Failing Endpoints" && !s.failing_endpoints) {
        s.failing_endpoints = parse::Integer(value);
        return s.failing_endpoints.has_value() || parse::Trim(value).empty();
    }
    return true;
}

/**
 * Design timing summary table:
 * @code
 *     WNS(ns)      TNS(ns)  TNS Failing Endpoints  ...
 *     -------      -------  ---------------------  ...
 *      -0.250       -1.375                      7  ...
 * @endcode
 * The dashed rule gives each column's extent; labels are read from the header
 * over the same extent and values are taken in column order.
 */
void ApplyTabularSummary(const std::string &raw, TimingSummary &s,
                         std::vector<std::string> &rejected) {
    const auto lines = parse::Lines(raw);
    for (std::size_t i = 0; i + 2 < lines.size(); ++i) {
        const auto &header = lines[i];
        if (header.find("WNS(ns)") == std::string::npos || header.find(':') != std::string::npos) {
            continue;
        }
        const auto &rule = lines[i + 1];
        if (rule.find("---") == std::string::npos) {
            continue;
        }

        std::vector<std::pair<std::size_t, std::size_t>> spans;
        for (std::size_t p = 0; p < rule.size();) {
            if (rule[p] == '-') {
                const std::size_t begin = p;
                while (p < rule.size() && rule[p] == '-') {
                    ++p;
                }
                spans.emplace_back(begin, p);
            } else {
                ++p;
            }
        }

        std::size_t v = i + 2;
        while (v < lines.size() && parse::Trim(lines[v]).empty()) {
            ++v;
        }
        if (v >= lines.size()) {
            return;
        }
        const auto &row = lines[v];
        const auto values = Words(row);

        for (std::size_t k = 0; k < spans.size(); ++k) {
            const auto [begin, end] = spans[k];
            if (begin >= header.size()) {
                break;
            }
            const auto label = parse::Trim(header.substr(begin, end - begin));
            std::string value;
            if (values.size() == spans.size()) {
                value = values[k];
            } else if (begin < row.size()) {
                value = parse::Trim(row.substr(begin, end - begin));
            }
            if (!AssignSummaryColumn(s, label, value)) {
                rejected.push_back(label);
            }
        }
        return;
    }
}

// =============================================================================
// Timing paths
// =============================================================================

template <typename T>
FieldExtractor<TimingPath> PathField(const char *name, const std::string &pattern,
                                     std::optional<T> TimingPath::*member) {
    return {name, std::regex(pattern), false, [member](TimingPath &p, const std::smatch &m) {
                if constexpr (std::is_same_v<T, std::string>) {
                    p.*member = m[1].str();
                } else if constexpr (std::is_same_v<T, int>) {
                    p.*member = parse::Integer(m[1].str());
                } else {
                    p.*member = parse::Number(m[1].str());
                }
            }};
}

const std::vector<FieldExtractor<TimingPath>> &TimingPathTable() {
    static const std::vector<FieldExtractor<TimingPath>> table = {
        {"slack", std::regex(R"(Slack\s*(?:\([A-Z]+\))?\s*:\s*)" + kNum + R"(\s*ns)"), true,
         [](TimingPath &p, const std::smatch &m) {
             // NaN marks a slack that was printed but could not be read
             p.slack = parse::Number(m[1].str()).value_or(std::numeric_limits<double>::quiet_NaN());
         }},
        PathField<std::string>("source", R"(Source:\s*(\S+))", &TimingPath::source),
        PathField<std::string>("destination", R"(Destination:\s*(\S+))",
                               &TimingPath::destination),
        PathField<std::string>("source_clock", R"(Source Clock:\s*(\S+))",
                               &TimingPath::source_clock),
        PathField<std::string>("destination_clock", R"(Destination Clock:\s*(\S+))",
                               &TimingPath::destination_clock),
        PathField<double>("requirement", R"(Requirement:\s*)" + kNum + R"(\s*ns)",
                          &TimingPath::requirement),
        PathField<double>("data_path_delay", R"(Data Path Delay:\s*)" + kNum + R"(\s*ns)",
                          &TimingPath::data_path_delay),
        PathField<int>("logic_levels", R"(Logic Levels:\s*([0-9]+))", &TimingPath::logic_levels),
    };
    return table;
}

// =============================================================================
// Utilization
// =============================================================================

struct ResourceRow {
    const char *key;
    std::vector<std::string> names; ///< Lower-case site type names across device families
    bool required;
};

const std::vector<ResourceRow> &ResourceTable() {
    static const std::vector<ResourceRow> table = {
        {"lut", {"slice luts", "clb luts"}, true},
        {"ff", {"slice registers", "clb registers"}, true},
        {"bram", {"block ram tile"}, false},
        {"dsp", {"dsps", "dsp"}, false},
        {"io", {"bonded iob", "bonded user i/o"}, false},
    };
    return table;
}

std::vector<std::string> SplitCells(const std::string &line) {
    std::vector<std::string> cells;
    std::string current;
    for (char c : line) {
        if (c == '|') {
            cells.push_back(parse::Trim(current));
            current.clear();
        } else {
            current.push_back(c);
        }
    }
    cells.push_back(parse::Trim(current));
    return cells;
}

std::string SiteName(std::string cell) {
    while (!cell.empty() && (cell.back() == '*' || cell.back() == ' ')) {
        cell.pop_back();
    }
    return Lower(cell);
}

} // namespace

// =============================================================================
// ReportParser
// =============================================================================

int ReportParser::HierarchyDepth(const std::string &path) {
    return static_cast<int>(std::count(path.begin(), path.end(), '/'));
}

ParsedReport ReportParser::Parse(ReportKind kind, const std::string &raw) {
    using ParseFn = std::function<ParsedReport(const std::string &)>;
    static const std::map<ReportKind, ParseFn> table = {
        {ReportKind::TimingSummary, [](const std::string &r) { return ParseTimingSummary(r); }},
        {ReportKind::TimingPaths, [](const std::string &r) { return ParseTimingPaths(r); }},
        {ReportKind::Utilization, [](const std::string &r) { return ParseUtilization(r); }},
        {ReportKind::Hierarchy, [](const std::string &r) { return ParseHierarchy(r); }},
        {ReportKind::ClockList, [](const std::string &r) { return ParseClocks(r); }},
        {ReportKind::PortList, [](const std::string &r) { return ParsePorts(r); }},
        {ReportKind::NetList, [](const std::string &r) { return ParseNets(r); }},
        {ReportKind::CellList, [](const std::string &r) { return ParseCells(r); }},
        {ReportKind::MessageList, [](const std::string &r) { return ParseMessages(r); }},
    };
    return table.at(kind)(raw);
}

ParsedReport ReportParser::ParseTimingSummary(const std::string &raw) {
    TimingSummary summary;
    const auto &table = TimingSummaryTable();
    const auto unmatched = ApplyExtractors(table, raw, summary);
    std::vector<std::string> rejected;
    ApplyTabularSummary(raw, summary, rejected);
    const bool endpoints_printed = std::find(unmatched.begin(), unmatched.end(),
                                             "failing_endpoints") == unmatched.end();

    if (summary.wns && summary.whs) {
        summary.met = *summary.wns >= 0.0 && *summary.whs >= 0.0;
    }

    auto report = MakeReport(ReportKind::TimingSummary, raw, summary);
    const std::map<std::string, bool> present = {
        {"wns", summary.wns.has_value()},
        {"tns", summary.tns.has_value()},
        {"whs", summary.whs.has_value()},
        {"ths", summary.ths.has_value()},
    };
    for (const auto &extractor : table) {
        if (!extractor.required) {
            continue;
        }
        if (auto it = present.find(extractor.name); it != present.end() && !it->second) {
            MarkMissing(report, extractor.name);
        }
    }
    if ((endpoints_printed || !rejected.empty()) && !summary.failing_endpoints) {
        MarkMissing(report, "failing_endpoints");
    }
    return report;
}

ParsedReport ReportParser::ParseTimingPaths(const std::string &raw, std::size_t max_paths) {
    static const std::regex block_start(R"(^\s*Slack\b)");

    std::vector<std::string> blocks;
    for (const auto &line : parse::Lines(raw)) {
        if (std::regex_search(line, block_start)) {
            blocks.emplace_back();
        }
        if (!blocks.empty()) {
            blocks.back() += line + "\n";
        }
    }

    TimingPaths result;
    std::vector<std::string> missing;
    for (const auto &block : blocks) {
        if (result.paths.size() >= max_paths) {
            break;
        }
        TimingPath path;
        auto unmatched = ApplyExtractors(TimingPathTable(), block, path);
        const auto has = [&](const char *name) {
            return std::find(unmatched.begin(), unmatched.end(), name) == unmatched.end();
        };
        if (!has("slack") || std::isnan(path.slack)) {
            missing.emplace_back("slack");
            continue;
        }
        if (has("logic_levels") && !path.logic_levels) {
            missing.emplace_back("logic_levels");
        }
        if (!has("source")) {
            missing.emplace_back("source");
        }
        if (!has("destination")) {
            missing.emplace_back("destination");
        }
        result.paths.push_back(std::move(path));
    }

    auto report = MakeReport(ReportKind::TimingPaths, raw, result);
    for (const auto &field : missing) {
        MarkMissing(report, field);
    }
    return report;
}

ParsedReport ReportParser::ParseUtilization(const std::string &raw) {
    UtilizationReport result;

    // Column positions in the '|'-split row; updated whenever a header row appears
    std::optional<std::size_t> used_col;
    std::optional<std::size_t> avail_col;
    std::optional<std::size_t> util_col;

    for (const auto &line : parse::Lines(raw)) {
        const auto trimmed = parse::Trim(line);
        if (trimmed.empty() || trimmed.front() != '|') {
            continue;
        }
        const auto cells = SplitCells(trimmed);
        if (cells.size() < 4) {
            continue;
        }

        if (Lower(cells[1]) == "site type") {
            used_col.reset();
            avail_col.reset();
            util_col.reset();
            for (std::size_t c = 0; c < cells.size(); ++c) {
                const auto label = Lower(cells[c]);
                if (label == "used") {
                    used_col = c;
                } else if (label == "available") {
                    avail_col = c;
                } else if (label == "util%") {
                    util_col = c;
                }
            }
            continue;
        }

        const auto name = SiteName(cells[1]);
        for (const auto &row : ResourceTable()) {
            if (result.resources.count(row.key) != 0 ||
                std::find(row.names.begin(), row.names.end(), name) == row.names.end()) {
                continue;
            }
            // Rows end with an empty cell after the closing '|'
            const std::size_t last = cells.back().empty() ? cells.size() - 2 : cells.size() - 1;
            const auto cell_at = [&](std::optional<std::size_t> col,
                                     std::size_t fallback) -> std::string {
                const std::size_t c = col.value_or(fallback);
                return c < cells.size() ? cells[c] : std::string{};
            };
            auto used = parse::Number(cell_at(used_col, 2));
            if (!used) {
                break;
            }
            ResourceUsage usage;
            usage.used = *used;
            usage.available = parse::Number(cell_at(avail_col, last > 0 ? last - 1 : 0));
            usage.percent = parse::Number(cell_at(util_col, last));
            result.resources.emplace(row.key, usage);
            break;
        }
    }

    auto report = MakeReport(ReportKind::Utilization, raw, result);
    for (const auto &row : ResourceTable()) {
        if (row.required && result.resources.count(row.key) == 0) {
            MarkMissing(report, row.key);
        }
    }
    return report;
}

ParsedReport ReportParser::ParseHierarchy(const std::string &raw, std::optional<int> max_depth,
                                          const std::map<std::string, std::string> &refs) {
    const auto body = SplitListBody(raw);
    Hierarchy result;
    result.max_depth = max_depth;

    for (const auto &record : ParseObjectRecords(body)) {
        ++result.total_cells;
        HierarchyEntry entry;
        entry.path = record.name;
        entry.depth = HierarchyDepth(record.name);
        if (max_depth && entry.depth > *max_depth) {
            continue;
        }
        if (record.type) {
            entry.ref = record.type;
        } else if (auto it = refs.find(record.name); it != refs.end()) {
            entry.ref = it->second;
        }
        result.cells.push_back(std::move(entry));
    }

    auto report = MakeReport(ReportKind::Hierarchy, raw, result);
    if (body.had_error) {
        MarkMissing(report, "cells");
    }
    return report;
}

ParsedReport ReportParser::ParseClocks(const std::string &raw) {
    // name  period  {rise fall}  [attributes]  [{sources}]
    static const std::regex row(R"(^(\S+)\s+)" + kNum + R"(\s+\{\s*)" + kNum + R"(\s+)" + kNum +
                                R"(\s*\}(?:\s+([A-Za-z,]+))?(?:\s+\{([^}]*)\})?)");
    const auto body = SplitListBody(raw);
    ClockList result;
    for (const auto &line : body.lines) {
        std::smatch m;
        if (!std::regex_search(line, m, row)) {
            continue;
        }
        ClockInfo clock;
        clock.name = m[1].str();
        clock.period = parse::Number(m[2].str());
        clock.rise = parse::Number(m[3].str());
        clock.fall = parse::Number(m[4].str());
        if (m[5].matched) {
            clock.attributes = m[5].str();
        }
        if (m[6].matched) {
            clock.sources = tcl::SplitList(m[6].str());
        }
        result.clocks.push_back(std::move(clock));
    }

    auto report = MakeReport(ReportKind::ClockList, raw, result);
    if (body.had_error) {
        MarkMissing(report, "clocks");
    }
    return report;
}

ParsedReport ReportParser::ParsePorts(const std::string &raw) {
    static const std::set<std::string> directions = {"IN", "OUT", "INOUT"};
    static const std::regex bus_bit(R"(^(.+)\[([0-9]+)\]$)");

    const auto body = SplitListBody(raw);
    std::vector<std::pair<std::string, std::optional<std::string>>> bits;

    const bool with_direction =
        IsPairPerLine(body.lines, 1) &&
        std::all_of(body.lines.begin(), body.lines.end(), [](const std::string &l) {
            return directions.count(Words(l)[1]) != 0;
        });
    if (with_direction) {
        for (const auto &line : body.lines) {
            auto words = Words(line);
            bits.emplace_back(words[0], words[1]);
        }
    } else {
        for (const auto &record : ParseObjectRecords(body)) {
            bits.emplace_back(record.name, std::nullopt);
        }
    }

    PortList result;
    std::map<std::string, std::size_t> index_of;
    for (const auto &[name, direction] : bits) {
        std::smatch m;
        if (!std::regex_match(name, m, bus_bit)) {
            index_of[name] = result.ports.size();
            result.ports.push_back({name, direction, 1, std::nullopt, std::nullopt});
            continue;
        }
        const auto base = m[1].str();
        const auto digits = m[2].str();
        int bit = 0;
        const auto [end, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), bit);
        if (ec != std::errc() || end != digits.data() + digits.size()) {
            // Index too large for a bus bit: keep the name as written
            index_of[name] = result.ports.size();
            result.ports.push_back({name, direction, 1, std::nullopt, std::nullopt});
            continue;
        }
        auto it = index_of.find(base);
        if (it == index_of.end()) {
            index_of[base] = result.ports.size();
            result.ports.push_back({base, direction, 1, bit, bit});
            continue;
        }
        auto &port = result.ports[it->second];
        port.width += 1;
        port.msb = std::max(port.msb.value_or(bit), bit);
        port.lsb = std::min(port.lsb.value_or(bit), bit);
    }

    auto report = MakeReport(ReportKind::PortList, raw, result);
    if (body.had_error) {
        MarkMissing(report, "ports");
    }
    return report;
}

ParsedReport ReportParser::ParseNets(const std::string &raw) {
    const auto body = SplitListBody(raw);
    auto report = MakeReport(ReportKind::NetList, raw, NetList{ParseObjectRecords(body)});
    if (body.had_error) {
        MarkMissing(report, "nets");
    }
    return report;
}

ParsedReport ReportParser::ParseCells(const std::string &raw) {
    const auto body = SplitListBody(raw);
    auto report = MakeReport(ReportKind::CellList, raw, CellList{ParseObjectRecords(body)});
    if (body.had_error) {
        MarkMissing(report, "cells");
    }
    return report;
}

ParsedReport ReportParser::ParseMessages(const std::string &raw) {
    static const std::regex line_re(
        R"(^(ERROR|CRITICAL WARNING|WARNING|INFO):\s*(?:\[([^\]]+)\])?)");
    MessageList result;
    for (const auto &line : parse::Lines(raw)) {
        const auto trimmed = parse::Trim(line);
        std::smatch m;
        if (!std::regex_search(trimmed, m, line_re)) {
            continue;
        }
        EngineMessage message;
        const auto severity = m[1].str();
        if (severity == "ERROR") {
            message.severity = MessageSeverity::Error;
        } else if (severity == "CRITICAL WARNING") {
            message.severity = MessageSeverity::CriticalWarning;
        } else if (severity == "WARNING") {
            message.severity = MessageSeverity::Warning;
        } else {
            message.severity = MessageSeverity::Info;
        }
        if (m[2].matched) {
            message.id = m[2].str();
        }
        message.text = trimmed;
        result.messages.push_back(std::move(message));
    }
    return MakeReport(ReportKind::MessageList, raw, result);
}

} // namespace tether
