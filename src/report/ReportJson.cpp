/**
 * @file ReportJson.cpp
 * @brief nlohmann::json conversion for each report payload
 */

#include <tether/report/ReportJson.hpp>

namespace tether {

namespace {

template <typename T>
void PutIf(nlohmann::json &j, const char *key, const std::optional<T> &value) {
    if (value) {
        j[key] = *value;
    }
}

nlohmann::json Convert(const TimingSummary &s) {
    nlohmann::json j = nlohmann::json::object();
    PutIf(j, "wns", s.wns);
    PutIf(j, "tns", s.tns);
    PutIf(j, "whs", s.whs);
    PutIf(j, "ths", s.ths);
    PutIf(j, "wpws", s.wpws);
    PutIf(j, "tpws", s.tpws);
    PutIf(j, "failing_endpoints", s.failing_endpoints);
    PutIf(j, "timing_met", s.met);
    return j;
}

nlohmann::json Convert(const TimingPaths &t) {
    nlohmann::json paths = nlohmann::json::array();
    for (const auto &p : t.paths) {
        nlohmann::json jp;
        jp["slack"] = p.slack;
        PutIf(jp, "source", p.source);
        PutIf(jp, "destination", p.destination);
        PutIf(jp, "source_clock", p.source_clock);
        PutIf(jp, "destination_clock", p.destination_clock);
        PutIf(jp, "requirement", p.requirement);
        PutIf(jp, "data_path_delay", p.data_path_delay);
        PutIf(jp, "logic_levels", p.logic_levels);
        paths.push_back(std::move(jp));
    }
    return {{"paths", paths}, {"path_count", t.paths.size()}};
}

nlohmann::json Convert(const UtilizationReport &u) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto &[key, usage] : u.resources) {
        nlohmann::json jr;
        jr["used"] = usage.used;
        PutIf(jr, "available", usage.available);
        PutIf(jr, "percent", usage.percent);
        j[key] = std::move(jr);
    }
    return j;
}

nlohmann::json Convert(const Hierarchy &h) {
    nlohmann::json cells = nlohmann::json::array();
    for (const auto &c : h.cells) {
        nlohmann::json jc;
        jc["path"] = c.path;
        jc["depth"] = c.depth;
        PutIf(jc, "ref", c.ref);
        cells.push_back(std::move(jc));
    }
    nlohmann::json j;
    j["cells"] = std::move(cells);
    j["total_cells"] = h.total_cells;
    j["returned_cells"] = h.cells.size();
    PutIf(j, "max_depth", h.max_depth);
    return j;
}

nlohmann::json Convert(const ClockList &c) {
    nlohmann::json clocks = nlohmann::json::array();
    for (const auto &clk : c.clocks) {
        nlohmann::json jc;
        jc["name"] = clk.name;
        PutIf(jc, "period", clk.period);
        if (clk.rise && clk.fall) {
            jc["waveform"] = {*clk.rise, *clk.fall};
        }
        PutIf(jc, "attributes", clk.attributes);
        if (!clk.sources.empty()) {
            jc["sources"] = clk.sources;
        }
        clocks.push_back(std::move(jc));
    }
    return {{"clocks", clocks}, {"clock_count", c.clocks.size()}};
}

nlohmann::json Convert(const PortList &p) {
    nlohmann::json ports = nlohmann::json::array();
    for (const auto &port : p.ports) {
        nlohmann::json jp;
        jp["name"] = port.name;
        PutIf(jp, "direction", port.direction);
        jp["width"] = port.width;
        PutIf(jp, "msb", port.msb);
        PutIf(jp, "lsb", port.lsb);
        ports.push_back(std::move(jp));
    }
    return {{"ports", ports}, {"port_count", p.ports.size()}};
}

nlohmann::json ConvertObjects(const std::vector<ObjectRecord> &records) {
    nlohmann::json arr = nlohmann::json::array();
    for (const auto &r : records) {
        nlohmann::json jr;
        jr["name"] = r.name;
        PutIf(jr, "type", r.type);
        arr.push_back(std::move(jr));
    }
    return arr;
}

nlohmann::json Convert(const NetList &n) {
    return {{"nets", ConvertObjects(n.nets)}, {"net_count", n.nets.size()}};
}

nlohmann::json Convert(const CellList &c) {
    return {{"cells", ConvertObjects(c.cells)}, {"cell_count", c.cells.size()}};
}

nlohmann::json Convert(const MessageList &m) {
    nlohmann::json messages = nlohmann::json::array();
    for (const auto &msg : m.messages) {
        nlohmann::json jm;
        jm["severity"] = MessageSeverityName(msg.severity);
        PutIf(jm, "id", msg.id);
        jm["text"] = msg.text;
        messages.push_back(std::move(jm));
    }
    nlohmann::json counts;
    counts["errors"] = m.Count(MessageSeverity::Error);
    counts["critical_warnings"] = m.Count(MessageSeverity::CriticalWarning);
    counts["warnings"] = m.Count(MessageSeverity::Warning);
    counts["info"] = m.Count(MessageSeverity::Info);
    return {{"messages", messages}, {"counts", counts}};
}

} // namespace

nlohmann::json DataToJson(const ReportData &data) {
    return std::visit([](const auto &payload) { return Convert(payload); }, data);
}

nlohmann::json ToJson(const ParsedReport &report, bool include_raw) {
    nlohmann::json j;
    j["kind"] = ReportKindName(report.kind);
    j["data"] = DataToJson(report.data);
    j["parse_incomplete"] = report.parse_incomplete;
    j["missing_fields"] = report.missing_fields;
    if (include_raw) {
        j["raw"] = report.raw;
    }
    return j;
}

} // namespace tether
