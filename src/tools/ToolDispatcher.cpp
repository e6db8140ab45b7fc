/**
 * @file ToolDispatcher.cpp
 * @brief Tool table: session, project, flow, report, query, simulation, raw
 */

#include <tether/tools/ToolDispatcher.hpp>

#include <tether/core/ErrorLogging.hpp>
#include <tether/core/Tcl.hpp>
#include <tether/io/LogService.hpp>
#include <tether/report/ReportJson.hpp>
#include <tether/report/ReportParser.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>

namespace tether {

namespace {

using nlohmann::json;

template <typename T> T Arg(const json &args, const char *key, T fallback) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return fallback;
    }
    return it->get<T>();
}

template <typename T> std::optional<T> OptArg(const json &args, const char *key) {
    auto it = args.find(key);
    if (it == args.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<T>();
}

std::chrono::milliseconds Seconds(double s) {
    return std::chrono::milliseconds(std::llround(s * 1000.0));
}

std::optional<std::chrono::milliseconds> TimeoutArg(const json &args) {
    if (auto s = OptArg<double>(args, "timeout")) {
        return Seconds(*s);
    }
    return std::nullopt;
}

std::string Trim(const std::string &s) {
    const auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = s.find_last_not_of(" \t\r\n");
    return s.substr(first, last - first + 1);
}

std::string Lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

json ErrorJson(const std::string &message, const std::string &category) {
    return {{"success", false}, {"error", message}, {"category", category}};
}

/// Fields shared by every response built from one transaction
json TransactionMeta(const Transaction &tx) {
    json j;
    j["success"] = tx.Ok();
    j["completion"] = CompletionKindName(tx.completion);
    j["elapsed_ms"] = tx.elapsed.count();
    if (!tx.command_sent) {
        j["command_sent"] = false;
    }
    if (!tx.error_messages.empty()) {
        j["errors"] = tx.error_messages;
    }
    if (!tx.stale_output.empty()) {
        j["stale_output_chars"] = tx.stale_output.size();
    }
    return j;
}

} // namespace

DetailLevel ParseDetailLevel(const std::string &name) {
    if (name == "standard") {
        return DetailLevel::Standard;
    }
    if (name == "full") {
        return DetailLevel::Full;
    }
    return DetailLevel::Summary;
}

// =============================================================================
// Dispatch
// =============================================================================

ToolDispatcher::ToolDispatcher(Session &session, SimulationController &sim,
                               ReportArchive &archive)
    : session_(session), sim_(sim), archive_(archive) {
    RegisterSessionTools();
    RegisterProjectTools();
    RegisterFlowTools();
    RegisterReportTools();
    RegisterQueryTools();
    RegisterSimulationTools();

    Register("run_tcl", [this](const json &args) {
        const auto command = Arg<std::string>(args, "command", "");
        return TransactionResponse(session_.Execute(command, TimeoutArg(args)));
    });
}

void ToolDispatcher::Register(const std::string &name, Handler handler) {
    handlers_[name] = std::move(handler);
}

std::vector<std::string> ToolDispatcher::ToolNames() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto &entry : handlers_) {
        names.push_back(entry.first);
    }
    return names;
}

json ToolDispatcher::Call(const std::string &name, const json &args) {
    LogContextManager::ScopedContext ctx("tools");

    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        GetLogService().Warning("unknown tool '" + name + "'");
        return ErrorJson("Unknown tool: " + name, "tools");
    }

    const json effective = args.is_object() ? args : json::object();
    GetLogService().Debug("tool " + name + " " + effective.dump());
    try {
        return it->second(effective);
    } catch (const Error &e) {
        LogError(e);
        return ErrorJson(e.what(), e.category());
    } catch (const json::exception &e) {
        GetLogService().Warning("tool " + name + ": bad arguments: " + e.what());
        return ErrorJson(std::string("invalid arguments: ") + e.what(), "arguments");
    } catch (const std::exception &e) {
        GetLogService().Error("tool " + name + " failed: " + e.what());
        return ErrorJson(e.what(), "internal");
    }
}

// =============================================================================
// Response helpers
// =============================================================================

json ToolDispatcher::TransactionResponse(const Transaction &tx, const std::string &key) {
    auto j = TransactionMeta(tx);
    j.update(ToJson(archive_.Wrap(tx.raw, MaxChars(), "output"), key));
    return j;
}

json ToolDispatcher::ReportResponse(const Transaction &tx, const ParsedReport &report,
                                    DetailLevel detail) {
    auto j = TransactionMeta(tx);
    j.update(ToJson(report));

    if (detail == DetailLevel::Summary) {
        return j;
    }
    const auto budget = detail == DetailLevel::Full ? MaxChars() : MaxChars() / 2;
    const auto envelope = archive_.Wrap(report.raw, budget, ReportKindName(report.kind));
    j["raw"] = envelope.content;
    if (envelope.truncated) {
        j["raw_truncated"] = true;
        j["raw_total_chars"] = envelope.total_length;
        j["truncation_message"] = envelope.truncation_message;
        if (envelope.artifact_path) {
            j["file_path"] = *envelope.artifact_path;
        }
    }
    return j;
}

json ToolDispatcher::SimulationStateJson() const {
    const auto state = sim_.State();
    json j;
    j["phase"] = SimPhaseName(state.phase);
    j["current_time"] = state.current_time_text;
    j["current_time_ns"] = state.current_time_ns;
    if (state.top_module) {
        j["top_module"] = *state.top_module;
    }
    if (state.mode) {
        j["mode"] = SimModeName(*state.mode);
    }
    if (state.active_scope) {
        j["active_scope"] = *state.active_scope;
    }
    json bps = json::array();
    for (const auto &bp : state.breakpoints) {
        bps.push_back({{"signal", bp.path}, {"condition", BreakConditionName(bp.condition)}});
    }
    j["breakpoints"] = std::move(bps);
    return j;
}

// =============================================================================
// Session
// =============================================================================

void ToolDispatcher::RegisterSessionTools() {
    Register("start_session", [this](const json &args) {
        const auto path = Arg<std::string>(args, "vivado_path", "");
        std::optional<std::chrono::milliseconds> startup;
        if (auto s = OptArg<double>(args, "startup_timeout")) {
            startup = Seconds(*s);
        }
        const auto t0 = std::chrono::steady_clock::now();
        session_.Start(path, startup);
        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - t0);
        return json{{"success", true},
                    {"message", "session ready"},
                    {"generation", session_.Generation()},
                    {"elapsed_ms", elapsed.count()}};
    });

    Register("stop_session", [this](const json &) {
        session_.Stop();
        current_project_.reset();
        return json{{"success", true}, {"message", "session stopped"}};
    });

    Register("session_status", [this](const json &) {
        const auto status = session_.Status();
        json j;
        j["state"] = SessionStateName(status.state);
        j["running"] = status.Running();
        j["executable"] = status.executable;
        j["generation"] = status.generation;
        j["uptime_seconds"] = status.uptime_seconds;
        j["command_count"] = status.command_count;
        j["error_count"] = status.error_count;
        j["timeout_count"] = status.timeout_count;
        j["total_command_seconds"] = status.total_command_seconds;
        j["average_command_seconds"] = status.average_command_seconds;
        j["resync_pending"] = status.resync_pending;
        j["queue_depth"] = status.queue_depth;
        if (current_project_) {
            j["current_project"] = *current_project_;
        }
        json history = json::array();
        for (const auto &record : status.history) {
            history.push_back({{"id", record.id},
                               {"command", record.command},
                               {"completion", CompletionKindName(record.completion)},
                               {"elapsed_ms", record.elapsed.count()}});
        }
        j["history"] = std::move(history);
        return j;
    });

    Register("check_session_health", [this](const json &args) {
        const bool auto_recover = Arg<bool>(args, "auto_recover", true);
        const auto check_timeout = TimeoutArg(args).value_or(std::chrono::seconds{5});

        if (!session_.Status().Running()) {
            if (!auto_recover) {
                return json{{"healthy", false},
                            {"action", "none"},
                            {"message", "session not running (auto_recover=false)"}};
            }
            session_.Restart();
            return json{{"healthy", session_.IsHealthy(check_timeout)},
                        {"action", "started"},
                        {"message", "session was not running, started a new one"}};
        }

        if (session_.IsHealthy(check_timeout)) {
            return json{{"healthy", true},
                        {"action", "none"},
                        {"message", "session is healthy and responsive"}};
        }
        if (!auto_recover) {
            return json{{"healthy", false},
                        {"action", "none"},
                        {"message", "session is unresponsive (auto_recover=false)"}};
        }
        const auto generation = session_.Generation();
        const bool healthy = session_.EnsureHealthy(check_timeout);
        if (session_.Generation() == generation) {
            return json{{"healthy", healthy},
                        {"action", "none"},
                        {"message", "engine is alive but did not answer the health check; it may "
                                    "still be running a timed-out command. Not restarted."}};
        }
        return json{{"healthy", healthy},
                    {"action", "restarted"},
                    {"message", "session was unresponsive, restarted"}};
    });
}

// =============================================================================
// Project
// =============================================================================

void ToolDispatcher::RegisterProjectTools() {
    Register("open_project", [this](const json &args) {
        const auto path = Arg<std::string>(args, "project_path", "");
        auto tx = session_.Execute("open_project " + tcl::Brace(path));
        if (tx.Ok()) {
            current_project_ = path;
        }
        return TransactionResponse(tx);
    });

    Register("close_project", [this](const json &) {
        auto tx = session_.Execute("close_project");
        current_project_.reset();
        return TransactionResponse(tx);
    });

    Register("get_project_info", [this](const json &) {
        static const std::vector<std::pair<const char *, const char *>> queries = {
            {"project", "current_project"},
            {"part", "get_property PART [current_project]"},
            {"target_language", "get_property TARGET_LANGUAGE [current_project]"},
            {"directory", "get_property DIRECTORY [current_project]"},
        };
        json j;
        bool ok = true;
        for (const auto &[key, command] : queries) {
            auto tx = session_.Execute(command);
            ok = ok && tx.Ok();
            if (tx.Ok()) {
                j[key] = Trim(tx.raw);
            } else {
                j[key] = nullptr;
            }
        }
        j["success"] = ok;
        if (current_project_) {
            j["project_path"] = *current_project_;
        }
        return j;
    });
}

// =============================================================================
// Flow
// =============================================================================

RunVerification ToolDispatcher::VerifyRun(const std::string &run_name) {
    RunVerification v;
    v.run_name = run_name;
    auto status = session_.Execute("get_property STATUS [get_runs " + run_name + "]");
    auto progress = session_.Execute("get_property PROGRESS [get_runs " + run_name + "]");
    if (status.Ok()) {
        v.status = Trim(status.raw);
    }
    if (progress.Ok()) {
        v.progress = Trim(progress.raw);
    }
    const auto lower = Lower(v.status);
    v.succeeded = lower.find("complete") != std::string::npos;
    v.failed = lower.find("error") != std::string::npos;
    return v;
}

json ToolDispatcher::RunFlow(const std::string &command, const std::string &run_name,
                             std::chrono::milliseconds timeout) {
    auto tx = session_.Execute(command, timeout);
    auto j = TransactionResponse(tx);
    if (!tx.Completed()) {
        // Run still in progress or engine gone; STATUS would not be final
        return j;
    }

    const auto v = VerifyRun(run_name);
    j["success"] = v.succeeded && !v.failed;
    j["run_status"] = v.status;
    j["run_progress"] = v.progress;
    if (!tx.Ok() && v.succeeded) {
        j["note"] = "output contained error markers but the run completed";
    }
    return j;
}

void ToolDispatcher::RegisterFlowTools() {
    Register("run_synthesis", [this](const json &args) {
        const int jobs = Arg<int>(args, "jobs", 4);
        const double timeout = Arg<double>(args, "timeout", 1800.0);
        return RunFlow("reset_run synth_1; launch_runs synth_1 -jobs " + std::to_string(jobs) +
                           "; wait_on_run synth_1",
                       "synth_1", Seconds(timeout));
    });

    Register("run_implementation", [this](const json &args) {
        const int jobs = Arg<int>(args, "jobs", 4);
        const double timeout = Arg<double>(args, "timeout", 3600.0);
        return RunFlow("launch_runs impl_1 -jobs " + std::to_string(jobs) +
                           "; wait_on_run impl_1",
                       "impl_1", Seconds(timeout));
    });

    Register("generate_bitstream", [this](const json &args) {
        const double timeout = Arg<double>(args, "timeout", 3600.0);
        return RunFlow("launch_runs impl_1 -to_step write_bitstream; wait_on_run impl_1", "impl_1",
                       Seconds(timeout));
    });
}

// =============================================================================
// Reports
// =============================================================================

void ToolDispatcher::RegisterReportTools() {
    Register("get_timing_summary", [this](const json &args) {
        const auto detail = ParseDetailLevel(Arg<std::string>(args, "detail_level", "summary"));
        auto tx = session_.Execute("report_timing_summary -no_header -return_string");
        return ReportResponse(tx, ReportParser::ParseTimingSummary(tx.raw), detail);
    });

    Register("get_timing_paths", [this](const json &args) {
        const int num_paths = Arg<int>(args, "num_paths", 10);
        const double slack_threshold = Arg<double>(args, "slack_threshold", 0.0);
        const auto path_type = Arg<std::string>(args, "path_type", "setup");
        const auto detail = ParseDetailLevel(Arg<std::string>(args, "detail_level", "summary"));

        json filters;
        filters["path_type"] = path_type;
        filters["num_paths"] = num_paths;
        filters["slack_threshold"] = slack_threshold;

        std::ostringstream cmd;
        cmd << "report_timing -delay_type " << (path_type == "hold" ? "min" : "max")
            << " -max_paths " << num_paths << " -slack_lesser_than " << slack_threshold;
        for (const auto &[key, flag] : std::vector<std::pair<const char *, const char *>>{
                 {"from_pin", "-from"}, {"to_pin", "-to"}, {"through", "-through"}}) {
            if (auto value = OptArg<std::string>(args, key)) {
                cmd << " " << flag << " " << tcl::Brace(*value);
                filters[key] = *value;
            }
        }
        if (auto clock = OptArg<std::string>(args, "clock")) {
            cmd << " -filter {CLOCK == " << *clock << "}";
            filters["clock"] = *clock;
        }
        cmd << " -return_string";

        auto tx = session_.Execute(cmd.str());
        const auto report = ReportParser::ParseTimingPaths(
            tx.raw, static_cast<std::size_t>(std::max(num_paths, 0)));
        auto j = ReportResponse(tx, report, detail);
        j["filters_applied"] = std::move(filters);
        return j;
    });

    Register("get_utilization", [this](const json &args) {
        const bool hierarchical = Arg<bool>(args, "hierarchical", false);
        const auto detail = ParseDetailLevel(Arg<std::string>(args, "detail_level", "summary"));

        std::string cmd = "report_utilization -return_string";
        if (hierarchical) {
            cmd += " -hierarchical";
            if (auto filter = OptArg<std::string>(args, "module_filter")) {
                cmd += " -hierarchical_pattern " + tcl::Brace(*filter);
            }
        }
        auto tx = session_.Execute(cmd);
        auto j = ReportResponse(tx, ReportParser::ParseUtilization(tx.raw), detail);

        if (auto threshold = OptArg<double>(args, "threshold_percent")) {
            for (auto &item : j["data"].items()) {
                auto &usage = item.value();
                if (usage.contains("percent") && usage["percent"].get<double>() < *threshold) {
                    usage["below_threshold"] = true;
                }
            }
        }
        return j;
    });

    Register("get_clocks", [this](const json &args) {
        const auto detail = ParseDetailLevel(Arg<std::string>(args, "detail_level", "summary"));
        auto tx = session_.Execute("report_clocks -return_string");
        return ReportResponse(tx, ReportParser::ParseClocks(tx.raw), detail);
    });

    Register("get_messages", [this](const json &args) {
        static const std::map<std::string, MessageSeverity> severities = {
            {"error", MessageSeverity::Error},
            {"critical", MessageSeverity::CriticalWarning},
            {"warning", MessageSeverity::Warning},
            {"info", MessageSeverity::Info},
        };
        const auto severity = Arg<std::string>(args, "severity", "all");
        auto tx = session_.Execute("get_msg_config -rules");
        auto report = ReportParser::ParseMessages(tx.raw);

        if (auto it = severities.find(severity); it != severities.end()) {
            MessageList filtered;
            for (const auto &m : report.As<MessageList>().messages) {
                if (m.severity == it->second) {
                    filtered.messages.push_back(m);
                }
            }
            report.data = std::move(filtered);
        }
        auto j = ReportResponse(tx, report, DetailLevel::Summary);
        j["severity"] = severity;
        return j;
    });

    Register("generate_full_report", [this](const json &args) {
        static const std::map<std::string, std::string> commands = {
            {"timing", "report_timing -max_paths 100"},
            {"timing_summary", "report_timing_summary"},
            {"utilization", "report_utilization"},
            {"hierarchy", "report_utilization -hierarchical"},
            {"clocks", "report_clocks"},
            {"power", "report_power"},
            {"drc", "report_drc"},
        };
        const auto report_type = Arg<std::string>(args, "report_type", "timing");
        const json options = Arg<json>(args, "options", json::object());

        auto it = commands.find(report_type);
        std::string cmd = it != commands.end() ? it->second : "report_" + report_type;
        if (report_type == "utilization" && Arg<bool>(options, "hierarchical", false)) {
            cmd += " -hierarchical";
        }
        if (report_type == "timing") {
            if (auto n = OptArg<int>(options, "num_paths")) {
                cmd = "report_timing -max_paths " + std::to_string(*n);
            }
        }
        cmd += " -return_string";

        auto result = archive_.GenerateFullReport(session_, cmd, report_type,
                                                  OptArg<std::string>(args, "output_file"),
                                                  TimeoutArg(args));
        auto j = TransactionMeta(result.transaction);
        if (!result.Ok()) {
            j["success"] = false;
            j.update(ToJson(MakeEnvelope(result.transaction.raw, MaxChars()), "error"));
            return j;
        }
        const auto &record = *result.record;
        j["report_id"] = record.id;
        j["file_path"] = record.path;
        j["report_type"] = record.kind;
        j["size_bytes"] = record.size_bytes;
        j["line_count"] = record.line_count;
        j["message"] = "Report written to " + record.path +
                       ". Use read_report_section to read portions.";
        return j;
    });

    Register("read_report_section", [this](const json &args) {
        std::string path;
        if (auto id = OptArg<std::string>(args, "report_id")) {
            path = archive_.Resolve(*id);
        } else if (auto file = OptArg<std::string>(args, "file_path")) {
            path = *file;
        } else {
            return ErrorJson("either report_id or file_path must be provided", "arguments");
        }

        if (auto offset = OptArg<std::size_t>(args, "offset")) {
            const auto length = Arg<std::size_t>(args, "length", MaxChars());
            const auto section = ReportArchive::ReadReportSection(path, *offset, length);
            return json{{"success", true},
                        {"file_path", section.path},
                        {"offset", section.offset},
                        {"length", section.content.size()},
                        {"total_length", section.total_length},
                        {"content", section.content}};
        }

        const auto search = OptArg<std::string>(args, "search_pattern");
        const auto lines = ReportArchive::ReadReportLines(
            path, Arg<std::size_t>(args, "start_line", 1), Arg<std::size_t>(args, "num_lines", 100),
            search);
        if (!lines.pattern_found) {
            return json{{"success", true},
                        {"warning", "Pattern '" + search.value_or("") + "' not found in file"},
                        {"total_lines", lines.total_lines},
                        {"file_path", lines.path}};
        }
        return json{{"success", true},
                    {"file_path", lines.path},
                    {"start_line", lines.start_line},
                    {"end_line", lines.end_line},
                    {"total_lines", lines.total_lines},
                    {"returned_lines", lines.returned_lines},
                    {"content", lines.content}};
    });
}

// =============================================================================
// Design queries
// =============================================================================

void ToolDispatcher::RegisterQueryTools() {
    Register("get_design_hierarchy", [this](const json &args) {
        constexpr std::size_t kMaxCells = 500;
        constexpr std::size_t kMaxRefLookups = 100;

        const int max_depth = Arg<int>(args, "max_depth", 3);
        const auto pattern = Arg<std::string>(args, "instance_pattern", "*");

        auto tx = session_.Execute("get_cells -hierarchical " + tcl::Brace(pattern));
        const auto first = ReportParser::ParseHierarchy(tx.raw, max_depth);
        if (!tx.Ok()) {
            return ReportResponse(tx, first, DetailLevel::Summary);
        }

        std::map<std::string, std::string> refs;
        const auto &cells = first.As<Hierarchy>().cells;
        for (std::size_t i = 0; i < cells.size() && i < kMaxRefLookups; ++i) {
            auto ref = session_.Execute("get_property REF_NAME [get_cells " +
                                        tcl::Brace(cells[i].path) + "]");
            const auto name = Trim(ref.raw);
            if (ref.Ok() && !name.empty()) {
                refs[cells[i].path] = name;
            }
        }

        auto report = ReportParser::ParseHierarchy(tx.raw, max_depth, refs);
        auto j = ReportResponse(tx, report, DetailLevel::Summary);
        auto &out = j["data"]["cells"];
        if (out.size() > kMaxCells) {
            out.erase(out.begin() + static_cast<std::ptrdiff_t>(kMaxCells), out.end());
            j["truncated"] = true;
            j["message"] = "Cell list truncated. Use instance_pattern to filter or "
                           "generate_full_report for complete hierarchy.";
        }
        return j;
    });

    Register("get_ports", [this](const json &) {
        auto tx = session_.Execute(
            "foreach p [get_ports *] { puts \"$p [get_property DIRECTION $p]\" }");
        return ReportResponse(tx, ReportParser::ParsePorts(tx.raw), DetailLevel::Summary);
    });

    Register("get_nets", [this](const json &args) {
        const auto pattern = Arg<std::string>(args, "pattern", "*");
        const int limit = std::max(Arg<int>(args, "limit", 100), 1);
        auto tx = session_.Execute("lrange [get_nets " + tcl::Brace(pattern) + "] 0 " +
                                   std::to_string(limit - 1));
        return ReportResponse(tx, ReportParser::ParseNets(tx.raw), DetailLevel::Summary);
    });

    Register("get_cells", [this](const json &args) {
        const auto pattern = Arg<std::string>(args, "pattern", "*");
        const int limit = std::max(Arg<int>(args, "limit", 100), 1);
        auto tx = session_.Execute("lrange [get_cells " + tcl::Brace(pattern) + "] 0 " +
                                   std::to_string(limit - 1));
        return ReportResponse(tx, ReportParser::ParseCells(tx.raw), DetailLevel::Summary);
    });
}

// =============================================================================
// Simulation
// =============================================================================

void ToolDispatcher::RegisterSimulationTools() {
    const auto with_state = [this](json j) {
        j["simulation"] = SimulationStateJson();
        return j;
    };

    Register("launch_simulation", [this, with_state](const json &args) {
        const auto mode_name = Arg<std::string>(args, "mode", "behavioral");
        const auto mode = ParseSimMode(mode_name).value_or(SimMode::Behavioral);
        auto tx = sim_.Launch(mode, OptArg<std::string>(args, "top_module"));
        return with_state(TransactionResponse(tx, "message"));
    });

    Register("run_simulation", [this, with_state](const json &args) {
        auto tx = sim_.Run(Arg<std::string>(args, "time", "100ns"), TimeoutArg(args));
        return with_state(TransactionResponse(tx));
    });

    Register("step_simulation", [this, with_state](const json &args) {
        return with_state(TransactionResponse(sim_.Step(Arg<int>(args, "count", 1))));
    });

    Register("restart_simulation", [this, with_state](const json &) {
        return with_state(TransactionResponse(sim_.Restart(), "message"));
    });

    Register("close_simulation", [this, with_state](const json &) {
        return with_state(TransactionResponse(sim_.Close(), "message"));
    });

    Register("get_simulation_time", [this](const json &) {
        const auto time = sim_.CurrentTime();
        return json{{"success", true}, {"time", time}, {"time_ns", sim_.State().current_time_ns}};
    });

    Register("get_signal_value", [this](const json &args) {
        const auto value = sim_.GetSignalValue(Arg<std::string>(args, "signal", ""),
                                               Arg<std::string>(args, "radix", "hex"));
        if (value.completion != CompletionKind::PromptMatched) {
            return json{{"success", false},
                        {"signal", value.path},
                        {"completion", CompletionKindName(value.completion)},
                        {"error", std::string("get_value did not complete: ") +
                                      CompletionKindName(value.completion)}};
        }
        return json{{"success", true},
                    {"signal", value.path},
                    {"value", value.value},
                    {"radix", value.radix}};
    });

    Register("get_signal_values", [this](const json &args) {
        const auto radix = Arg<std::string>(args, "radix", "hex");
        const auto result = sim_.GetSignalValues(Arg<std::string>(args, "pattern", "/*"), radix);
        if (result.completion != CompletionKind::PromptMatched) {
            return json{{"success", false},
                        {"completion", CompletionKindName(result.completion)},
                        {"error", std::string("get_objects did not complete: ") +
                                      CompletionKindName(result.completion)}};
        }
        json values = json::object();
        for (const auto &v : result.values) {
            values[v.path] = v.value;
        }
        json j{{"success", true},
               {"values", values},
               {"radix", radix},
               {"matched", result.matched}};
        if (result.truncated) {
            j["truncated"] = true;
        }
        return j;
    });

    Register("add_signals_to_wave", [this](const json &args) {
        std::vector<std::string> signals;
        if (auto it = args.find("signals"); it != args.end()) {
            if (it->is_string()) {
                signals.push_back(it->get<std::string>());
            } else {
                signals = it->get<std::vector<std::string>>();
            }
        }
        json results = json::array();
        bool all_ok = true;
        for (const auto &r : sim_.AddToWave(signals)) {
            results.push_back({{"signal", r.signal}, {"success", r.success}});
            all_ok = all_ok && r.success;
        }
        return json{{"success", all_ok}, {"results", results}};
    });

    Register("set_simulation_top", [this, with_state](const json &args) {
        auto tx = sim_.SetTop(Arg<std::string>(args, "top_module", ""),
                              Arg<std::string>(args, "fileset", "sim_1"));
        return with_state(TransactionResponse(tx, "message"));
    });

    Register("get_simulation_objects", [this](const json &args) {
        const auto scope = Arg<std::string>(args, "scope", "/");
        const auto objects = sim_.ListObjects(scope, Arg<std::string>(args, "filter", "all"));
        return json{{"success", true},
                    {"scope", scope},
                    {"objects", objects},
                    {"count", objects.size()}};
    });

    Register("get_scopes", [this](const json &args) {
        const auto parent = Arg<std::string>(args, "parent", "/");
        const auto scopes = sim_.ListScopes(parent);
        return json{{"success", true},
                    {"parent", parent},
                    {"scopes", scopes},
                    {"count", scopes.size()}};
    });

    Register("add_breakpoint", [this, with_state](const json &args) {
        const auto signal = Arg<std::string>(args, "signal", "");
        const auto condition_name = Arg<std::string>(args, "condition", "change");
        const auto condition = ParseBreakCondition(condition_name).value_or(BreakCondition::Change);
        auto j = TransactionResponse(sim_.AddBreakpoint(signal, condition), "message");
        j["signal"] = signal;
        j["condition"] = BreakConditionName(condition);
        return with_state(j);
    });

    Register("remove_breakpoints", [this, with_state](const json &) {
        return with_state(TransactionResponse(sim_.RemoveBreakpoints(), "message"));
    });

    Register("get_simulation_messages", [this](const json &args) {
        const auto severity = Arg<std::string>(args, "severity", "all");
        std::string cmd = "get_msg_config -count";
        if (severity != "all") {
            cmd += " -severity " + tcl::Brace(severity);
        }
        return TransactionResponse(session_.Execute(cmd), "messages");
    });
}

} // namespace tether
