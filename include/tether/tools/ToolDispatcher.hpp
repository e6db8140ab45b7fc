#pragma once

/**
 * @file ToolDispatcher.hpp
 * @brief Named tool calls onto session, parser, envelope and simulator
 *
 * Each tool takes a JSON object of named arguments and returns a JSON object.
 * Tools are registered in a table by name, the same way the front end lists
 * them, so adding a tool is one Register() call.
 *
 * Library exceptions never escape Call(); they become
 * `{"success": false, "error": ..., "category": ...}`.
 */

#include <tether/report/ParsedReport.hpp>
#include <tether/report/ReportArchive.hpp>
#include <tether/sim/SimulationController.hpp>
#include <tether/session/Session.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace tether {

/// How much raw report text accompanies the parsed fields
enum class DetailLevel {
    Summary,  ///< Structured data only
    Standard, ///< Plus raw text enveloped to max_chars / 2
    Full      ///< Plus raw text enveloped to max_chars
};

[[nodiscard]] DetailLevel ParseDetailLevel(const std::string &name);

/// Outcome of a flow run as recorded on the run object
struct RunVerification {
    std::string run_name;
    std::string status = "unknown";
    std::string progress = "unknown";
    bool succeeded = false;
    bool failed = false;
};

class ToolDispatcher {
  public:
    using Handler = std::function<nlohmann::json(const nlohmann::json &args)>;

    ToolDispatcher(Session &session, SimulationController &sim, ReportArchive &archive);

    /// Run a tool. Unknown tools and failures produce an error object.
    nlohmann::json Call(const std::string &name,
                        const nlohmann::json &args = nlohmann::json::object());

    void Register(const std::string &name, Handler handler);

    [[nodiscard]] bool HasTool(const std::string &name) const { return handlers_.count(name) > 0; }
    [[nodiscard]] std::vector<std::string> ToolNames() const;

    /// Read STATUS and PROGRESS of a run ("synth_1", "impl_1")
    RunVerification VerifyRun(const std::string &run_name);

  private:
    void RegisterSessionTools();
    void RegisterProjectTools();
    void RegisterFlowTools();
    void RegisterReportTools();
    void RegisterQueryTools();
    void RegisterSimulationTools();

    nlohmann::json RunFlow(const std::string &command, const std::string &run_name,
                           std::chrono::milliseconds timeout);

    /// Parsed report plus raw text per the detail level
    nlohmann::json ReportResponse(const Transaction &tx, const ParsedReport &report,
                                  DetailLevel detail);

    /// Command output under `key`, enveloped to max_chars
    nlohmann::json TransactionResponse(const Transaction &tx, const std::string &key = "output");

    [[nodiscard]] nlohmann::json SimulationStateJson() const;
    [[nodiscard]] std::size_t MaxChars() const { return archive_.Config().max_chars; }

    Session &session_;
    SimulationController &sim_;
    ReportArchive &archive_;
    std::map<std::string, Handler> handlers_;
    std::optional<std::string> current_project_;
};

} // namespace tether
