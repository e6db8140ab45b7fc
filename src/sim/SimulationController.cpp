/**
 * @file SimulationController.cpp
 * @brief Simulation phase tracking over Session::Execute
 */

#include <tether/sim/SimulationController.hpp>

#include <tether/core/Error.hpp>
#include <tether/core/Tcl.hpp>
#include <tether/io/LogService.hpp>
#include <tether/report/FieldExtractor.hpp>
#include <tether/session/Session.hpp>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <regex>

namespace tether {

namespace {

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

} // namespace

// =============================================================================
// Name mapping
// =============================================================================

const char *SimPhaseName(SimPhase phase) {
    switch (phase) {
    case SimPhase::NotStarted:
        return "NotStarted";
    case SimPhase::Running:
        return "Running";
    case SimPhase::Paused:
        return "Paused";
    case SimPhase::Closed:
        return "Closed";
    }
    return "Unknown";
}

const char *SimModeName(SimMode mode) {
    switch (mode) {
    case SimMode::Behavioral:
        return "behavioral";
    case SimMode::PostSynthFunc:
        return "post_synth_func";
    case SimMode::PostSynthTiming:
        return "post_synth_timing";
    case SimMode::PostImplFunc:
        return "post_impl_func";
    case SimMode::PostImplTiming:
        return "post_impl_timing";
    }
    return "behavioral";
}

const char *SimModeArgs(SimMode mode) {
    switch (mode) {
    case SimMode::Behavioral:
        return "behav";
    case SimMode::PostSynthFunc:
        return "synth -type func";
    case SimMode::PostSynthTiming:
        return "synth -type timing";
    case SimMode::PostImplFunc:
        return "impl -type func";
    case SimMode::PostImplTiming:
        return "impl -type timing";
    }
    return "behav";
}

std::optional<SimMode> ParseSimMode(const std::string &name) {
    for (auto mode : {SimMode::Behavioral, SimMode::PostSynthFunc, SimMode::PostSynthTiming,
                      SimMode::PostImplFunc, SimMode::PostImplTiming}) {
        if (name == SimModeName(mode)) {
            return mode;
        }
    }
    return std::nullopt;
}

const char *BreakConditionName(BreakCondition condition) {
    switch (condition) {
    case BreakCondition::Change:
        return "change";
    case BreakCondition::Posedge:
        return "posedge";
    case BreakCondition::Negedge:
        return "negedge";
    }
    return "change";
}

std::optional<BreakCondition> ParseBreakCondition(const std::string &name) {
    for (auto c : {BreakCondition::Change, BreakCondition::Posedge, BreakCondition::Negedge}) {
        if (name == BreakConditionName(c)) {
            return c;
        }
    }
    return std::nullopt;
}

std::optional<double> ParseSimTimeNs(const std::string &text) {
    static const std::regex time_re(
        R"(([-+]?[0-9]*\.?[0-9]+(?:[eE][-+]?[0-9]+)?)\s*(fs|ps|ns|us|ms|s)?\b)");
    static const std::map<std::string, double> scale = {
        {"fs", 1e-6}, {"ps", 1e-3}, {"ns", 1.0}, {"us", 1e3}, {"ms", 1e6}, {"s", 1e9},
    };
    std::smatch m;
    if (!std::regex_search(text, m, time_re)) {
        return std::nullopt;
    }
    const auto value = parse::Number(m[1].str());
    if (!value) {
        return std::nullopt;
    }
    const std::string unit = m[2].matched ? m[2].str() : "ns";
    const double ns = *value * scale.at(unit);
    if (!std::isfinite(ns)) {
        return std::nullopt;
    }
    return ns;
}

// =============================================================================
// SimulationController
// =============================================================================

SimulationController::SimulationController(Session &session)
    : session_(session), generation_(session.Generation()) {}

void SimulationController::SyncGeneration() {
    const auto current = session_.Generation();
    if (current == generation_) {
        return;
    }
    generation_ = current;
    if (state_.phase != SimPhase::NotStarted) {
        GetLogService().Event("engine restarted; simulation state reset");
    }
    state_ = SimulationState{};
}

void SimulationController::RequireActive(const char *operation) const {
    if (state_.phase != SimPhase::Running && state_.phase != SimPhase::Paused) {
        throw SimulationError::InvalidPhase(operation, SimPhaseName(state_.phase));
    }
}

void SimulationController::SetPhase(SimPhase phase) {
    if (phase != state_.phase) {
        GetLogService().Event(std::string("simulation ") + SimPhaseName(state_.phase) + " -> " +
                              SimPhaseName(phase));
    }
    state_.phase = phase;
}

Transaction SimulationController::Exec(const std::string &command,
                                       std::optional<std::chrono::milliseconds> timeout) {
    return session_.Execute(command, timeout);
}

std::string SimulationController::BreakpointCommand(const Breakpoint &bp) {
    std::string cmd = "add_bp ";
    if (bp.condition == BreakCondition::Posedge) {
        cmd += "-posedge ";
    } else if (bp.condition == BreakCondition::Negedge) {
        cmd += "-negedge ";
    }
    return cmd + tcl::Brace(bp.path);
}

std::string SimulationController::JoinScope(const std::string &scope) {
    if (!scope.empty() && scope.back() == '/') {
        return scope + "*";
    }
    return scope + "/*";
}

void SimulationController::ReapplyBreakpoints() {
    if (state_.breakpoints.empty()) {
        return;
    }
    auto clear = Exec("remove_bps -all");
    if (!clear.Completed()) {
        GetLogService().Warning("could not clear engine breakpoints before re-applying");
    }
    for (const auto &bp : state_.breakpoints) {
        auto tx = Exec(BreakpointCommand(bp));
        if (!tx.Ok()) {
            GetLogService().Warning("breakpoint on " + bp.path + " not re-applied (" +
                                    CompletionKindName(tx.completion) + ")");
        }
    }
    GetLogService().Debug("re-applied " + std::to_string(state_.breakpoints.size()) +
                          " breakpoint(s)");
}

void SimulationController::RefreshTime() {
    auto tx = Exec("current_time");
    if (!tx.Ok()) {
        return;
    }
    const auto text = Trim(tx.raw);
    if (text.empty()) {
        return;
    }
    state_.current_time_text = text;
    if (auto ns = ParseSimTimeNs(text)) {
        state_.current_time_ns = *ns;
    } else {
        GetLogService().Debug("simulation time '" + text + "' not numeric; keeping " +
                              std::to_string(state_.current_time_ns) + " ns");
    }
}

Transaction SimulationController::ApplyTop(const std::string &top_module,
                                           const std::string &fileset) {
    auto tx = Exec("set_property top " + tcl::Brace(top_module) + " [get_filesets " +
                   tcl::Brace(fileset) + "]");
    if (tx.Ok()) {
        state_.top_module = top_module;
    }
    return tx;
}

Transaction SimulationController::SetTop(const std::string &top_module,
                                         const std::string &fileset) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    return ApplyTop(top_module, fileset);
}

Transaction SimulationController::Launch(SimMode mode,
                                         const std::optional<std::string> &top_module) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    if (state_.phase != SimPhase::NotStarted && state_.phase != SimPhase::Closed) {
        throw SimulationError::InvalidPhase("launch", SimPhaseName(state_.phase));
    }

    if (top_module) {
        auto top = ApplyTop(*top_module, "sim_1");
        if (!top.Ok()) {
            return top;
        }
    }

    auto tx = Exec(std::string("launch_simulation -mode ") + SimModeArgs(mode));
    if (!tx.Ok()) {
        return tx;
    }

    state_.mode = mode;
    state_.current_time_ns = 0.0;
    state_.current_time_text = "0";
    state_.active_scope.reset();
    SetPhase(SimPhase::Running);
    ReapplyBreakpoints();
    return tx;
}

Transaction SimulationController::Run(const std::string &duration,
                                      std::optional<std::chrono::milliseconds> timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("run");

    const auto trimmed = Trim(duration);
    const auto lower = Lower(trimmed);
    const bool to_end = lower == "all" || lower == "-all" || lower == "forever";

    auto tx = Exec(to_end ? "run -all" : "run " + trimmed, timeout);
    if (tx.TimedOut()) {
        SetPhase(SimPhase::Running);
        return tx;
    }
    if (tx.Completed()) {
        RefreshTime();
        SetPhase(SimPhase::Paused);
    }
    return tx;
}

Transaction SimulationController::Step(int count) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("step");

    auto tx = Exec("step " + std::to_string(std::max(count, 1)));
    if (tx.Completed()) {
        RefreshTime();
        SetPhase(SimPhase::Paused);
    }
    return tx;
}

Transaction SimulationController::Restart() {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    if (state_.phase == SimPhase::NotStarted) {
        throw SimulationError::InvalidPhase("restart", SimPhaseName(state_.phase));
    }

    const bool relaunch = state_.phase == SimPhase::Closed;
    auto tx = relaunch ? Exec(std::string("launch_simulation -mode ") +
                              SimModeArgs(state_.mode.value_or(SimMode::Behavioral)))
                       : Exec("restart");
    if (!tx.Ok()) {
        return tx;
    }

    state_.current_time_ns = 0.0;
    state_.current_time_text = "0";
    SetPhase(SimPhase::Running);
    ReapplyBreakpoints();
    return tx;
}

Transaction SimulationController::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();

    auto tx = Exec("close_sim");
    if (tx.Completed()) {
        state_.current_time_ns = 0.0;
        state_.current_time_text = "0";
        state_.active_scope.reset();
        SetPhase(SimPhase::Closed);
    }
    return tx;
}

std::string SimulationController::CurrentTime() {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("current_time");
    RefreshTime();
    return state_.current_time_text;
}

SignalValue SimulationController::GetSignalValue(const std::string &path,
                                                 const std::string &radix) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("get_signal_value");

    auto tx = Exec("get_value -radix " + radix + " " + tcl::Brace(path));
    SignalValue result{path, "", radix, tx.completion};
    if (!tx.Completed()) {
        GetLogService().Warning("reading " + path + " ended with " +
                                CompletionKindName(tx.completion));
        return result;
    }
    result.value = Trim(tx.raw);
    if (tx.completion == CompletionKind::ErrorDetected || result.value.empty()) {
        throw SimulationError::InvalidScope(path);
    }
    return result;
}

SignalValues SimulationController::GetSignalValues(const std::string &pattern,
                                                   const std::string &radix) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("get_signal_values");

    auto list = Exec("get_objects -filter {TYPE == signal || TYPE == port} " +
                     tcl::Brace(pattern));
    SignalValues result;
    if (!list.Completed()) {
        GetLogService().Warning("listing " + pattern + " ended with " +
                                CompletionKindName(list.completion));
        result.completion = list.completion;
        return result;
    }
    const auto names = list.Ok() ? tcl::SplitList(list.raw) : std::vector<std::string>{};
    if (names.empty()) {
        throw SimulationError::InvalidScope(pattern);
    }

    result.matched = names.size();
    result.truncated = names.size() > kMaxSignalValues;
    const auto n = std::min(names.size(), kMaxSignalValues);
    for (std::size_t i = 0; i < n; ++i) {
        auto tx = Exec("get_value -radix " + radix + " " + tcl::Brace(names[i]));
        if (tx.Ok()) {
            result.values.push_back({names[i], Trim(tx.raw), radix, tx.completion});
        }
    }
    return result;
}

std::vector<std::string> SimulationController::ListObjects(const std::string &scope,
                                                           const std::string &filter) {
    static const std::map<std::string, std::string> filters = {
        {"all", ""},
        {"signals", "-filter {TYPE == signal} "},
        {"ports", "-filter {TYPE == port} "},
        {"internal", "-filter {TYPE == signal && IS_PORT == false} "},
    };

    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("get_simulation_objects");

    const auto it = filters.find(filter);
    const std::string filter_args = it != filters.end() ? it->second : "";
    auto tx = Exec("get_objects " + filter_args + tcl::Brace(JoinScope(scope)));
    if (!tx.Ok()) {
        throw SimulationError::InvalidScope(scope);
    }
    return tcl::SplitList(tx.raw);
}

std::vector<std::string> SimulationController::ListScopes(const std::string &parent) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("get_scopes");

    auto tx = Exec("get_scopes " + tcl::Brace(JoinScope(parent)));
    if (!tx.Ok()) {
        throw SimulationError::InvalidScope(parent);
    }
    state_.active_scope = parent;
    return tcl::SplitList(tx.raw);
}

std::vector<WaveResult> SimulationController::AddToWave(const std::vector<std::string> &signals) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("add_signals_to_wave");

    std::vector<WaveResult> results;
    for (const auto &signal : signals) {
        auto tx = Exec("add_wave " + tcl::Brace(signal));
        results.push_back({signal, tx.Ok()});
    }
    return results;
}

Transaction SimulationController::AddBreakpoint(const std::string &path,
                                                BreakCondition condition) {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();
    RequireActive("add_breakpoint");

    Breakpoint bp{path, condition};
    auto tx = Exec(BreakpointCommand(bp));
    if (tx.HasError()) {
        throw SimulationError::InvalidScope(path);
    }
    if (tx.Ok()) {
        state_.breakpoints.insert(std::move(bp));
    }
    return tx;
}

Transaction SimulationController::RemoveBreakpoints() {
    std::lock_guard<std::mutex> lock(mutex_);
    LogContextManager::ScopedContext ctx("sim");
    SyncGeneration();

    if (state_.phase != SimPhase::Running && state_.phase != SimPhase::Paused) {
        state_.breakpoints.clear();
        Transaction tx;
        tx.command = "remove_bps -all";
        tx.command_sent = false;
        return tx;
    }

    auto tx = Exec("remove_bps -all");
    if (tx.Completed()) {
        state_.breakpoints.clear();
    }
    return tx;
}

SimulationState SimulationController::State() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session_.Generation() != generation_) {
        return SimulationState{};
    }
    return state_;
}

SimPhase SimulationController::Phase() const { return State().phase; }

} // namespace tether
