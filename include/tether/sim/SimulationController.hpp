#pragma once

/**
 * @file SimulationController.hpp
 * @brief Stateful control of the engine's event-driven simulator
 *
 * The simulator is driven entirely through Session::Execute. The controller
 * keeps what the engine cannot be asked for reliably: the phase, the last
 * known simulation time, the top module and the breakpoints this controller
 * installed. Breakpoints are re-installed after every launch and restart.
 *
 * Preconditions are checked before anything is sent to the engine; a
 * violation raises SimulationError and leaves the session untouched. When
 * the session has been restarted underneath the controller (its generation
 * changed) all tracked state resets to NotStarted.
 */

#include <tether/session/Transaction.hpp>

#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <tuple>
#include <utility>
#include <vector>

namespace tether {

class Session;

// =============================================================================
// Simulation types
// =============================================================================

/**
 * @brief Controller phase
 *
 * Running: simulation loaded and either at time 0 or advancing (a run that
 * timed out is still advancing). Paused: a run or step returned and the
 * simulator is idle at current_time.
 */
enum class SimPhase { NotStarted, Running, Paused, Closed };

enum class SimMode { Behavioral, PostSynthFunc, PostSynthTiming, PostImplFunc, PostImplTiming };

enum class BreakCondition { Change, Posedge, Negedge };

struct Breakpoint {
    std::string path;
    BreakCondition condition = BreakCondition::Change;

    bool operator<(const Breakpoint &other) const {
        return std::tie(path, condition) < std::tie(other.path, other.condition);
    }
    bool operator==(const Breakpoint &other) const {
        return path == other.path && condition == other.condition;
    }
};

struct SimulationState {
    SimPhase phase = SimPhase::NotStarted;
    double current_time_ns = 0.0;
    std::string current_time_text = "0"; ///< As last reported by the engine
    std::optional<std::string> top_module;
    std::optional<SimMode> mode;
    std::optional<std::string> active_scope;
    std::set<Breakpoint> breakpoints;
};

struct SignalValue {
    std::string path;
    std::string value;
    std::string radix;

    /// Timeout or ProcessExited leaves `value` empty
    CompletionKind completion = CompletionKind::PromptMatched;
};

struct SignalValues {
    std::vector<SignalValue> values; ///< In the order the engine listed the objects
    std::size_t matched = 0;         ///< Objects matching the pattern before the limit
    bool truncated = false;

    /// Outcome of listing the objects; values are read only after a clean listing
    CompletionKind completion = CompletionKind::PromptMatched;
};

/// Outcome of adding one signal to the waveform window
struct WaveResult {
    std::string signal;
    bool success = false;
};

// =============================================================================
// Name mapping
// =============================================================================

[[nodiscard]] const char *SimPhaseName(SimPhase phase);
[[nodiscard]] const char *SimModeName(SimMode mode);

/// Engine arguments for `launch_simulation -mode ...`
[[nodiscard]] const char *SimModeArgs(SimMode mode);

/// "behavioral", "post_synth_func", ... @return nullopt for unknown names
[[nodiscard]] std::optional<SimMode> ParseSimMode(const std::string &name);

[[nodiscard]] const char *BreakConditionName(BreakCondition condition);
[[nodiscard]] std::optional<BreakCondition> ParseBreakCondition(const std::string &name);

/**
 * @brief Parse the engine's time report ("1200 ns", "1.5us", "0") into ns
 * @return nullopt when no number is present or it does not fit a double
 */
[[nodiscard]] std::optional<double> ParseSimTimeNs(const std::string &text);

// =============================================================================
// SimulationController
// =============================================================================

class SimulationController {
  public:
    static constexpr std::size_t kMaxSignalValues = 50;

    explicit SimulationController(Session &session);

    /// Set the simulation top module on a fileset (any phase)
    Transaction SetTop(const std::string &top_module, const std::string &fileset = "sim_1");

    /**
     * @brief Launch the simulator
     *
     * Valid from NotStarted or Closed. On success phase becomes Running at
     * time 0 and tracked breakpoints are re-installed.
     *
     * @param top_module Applied with SetTop before launching, if given
     * @throws SimulationError::InvalidPhase
     */
    Transaction Launch(SimMode mode = SimMode::Behavioral,
                       const std::optional<std::string> &top_module = std::nullopt);

    /**
     * @brief Advance simulation time
     * @param duration e.g. "100ns", "1 us"; "all" or "forever" runs to completion
     * @throws SimulationError::InvalidPhase unless Running or Paused
     */
    Transaction Run(const std::string &duration,
                    std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// @throws SimulationError::InvalidPhase unless Running or Paused
    Transaction Step(int count = 1);

    /**
     * @brief Return to time 0, keeping top module and breakpoints
     *
     * From Closed this relaunches with the last mode.
     * @throws SimulationError::InvalidPhase when NotStarted
     */
    Transaction Restart();

    /// Tear down the simulator (any phase). Phase becomes Closed.
    Transaction Close();

    /// Re-read the engine's current time and update the tracked time
    std::string CurrentTime();

    /// @throws SimulationError InvalidPhase, InvalidScope
    SignalValue GetSignalValue(const std::string &path, const std::string &radix = "hex");

    /**
     * @brief Values of the signals and ports matching `pattern`, at most
     *        kMaxSignalValues of them
     * @throws SimulationError InvalidPhase, InvalidScope
     */
    SignalValues GetSignalValues(const std::string &pattern, const std::string &radix = "hex");

    /**
     * @brief Objects in a scope
     * @param filter "all", "signals", "ports" or "internal"
     * @throws SimulationError InvalidPhase, InvalidScope
     */
    std::vector<std::string> ListObjects(const std::string &scope = "/",
                                         const std::string &filter = "all");

    /// Child scopes of `parent`; a successful listing makes `parent` the active scope
    std::vector<std::string> ListScopes(const std::string &parent = "/");

    std::vector<WaveResult> AddToWave(const std::vector<std::string> &signals);

    /**
     * @brief Install a breakpoint and track it
     * @throws SimulationError InvalidPhase, InvalidScope (engine rejected the path)
     */
    Transaction AddBreakpoint(const std::string &path,
                              BreakCondition condition = BreakCondition::Change);

    /**
     * @brief Remove every breakpoint from the engine and the tracked set
     *
     * With no simulation loaded only the tracked set is cleared and the
     * returned Transaction has command_sent == false.
     */
    Transaction RemoveBreakpoints();

    [[nodiscard]] SimulationState State() const;
    [[nodiscard]] SimPhase Phase() const;

  private:
    /// Reset when the session restarted since the last call. Caller holds mutex_.
    void SyncGeneration();
    void RequireActive(const char *operation) const;
    Transaction ApplyTop(const std::string &top_module, const std::string &fileset);
    void SetPhase(SimPhase phase);
    void ReapplyBreakpoints();
    void RefreshTime();
    Transaction Exec(const std::string &command,
                     std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    static std::string BreakpointCommand(const Breakpoint &bp);
    static std::string JoinScope(const std::string &scope);

    Session &session_;
    mutable std::mutex mutex_;
    SimulationState state_;
    uint64_t generation_ = 0;
};

} // namespace tether
