#pragma once

/**
 * @file Session.hpp
 * @brief Persistent engine process with a serialized command contract
 *
 * State machine:
 * @code
 * Uninitialized -> Starting -> Ready <-> Busy -> ... -> Stopping -> Uninitialized
 *                              Ready|Busy -> Failed -> (Stop) -> Uninitialized
 * @endcode
 *
 * Execute() calls are admitted in FIFO order through a ticket lock; a caller
 * arriving while another command is in flight waits rather than failing.
 * Status() reads only atomics and a small history lock, so it never waits on
 * an in-flight command.
 *
 * After a command times out its response boundary is still outstanding. The
 * next Execute() first drains output up to the next prompt and reports it as
 * Transaction::stale_output; if no prompt shows up in time the new command
 * is not sent (Transaction::command_sent == false).
 */

#include <tether/session/Channel.hpp>
#include <tether/session/FifoMutex.hpp>
#include <tether/session/SessionConfig.hpp>
#include <tether/session/Transaction.hpp>
#include <tether/session/TransactionFramer.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace tether {

// =============================================================================
// State and status
// =============================================================================

enum class SessionState { Uninitialized, Starting, Ready, Busy, Stopping, Failed };

[[nodiscard]] inline const char *SessionStateName(SessionState state) {
    switch (state) {
    case SessionState::Uninitialized:
        return "Uninitialized";
    case SessionState::Starting:
        return "Starting";
    case SessionState::Ready:
        return "Ready";
    case SessionState::Busy:
        return "Busy";
    case SessionState::Stopping:
        return "Stopping";
    case SessionState::Failed:
        return "Failed";
    }
    return "Unknown";
}

/// One finished command, kept in the bounded status history
struct CommandRecord {
    uint64_t id = 0;
    std::string command;
    CompletionKind completion = CompletionKind::PromptMatched;
    std::chrono::milliseconds elapsed{0};
    std::chrono::system_clock::time_point finished_at;
};

/// Snapshot returned by Session::Status()
struct SessionStatus {
    SessionState state = SessionState::Uninitialized;
    std::string executable;
    uint64_t generation = 0;

    double uptime_seconds = 0.0;
    std::optional<std::chrono::system_clock::time_point> started_at;
    std::optional<std::chrono::system_clock::time_point> last_command_at;

    uint64_t command_count = 0;
    uint64_t error_count = 0;
    uint64_t timeout_count = 0;
    double total_command_seconds = 0.0;
    double average_command_seconds = 0.0;

    /// A timed-out command's output has not been drained yet
    bool resync_pending = false;

    /// Callers holding or waiting for the command lock
    uint64_t queue_depth = 0;

    std::vector<CommandRecord> history;

    [[nodiscard]] bool Running() const {
        return state == SessionState::Ready || state == SessionState::Busy;
    }
};

// =============================================================================
// Session
// =============================================================================

class Session {
  public:
    /**
     * @brief Create an idle session
     * @throws ConfigError if the configuration does not validate
     */
    explicit Session(SessionConfig config = {}, ChannelFactory factory = {});
    ~Session();

    Session(const Session &) = delete;
    Session &operator=(const Session &) = delete;
    Session(Session &&) = delete;
    Session &operator=(Session &&) = delete;

    /**
     * @brief Spawn the engine and wait for its first prompt
     *
     * Empty executable / unset timeout fall back to the configuration.
     * `extra_args` are appended to the configured arguments.
     *
     * @throws SessionError AlreadyStarted, SpawnFailed, StartupTimeout,
     *         ProcessExited
     */
    void Start(const std::string &executable = "",
               std::optional<std::chrono::milliseconds> startup_timeout = std::nullopt,
               const std::vector<std::string> &extra_args = {});

    /**
     * @brief Send one command and wait for its response boundary
     *
     * Timeouts, engine errors and process exit are reported in the returned
     * Transaction. Only a session that is not running raises.
     *
     * @throws SessionError::NotReady
     */
    Transaction Execute(const std::string &command,
                        std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    /// Idempotent. Aborts an in-flight command. Always ends Uninitialized.
    void Stop();

    /// Stop, then Start with the parameters of the last successful start
    void Restart();

    /// Check the interpreter with a round trip
    [[nodiscard]] bool IsHealthy(std::chrono::milliseconds timeout = std::chrono::seconds{5});

    /**
     * @brief Check health, and restart only an engine that is gone
     *
     * A failed check on a live engine (busy, or still draining a timed-out
     * command) never restarts it.
     *
     * @return health after any restart
     */
    bool EnsureHealthy(std::chrono::milliseconds check_timeout = std::chrono::seconds{5});

    /// Send the terminal interrupt character to the engine
    void Interrupt();

    [[nodiscard]] SessionStatus Status() const;
    [[nodiscard]] SessionState State() const { return state_.load(); }
    [[nodiscard]] bool IsReady() const { return state_.load() == SessionState::Ready; }

    /// Incremented on every successful start
    [[nodiscard]] uint64_t Generation() const { return generation_.load(); }

    [[nodiscard]] const SessionConfig &Config() const { return config_; }

  private:
    enum class DrainResult { Prompt, Timeout, Exited, Aborted };

    struct StartParams {
        std::string executable;
        std::optional<std::chrono::milliseconds> startup_timeout;
        std::vector<std::string> extra_args;
    };

    DrainResult ReadUntilPrompt(std::chrono::milliseconds budget, bool inactivity);
    void FinishCommand(const Transaction &tx);
    void Teardown(std::chrono::milliseconds grace);

    /// Failed, Uninitialized, or the process behind the channel has exited
    bool EngineGone();

    static int64_t NowNs(std::chrono::system_clock::time_point tp) {
        return std::chrono::duration_cast<std::chrono::nanoseconds>(tp.time_since_epoch())
            .count();
    }

    SessionConfig config_;
    ChannelFactory factory_;
    TransactionFramer framer_;

    FifoMutex exec_lock_;

    // Channel pointer changes only under exec_lock_; channel_mutex_ guards it
    // for out-of-band callers (Interrupt).
    std::unique_ptr<Channel> channel_;
    std::mutex channel_mutex_;

    std::atomic<SessionState> state_{SessionState::Uninitialized};
    std::atomic<bool> abort_{false};
    std::atomic<bool> resync_pending_{false};
    std::atomic<uint64_t> generation_{0};

    std::atomic<uint64_t> command_count_{0};
    std::atomic<uint64_t> error_count_{0};
    std::atomic<uint64_t> timeout_count_{0};
    std::atomic<int64_t> total_command_ms_{0};
    std::atomic<int64_t> started_wall_ns_{0};
    std::atomic<int64_t> started_steady_ns_{0};
    std::atomic<int64_t> last_command_wall_ns_{0};

    mutable std::mutex info_mutex_;
    std::deque<CommandRecord> history_;
    std::string executable_;
    std::optional<StartParams> last_start_;
};

} // namespace tether
